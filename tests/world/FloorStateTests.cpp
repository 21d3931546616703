/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE FloorStateTests
#include <boost/test/unit_test.hpp>

#include "dungeon/SpawnTable.hpp"
#include "dungeon/TerrainGrid.hpp"
#include "entities/MineableLoot.hpp"
#include "entities/MobRegistry.hpp"
#include "utils/JsonReader.hpp"
#include "world/FloorCatalog.hpp"
#include "world/FloorState.hpp"
#include <algorithm>
#include <climits>
#include <cstring>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace DelveEngine;

namespace {

const std::string kDataDir = std::string(DELVE_TEST_DATA_DIR) + "/data";

const std::vector<std::string> kRoomRows{
    "#########",
    "#S,.....#",
    "#,......#",
    "#.......D",
    "#.......#",
    "#########",
};

std::unique_ptr<TerrainGrid> roomTerrain() {
    auto terrain = TerrainGrid::fromAscii(kRoomRows);
    BOOST_REQUIRE(terrain);
    return terrain;
}

SpawnTable roomTable() {
    SpawnTable table;
    table.chest(IntRange{2, 2})
        .rock(IntRange{3, 3})
        .stairs(IntRange{1, 1})
        .mob("slime", 1)
        .mob("goblin", 1)
        .mobCount(IntRange{3, 3});
    return table;
}

// Byte offsets into a snapshot header: signature, version, width, height,
// next id, player id, then the player footprint
constexpr size_t NEXT_ID_OFFSET = sizeof(FLOOR_SNAPSHOT_SIGNATURE) + 3 * sizeof(int32_t);
constexpr size_t PLAYER_ID_OFFSET = NEXT_ID_OFFSET + sizeof(EntityId);
constexpr size_t PLAYER_ORIGIN_OFFSET = PLAYER_ID_OFFSET + sizeof(EntityId);

template <typename Payload> std::vector<EntityId> idsOf(const SpawnReport& report) {
    std::vector<EntityId> ids;
    for (const auto& placement : report.placements) {
        if (std::holds_alternative<Payload>(placement.entity)) {
            ids.push_back(placement.id);
        }
    }
    return ids;
}

template <typename T> void patch(std::string& bytes, size_t offset, T value) {
    std::memcpy(&bytes[offset], &value, sizeof(T));
}

} // namespace

struct FloorStateFixture {
    FloorState floor{roomTerrain(), 2468};
    SpawnReport report;

    FloorStateFixture() { report = floor.populate(roomTable(), nullptr); }
};

BOOST_AUTO_TEST_CASE(TestNullTerrainThrows) {
    BOOST_CHECK_THROW(FloorState(nullptr, 1), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestNoEntranceMeansNoPlayer) {
    FloorState floor(TerrainGrid::walledRoom(6, 6), 5);
    SpawnTable table;
    table.chest(IntRange{1, 1});
    floor.populate(table, nullptr);

    BOOST_CHECK_EQUAL(floor.getPlayerId(), INVALID_ENTITY_ID);
    BOOST_CHECK(!floor.getPlayerPosition().has_value());
    BOOST_CHECK_EQUAL(floor.movePlayer(Direction::Up).outcome, MoveOutcome::Blocked);
}

BOOST_FIXTURE_TEST_SUITE(FloorStateTestSuite, FloorStateFixture)

BOOST_AUTO_TEST_CASE(TestPopulateRecordsEntities) {
    BOOST_CHECK(report.isComplete());
    // 1 door + 2 chests + 3 rocks + 1 stairs + 3 mobs
    BOOST_CHECK_EQUAL(floor.getEntityCount(), 10u);
    BOOST_CHECK_EQUAL(floor.getMobIds().size(), 3u);

    std::set<EntityId> ids;
    for (const auto& placement : report.placements) {
        BOOST_CHECK(ids.insert(placement.id).second);
        const DungeonEntity* entity = floor.getEntity(placement.id);
        BOOST_REQUIRE(entity);
        BOOST_CHECK(*entity == placement.entity);
        BOOST_CHECK_EQUAL(*floor.getPosition(placement.id), placement.position);
    }
}

BOOST_AUTO_TEST_CASE(TestPlayerPlacedAtEntrance) {
    BOOST_REQUIRE_NE(floor.getPlayerId(), INVALID_ENTITY_ID);
    BOOST_REQUIRE(floor.getPlayerPosition().has_value());
    BOOST_CHECK_EQUAL(*floor.getPlayerPosition(), GridPosition(1, 1));

    // The player is on the grid but not a floor entity
    BOOST_CHECK(floor.getEntity(floor.getPlayerId()) == nullptr);
    BOOST_CHECK_EQUAL(floor.getNextId(), floor.getPlayerId() + 1);
    BOOST_CHECK(!floor.placePlayer({2, 2}));
}

BOOST_AUTO_TEST_CASE(TestMovePlayer) {
    // Corridor cells never receive spawns, so the first step is always free
    StepResult result = floor.movePlayer(Direction::Right);
    BOOST_CHECK_EQUAL(result.outcome, MoveOutcome::Moved);
    BOOST_CHECK_EQUAL(*floor.getPlayerPosition(), GridPosition(2, 1));

    result = floor.movePlayer(Direction::Up);
    BOOST_CHECK_EQUAL(result.outcome, MoveOutcome::Blocked);
    BOOST_CHECK_EQUAL(*floor.getPlayerPosition(), GridPosition(2, 1));
}

BOOST_AUTO_TEST_CASE(TestRemoveEntityFreesCells) {
    const EntityId mob = floor.getMobIds().front();
    const GridPosition pos = *floor.getPosition(mob);

    BOOST_CHECK(floor.removeEntity(mob));
    BOOST_CHECK(floor.getEntity(mob) == nullptr);
    BOOST_CHECK(!floor.getOccupancy().isOccupied(pos.x, pos.y));
    BOOST_CHECK_EQUAL(floor.getMobIds().size(), 2u);
    BOOST_CHECK(!floor.removeEntity(mob));
}

BOOST_AUTO_TEST_CASE(TestMineRockYieldsOreAndFreesCells) {
    const MineableLoot loot = MineableLoot::standard();
    const auto rocks = idsOf<RockEntity>(report);
    BOOST_REQUIRE_EQUAL(rocks.size(), 3u);

    for (EntityId id : rocks) {
        const RockType type = std::get<RockEntity>(*floor.getEntity(id)).rockType;
        const GridPosition pos = *floor.getPosition(id);

        auto result = floor.mineEntity(id, loot, 0);
        BOOST_REQUIRE(result.has_value());
        BOOST_CHECK_EQUAL(result->id, id);
        BOOST_CHECK_EQUAL(result->miningXp, loot.getRockYield(type)->miningXp);

        // The ore entry is 1/1, so it drops on every swing
        const std::string& ore = loot.getRockYield(type)->loot.getEntries().front().itemId;
        const bool gotOre = std::any_of(result->drops.begin(), result->drops.end(),
                                        [&](const LootDrop& d) { return d.itemId == ore; });
        BOOST_CHECK_MESSAGE(gotOre, "no " << ore << " from " << result->description);

        BOOST_CHECK(floor.getEntity(id) == nullptr);
        BOOST_CHECK(!floor.getOccupancy().isOccupied(pos.x, pos.y));
    }
    BOOST_CHECK_EQUAL(floor.getEntityCount(), 7u);
}

BOOST_AUTO_TEST_CASE(TestOpenChestRollsChestTable) {
    const auto chests = idsOf<ChestEntity>(report);
    BOOST_REQUIRE_EQUAL(chests.size(), 2u);

    MineableLoot loot;
    loot.withChest(LootTable().with("silver_key", 1, 1, IntRange{2, 2}));

    auto result = floor.mineEntity(chests.front(), loot, 0);
    BOOST_REQUIRE(result.has_value());
    BOOST_REQUIRE_EQUAL(result->drops.size(), 1u);
    BOOST_CHECK_EQUAL(result->drops.front(), (LootDrop{"silver_key", 2}));
    BOOST_CHECK_EQUAL(result->miningXp, 0);
    BOOST_CHECK(floor.getEntity(chests.front()) == nullptr);

    // Opened once; the id is gone afterwards
    BOOST_CHECK(!floor.mineEntity(chests.front(), loot, 0).has_value());
}

BOOST_AUTO_TEST_CASE(TestMagicFindRaisesChestDrops) {
    MineableLoot loot;
    loot.withChest(LootTable().with("ruby", 1, 10, IntRange{1, 1}));

    // Fresh floors with the same seed so both runs see identical chests
    int plainDrops = 0;
    int luckyDrops = 0;
    for (uint32_t seed = 1; seed <= 200; ++seed) {
        for (int magicFind : {0, 300}) {
            FloorState local(roomTerrain(), seed);
            const SpawnReport localReport = local.populate(roomTable(), nullptr);
            for (EntityId id : idsOf<ChestEntity>(localReport)) {
                auto result = local.mineEntity(id, loot, magicFind);
                BOOST_REQUIRE(result.has_value());
                (magicFind == 0 ? plainDrops : luckyDrops) +=
                    static_cast<int>(result->drops.size());
            }
        }
    }
    // 400 chests: roughly 40 plain drops against 138 with four attempts each
    BOOST_CHECK_GT(luckyDrops, plainDrops * 2);
}

BOOST_AUTO_TEST_CASE(TestMineRejectsOtherEntities) {
    const MineableLoot loot = MineableLoot::standard();
    const EntityId mob = floor.getMobIds().front();
    const EntityId stairs = idsOf<StairsEntity>(report).front();
    const EntityId door = idsOf<DoorEntity>(report).front();
    const size_t before = floor.getEntityCount();

    BOOST_CHECK(!floor.mineEntity(mob, loot, 0).has_value());
    BOOST_CHECK(!floor.mineEntity(stairs, loot, 0).has_value());
    BOOST_CHECK(!floor.mineEntity(door, loot, 0).has_value());
    BOOST_CHECK(!floor.mineEntity(floor.getPlayerId(), loot, 0).has_value());
    BOOST_CHECK(!floor.mineEntity(9999, loot, 0).has_value());

    BOOST_CHECK_EQUAL(floor.getEntityCount(), before);
    BOOST_CHECK(floor.getPlayerPosition().has_value());
}

BOOST_AUTO_TEST_CASE(TestMineRockWithoutYieldStillBreaks) {
    const EntityId rock = idsOf<RockEntity>(report).front();

    auto result = floor.mineEntity(rock, MineableLoot(), 500);
    BOOST_REQUIRE(result.has_value());
    BOOST_CHECK(result->drops.empty());
    BOOST_CHECK_EQUAL(result->miningXp, 0);
    BOOST_CHECK(floor.getEntity(rock) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestRenderAscii) {
    const std::string map = floor.renderAscii();
    BOOST_CHECK_EQUAL(std::count(map.begin(), map.end(), '\n'), 6);
    BOOST_CHECK_EQUAL(std::count(map.begin(), map.end(), '@'), 1);
    BOOST_CHECK_EQUAL(map.substr(0, 10), "#########\n");
}

BOOST_AUTO_TEST_CASE(TestSnapshotRoundTrip) {
    BOOST_REQUIRE_EQUAL(floor.movePlayer(Direction::Right).outcome, MoveOutcome::Moved);

    std::stringstream buffer;
    BOOST_REQUIRE(floor.saveSnapshot(buffer));

    auto restored = FloorState::loadSnapshot(buffer, roomTerrain());
    BOOST_REQUIRE(restored);
    BOOST_CHECK_EQUAL(restored->renderAscii(), floor.renderAscii());
    BOOST_CHECK_EQUAL(restored->getEntityCount(), floor.getEntityCount());
    BOOST_CHECK_EQUAL(restored->getPlayerId(), floor.getPlayerId());
    BOOST_CHECK_EQUAL(*restored->getPlayerPosition(), *floor.getPlayerPosition());
    BOOST_CHECK_EQUAL(restored->getNextId(), floor.getNextId());

    for (const auto& placement : report.placements) {
        const DungeonEntity* entity = restored->getEntity(placement.id);
        BOOST_REQUIRE(entity);
        BOOST_CHECK(*entity == *floor.getEntity(placement.id));
    }

    // Both random sources continue from the same point
    for (int i = 0; i < 5; ++i) {
        BOOST_CHECK_EQUAL(restored->getRandom().intInRange(0, 1000000),
                          floor.getRandom().intInRange(0, 1000000));
    }
}

BOOST_AUTO_TEST_CASE(TestSnapshotRejectsBadSignature) {
    std::stringstream buffer;
    BOOST_REQUIRE(floor.saveSnapshot(buffer));
    std::string bytes = buffer.str();
    bytes[0] = 'X';

    std::stringstream corrupted(bytes);
    BOOST_CHECK(!FloorState::loadSnapshot(corrupted, roomTerrain()));
}

BOOST_AUTO_TEST_CASE(TestSnapshotRejectsTerrainMismatch) {
    std::stringstream buffer;
    BOOST_REQUIRE(floor.saveSnapshot(buffer));
    BOOST_CHECK(!FloorState::loadSnapshot(buffer, TerrainGrid::walledRoom(4, 4)));
}

BOOST_AUTO_TEST_CASE(TestSnapshotRejectsPlayerIdPastNextId) {
    std::stringstream buffer;
    BOOST_REQUIRE(floor.saveSnapshot(buffer));
    std::string bytes = buffer.str();

    EntityId nextId = INVALID_ENTITY_ID;
    std::memcpy(&nextId, &bytes[NEXT_ID_OFFSET], sizeof(nextId));
    BOOST_REQUIRE_EQUAL(nextId, floor.getNextId());

    // A player id the allocator would hand out again must not load
    patch(bytes, PLAYER_ID_OFFSET, nextId);
    std::stringstream reused(bytes);
    BOOST_CHECK(!FloorState::loadSnapshot(reused, roomTerrain()));

    patch(bytes, PLAYER_ID_OFFSET, nextId + 50);
    std::stringstream beyond(bytes);
    BOOST_CHECK(!FloorState::loadSnapshot(beyond, roomTerrain()));
}

BOOST_AUTO_TEST_CASE(TestSnapshotRejectsOutOfGridFootprint) {
    std::stringstream buffer;
    BOOST_REQUIRE(floor.saveSnapshot(buffer));
    std::string bytes = buffer.str();

    patch(bytes, PLAYER_ORIGIN_OFFSET, static_cast<int32_t>(INT_MAX));
    std::stringstream corrupted(bytes);
    BOOST_CHECK(!FloorState::loadSnapshot(corrupted, roomTerrain()));
}

BOOST_AUTO_TEST_CASE(TestSnapshotRejectsTruncation) {
    std::stringstream buffer;
    BOOST_REQUIRE(floor.saveSnapshot(buffer));
    const std::string bytes = buffer.str();

    std::stringstream truncated(bytes.substr(0, bytes.size() / 2));
    BOOST_CHECK(!FloorState::loadSnapshot(truncated, roomTerrain()));

    std::stringstream empty;
    BOOST_CHECK(!FloorState::loadSnapshot(empty, roomTerrain()));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(FloorCatalogTestSuite)

BOOST_AUTO_TEST_CASE(TestLoadShippedCatalog) {
    auto catalog = FloorCatalog::loadFromFile(kDataDir + "/floors.json");
    BOOST_REQUIRE(catalog.has_value());
    BOOST_CHECK_EQUAL(catalog->size(), 3u);

    const FloorDefinition* throne = catalog->find("throne");
    BOOST_REQUIRE(throne);
    BOOST_CHECK(throne->isFinal);
    BOOST_CHECK_CLOSE(throne->difficulty, 1.5, 0.0001);
    for (const auto& rule : throne->spawnTable.getRules()) {
        BOOST_CHECK(rule.target != SpawnTarget::Stairs);
    }
    BOOST_CHECK(catalog->find("basement") == nullptr);
}

BOOST_AUTO_TEST_CASE(TestShippedFloorsPopulate) {
    auto registry = MobRegistry::loadFromFile(kDataDir + "/mobs.json");
    auto catalog = FloorCatalog::loadFromFile(kDataDir + "/floors.json");
    BOOST_REQUIRE(registry.has_value());
    BOOST_REQUIRE(catalog.has_value());

    for (const auto& def : catalog->getFloors()) {
        BOOST_TEST_CONTEXT("floor " << def.name) {
            BOOST_CHECK_NO_THROW(def.spawnTable.validate(&*registry));

            FloorState floor(def.buildTerrain(), 77);
            SpawnReport report = floor.populate(def.spawnTable, &*registry);
            BOOST_CHECK(report.isComplete());
            BOOST_CHECK(floor.getPlayerPosition().has_value());
            BOOST_CHECK(!floor.getMobIds().empty());
        }
    }
}

BOOST_AUTO_TEST_CASE(TestRejectsMalformedCatalogs) {
    JsonReader reader;
    BOOST_REQUIRE(reader.parse(R"({ "floors": [
        { "name": "a", "map": ["#.#"] },
        { "name": "a", "map": ["#.#"] }
    ] })"));
    BOOST_CHECK_THROW(FloorCatalog::fromJson(reader.getRoot()), std::invalid_argument);

    BOOST_REQUIRE(reader.parse(R"({ "floors": [ { "name": "a", "map": ["#?#"] } ] })"));
    BOOST_CHECK_THROW(FloorCatalog::fromJson(reader.getRoot()), std::invalid_argument);

    BOOST_REQUIRE(reader.parse(R"({ "floors": [ { "name": "a", "map": [] } ] })"));
    BOOST_CHECK_THROW(FloorCatalog::fromJson(reader.getRoot()), std::invalid_argument);

    BOOST_REQUIRE(reader.parse(R"({ "floors": [
        { "name": "a", "difficulty": 0, "map": ["#.#"] } ] })"));
    BOOST_CHECK_THROW(FloorCatalog::fromJson(reader.getRoot()), std::invalid_argument);

    BOOST_REQUIRE(reader.parse(R"({ "levels": [] })"));
    BOOST_CHECK_THROW(FloorCatalog::fromJson(reader.getRoot()), std::invalid_argument);

    BOOST_CHECK(!FloorCatalog::loadFromFile(kDataDir + "/missing.json").has_value());
}

BOOST_AUTO_TEST_SUITE_END()
