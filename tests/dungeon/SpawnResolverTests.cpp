/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SpawnResolverTests
#include <boost/test/unit_test.hpp>

#include "dungeon/GridOccupancy.hpp"
#include "dungeon/SpawnResolver.hpp"
#include "dungeon/SpawnTable.hpp"
#include "dungeon/TerrainGrid.hpp"
#include "entities/MobRegistry.hpp"
#include "utils/RandomSource.hpp"
#include <memory>
#include <set>
#include <vector>

using namespace DelveEngine;

namespace {

MobSpec mobSpec(const std::string& id, GridSize size = GridSize::single()) {
    MobSpec spec;
    spec.id = id;
    spec.name = id;
    spec.maxHealth = IntRange{10, 10};
    spec.attack = IntRange{3, 3};
    spec.size = size;
    return spec;
}

// Every committed placement must match the grid exactly and never overlap
void checkPlacementsConsistent(const SpawnReport& report, const GridOccupancy& grid) {
    std::set<std::pair<int, int>> seen;
    for (const auto& placement : report.placements) {
        Footprint{placement.position, placement.size}.forEachCell([&](int x, int y) {
            BOOST_CHECK_EQUAL(grid.entityAt(x, y), placement.id);
            BOOST_CHECK(seen.insert({x, y}).second);
        });
    }
}

} // namespace

struct ResolverFixture {
    RandomSource rng{12345};
    MobRegistry registry{std::vector<MobSpec>{mobSpec("goblin"), mobSpec("slime"),
                                              mobSpec("merchant"),
                                              mobSpec("dwarf_king", GridSize{2, 2})}};
};

BOOST_FIXTURE_TEST_SUITE(SpawnResolverTestSuite, ResolverFixture)

BOOST_AUTO_TEST_CASE(TestOpenRoomMobAndChests) {
    auto terrain = TerrainGrid::openFloor(5, 5);
    GridOccupancy grid(5, 5);

    SpawnTable table;
    table.guaranteedMob("goblin", 1).chest(IntRange{2, 2});

    SpawnResolver resolver(*terrain, grid, nullptr, rng);
    SpawnReport report = resolver.resolve(table);

    BOOST_CHECK_EQUAL(report.placements.size(), 3u);
    BOOST_CHECK_EQUAL(grid.getEntityCount(), 3u);
    BOOST_CHECK_EQUAL(grid.getFreeCellCount(), 22u);
    BOOST_CHECK(report.isComplete());
    BOOST_CHECK_EQUAL(report.countMobs("goblin"), 1u);
    BOOST_CHECK_EQUAL(report.countOf(EntityCategory::Obstacle), 2u);
    checkPlacementsConsistent(report, grid);

    // Chests resolve before mobs regardless of declaration order
    BOOST_CHECK(std::holds_alternative<ChestEntity>(report.placements[0].entity));
    BOOST_CHECK(std::holds_alternative<MobEntity>(report.placements[2].entity));
}

BOOST_AUTO_TEST_CASE(TestExhaustedPoolIsShortfallNotError) {
    auto terrain = TerrainGrid::openFloor(2, 2);
    GridOccupancy grid(2, 2);

    SpawnTable table;
    table.rock(IntRange{10, 10});

    SpawnResolver resolver(*terrain, grid, nullptr, rng);
    SpawnReport report;
    BOOST_REQUIRE_NO_THROW(report = resolver.resolve(table));

    BOOST_CHECK_EQUAL(report.placements.size(), 4u);
    BOOST_CHECK_EQUAL(grid.getFreeCellCount(), 0u);
    BOOST_REQUIRE_EQUAL(report.shortfalls.size(), 1u);
    BOOST_CHECK_EQUAL(report.shortfalls[0].issue, SpawnIssue::InsufficientSpace);
    BOOST_CHECK_EQUAL(report.shortfalls[0].requested, 10);
    BOOST_CHECK_EQUAL(report.shortfalls[0].placed, 4);
    BOOST_REQUIRE_EQUAL(report.rules.size(), 1u);
    BOOST_CHECK_EQUAL(report.rules[0].placed, 4);
}

BOOST_AUTO_TEST_CASE(TestEarlierCategoriesConsumeThePool) {
    auto terrain = TerrainGrid::openFloor(1, 1);
    GridOccupancy grid(1, 1);

    SpawnTable table;
    table.guaranteedMob("goblin", 1).chest(IntRange{1, 1});

    SpawnResolver resolver(*terrain, grid, nullptr, rng);
    SpawnReport report = resolver.resolve(table);

    BOOST_REQUIRE_EQUAL(report.placements.size(), 1u);
    BOOST_CHECK(std::holds_alternative<ChestEntity>(report.placements[0].entity));
    BOOST_REQUIRE_EQUAL(report.shortfalls.size(), 1u);
    BOOST_CHECK_EQUAL(report.shortfalls[0].category, SpawnCategory::GuaranteedMob);
}

BOOST_AUTO_TEST_CASE(TestSameSeedSameReport) {
    auto terrain = TerrainGrid::walledRoom(12, 10);
    SpawnTable table = SpawnTable::standardFloor(false);

    // Standard floor names the dwarf variants individually
    MobRegistry full{std::vector<MobSpec>{
        mobSpec("goblin"), mobSpec("slime"), mobSpec("merchant"), mobSpec("dwarf_defender"),
        mobSpec("dwarf_warrior"), mobSpec("dwarf_miner"), mobSpec("dwarf_king", {2, 2})}};

    auto run = [&](uint32_t seed) {
        GridOccupancy grid(12, 10);
        RandomSource local(seed);
        SpawnResolver resolver(*terrain, grid, &full, local);
        return resolver.resolve(table);
    };

    SpawnReport first = run(777);
    SpawnReport second = run(777);

    BOOST_REQUIRE_EQUAL(first.placements.size(), second.placements.size());
    for (size_t i = 0; i < first.placements.size(); ++i) {
        BOOST_CHECK_EQUAL(first.placements[i].id, second.placements[i].id);
        BOOST_CHECK_EQUAL(first.placements[i].position, second.placements[i].position);
        BOOST_CHECK_EQUAL(first.placements[i].size, second.placements[i].size);
        BOOST_CHECK(first.placements[i].entity == second.placements[i].entity);
    }

    BOOST_CHECK_EQUAL(first.countMobs("dwarf_king"), 1u);
    BOOST_CHECK_EQUAL(first.countMobs("dwarf_defender"), 1u);
    const size_t weighted = first.countMobs("goblin") + first.countMobs("slime");
    BOOST_CHECK(weighted >= 3 && weighted <= 4);
}

BOOST_AUTO_TEST_CASE(TestMultiCellFootprintsFromRegistry) {
    auto terrain = TerrainGrid::openFloor(3, 3);
    GridOccupancy grid(3, 3);

    SpawnTable table;
    table.guaranteedMob("dwarf_king", 2);

    SpawnResolver resolver(*terrain, grid, &registry, rng);
    SpawnReport report = resolver.resolve(table);

    BOOST_REQUIRE_EQUAL(report.placements.size(), 1u);
    BOOST_CHECK_EQUAL(report.placements[0].size, GridSize(2, 2));
    BOOST_CHECK_EQUAL(grid.getOccupiedCellCount(), 4u);
    BOOST_REQUIRE_EQUAL(report.shortfalls.size(), 1u);
    BOOST_CHECK_EQUAL(report.shortfalls[0].issue, SpawnIssue::InsufficientSpace);
    checkPlacementsConsistent(report, grid);
}

BOOST_AUTO_TEST_CASE(TestDoorsPlacedFromTerrainFirst) {
    auto terrain = TerrainGrid::fromAscii({
        "##D##",
        "#...D",
        "#.,.#",
        "#####",
    });
    BOOST_REQUIRE(terrain);
    GridOccupancy grid(5, 4);

    SpawnTable table;
    table.chest(IntRange{5, 5});

    SpawnResolver resolver(*terrain, grid, nullptr, rng);
    SpawnReport report = resolver.resolve(table);

    BOOST_CHECK_EQUAL(report.countOf(EntityCategory::Door), 2u);
    BOOST_REQUIRE(report.placements.size() >= 2u);
    BOOST_CHECK_EQUAL(report.placements[0].position, GridPosition(2, 0));
    BOOST_CHECK_EQUAL(report.placements[1].position, GridPosition(4, 1));
    BOOST_CHECK_EQUAL(report.rules.front().category, SpawnCategory::Door);

    // Five floor cells; doors never took one of them
    BOOST_CHECK_EQUAL(report.countOf(EntityCategory::Obstacle), 5u);
    BOOST_CHECK(!grid.isOccupied(2, 2));  // corridor stays clear
    BOOST_CHECK_EQUAL(resolver.getPoolSize(), 0u);
    BOOST_CHECK(report.isComplete());
}

BOOST_AUTO_TEST_CASE(TestOnlySpawnableCellsUsed) {
    auto terrain = TerrainGrid::fromAscii({"S,,..,,"});
    BOOST_REQUIRE(terrain);
    GridOccupancy grid(7, 1);

    SpawnTable table;
    table.rock(IntRange{5, 5});

    SpawnResolver resolver(*terrain, grid, nullptr, rng);
    SpawnReport report = resolver.resolve(table);

    BOOST_CHECK_EQUAL(report.placements.size(), 2u);
    for (const auto& placement : report.placements) {
        BOOST_CHECK(terrain->canSpawnEntity(placement.position.x, placement.position.y));
    }
}

BOOST_AUTO_TEST_CASE(TestZeroWeightPoolPlacesNothing) {
    auto terrain = TerrainGrid::openFloor(4, 4);
    GridOccupancy grid(4, 4);

    SpawnTable table;
    table.mob("goblin", 0).mob("slime", 0).mobCount(IntRange{3, 3});

    SpawnResolver resolver(*terrain, grid, &registry, rng);
    SpawnReport report = resolver.resolve(table);

    BOOST_CHECK(report.placements.empty());
    BOOST_CHECK(report.isComplete());
}

BOOST_AUTO_TEST_CASE(TestWeightedSelectionHonoursZeroWeightEntries) {
    auto terrain = TerrainGrid::openFloor(6, 6);
    GridOccupancy grid(6, 6);

    SpawnTable table;
    table.mob("goblin", 0).mob("slime", 4).mobCount(IntRange{10, 10});

    SpawnResolver resolver(*terrain, grid, &registry, rng);
    SpawnReport report = resolver.resolve(table);

    BOOST_CHECK_EQUAL(report.countMobs("slime"), 10u);
    BOOST_CHECK_EQUAL(report.countMobs("goblin"), 0u);
}

BOOST_AUTO_TEST_CASE(TestChanceExtremes) {
    auto terrain = TerrainGrid::openFloor(4, 4);
    GridOccupancy grid(4, 4);

    SpawnTable table;
    table.forgeChance(1.0).anvilChance(0.0).npcChance("merchant", 1.0);

    SpawnResolver resolver(*terrain, grid, &registry, rng);
    SpawnReport report = resolver.resolve(table);

    BOOST_REQUIRE_EQUAL(report.placements.size(), 2u);
    const auto* station = std::get_if<CraftingStationEntity>(&report.placements[0].entity);
    BOOST_REQUIRE(station);
    BOOST_CHECK(station->stationType == CraftingStationType::Forge);
    BOOST_CHECK(std::holds_alternative<NpcEntity>(report.placements[1].entity));
}

BOOST_AUTO_TEST_CASE(TestFixedPlacements) {
    auto terrain = TerrainGrid::walledRoom(5, 5);
    GridOccupancy grid(5, 5);

    SpawnTable table;
    table.fixed(SpawnTarget::Stairs, {2, 2})
        .fixed(SpawnTarget::Chest, {2, 2})
        .fixed(SpawnTarget::Chest, {0, 0});

    SpawnResolver resolver(*terrain, grid, nullptr, rng);
    SpawnReport report = resolver.resolve(table);

    BOOST_REQUIRE_EQUAL(report.placements.size(), 1u);
    BOOST_CHECK(std::holds_alternative<StairsEntity>(report.placements[0].entity));
    BOOST_REQUIRE_EQUAL(report.shortfalls.size(), 2u);
    BOOST_CHECK_EQUAL(report.shortfalls[0].issue, SpawnIssue::OccupancyConflict);
    BOOST_CHECK_EQUAL(report.shortfalls[1].issue, SpawnIssue::InvalidFootprint);
}

BOOST_AUTO_TEST_CASE(TestPayloadVariantsInRange) {
    auto terrain = TerrainGrid::openFloor(10, 10);
    GridOccupancy grid(10, 10);

    SpawnTable table;
    table.chest(IntRange{30, 30}).rock(IntRange{30, 30});

    SpawnResolver resolver(*terrain, grid, nullptr, rng);
    SpawnReport report = resolver.resolve(table);
    BOOST_REQUIRE_EQUAL(report.placements.size(), 60u);

    for (const auto& placement : report.placements) {
        if (const auto* chest = std::get_if<ChestEntity>(&placement.entity)) {
            BOOST_CHECK_LT(chest->variant, CHEST_VARIANT_COUNT);
        } else if (const auto* rock = std::get_if<RockEntity>(&placement.entity)) {
            BOOST_CHECK_LT(rock->spriteVariant, ROCK_SPRITE_VARIANT_COUNT);
        } else {
            BOOST_FAIL("unexpected payload " << describeEntity(placement.entity));
        }
    }
}

BOOST_AUTO_TEST_CASE(TestIdsContinueAfterExistingEntities) {
    auto terrain = TerrainGrid::openFloor(3, 3);
    GridOccupancy grid(3, 3);
    BOOST_REQUIRE_EQUAL(grid.occupy({0, 0}, {1, 1}, 40), OccupancyResult::Success);

    SpawnTable table;
    table.chest(IntRange{2, 2});

    SpawnResolver resolver(*terrain, grid, nullptr, rng);
    SpawnReport report = resolver.resolve(table);

    BOOST_REQUIRE_EQUAL(report.placements.size(), 2u);
    BOOST_CHECK_EQUAL(report.placements[0].id, 41u);
    BOOST_CHECK_EQUAL(report.placements[1].id, 42u);
    BOOST_CHECK_EQUAL(grid.entityAt(0, 0), 40u);
}

BOOST_AUTO_TEST_SUITE_END()
