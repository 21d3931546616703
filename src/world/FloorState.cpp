/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/FloorState.hpp"
#include "core/Logger.hpp"
#include "dungeon/SpawnTable.hpp"
#include "entities/MineableLoot.hpp"
#include "utils/BinarySerializer.hpp"
#include <algorithm>
#include <cstring>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace DelveEngine {

namespace {

// Payload tags follow the DungeonEntity alternative order
enum class PayloadTag : uint8_t {
    Door = 0,
    Chest = 1,
    Stairs = 2,
    Rock = 3,
    CraftingStation = 4,
    Npc = 5,
    Mob = 6
};

bool writePayload(BinarySerial::Writer& writer, const DungeonEntity& entity) {
    const auto tag = static_cast<uint8_t>(entity.index());
    if (!writer.write(tag)) {
        return false;
    }

    switch (static_cast<PayloadTag>(tag)) {
        case PayloadTag::Chest:
            return writer.write(std::get<ChestEntity>(entity).variant);
        case PayloadTag::Rock: {
            const auto& rock = std::get<RockEntity>(entity);
            return writer.write(static_cast<uint8_t>(rock.rockType)) &&
                   writer.write(rock.spriteVariant);
        }
        case PayloadTag::CraftingStation:
            return writer.write(
                static_cast<uint8_t>(std::get<CraftingStationEntity>(entity).stationType));
        case PayloadTag::Npc:
            return writer.writeString(std::get<NpcEntity>(entity).mobId);
        case PayloadTag::Mob:
            return writer.writeString(std::get<MobEntity>(entity).mobId);
        case PayloadTag::Door:
        case PayloadTag::Stairs:
            return true;
    }
    return false;
}

std::optional<DungeonEntity> readPayload(BinarySerial::Reader& reader) {
    uint8_t tag = 0;
    if (!reader.read(tag)) {
        return std::nullopt;
    }

    switch (static_cast<PayloadTag>(tag)) {
        case PayloadTag::Door:
            return DungeonEntity{DoorEntity{}};
        case PayloadTag::Chest: {
            ChestEntity chest;
            if (!reader.read(chest.variant) || chest.variant >= CHEST_VARIANT_COUNT) {
                return std::nullopt;
            }
            return DungeonEntity{chest};
        }
        case PayloadTag::Stairs:
            return DungeonEntity{StairsEntity{}};
        case PayloadTag::Rock: {
            uint8_t type = 0;
            RockEntity rock;
            if (!reader.read(type) || !reader.read(rock.spriteVariant) ||
                type >= ALL_ROCK_TYPES.size() || rock.spriteVariant >= ROCK_SPRITE_VARIANT_COUNT) {
                return std::nullopt;
            }
            rock.rockType = static_cast<RockType>(type);
            return DungeonEntity{rock};
        }
        case PayloadTag::CraftingStation: {
            uint8_t station = 0;
            if (!reader.read(station) || station > static_cast<uint8_t>(CraftingStationType::Anvil)) {
                return std::nullopt;
            }
            return DungeonEntity{CraftingStationEntity{static_cast<CraftingStationType>(station)}};
        }
        case PayloadTag::Npc: {
            NpcEntity npc;
            if (!reader.readString(npc.mobId)) {
                return std::nullopt;
            }
            return DungeonEntity{npc};
        }
        case PayloadTag::Mob: {
            MobEntity mob;
            if (!reader.readString(mob.mobId)) {
                return std::nullopt;
            }
            return DungeonEntity{mob};
        }
    }
    return std::nullopt;
}

bool writeFootprint(BinarySerial::Writer& writer, const Footprint& footprint) {
    return writer.write(static_cast<int32_t>(footprint.origin.x)) &&
           writer.write(static_cast<int32_t>(footprint.origin.y)) &&
           writer.write(static_cast<int32_t>(footprint.size.width)) &&
           writer.write(static_cast<int32_t>(footprint.size.height));
}

bool readFootprint(BinarySerial::Reader& reader, Footprint& footprint) {
    int32_t x = 0, y = 0, w = 0, h = 0;
    if (!reader.read(x) || !reader.read(y) || !reader.read(w) || !reader.read(h)) {
        return false;
    }
    footprint = Footprint{GridPosition{x, y}, GridSize{w, h}};
    return true;
}

} // namespace

FloorState::FloorState(std::unique_ptr<TerrainGrid> terrain, uint32_t seed)
    : mp_terrain(std::move(terrain)),
      m_occupancy(mp_terrain ? mp_terrain->getWidth() : 0,
                  mp_terrain ? mp_terrain->getHeight() : 0),
      m_rng(seed) {
    if (!mp_terrain) {
        throw std::invalid_argument("FloorState needs a terrain grid");
    }
    FLOOR_DEBUG("Created floor " + std::to_string(mp_terrain->getWidth()) + "x" +
                std::to_string(mp_terrain->getHeight()) + " with seed " + std::to_string(seed));
}

SpawnReport FloorState::populate(const SpawnTable& table, const MobRegistry* registry) {
    SpawnResolver resolver(*mp_terrain, m_occupancy, registry, m_rng,
                           [this]() { return allocateId(); });
    SpawnReport report = resolver.resolve(table);

    for (const auto& placement : report.placements) {
        m_entities.emplace(placement.id, placement.entity);
    }

    if (auto entrance = mp_terrain->getEntrance()) {
        placePlayer(*entrance);
    } else {
        FLOOR_WARN("Floor has no entrance; player not placed");
    }

    FLOOR_INFO("Populated floor with " + std::to_string(m_entities.size()) + " entities");
    return report;
}

bool FloorState::placePlayer(GridPosition pos) {
    if (m_playerId != INVALID_ENTITY_ID) {
        FLOOR_WARN("FloorState::placePlayer - Player already placed");
        return false;
    }

    MovementValidator validator(*mp_terrain, m_occupancy);
    if (!validator.canOccupy(pos, GridSize::single())) {
        FLOOR_ERROR("FloorState::placePlayer - Cell blocked at (" + std::to_string(pos.x) + ", " +
                    std::to_string(pos.y) + ")");
        return false;
    }

    const EntityId id = allocateId();
    if (m_occupancy.occupy(pos, GridSize::single(), id) != OccupancyResult::Success) {
        return false;
    }
    m_playerId = id;
    return true;
}

const DungeonEntity* FloorState::getEntity(EntityId id) const {
    auto it = m_entities.find(id);
    return it != m_entities.end() ? &it->second : nullptr;
}

std::optional<GridPosition> FloorState::getPosition(EntityId id) const {
    if (auto footprint = m_occupancy.footprintOf(id)) {
        return footprint->origin;
    }
    return std::nullopt;
}

std::optional<GridPosition> FloorState::getPlayerPosition() const {
    return getPosition(m_playerId);
}

bool FloorState::removeEntity(EntityId id) {
    auto it = m_entities.find(id);
    if (it == m_entities.end()) {
        FLOOR_WARN("FloorState::removeEntity - Unknown entity " + std::to_string(id));
        return false;
    }

    if (!m_occupancy.remove(id)) {
        FLOOR_ERROR("FloorState::removeEntity - Entity " + std::to_string(id) +
                    " had no footprint on the grid");
    }
    FLOOR_DEBUG("Removed " + describeEntity(it->second) + " (" + std::to_string(id) + ")");
    m_entities.erase(it);
    return true;
}

std::optional<MineResult> FloorState::mineEntity(EntityId id, const MineableLoot& loot,
                                                 int magicFind) {
    const DungeonEntity* entity = getEntity(id);
    if (!entity) {
        FLOOR_WARN("FloorState::mineEntity - Unknown entity " + std::to_string(id));
        return std::nullopt;
    }

    MineResult result;
    result.id = id;
    result.description = describeEntity(*entity);

    if (const auto* rock = std::get_if<RockEntity>(entity)) {
        if (const RockYield* yield = loot.getRockYield(rock->rockType)) {
            result.drops = yield->loot.roll(magicFind, m_rng);
            result.miningXp = yield->miningXp;
        } else {
            FLOOR_WARN(std::string("FloorState::mineEntity - No loot table for ") +
                       rockTypeName(rock->rockType) + " rock");
        }
    } else if (std::holds_alternative<ChestEntity>(*entity)) {
        result.drops = loot.getChestLoot().roll(magicFind, m_rng);
    } else {
        FLOOR_WARN("FloorState::mineEntity - " + result.description + " (" +
                   std::to_string(id) + ") cannot be mined or opened");
        return std::nullopt;
    }

    if (!removeEntity(id)) {
        return std::nullopt;
    }
    FLOOR_DEBUG(result.description + " yielded " + std::to_string(result.drops.size()) +
                " drop(s)");
    return result;
}

MovementValidator::EntityLookup FloorState::makeLookup() const {
    return [this](EntityId id) { return getEntity(id); };
}

StepResult FloorState::movePlayer(Direction direction) {
    if (m_playerId == INVALID_ENTITY_ID) {
        FLOOR_WARN("FloorState::movePlayer - No player on this floor");
        return StepResult{};
    }

    MovementValidator validator(*mp_terrain, m_occupancy);
    return validator.tryStep(m_occupancy, m_playerId, direction, makeLookup());
}

std::vector<EntityId> FloorState::getMobIds() const {
    std::vector<EntityId> ids;
    for (const auto& [id, entity] : m_entities) {
        if (isMob(entity)) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::string FloorState::renderAscii() const {
    const int width = mp_terrain->getWidth();
    const int height = mp_terrain->getHeight();

    std::string out;
    out.reserve(static_cast<size_t>((width + 1) * height));
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const EntityId id = m_occupancy.entityAt(x, y);
            if (id != INVALID_ENTITY_ID && id == m_playerId) {
                out += '@';
            } else if (const DungeonEntity* entity = getEntity(id)) {
                out += entityGlyph(*entity);
            } else {
                out += TerrainGrid::glyphFor(mp_terrain->getTile(x, y));
            }
        }
        out += '\n';
    }
    return out;
}

bool FloorState::saveSnapshot(std::ostream& out) const {
    try {
        auto writer = BinarySerial::Writer::borrow(out);

        writer.stream().write(FLOOR_SNAPSHOT_SIGNATURE, sizeof(FLOOR_SNAPSHOT_SIGNATURE));
        bool ok = writer.write(FLOOR_SNAPSHOT_VERSION) &&
                  writer.write(static_cast<int32_t>(mp_terrain->getWidth())) &&
                  writer.write(static_cast<int32_t>(mp_terrain->getHeight())) &&
                  writer.write(m_nextId) && writer.write(m_playerId);

        if (ok && m_playerId != INVALID_ENTITY_ID) {
            auto footprint = m_occupancy.footprintOf(m_playerId);
            ok = footprint && writeFootprint(writer, *footprint);
        }

        ok = ok && writer.write(static_cast<uint32_t>(m_entities.size()));
        for (const auto& [id, entity] : m_entities) {
            if (!ok) {
                break;
            }
            auto footprint = m_occupancy.footprintOf(id);
            if (!footprint) {
                FLOOR_ERROR("FloorState::saveSnapshot - Entity " + std::to_string(id) +
                            " has no footprint");
                return false;
            }
            ok = writer.write(id) && writeFootprint(writer, *footprint) &&
                 writePayload(writer, entity);
        }

        ok = ok && writer.write(m_rng.getSeed()) && writer.writeString(m_rng.saveState());
        writer.flush();

        if (!ok || !writer.good()) {
            SAVEGAME_ERROR("FloorState::saveSnapshot - Stream failed while writing");
            return false;
        }
        SAVEGAME_DEBUG("Saved floor snapshot with " + std::to_string(m_entities.size()) +
                       " entities");
        return true;
    } catch (const std::runtime_error& e) {
        SAVEGAME_ERROR(std::string("FloorState::saveSnapshot - ") + e.what());
        return false;
    }
}

std::unique_ptr<FloorState> FloorState::loadSnapshot(std::istream& in,
                                                     std::unique_ptr<TerrainGrid> terrain) {
    if (!terrain) {
        SAVEGAME_ERROR("FloorState::loadSnapshot - No terrain supplied");
        return nullptr;
    }

    try {
        auto reader = BinarySerial::Reader::borrow(in);

        char signature[sizeof(FLOOR_SNAPSHOT_SIGNATURE)]{};
        reader.stream().read(signature, sizeof(signature));
        if (!reader.good() ||
            std::memcmp(signature, FLOOR_SNAPSHOT_SIGNATURE, sizeof(signature)) != 0) {
            SAVEGAME_ERROR("FloorState::loadSnapshot - Bad signature");
            return nullptr;
        }

        uint32_t version = 0;
        int32_t width = 0;
        int32_t height = 0;
        EntityId nextId = 0;
        EntityId playerId = INVALID_ENTITY_ID;
        if (!reader.read(version) || !reader.read(width) || !reader.read(height) ||
            !reader.read(nextId) || !reader.read(playerId)) {
            SAVEGAME_ERROR("FloorState::loadSnapshot - Truncated header");
            return nullptr;
        }
        if (version != FLOOR_SNAPSHOT_VERSION) {
            SAVEGAME_ERROR("FloorState::loadSnapshot - Unsupported version " +
                           std::to_string(version));
            return nullptr;
        }
        if (width != terrain->getWidth() || height != terrain->getHeight()) {
            SAVEGAME_ERROR("FloorState::loadSnapshot - Snapshot is " + std::to_string(width) +
                           "x" + std::to_string(height) + " but terrain is " +
                           std::to_string(terrain->getWidth()) + "x" +
                           std::to_string(terrain->getHeight()));
            return nullptr;
        }

        auto floor = std::make_unique<FloorState>(std::move(terrain), 0);

        if (playerId != INVALID_ENTITY_ID) {
            Footprint footprint;
            if (playerId >= nextId || !readFootprint(reader, footprint) ||
                floor->m_occupancy.occupy(footprint.origin, footprint.size, playerId) !=
                    OccupancyResult::Success) {
                SAVEGAME_ERROR("FloorState::loadSnapshot - Bad player placement");
                return nullptr;
            }
            floor->m_playerId = playerId;
        }

        uint32_t count = 0;
        if (!reader.read(count) || count > BinarySerial::MAX_RECORD_COUNT) {
            SAVEGAME_ERROR("FloorState::loadSnapshot - Bad entity count");
            return nullptr;
        }

        for (uint32_t i = 0; i < count; ++i) {
            EntityId id = INVALID_ENTITY_ID;
            Footprint footprint;
            if (!reader.read(id) || !readFootprint(reader, footprint)) {
                SAVEGAME_ERROR("FloorState::loadSnapshot - Truncated entity record");
                return nullptr;
            }
            auto payload = readPayload(reader);
            if (!payload) {
                SAVEGAME_ERROR("FloorState::loadSnapshot - Corrupt payload for entity " +
                               std::to_string(id));
                return nullptr;
            }
            if (id >= nextId ||
                floor->m_occupancy.occupy(footprint.origin, footprint.size, id) !=
                    OccupancyResult::Success) {
                SAVEGAME_ERROR("FloorState::loadSnapshot - Entity " + std::to_string(id) +
                               " cannot be restored");
                return nullptr;
            }
            floor->m_entities.emplace(id, std::move(*payload));
        }

        uint32_t seed = 0;
        std::string rngState;
        if (!reader.read(seed) || !reader.readString(rngState)) {
            SAVEGAME_ERROR("FloorState::loadSnapshot - Missing RNG state");
            return nullptr;
        }
        floor->m_rng.reseed(seed);
        if (!floor->m_rng.restoreState(rngState)) {
            SAVEGAME_ERROR("FloorState::loadSnapshot - Corrupt RNG state");
            return nullptr;
        }

        floor->m_nextId = std::max<EntityId>(nextId, 1);
        SAVEGAME_INFO("Loaded floor snapshot with " + std::to_string(floor->m_entities.size()) +
                      " entities");
        return floor;
    } catch (const std::runtime_error& e) {
        SAVEGAME_ERROR(std::string("FloorState::loadSnapshot - ") + e.what());
        return nullptr;
    }
}

} // namespace DelveEngine
