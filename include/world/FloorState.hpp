/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FLOOR_STATE_HPP
#define FLOOR_STATE_HPP

/**
 * @file FloorState.hpp
 * @brief Everything one dungeon floor owns while it is loaded
 *
 * A FloorState bundles the terrain, the occupancy grid, the placed entity
 * payloads, the floor's random source and its entity id counter. It is
 * created when a floor is entered and discarded when the floor unloads;
 * nothing about a floor lives in global state.
 */

#include "combat/LootTable.hpp"
#include "dungeon/DungeonEntity.hpp"
#include "dungeon/GridOccupancy.hpp"
#include "dungeon/GridTypes.hpp"
#include "dungeon/MovementValidator.hpp"
#include "dungeon/SpawnResolver.hpp"
#include "dungeon/TerrainGrid.hpp"
#include "utils/RandomSource.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace DelveEngine {

class MineableLoot;
class MobRegistry;
class SpawnTable;

// Snapshot file signature "DELVEFLR"
constexpr char FLOOR_SNAPSHOT_SIGNATURE[8] = {'D', 'E', 'L', 'V', 'E', 'F', 'L', 'R'};
constexpr uint32_t FLOOR_SNAPSHOT_VERSION = 1;

/// What breaking open a chest or rock produced
struct MineResult {
    EntityId id{INVALID_ENTITY_ID};
    std::string description;
    std::vector<LootDrop> drops;
    int miningXp{0};
};

class FloorState {
public:
    FloorState(std::unique_ptr<TerrainGrid> terrain, uint32_t seed);

    FloorState(const FloorState&) = delete;
    FloorState& operator=(const FloorState&) = delete;

    /**
     * @brief Resolve a spawn table onto this floor and drop the player at the entrance
     *
     * Placements are recorded as floor entities. The player is placed after
     * spawning; a floor without an entrance tile simply has no player.
     */
    SpawnReport populate(const SpawnTable& table, const MobRegistry* registry);

    /// Place the player at pos; false if already placed or the cell is taken
    bool placePlayer(GridPosition pos);

    const TerrainGrid& getTerrain() const { return *mp_terrain; }
    const GridOccupancy& getOccupancy() const { return m_occupancy; }
    RandomSource& getRandom() { return m_rng; }

    const DungeonEntity* getEntity(EntityId id) const;
    std::optional<GridPosition> getPosition(EntityId id) const;

    /// Forget an entity and clear its footprint (defeated mobs, opened chests)
    bool removeEntity(EntityId id);

    /**
     * @brief Mine a rock or open a chest
     *
     * Rolls the matching table from loot with the floor's random source,
     * then removes the entity so its cells free up. Rocks also report their
     * mining xp.
     *
     * @param magicFind Player magic find forwarded to LootTable::roll
     * @return std::nullopt (logged) for an unknown id or an entity that is
     * neither a rock nor a chest
     */
    std::optional<MineResult> mineEntity(EntityId id, const MineableLoot& loot, int magicFind);

    EntityId getPlayerId() const { return m_playerId; }
    std::optional<GridPosition> getPlayerPosition() const;

    /// One-cell player move; Interact carries the blocking entity
    StepResult movePlayer(Direction direction);

    /// Mob entity ids in id order
    std::vector<EntityId> getMobIds() const;
    size_t getEntityCount() const { return m_entities.size(); }
    EntityId getNextId() const { return m_nextId; }

    /// Terrain glyphs with entities drawn on top ('@' for the player)
    std::string renderAscii() const;

    /**
     * @brief Write the floor contents and RNG state
     * @return false when the stream fails mid-write
     */
    bool saveSnapshot(std::ostream& out) const;

    /**
     * @brief Rebuild a floor from a snapshot over the given terrain
     * @return nullptr on a bad signature, version, size mismatch, or corrupt payload
     */
    static std::unique_ptr<FloorState> loadSnapshot(std::istream& in,
                                                    std::unique_ptr<TerrainGrid> terrain);

private:
    EntityId allocateId() { return m_nextId++; }
    MovementValidator::EntityLookup makeLookup() const;

    std::unique_ptr<TerrainGrid> mp_terrain;
    GridOccupancy m_occupancy;
    boost::container::flat_map<EntityId, DungeonEntity> m_entities;
    RandomSource m_rng;
    EntityId m_nextId{1};
    EntityId m_playerId{INVALID_ENTITY_ID};
};

} // namespace DelveEngine

#endif // FLOOR_STATE_HPP
