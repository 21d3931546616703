/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPAWN_RESOLVER_HPP
#define SPAWN_RESOLVER_HPP

/**
 * @file SpawnResolver.hpp
 * @brief Turns a SpawnTable into concrete, non-overlapping placements
 *
 * Resolution works on a shared candidate pool: every cell that is walkable,
 * spawn-eligible and free when resolution starts. Doors are taken from the
 * terrain's door metadata instead of the pool. Each committed placement
 * removes its footprint from the pool before the next attempt, so later
 * categories only see what earlier ones left behind.
 *
 * Running out of room is never an error: the rule places what it can and
 * the shortfall is recorded in the report.
 */

#include "dungeon/DungeonEntity.hpp"
#include "dungeon/GridOccupancy.hpp"
#include "dungeon/GridTypes.hpp"
#include "dungeon/SpawnTable.hpp"
#include "dungeon/TerrainGrid.hpp"
#include "utils/RandomSource.hpp"
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace DelveEngine {

class MobRegistry;

/// One committed entity, in placement order
struct Placement {
    EntityId id{INVALID_ENTITY_ID};
    DungeonEntity entity;
    GridPosition position{};
    GridSize size{};
};

enum class SpawnIssue : uint8_t {
    InsufficientSpace,  // Candidate pool ran out
    InvalidFootprint,   // Fixed position outside the grid or not walkable
    OccupancyConflict   // Target cell already held by another entity
};

inline std::ostream& operator<<(std::ostream& os, const SpawnIssue& issue) {
    switch (issue) {
        case SpawnIssue::InsufficientSpace: return os << "InsufficientSpace";
        case SpawnIssue::InvalidFootprint: return os << "InvalidFootprint";
        case SpawnIssue::OccupancyConflict: return os << "OccupancyConflict";
        default: return os << "UNKNOWN";
    }
}

struct RuleOutcome {
    std::string rule;
    SpawnCategory category{SpawnCategory::Obstacle};
    int requested{0};
    int placed{0};
};

struct SpawnShortfall {
    std::string rule;
    SpawnCategory category{SpawnCategory::Obstacle};
    int requested{0};
    int placed{0};
    SpawnIssue issue{SpawnIssue::InsufficientSpace};
};

struct SpawnReport {
    std::vector<Placement> placements;
    std::vector<RuleOutcome> rules;          // One per rule, resolution order
    std::vector<SpawnShortfall> shortfalls;

    bool isComplete() const { return shortfalls.empty(); }
    size_t countOf(EntityCategory category) const;
    size_t countMobs(const std::string& mobId) const;
};

class SpawnResolver {
public:
    /// Hands out fresh entity ids; must never return INVALID_ENTITY_ID
    using IdAllocator = std::function<EntityId()>;

    /**
     * @param registry Supplies mob footprints; may be null (every mob is 1x1)
     * @param allocateId When empty, ids continue after the highest id already
     *        in the occupancy grid
     */
    SpawnResolver(const ITerrainOracle& terrain, GridOccupancy& occupancy,
                  const MobRegistry* registry, RandomSource& rng,
                  IdAllocator allocateId = IdAllocator());

    /**
     * @brief Place everything the table asks for, as far as space allows
     * @note Validate the table first; malformed rules are skipped here
     */
    SpawnReport resolve(const SpawnTable& table);

    /// Cells currently in the candidate pool (valid during and after resolve)
    size_t getPoolSize() const { return m_poolCount; }

private:
    void buildPool();
    void placeDoors(SpawnReport& report);
    void resolveRule(const SpawnRule& rule, SpawnReport& report);
    void resolveFixed(const SpawnRule& rule, SpawnReport& report);

    int sampleCount(const SpawnRule& rule);
    const WeightedMobEntry* selectWeighted(const SpawnRule& rule, int totalWeight);
    DungeonEntity makePayload(const SpawnRule& rule, const std::string& mobId);
    GridSize sizeFor(SpawnTarget target, const std::string& mobId) const;

    std::vector<GridPosition> validOrigins(GridSize size) const;
    OccupancyResult commit(const DungeonEntity& entity, GridPosition pos, GridSize size,
                           SpawnReport& report);
    void removeFromPool(GridPosition pos, GridSize size);
    bool inPool(int x, int y) const;

    void recordShortfall(const SpawnRule& rule, int requested, int placed, SpawnIssue issue,
                         SpawnReport& report);

    const ITerrainOracle& m_terrain;
    GridOccupancy& m_occupancy;
    const MobRegistry* mp_registry;
    RandomSource& m_rng;
    IdAllocator m_allocateId;

    std::vector<uint8_t> m_pool; // row-major, 1 = candidate
    size_t m_poolCount{0};
};

} // namespace DelveEngine

#endif // SPAWN_RESOLVER_HPP
