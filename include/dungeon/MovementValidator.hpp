/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOVEMENT_VALIDATOR_HPP
#define MOVEMENT_VALIDATOR_HPP

#include "dungeon/DungeonEntity.hpp"
#include "dungeon/GridOccupancy.hpp"
#include "dungeon/GridTypes.hpp"
#include "dungeon/TerrainGrid.hpp"
#include <functional>
#include <ostream>

namespace DelveEngine {

enum class MoveOutcome : uint8_t {
    Moved,     // Footprint relocated one cell
    Blocked,   // Wall, grid edge, or an entity that cannot be interacted with
    Interact   // Bumped into a mob, door or stairs
};

inline std::ostream& operator<<(std::ostream& os, const MoveOutcome& outcome) {
    switch (outcome) {
        case MoveOutcome::Moved: return os << "Moved";
        case MoveOutcome::Blocked: return os << "Blocked";
        case MoveOutcome::Interact: return os << "Interact";
        default: return os << "UNKNOWN";
    }
}

struct StepResult {
    MoveOutcome outcome{MoveOutcome::Blocked};
    EntityId target{INVALID_ENTITY_ID}; // Set for Interact
    GridPosition position{};            // Mover origin after the step
};

/**
 * @brief Walkability and overlap checks shared by spawning and movement
 *
 * Holds references only; the terrain and occupancy grid must outlive it.
 */
class MovementValidator {
public:
    /// Resolves an occupant id to its payload; nullptr for unknown ids
    using EntityLookup = std::function<const DungeonEntity*(EntityId)>;

    MovementValidator(const ITerrainOracle& terrain, const GridOccupancy& occupancy)
        : m_terrain(terrain), m_occupancy(occupancy) {}

    /**
     * @brief Whether the footprint may sit at pos
     *
     * True iff every covered cell is in bounds, walkable, and either free or
     * already held by mover. Pass INVALID_ENTITY_ID for a fresh placement.
     */
    bool canOccupy(GridPosition pos, GridSize size, EntityId mover = INVALID_ENTITY_ID) const;

    /// Walkable, spawn-eligible and unoccupied
    bool isCandidateCell(int x, int y) const;

    /**
     * @brief Decide what a one-cell step of mover would do
     *
     * Does not mutate anything; the caller commits a Moved result through
     * GridOccupancy::relocate.
     */
    StepResult evaluateStep(EntityId mover, Direction direction,
                            const EntityLookup& lookup) const;

    /**
     * @brief Resolve a one-cell step and commit it when the way is clear
     */
    StepResult tryStep(GridOccupancy& occupancy, EntityId mover, Direction direction,
                       const EntityLookup& lookup) const;

private:
    const ITerrainOracle& m_terrain;
    const GridOccupancy& m_occupancy;
};

} // namespace DelveEngine

#endif // MOVEMENT_VALIDATOR_HPP
