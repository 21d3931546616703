/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "dungeon/MovementValidator.hpp"
#include "core/Logger.hpp"

namespace DelveEngine {

namespace {

bool isInteractable(const DungeonEntity& entity) {
    return std::holds_alternative<MobEntity>(entity) ||
           std::holds_alternative<DoorEntity>(entity) ||
           std::holds_alternative<StairsEntity>(entity);
}

} // namespace

bool MovementValidator::canOccupy(GridPosition pos, GridSize size, EntityId mover) const {
    if (!m_occupancy.footprintInBounds(pos, size)) {
        return false;
    }

    bool allowed = true;
    Footprint{pos, size}.forEachCell([&](int x, int y) {
        if (!allowed) {
            return;
        }
        if (!m_terrain.isWalkable(x, y)) {
            allowed = false;
            return;
        }
        EntityId occupant = m_occupancy.entityAt(x, y);
        if (occupant != INVALID_ENTITY_ID && occupant != mover) {
            allowed = false;
        }
    });
    return allowed;
}

bool MovementValidator::isCandidateCell(int x, int y) const {
    return m_terrain.isWalkable(x, y) && m_terrain.canSpawnEntity(x, y) &&
           !m_occupancy.isOccupied(x, y);
}

StepResult MovementValidator::evaluateStep(EntityId mover, Direction direction,
                                           const EntityLookup& lookup) const {
    StepResult result;

    auto footprint = m_occupancy.footprintOf(mover);
    if (!footprint) {
        MOVEMENT_WARN("Step requested for unplaced entity " + std::to_string(mover));
        return result;
    }

    result.position = footprint->origin;
    const GridPosition target = step(footprint->origin, direction);

    if (!m_occupancy.footprintInBounds(target, footprint->size)) {
        return result;
    }

    // First foreign occupant in the destination decides the interaction
    EntityId blocker = INVALID_ENTITY_ID;
    bool walkable = true;
    Footprint{target, footprint->size}.forEachCell([&](int x, int y) {
        walkable = walkable && m_terrain.isWalkable(x, y);
        EntityId occupant = m_occupancy.entityAt(x, y);
        if (blocker == INVALID_ENTITY_ID && occupant != INVALID_ENTITY_ID && occupant != mover) {
            blocker = occupant;
        }
    });

    if (blocker != INVALID_ENTITY_ID) {
        const DungeonEntity* entity = lookup ? lookup(blocker) : nullptr;
        if (entity && isInteractable(*entity)) {
            result.outcome = MoveOutcome::Interact;
            result.target = blocker;
        }
        return result;
    }

    if (!walkable) {
        return result;
    }

    result.outcome = MoveOutcome::Moved;
    result.position = target;
    return result;
}

StepResult MovementValidator::tryStep(GridOccupancy& occupancy, EntityId mover,
                                      Direction direction, const EntityLookup& lookup) const {
    if (&occupancy != &m_occupancy) {
        MOVEMENT_ERROR("tryStep called with an occupancy grid this validator does not watch");
        return StepResult{};
    }

    StepResult result = evaluateStep(mover, direction, lookup);
    if (result.outcome != MoveOutcome::Moved) {
        return result;
    }

    if (occupancy.relocate(mover, result.position) != OccupancyResult::Success) {
        result.outcome = MoveOutcome::Blocked;
        if (auto footprint = occupancy.footprintOf(mover)) {
            result.position = footprint->origin;
        }
    }
    return result;
}

} // namespace DelveEngine
