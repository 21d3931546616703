/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "dungeon/GridOccupancy.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <sstream>

namespace DelveEngine {

namespace {

std::string describe(GridPosition pos, GridSize size) {
    std::ostringstream oss;
    oss << pos << " " << size;
    return oss.str();
}

} // namespace

GridOccupancy::GridOccupancy(int width, int height)
    : m_width(std::max(0, width)), m_height(std::max(0, height)),
      m_cells(static_cast<size_t>(m_width) * static_cast<size_t>(m_height),
              INVALID_ENTITY_ID) {}

bool GridOccupancy::footprintInBounds(GridPosition pos, GridSize size) const {
    if (!size.isValid()) {
        return false;
    }
    // Subtract instead of add: pos + size can overflow for hostile input
    return pos.x >= 0 && pos.y >= 0 && size.width <= m_width - pos.x &&
           size.height <= m_height - pos.y;
}

OccupancyResult GridOccupancy::occupy(GridPosition pos, GridSize size, EntityId entity) {
    if (entity == INVALID_ENTITY_ID || !footprintInBounds(pos, size)) {
        OCCUPANCY_WARN("Rejected footprint " + describe(pos, size) + " for entity " +
                       std::to_string(entity));
        return OccupancyResult::InvalidFootprint;
    }

    if (contains(entity)) {
        OCCUPANCY_WARN("Entity " + std::to_string(entity) + " is already placed");
        return OccupancyResult::InvalidFootprint;
    }

    const Footprint footprint{pos, size};

    // Validate every cell before writing any of them
    EntityId blocker = INVALID_ENTITY_ID;
    footprint.forEachCell([&](int x, int y) {
        if (blocker == INVALID_ENTITY_ID) {
            blocker = m_cells[cellIndex(x, y)];
        }
    });

    if (blocker != INVALID_ENTITY_ID) {
        OCCUPANCY_ERROR("Occupancy conflict placing entity " + std::to_string(entity) + " at " +
                        describe(pos, size) + ": cell held by entity " +
                        std::to_string(blocker));
        return OccupancyResult::Conflict;
    }

    footprint.forEachCell([&](int x, int y) { m_cells[cellIndex(x, y)] = entity; });
    m_occupiedCells += static_cast<size_t>(size.cellCount());
    m_entities.emplace(entity, Registration{footprint, size.cellCount()});

    return OccupancyResult::Success;
}

void GridOccupancy::releaseCell(int x, int y) {
    EntityId& cell = m_cells[cellIndex(x, y)];
    if (cell == INVALID_ENTITY_ID) {
        return;
    }

    auto it = m_entities.find(cell);
    if (it != m_entities.end() && --it->second.remainingCells <= 0) {
        m_entities.erase(it);
    }

    cell = INVALID_ENTITY_ID;
    --m_occupiedCells;
}

OccupancyResult GridOccupancy::vacate(GridPosition pos, GridSize size) {
    if (!footprintInBounds(pos, size)) {
        OCCUPANCY_WARN("Rejected vacate of " + describe(pos, size));
        return OccupancyResult::InvalidFootprint;
    }

    Footprint{pos, size}.forEachCell([this](int x, int y) { releaseCell(x, y); });
    return OccupancyResult::Success;
}

bool GridOccupancy::remove(EntityId entity) {
    auto it = m_entities.find(entity);
    if (it == m_entities.end()) {
        return false;
    }

    const Footprint footprint = it->second.footprint;
    footprint.forEachCell([&](int x, int y) {
        if (m_cells[cellIndex(x, y)] == entity) {
            releaseCell(x, y);
        }
    });
    // Registration is erased by releaseCell once the last cell goes
    m_entities.erase(entity);
    return true;
}

OccupancyResult GridOccupancy::relocate(EntityId entity, GridPosition newPos) {
    auto it = m_entities.find(entity);
    if (it == m_entities.end()) {
        OCCUPANCY_WARN("Cannot relocate unplaced entity " + std::to_string(entity));
        return OccupancyResult::InvalidFootprint;
    }

    const Footprint oldFootprint = it->second.footprint;
    const Footprint newFootprint{newPos, oldFootprint.size};

    if (!footprintInBounds(newPos, oldFootprint.size)) {
        return OccupancyResult::InvalidFootprint;
    }

    EntityId blocker = INVALID_ENTITY_ID;
    newFootprint.forEachCell([&](int x, int y) {
        EntityId current = m_cells[cellIndex(x, y)];
        if (blocker == INVALID_ENTITY_ID && current != INVALID_ENTITY_ID && current != entity) {
            blocker = current;
        }
    });

    if (blocker != INVALID_ENTITY_ID) {
        OCCUPANCY_ERROR("Occupancy conflict moving entity " + std::to_string(entity) + " to " +
                        describe(newPos, oldFootprint.size) + ": cell held by entity " +
                        std::to_string(blocker));
        return OccupancyResult::Conflict;
    }

    size_t released = 0;
    oldFootprint.forEachCell([&](int x, int y) {
        EntityId& cell = m_cells[cellIndex(x, y)];
        if (cell == entity) {
            cell = INVALID_ENTITY_ID;
            ++released;
        }
    });
    m_occupiedCells -= released;

    newFootprint.forEachCell([&](int x, int y) { m_cells[cellIndex(x, y)] = entity; });
    m_occupiedCells += static_cast<size_t>(newFootprint.size.cellCount());

    it->second = Registration{newFootprint, newFootprint.size.cellCount()};
    return OccupancyResult::Success;
}

EntityId GridOccupancy::entityAt(int x, int y) const {
    if (!inBounds(x, y)) {
        return INVALID_ENTITY_ID;
    }
    return m_cells[cellIndex(x, y)];
}

bool GridOccupancy::isAreaFree(GridPosition pos, GridSize size) const {
    if (!footprintInBounds(pos, size)) {
        return false;
    }
    bool free = true;
    Footprint{pos, size}.forEachCell([&](int x, int y) {
        free = free && m_cells[cellIndex(x, y)] == INVALID_ENTITY_ID;
    });
    return free;
}

GridOccupancy::NeighborList GridOccupancy::adjacentOccupants(GridPosition pos,
                                                            GridSize size) const {
    NeighborList result;
    NeighborList self;
    if (!footprintInBounds(pos, size)) {
        return result;
    }

    const Footprint footprint{pos, size};
    footprint.forEachCell([&](int x, int y) {
        EntityId id = entityAt(x, y);
        if (id != INVALID_ENTITY_ID &&
            std::find(self.begin(), self.end(), id) == self.end()) {
            self.push_back(id);
        }
    });

    auto consider = [&](int x, int y) {
        EntityId id = entityAt(x, y);
        if (id == INVALID_ENTITY_ID) {
            return;
        }
        if (std::find(self.begin(), self.end(), id) != self.end()) {
            return;
        }
        if (std::find(result.begin(), result.end(), id) == result.end()) {
            result.push_back(id);
        }
    };

    for (int x = pos.x; x < pos.x + size.width; ++x) {
        consider(x, pos.y - 1);
    }
    for (int y = pos.y; y < pos.y + size.height; ++y) {
        consider(pos.x - 1, y);
        consider(pos.x + size.width, y);
    }
    for (int x = pos.x; x < pos.x + size.width; ++x) {
        consider(x, pos.y + size.height);
    }

    return result;
}

std::optional<Footprint> GridOccupancy::footprintOf(EntityId entity) const {
    auto it = m_entities.find(entity);
    if (it == m_entities.end()) {
        return std::nullopt;
    }
    return it->second.footprint;
}

std::vector<std::pair<EntityId, Footprint>> GridOccupancy::placements() const {
    std::vector<std::pair<EntityId, Footprint>> result;
    result.reserve(m_entities.size());
    for (const auto& [id, registration] : m_entities) {
        result.emplace_back(id, registration.footprint);
    }
    return result;
}

void GridOccupancy::clear() {
    std::fill(m_cells.begin(), m_cells.end(), INVALID_ENTITY_ID);
    m_occupiedCells = 0;
    m_entities.clear();
}

} // namespace DelveEngine
