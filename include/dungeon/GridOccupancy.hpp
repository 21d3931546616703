/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GRID_OCCUPANCY_HPP
#define GRID_OCCUPANCY_HPP

#include "dungeon/GridTypes.hpp"
#include <boost/container/flat_map.hpp>
#include <boost/container/small_vector.hpp>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

namespace DelveEngine {

enum class OccupancyResult : uint8_t {
    Success,
    Conflict,         // A covered cell belongs to another entity
    InvalidFootprint  // Out of bounds, non-positive size, or bad entity id
};

inline std::ostream& operator<<(std::ostream& os, const OccupancyResult& result) {
    switch (result) {
        case OccupancyResult::Success: return os << "Success";
        case OccupancyResult::Conflict: return os << "Conflict";
        case OccupancyResult::InvalidFootprint: return os << "InvalidFootprint";
        default: return os << "UNKNOWN";
    }
}

/**
 * @brief Bounded cell map recording which entity covers each grid cell
 *
 * Every cell stores the id of the entity covering it (INVALID_ENTITY_ID when
 * free). Multi-cell entities map all of their cells to the same id. Mutations
 * are all-or-nothing: a rejected occupy/relocate leaves every cell untouched,
 * so two footprints can never overlap.
 */
class GridOccupancy {
public:
    using NeighborList = boost::container::small_vector<EntityId, 8>;

    GridOccupancy(int width, int height);

    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }

    /**
     * @brief Register an entity over the footprint at pos
     * @return Success, Conflict if any cell is taken, InvalidFootprint if the
     *         footprint leaves the grid or the id is invalid/already placed
     */
    OccupancyResult occupy(GridPosition pos, GridSize size, EntityId entity);

    /**
     * @brief Clear every cell of the footprint
     *
     * Already-empty cells are left as they are. An entity whose last cell is
     * cleared here is forgotten entirely.
     */
    OccupancyResult vacate(GridPosition pos, GridSize size);

    /// Clear every cell owned by the entity; false if it is not placed
    bool remove(EntityId entity);

    /**
     * @brief Move a placed entity's footprint to a new origin
     *
     * Cells already owned by the entity do not count as conflicts, so a
     * multi-cell entity can shift by one cell. On failure the original
     * placement is kept.
     */
    OccupancyResult relocate(EntityId entity, GridPosition newPos);

    bool isOccupied(int x, int y) const { return entityAt(x, y) != INVALID_ENTITY_ID; }
    EntityId entityAt(int x, int y) const;

    /// True if every cell of the footprint is inside the grid and free
    bool isAreaFree(GridPosition pos, GridSize size) const;

    /**
     * @brief Distinct occupants of the 4-way neighbour ring of a footprint
     *
     * Scans the row above, then the left and right flank row by row, then the
     * row below. Whatever occupies the footprint itself is excluded.
     */
    NeighborList adjacentOccupants(GridPosition pos, GridSize size) const;

    std::optional<Footprint> footprintOf(EntityId entity) const;
    bool contains(EntityId entity) const { return m_entities.count(entity) != 0; }

    size_t getFreeCellCount() const { return m_cells.size() - m_occupiedCells; }
    size_t getOccupiedCellCount() const { return m_occupiedCells; }
    size_t getEntityCount() const { return m_entities.size(); }

    /// (id, footprint) for every placed entity in ascending id order
    std::vector<std::pair<EntityId, Footprint>> placements() const;

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < m_width && y < m_height;
    }

    bool footprintInBounds(GridPosition pos, GridSize size) const;

    void clear();

private:
    struct Registration {
        Footprint footprint;
        int remainingCells{0};
    };

    size_t cellIndex(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x);
    }

    void releaseCell(int x, int y);

    int m_width;
    int m_height;
    std::vector<EntityId> m_cells; // row-major
    size_t m_occupiedCells{0};
    boost::container::flat_map<EntityId, Registration> m_entities;
};

} // namespace DelveEngine

#endif // GRID_OCCUPANCY_HPP
