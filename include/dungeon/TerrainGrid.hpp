/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TERRAIN_GRID_HPP
#define TERRAIN_GRID_HPP

#include "dungeon/GridTypes.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace DelveEngine {

/**
 * @brief Read-only terrain queries consumed by movement and spawning
 *
 * Out-of-range coordinates must answer false for both predicates.
 */
class ITerrainOracle {
public:
    virtual ~ITerrainOracle() = default;

    virtual int getWidth() const = 0;
    virtual int getHeight() const = 0;
    virtual bool isWalkable(int x, int y) const = 0;
    virtual bool canSpawnEntity(int x, int y) const = 0;

    /// Cells that carry door metadata, row-major
    virtual std::vector<GridPosition> getDoorCells() const = 0;

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < getWidth() && y < getHeight();
    }
};

enum class TileType : uint8_t {
    Empty,       // Not rendered, not walkable
    Wall,
    Floor,       // Walkable, spawn-eligible
    Corridor,    // Walkable, never spawn-eligible
    Door,        // Walkable, carries door metadata
    SpawnPoint   // Player entrance; walkable, kept clear of entities
};

inline std::ostream& operator<<(std::ostream& os, const TileType& type) {
    switch (type) {
        case TileType::Empty: return os << "Empty";
        case TileType::Wall: return os << "Wall";
        case TileType::Floor: return os << "Floor";
        case TileType::Corridor: return os << "Corridor";
        case TileType::Door: return os << "Door";
        case TileType::SpawnPoint: return os << "SpawnPoint";
        default: return os << "UNKNOWN";
    }
}

constexpr bool isWalkableTile(TileType type) {
    return type == TileType::Floor || type == TileType::Corridor ||
           type == TileType::Door || type == TileType::SpawnPoint;
}

constexpr bool isSpawnableTile(TileType type) {
    return type == TileType::Floor;
}

/**
 * @brief Tile-based terrain oracle built from an ASCII floor map
 *
 * Glyphs: '#' wall, '.' floor, ',' corridor, 'D' door, 'S' spawn point,
 * ' ' empty. Rows shorter than the widest row are padded with Empty.
 */
class TerrainGrid : public ITerrainOracle {
public:
    TerrainGrid(int width, int height, TileType fill = TileType::Wall);

    /**
     * @brief Parse an ASCII map
     * @param rows One string per row, top to bottom
     * @param error Receives a description of the first bad glyph
     * @return nullptr on an empty map or an unknown glyph
     */
    static std::unique_ptr<TerrainGrid> fromAscii(const std::vector<std::string>& rows,
                                                  std::string* error = nullptr);

    /// Fully walkable, spawn-eligible rectangle
    static std::unique_ptr<TerrainGrid> openFloor(int width, int height);

    /// Floor interior surrounded by a one-cell wall border
    static std::unique_ptr<TerrainGrid> walledRoom(int width, int height);

    // ITerrainOracle
    int getWidth() const override { return m_width; }
    int getHeight() const override { return m_height; }
    bool isWalkable(int x, int y) const override;
    bool canSpawnEntity(int x, int y) const override;
    std::vector<GridPosition> getDoorCells() const override;

    TileType getTile(int x, int y) const;
    void setTile(int x, int y, TileType type);

    /// First spawn point in row-major order, if the map has one
    std::optional<GridPosition> getEntrance() const;

    size_t countTiles(TileType type) const;

    static char glyphFor(TileType type);

private:
    int m_width;
    int m_height;
    std::vector<TileType> m_tiles; // row-major
};

} // namespace DelveEngine

#endif // TERRAIN_GRID_HPP
