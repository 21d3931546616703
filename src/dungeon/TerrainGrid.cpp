/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "dungeon/TerrainGrid.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace DelveEngine {

namespace {

std::optional<TileType> tileFromGlyph(char glyph) {
    switch (glyph) {
        case '#': return TileType::Wall;
        case '.': return TileType::Floor;
        case ',': return TileType::Corridor;
        case 'D': return TileType::Door;
        case 'S': return TileType::SpawnPoint;
        case ' ': return TileType::Empty;
        default: return std::nullopt;
    }
}

} // namespace

TerrainGrid::TerrainGrid(int width, int height, TileType fill)
    : m_width(std::max(0, width)), m_height(std::max(0, height)),
      m_tiles(static_cast<size_t>(m_width) * static_cast<size_t>(m_height), fill) {}

std::unique_ptr<TerrainGrid> TerrainGrid::fromAscii(const std::vector<std::string>& rows,
                                                    std::string* error) {
    size_t width = 0;
    for (const auto& row : rows) {
        width = std::max(width, row.size());
    }

    if (rows.empty() || width == 0) {
        if (error) {
            *error = "map has no rows";
        }
        TERRAIN_ERROR("TerrainGrid::fromAscii - map has no rows");
        return nullptr;
    }

    auto grid = std::make_unique<TerrainGrid>(static_cast<int>(width),
                                              static_cast<int>(rows.size()), TileType::Empty);

    for (size_t y = 0; y < rows.size(); ++y) {
        const std::string& row = rows[y];
        for (size_t x = 0; x < row.size(); ++x) {
            auto tile = tileFromGlyph(row[x]);
            if (!tile) {
                std::string message = "unknown glyph '" + std::string(1, row[x]) +
                                      "' at (" + std::to_string(x) + ", " +
                                      std::to_string(y) + ")";
                if (error) {
                    *error = message;
                }
                TERRAIN_ERROR("TerrainGrid::fromAscii - " + message);
                return nullptr;
            }
            grid->setTile(static_cast<int>(x), static_cast<int>(y), *tile);
        }
    }

    TERRAIN_DEBUG("Parsed " + std::to_string(width) + "x" + std::to_string(rows.size()) +
                  " terrain with " + std::to_string(grid->countTiles(TileType::Floor)) +
                  " floor tiles");
    return grid;
}

std::unique_ptr<TerrainGrid> TerrainGrid::openFloor(int width, int height) {
    return std::make_unique<TerrainGrid>(width, height, TileType::Floor);
}

std::unique_ptr<TerrainGrid> TerrainGrid::walledRoom(int width, int height) {
    auto grid = std::make_unique<TerrainGrid>(width, height, TileType::Floor);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (x == 0 || y == 0 || x == width - 1 || y == height - 1) {
                grid->setTile(x, y, TileType::Wall);
            }
        }
    }
    return grid;
}

bool TerrainGrid::isWalkable(int x, int y) const {
    return inBounds(x, y) && isWalkableTile(getTile(x, y));
}

bool TerrainGrid::canSpawnEntity(int x, int y) const {
    return inBounds(x, y) && isSpawnableTile(getTile(x, y));
}

std::vector<GridPosition> TerrainGrid::getDoorCells() const {
    std::vector<GridPosition> doors;
    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            if (getTile(x, y) == TileType::Door) {
                doors.emplace_back(x, y);
            }
        }
    }
    return doors;
}

TileType TerrainGrid::getTile(int x, int y) const {
    if (!inBounds(x, y)) {
        return TileType::Empty;
    }
    return m_tiles[static_cast<size_t>(y) * static_cast<size_t>(m_width) +
                   static_cast<size_t>(x)];
}

void TerrainGrid::setTile(int x, int y, TileType type) {
    if (!inBounds(x, y)) {
        return;
    }
    m_tiles[static_cast<size_t>(y) * static_cast<size_t>(m_width) + static_cast<size_t>(x)] =
        type;
}

std::optional<GridPosition> TerrainGrid::getEntrance() const {
    for (int y = 0; y < m_height; ++y) {
        for (int x = 0; x < m_width; ++x) {
            if (getTile(x, y) == TileType::SpawnPoint) {
                return GridPosition{x, y};
            }
        }
    }
    return std::nullopt;
}

size_t TerrainGrid::countTiles(TileType type) const {
    return static_cast<size_t>(std::count(m_tiles.begin(), m_tiles.end(), type));
}

char TerrainGrid::glyphFor(TileType type) {
    switch (type) {
        case TileType::Empty: return ' ';
        case TileType::Wall: return '#';
        case TileType::Floor: return '.';
        case TileType::Corridor: return ',';
        case TileType::Door: return 'D';
        case TileType::SpawnPoint: return 'S';
    }
    return '?';
}

} // namespace DelveEngine
