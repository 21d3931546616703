/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FLOOR_CATALOG_HPP
#define FLOOR_CATALOG_HPP

#include "dungeon/SpawnTable.hpp"
#include "dungeon/TerrainGrid.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace DelveEngine {

class JsonValue;

/**
 * @brief One named floor: its ASCII map plus what spawns on it
 *
 * A definition marked "standard" uses SpawnTable::standardFloor instead of
 * its own rule list.
 */
struct FloorDefinition {
    std::string name;
    std::vector<std::string> rows;
    SpawnTable spawnTable;
    bool isFinal{false};
    double difficulty{1.0}; // Mob stat multiplier

    /// Fresh terrain for a new FloorState; nullptr if the map does not parse
    std::unique_ptr<TerrainGrid> buildTerrain() const;
};

class FloorCatalog {
public:
    FloorCatalog() = default;

    /**
     * @brief Parse {"floors": [...]}
     * @throws std::invalid_argument on malformed floors or duplicate names
     */
    static FloorCatalog fromJson(const JsonValue& root);

    static std::optional<FloorCatalog> loadFromFile(const std::string& path);

    const FloorDefinition* find(const std::string& name) const;
    const std::vector<FloorDefinition>& getFloors() const { return m_floors; }
    size_t size() const { return m_floors.size(); }

private:
    std::vector<FloorDefinition> m_floors; // file order
};

} // namespace DelveEngine

#endif // FLOOR_CATALOG_HPP
