/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/FloorCatalog.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <stdexcept>

namespace DelveEngine {

namespace {

FloorDefinition floorFromJson(const JsonValue& floor) {
    if (!floor.isObject() || !floor["name"].isString()) {
        throw std::invalid_argument("Floor entry without a string name: " + floor.toString());
    }

    FloorDefinition def;
    def.name = floor["name"].asString();
    def.isFinal = floor.getBool("is_final", false);
    def.difficulty = floor.getNumber("difficulty", 1.0);
    if (def.difficulty <= 0.0) {
        throw std::invalid_argument("Floor '" + def.name + "' needs a positive difficulty");
    }

    const JsonArray* map = floor["map"].tryAsArray();
    if (!map || map->empty()) {
        throw std::invalid_argument("Floor '" + def.name + "' needs a non-empty 'map' array");
    }
    for (const auto& row : *map) {
        if (!row.isString()) {
            throw std::invalid_argument("Floor '" + def.name + "' has a non-string map row");
        }
        def.rows.push_back(row.asString());
    }

    std::string error;
    if (!TerrainGrid::fromAscii(def.rows, &error)) {
        throw std::invalid_argument("Floor '" + def.name + "': " + error);
    }

    if (floor.getBool("standard", false)) {
        def.spawnTable = SpawnTable::standardFloor(def.isFinal);
    } else if (floor.hasKey("spawns")) {
        def.spawnTable = SpawnTable::fromJson(floor["spawns"]);
    }
    return def;
}

} // namespace

std::unique_ptr<TerrainGrid> FloorDefinition::buildTerrain() const {
    std::string error;
    auto terrain = TerrainGrid::fromAscii(rows, &error);
    if (!terrain) {
        FLOOR_ERROR("FloorDefinition::buildTerrain - " + name + ": " + error);
    }
    return terrain;
}

FloorCatalog FloorCatalog::fromJson(const JsonValue& root) {
    const JsonArray* floors = root["floors"].tryAsArray();
    if (!floors) {
        throw std::invalid_argument("Floor catalog JSON needs a 'floors' array");
    }

    FloorCatalog catalog;
    for (const auto& floor : *floors) {
        FloorDefinition def = floorFromJson(floor);
        if (catalog.find(def.name)) {
            throw std::invalid_argument("Duplicate floor name '" + def.name + "'");
        }
        catalog.m_floors.push_back(std::move(def));
    }
    return catalog;
}

std::optional<FloorCatalog> FloorCatalog::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        FLOOR_ERROR("FloorCatalog::loadFromFile - Failed to load " + path + ": " +
                    reader.getLastError());
        return std::nullopt;
    }

    try {
        FloorCatalog catalog = fromJson(reader.getRoot());
        FLOOR_INFO("Loaded " + std::to_string(catalog.size()) + " floors from " + path);
        return catalog;
    } catch (const std::invalid_argument& e) {
        FLOOR_ERROR("FloorCatalog::loadFromFile - " + path + ": " + e.what());
        return std::nullopt;
    }
}

const FloorDefinition* FloorCatalog::find(const std::string& name) const {
    auto it = std::find_if(m_floors.begin(), m_floors.end(),
                           [&name](const FloorDefinition& def) { return def.name == name; });
    return it != m_floors.end() ? &*it : nullptr;
}

} // namespace DelveEngine
