/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/MineableLoot.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <stdexcept>

namespace DelveEngine {

namespace {

// Every rock carries the same rare upgrade stone on top of its ore
LootTable rockTable(const std::string& ore, IntRange quantity) {
    return LootTable()
        .with(ore, 1, 1, quantity)
        .with("quality_upgrade_stone", 1, 100, IntRange{1, 1});
}

std::optional<RockType> parseRockType(const std::string& name) {
    for (RockType type : ALL_ROCK_TYPES) {
        if (name == rockTypeName(type)) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace

MineableLoot MineableLoot::standard() {
    MineableLoot loot;
    loot.withRock(RockType::Coal, rockTable("coal", IntRange{1, 2}), 3)
        .withRock(RockType::Copper, rockTable("copper_ore", IntRange{1, 3}), 5)
        .withRock(RockType::Iron, rockTable("iron_ore", IntRange{1, 3}), 8)
        .withRock(RockType::Gold, rockTable("gold_ore", IntRange{1, 3}), 12)
        .withChest(LootTable()
                       .with("health_potion", 1, 2, IntRange{1, 2})
                       .with("copper_ore", 1, 3, IntRange{1, 4})
                       .with("quality_upgrade_stone", 1, 20, IntRange{1, 1}));
    return loot;
}

MineableLoot& MineableLoot::withRock(RockType type, LootTable loot, int miningXp) {
    if (miningXp < 0) {
        throw std::invalid_argument(std::string("Rock '") + rockTypeName(type) +
                                    "' has negative mining xp");
    }
    m_rocks[type] = RockYield{std::move(loot), miningXp};
    return *this;
}

MineableLoot& MineableLoot::withChest(LootTable loot) {
    m_chest = std::move(loot);
    return *this;
}

const RockYield* MineableLoot::getRockYield(RockType type) const {
    auto it = m_rocks.find(type);
    return it != m_rocks.end() ? &it->second : nullptr;
}

MineableLoot MineableLoot::fromJson(const JsonValue& root) {
    const JsonObject* rocks = root["rocks"].tryAsObject();
    if (!rocks) {
        throw std::invalid_argument("Mineables JSON needs a 'rocks' object");
    }

    MineableLoot loot;
    for (const auto& [name, rock] : *rocks) {
        const auto type = parseRockType(name);
        if (!type) {
            throw std::invalid_argument("Unknown rock type '" + name + "'");
        }
        if (!rock.isObject()) {
            throw std::invalid_argument("Rock '" + name + "' must be an object");
        }
        const JsonValue& xp = rock["mining_xp"];
        if (!xp.isNull() && !xp.isNumber()) {
            throw std::invalid_argument("Rock '" + name + "' needs a numeric 'mining_xp'");
        }
        loot.withRock(*type, LootTable::fromJson(rock["loot"]), xp.isNull() ? 0 : xp.asInt());
    }

    const JsonValue& chest = root["chest"];
    if (!chest.isNull()) {
        if (!chest.isObject()) {
            throw std::invalid_argument("Mineables 'chest' must be an object");
        }
        loot.withChest(LootTable::fromJson(chest["loot"]));
    }
    return loot;
}

std::optional<MineableLoot> MineableLoot::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        REGISTRY_ERROR("MineableLoot::loadFromFile - Failed to load " + path + ": " +
                       reader.getLastError());
        return std::nullopt;
    }

    try {
        MineableLoot loot = fromJson(reader.getRoot());
        REGISTRY_INFO("Loaded " + std::to_string(loot.rockCount()) + " rock tables from " +
                      path);
        return loot;
    } catch (const std::invalid_argument& e) {
        REGISTRY_ERROR("MineableLoot::loadFromFile - " + path + ": " + e.what());
        return std::nullopt;
    }
}

} // namespace DelveEngine
