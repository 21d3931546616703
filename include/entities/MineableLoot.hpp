/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MINEABLE_LOOT_HPP
#define MINEABLE_LOOT_HPP

#include "combat/LootTable.hpp"
#include "dungeon/DungeonEntity.hpp"
#include <boost/container/flat_map.hpp>
#include <optional>
#include <string>

namespace DelveEngine {

class JsonValue;

/// Drops and mining experience for one kind of rock
struct RockYield {
    LootTable loot;
    int miningXp{0};
};

/**
 * @brief Loot tables for the non-mob entities a player can break open
 *
 * One table per RockType plus a single chest table. Rocks also grant mining
 * experience; chests grant none. A rock type without a yield drops nothing.
 */
class MineableLoot {
public:
    MineableLoot() = default;

    /// Built-in tables matching res/data/mineables.json
    static MineableLoot standard();

    /**
     * @brief Parse {"rocks": {"Coal": {"mining_xp": n, "loot": [...]}, ...},
     * "chest": {"loot": [...]}}
     * @throws std::invalid_argument on an unknown rock name or malformed table
     */
    static MineableLoot fromJson(const JsonValue& root);

    /**
     * @brief Load a mineables file
     * @return std::nullopt (logged) if the file is missing, unparsable or malformed
     */
    static std::optional<MineableLoot> loadFromFile(const std::string& path);

    /// @throws std::invalid_argument on negative mining xp
    MineableLoot& withRock(RockType type, LootTable loot, int miningXp);
    MineableLoot& withChest(LootTable loot);

    const RockYield* getRockYield(RockType type) const;
    const LootTable& getChestLoot() const { return m_chest; }
    size_t rockCount() const { return m_rocks.size(); }

private:
    boost::container::flat_map<RockType, RockYield> m_rocks;
    LootTable m_chest;
};

} // namespace DelveEngine

#endif // MINEABLE_LOOT_HPP
