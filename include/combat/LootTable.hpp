/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOOT_TABLE_HPP
#define LOOT_TABLE_HPP

#include "utils/IntRange.hpp"
#include "utils/RandomSource.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace DelveEngine {

class JsonValue;

/**
 * @brief One independently rolled drop: numerator/denominator chance of
 * yielding a quantity in the inclusive range
 */
struct LootEntry {
    std::string itemId;
    int numerator{0};
    int denominator{1};
    IntRange quantity{1, 1};

    double dropChance() const {
        return static_cast<double>(numerator) / static_cast<double>(denominator);
    }
};

struct LootDrop {
    std::string itemId;
    int quantity{0};

    bool operator==(const LootDrop& other) const {
        return itemId == other.itemId && quantity == other.quantity;
    }
};

inline std::ostream& operator<<(std::ostream& os, const LootDrop& drop) {
    return os << drop.itemId << " x" << drop.quantity;
}

/**
 * @brief Independent-trial drop resolver
 *
 * Every entry is tested on its own: a uniform draw in [1, denominator] drops
 * the entry when it is <= numerator. Magic find adds whole extra attempts
 * (one per 100 points, plus a partial chance for the remainder); an entry
 * still drops at most once per roll, keeping its largest quantity.
 */
class LootTable {
public:
    LootTable() = default;

    /**
     * @brief Add an entry
     * @throws std::invalid_argument if the chance or quantity range is malformed
     * @return false (and logs) if the item id is already in the table
     */
    bool addEntry(const LootEntry& entry);

    /// Builder-style add; same validation as addEntry
    LootTable& with(const std::string& itemId, int numerator, int denominator,
                    IntRange quantity);

    /**
     * @brief Roll every entry once (plus magic-find bonus attempts)
     * @param magicFind Magic find percentage; <= 0 means a single attempt
     */
    std::vector<LootDrop> roll(int magicFind, RandomSource& rng) const;

    /// Extra attempts granted by magic find; draws from rng only for a partial remainder
    static int bonusRolls(int magicFind, RandomSource& rng);

    /// Checks an entry without adding it; throws std::invalid_argument
    static void validateEntry(const LootEntry& entry);

    /**
     * @brief Build from a JSON array of {"item", "numerator", "denominator",
     * "quantity": [min, max]} objects
     * @throws std::invalid_argument on a malformed entry
     */
    static LootTable fromJson(const JsonValue& json);

    const LootEntry* findEntry(const std::string& itemId) const;
    const std::vector<LootEntry>& getEntries() const { return m_entries; }
    bool isEmpty() const { return m_entries.empty(); }
    size_t size() const { return m_entries.size(); }

private:
    std::vector<LootEntry> m_entries;
};

} // namespace DelveEngine

#endif // LOOT_TABLE_HPP
