/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "combat/LootTable.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>

namespace DelveEngine {

namespace {

std::optional<IntRange> rangeFromJson(const JsonValue& json) {
    if (json.isNumber()) {
        return IntRange::exactly(json.asInt());
    }
    if (json.isArray() && json.size() == 2 && json[0].isNumber() && json[1].isNumber()) {
        return IntRange{json[0].asInt(), json[1].asInt()};
    }
    return std::nullopt;
}

} // namespace

void LootTable::validateEntry(const LootEntry& entry) {
    if (entry.itemId.empty()) {
        throw std::invalid_argument("Loot entry has an empty item id");
    }
    if (entry.denominator <= 0) {
        throw std::invalid_argument("Loot entry '" + entry.itemId +
                                    "' has a non-positive denominator");
    }
    if (entry.numerator < 0 || entry.numerator > entry.denominator) {
        throw std::invalid_argument("Loot entry '" + entry.itemId + "' has chance " +
                                    std::to_string(entry.numerator) + "/" +
                                    std::to_string(entry.denominator) +
                                    " outside [0, 1]");
    }
    if (entry.quantity.min < 1 || !entry.quantity.isValid()) {
        throw std::invalid_argument("Loot entry '" + entry.itemId +
                                    "' has an invalid quantity range " +
                                    std::to_string(entry.quantity.min) + ".." +
                                    std::to_string(entry.quantity.max));
    }
}

bool LootTable::addEntry(const LootEntry& entry) {
    validateEntry(entry);

    if (findEntry(entry.itemId)) {
        LOOT_ERROR("Item '" + entry.itemId + "' is already in the loot table");
        return false;
    }

    m_entries.push_back(entry);
    return true;
}

LootTable& LootTable::with(const std::string& itemId, int numerator, int denominator,
                           IntRange quantity) {
    addEntry(LootEntry{itemId, numerator, denominator, quantity});
    return *this;
}

const LootEntry* LootTable::findEntry(const std::string& itemId) const {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&](const LootEntry& e) { return e.itemId == itemId; });
    return it != m_entries.end() ? &*it : nullptr;
}

int LootTable::bonusRolls(int magicFind, RandomSource& rng) {
    if (magicFind <= 0) {
        return 0;
    }

    int guaranteed = magicFind / 100;
    int remainder = magicFind % 100;
    int extra = (remainder > 0 && rng.intInRange(1, 100) <= remainder) ? 1 : 0;
    return guaranteed + extra;
}

std::vector<LootDrop> LootTable::roll(int magicFind, RandomSource& rng) const {
    std::vector<LootDrop> drops;
    if (m_entries.empty()) {
        return drops;
    }

    const int attempts = 1 + bonusRolls(magicFind, rng);

    for (const auto& entry : m_entries) {
        int best = 0;
        for (int attempt = 0; attempt < attempts; ++attempt) {
            if (rng.intInRange(1, entry.denominator) <= entry.numerator) {
                best = std::max(best, entry.quantity.roll(rng));
            }
        }

        if (best > 0) {
            drops.push_back(LootDrop{entry.itemId, best});
        }
    }

    LOOT_DEBUG("Rolled " + std::to_string(drops.size()) + " drops from " +
               std::to_string(m_entries.size()) + " entries with " + std::to_string(attempts) +
               " attempt(s) each");
    return drops;
}

LootTable LootTable::fromJson(const JsonValue& json) {
    LootTable table;
    if (json.isNull()) {
        return table;
    }
    if (!json.isArray()) {
        throw std::invalid_argument("Loot table must be a JSON array");
    }

    for (const auto& item : json.asArray()) {
        auto quantity = rangeFromJson(item["quantity"]);
        if (!item.isObject() || !item["item"].isString() || !item["numerator"].isNumber() ||
            !item["denominator"].isNumber() || !quantity) {
            throw std::invalid_argument("Malformed loot entry: " + item.toString());
        }

        LootEntry entry{item["item"].asString(), item["numerator"].asInt(),
                        item["denominator"].asInt(), *quantity};
        if (!table.addEntry(entry)) {
            throw std::invalid_argument("Duplicate loot item '" + entry.itemId + "'");
        }
    }

    return table;
}

} // namespace DelveEngine
