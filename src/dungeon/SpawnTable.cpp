/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "dungeon/SpawnTable.hpp"
#include "entities/MobRegistry.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace DelveEngine {

namespace {

SpawnRule makeRule(SpawnTarget target, SpawnPolicy policy) {
    SpawnRule rule;
    rule.target = target;
    rule.policy = policy;
    return rule;
}

SpawnRule rangedRule(SpawnTarget target, IntRange count) {
    SpawnRule rule = makeRule(target, SpawnPolicy::CountRange);
    rule.range = count;
    return rule;
}

SpawnRule chanceRule(SpawnTarget target, double chance) {
    SpawnRule rule = makeRule(target, SpawnPolicy::Chance);
    rule.chance = chance;
    return rule;
}

bool targetNeedsMobId(SpawnTarget target) {
    return target == SpawnTarget::Npc || target == SpawnTarget::Mob;
}

[[noreturn]] void reject(const SpawnRule& rule, const std::string& reason) {
    throw std::invalid_argument("Spawn rule '" + rule.describe() + "': " + reason);
}

IntRange rangeField(const JsonValue& value, const std::string& context) {
    if (value.isNumber()) {
        return IntRange::exactly(value.asInt());
    }
    if (value.isArray() && value.size() == 2 && value[0].isNumber() && value[1].isNumber()) {
        return IntRange{value[0].asInt(), value[1].asInt()};
    }
    throw std::invalid_argument(context + ": 'count' must be a number or [min, max]");
}

} // namespace

SpawnCategory SpawnRule::getCategory() const {
    switch (target) {
        case SpawnTarget::Chest:
        case SpawnTarget::Stairs:
        case SpawnTarget::Rock:
        case SpawnTarget::Forge:
        case SpawnTarget::Anvil:
            return SpawnCategory::Obstacle;
        case SpawnTarget::Npc:
            return SpawnCategory::Npc;
        case SpawnTarget::Mob:
            return SpawnCategory::GuaranteedMob;
        case SpawnTarget::WeightedMobs:
            return SpawnCategory::WeightedMob;
    }
    return SpawnCategory::Obstacle;
}

std::string SpawnRule::describe() const {
    std::ostringstream oss;
    oss << spawnTargetName(target);
    if (!mobId.empty()) {
        oss << " " << mobId;
    }
    switch (policy) {
        case SpawnPolicy::Guaranteed:
            oss << " x" << count;
            break;
        case SpawnPolicy::CountRange:
            oss << " " << range;
            break;
        case SpawnPolicy::Chance:
            oss << " @" << chance;
            break;
        case SpawnPolicy::Fixed:
            oss << " at " << position;
            break;
    }
    if (target == SpawnTarget::WeightedMobs) {
        oss << " [";
        for (size_t i = 0; i < entries.size(); ++i) {
            oss << (i > 0 ? ", " : "") << entries[i].mobId << ":" << entries[i].weight;
        }
        oss << "]";
    }
    return oss.str();
}

const char* spawnTargetName(SpawnTarget target) {
    switch (target) {
        case SpawnTarget::Chest: return "chest";
        case SpawnTarget::Stairs: return "stairs";
        case SpawnTarget::Rock: return "rock";
        case SpawnTarget::Forge: return "forge";
        case SpawnTarget::Anvil: return "anvil";
        case SpawnTarget::Npc: return "npc";
        case SpawnTarget::Mob: return "mob";
        case SpawnTarget::WeightedMobs: return "weighted_mobs";
    }
    return "unknown";
}

std::optional<SpawnTarget> spawnTargetFromName(const std::string& name) {
    static const SpawnTarget all[] = {SpawnTarget::Chest, SpawnTarget::Stairs, SpawnTarget::Rock,
                                      SpawnTarget::Forge, SpawnTarget::Anvil,  SpawnTarget::Npc,
                                      SpawnTarget::Mob,   SpawnTarget::WeightedMobs};
    for (SpawnTarget target : all) {
        if (name == spawnTargetName(target)) {
            return target;
        }
    }
    return std::nullopt;
}

SpawnTable& SpawnTable::chest(IntRange count) {
    return addRule(rangedRule(SpawnTarget::Chest, count));
}

SpawnTable& SpawnTable::stairs(IntRange count) {
    return addRule(rangedRule(SpawnTarget::Stairs, count));
}

SpawnTable& SpawnTable::rock(IntRange count) {
    return addRule(rangedRule(SpawnTarget::Rock, count));
}

SpawnTable& SpawnTable::forge(IntRange count) {
    return addRule(rangedRule(SpawnTarget::Forge, count));
}

SpawnTable& SpawnTable::anvil(IntRange count) {
    return addRule(rangedRule(SpawnTarget::Anvil, count));
}

SpawnTable& SpawnTable::forgeChance(double chance) {
    return addRule(chanceRule(SpawnTarget::Forge, chance));
}

SpawnTable& SpawnTable::anvilChance(double chance) {
    return addRule(chanceRule(SpawnTarget::Anvil, chance));
}

SpawnTable& SpawnTable::npc(const std::string& mobId, IntRange count) {
    SpawnRule rule = rangedRule(SpawnTarget::Npc, count);
    rule.mobId = mobId;
    return addRule(std::move(rule));
}

SpawnTable& SpawnTable::npcChance(const std::string& mobId, double chance) {
    SpawnRule rule = chanceRule(SpawnTarget::Npc, chance);
    rule.mobId = mobId;
    return addRule(std::move(rule));
}

SpawnTable& SpawnTable::guaranteedMob(const std::string& mobId, int count) {
    SpawnRule rule = makeRule(SpawnTarget::Mob, SpawnPolicy::Guaranteed);
    rule.mobId = mobId;
    rule.count = count;
    return addRule(std::move(rule));
}

SpawnTable& SpawnTable::mob(const std::string& mobId, int weight) {
    weightedRule().entries.push_back(WeightedMobEntry{mobId, weight});
    return *this;
}

SpawnTable& SpawnTable::mobCount(IntRange count) {
    weightedRule().range = count;
    return *this;
}

SpawnTable& SpawnTable::fixed(SpawnTarget target, GridPosition position,
                              const std::string& mobId) {
    SpawnRule rule = makeRule(target, SpawnPolicy::Fixed);
    rule.position = position;
    rule.mobId = mobId;
    return addRule(std::move(rule));
}

SpawnTable& SpawnTable::addRule(SpawnRule rule) {
    m_rules.push_back(std::move(rule));
    return *this;
}

SpawnRule& SpawnTable::weightedRule() {
    auto it = std::find_if(m_rules.begin(), m_rules.end(), [](const SpawnRule& r) {
        return r.target == SpawnTarget::WeightedMobs;
    });
    if (it != m_rules.end()) {
        return *it;
    }
    m_rules.push_back(rangedRule(SpawnTarget::WeightedMobs, IntRange{0, 0}));
    return m_rules.back();
}

void SpawnTable::validate(const MobRegistry* registry) const {
    auto checkMobId = [registry](const SpawnRule& rule, const std::string& mobId) {
        if (mobId.empty()) {
            reject(rule, "missing mob id");
        }
        if (registry && !registry->contains(mobId)) {
            reject(rule, "unknown mob id '" + mobId + "'");
        }
    };

    for (const auto& rule : m_rules) {
        switch (rule.policy) {
            case SpawnPolicy::Guaranteed:
                if (rule.count < 0) {
                    reject(rule, "negative count");
                }
                break;
            case SpawnPolicy::CountRange:
                if (rule.range.min < 0) {
                    reject(rule, "negative count");
                }
                if (!rule.range.isValid()) {
                    reject(rule, "inverted count range");
                }
                break;
            case SpawnPolicy::Chance:
                if (!(rule.chance >= 0.0 && rule.chance <= 1.0)) {
                    reject(rule, "chance outside [0, 1]");
                }
                break;
            case SpawnPolicy::Fixed:
                if (rule.target == SpawnTarget::WeightedMobs) {
                    reject(rule, "weighted pools cannot be placed at a fixed position");
                }
                break;
        }

        if (rule.target == SpawnTarget::WeightedMobs) {
            if (rule.policy != SpawnPolicy::CountRange) {
                reject(rule, "weighted pools need a count range");
            }
            if (rule.entries.empty() && rule.range.max > 0) {
                reject(rule, "empty weighted pool with a non-zero count");
            }
            for (const auto& entry : rule.entries) {
                if (entry.weight < 0) {
                    reject(rule, "negative weight for '" + entry.mobId + "'");
                }
                checkMobId(rule, entry.mobId);
            }
        } else if (targetNeedsMobId(rule.target)) {
            checkMobId(rule, rule.mobId);
        }
    }
}

std::vector<const SpawnRule*> SpawnTable::getResolutionOrder() const {
    std::vector<const SpawnRule*> ordered;
    ordered.reserve(m_rules.size());
    for (const auto& rule : m_rules) {
        ordered.push_back(&rule);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const SpawnRule* a, const SpawnRule* b) {
        return static_cast<uint8_t>(a->getCategory()) < static_cast<uint8_t>(b->getCategory());
    });
    return ordered;
}

SpawnTable SpawnTable::standardFloor(bool isFinalFloor) {
    SpawnTable table;
    table.mob("goblin", 5)
        .mob("slime", 3)
        .mobCount(IntRange{3, 4})
        .guaranteedMob("dwarf_defender", 1)
        .guaranteedMob("dwarf_warrior", 1)
        .guaranteedMob("dwarf_miner", 1)
        .guaranteedMob("dwarf_king", 1)
        .rock(IntRange{0, 4})
        .forgeChance(0.33)
        .anvilChance(0.33)
        .npcChance("merchant", 0.33);

    if (!isFinalFloor) {
        table.stairs(IntRange{1, 1});
    }
    return table;
}

SpawnTable SpawnTable::fromJson(const JsonValue& rules) {
    const JsonArray* array = rules.tryAsArray();
    if (!array) {
        throw std::invalid_argument("Spawn table must be a JSON array of rules");
    }

    SpawnTable table;
    for (const auto& item : *array) {
        const std::string kind = item.getString("kind", "");
        auto target = spawnTargetFromName(kind);
        if (!target) {
            throw std::invalid_argument("Unknown spawn rule kind '" + kind + "'");
        }

        const std::string context = "Spawn rule '" + kind + "'";
        SpawnRule rule = makeRule(*target, SpawnPolicy::CountRange);
        rule.mobId = item.getString("mob", "");

        if (item.hasKey("chance")) {
            auto chance = item["chance"].tryAsNumber();
            if (!chance) {
                throw std::invalid_argument(context + ": 'chance' must be a number");
            }
            rule.policy = SpawnPolicy::Chance;
            rule.chance = *chance;
        } else if (item.hasKey("at")) {
            const JsonValue& at = item["at"];
            if (!at.isArray() || at.size() != 2 || !at[0].isNumber() || !at[1].isNumber()) {
                throw std::invalid_argument(context + ": 'at' must be [x, y]");
            }
            rule.policy = SpawnPolicy::Fixed;
            rule.position = GridPosition{at[0].asInt(), at[1].asInt()};
        } else if (item["count"].isNumber() && *target != SpawnTarget::WeightedMobs) {
            rule.policy = SpawnPolicy::Guaranteed;
            rule.count = item["count"].asInt();
        } else {
            rule.range = rangeField(item["count"], context);
        }

        if (*target == SpawnTarget::WeightedMobs) {
            const JsonArray* mobs = item["mobs"].tryAsArray();
            if (!mobs) {
                throw std::invalid_argument(context + ": needs a 'mobs' array");
            }
            for (const auto& entry : *mobs) {
                if (!entry["mob"].isString() || !entry["weight"].isNumber()) {
                    throw std::invalid_argument(context + ": malformed entry " + entry.toString());
                }
                rule.entries.push_back(
                    WeightedMobEntry{entry["mob"].asString(), entry["weight"].asInt()});
            }
        }

        table.addRule(std::move(rule));
    }

    table.validate();
    return table;
}

} // namespace DelveEngine
