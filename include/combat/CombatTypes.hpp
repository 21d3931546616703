/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_TYPES_HPP
#define COMBAT_TYPES_HPP

/**
 * @file CombatTypes.hpp
 * @brief Plain data shared by the combat rules and the encounter state machine
 */

#include "combat/LootTable.hpp"
#include "utils/IntRange.hpp"
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace DelveEngine {

struct CombatantStats {
    int health{1};
    int maxHealth{1};
    IntRange attack{1, 1};  // Raw damage before mitigation, inclusive
    int defense{0};
    int goldFind{0};        // Percent bonus on gold rewards
    int magicFind{0};       // Percent bonus loot attempts

    bool isAlive() const { return health > 0; }
};

enum class MobQuality : uint8_t { Normal, Boss };

inline std::ostream& operator<<(std::ostream& os, const MobQuality& quality) {
    switch (quality) {
        case MobQuality::Normal: return os << "Normal";
        case MobQuality::Boss: return os << "Boss";
        default: return os << "UNKNOWN";
    }
}

/// A rolled mob ready to fight
struct MobInstance {
    std::string mobId;
    std::string name;
    MobQuality quality{MobQuality::Normal};
    CombatantStats stats;
    int baseGold{0};
    int baseXp{0};
    LootTable loot;
};

struct PlayerCombatant {
    std::string name{"Player"};
    CombatantStats stats;
    int gold{0};
    int xp{0};
};

struct AttackResult {
    int rawDamage{0};
    int damage{0};            // After mitigation
    int healthBefore{0};
    int healthAfter{0};
    bool killed{false};
    bool ignored{false};      // Target was already defeated; nothing changed
};

struct VictoryRewards {
    int gold{0};
    int xp{0};
    std::vector<LootDrop> drops;
};

struct DefeatPenalty {
    int goldLost{0};
    int healthRestored{0};
};

} // namespace DelveEngine

#endif // COMBAT_TYPES_HPP
