/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_EVENT_HPP
#define COMBAT_EVENT_HPP

/**
 * @file CombatEvent.hpp
 * @brief Plain combat notifications returned by CombatEncounter
 *
 * The encounter never calls into presentation code. Every round returns an
 * ordered list of these values and the caller forwards them to whatever
 * displays health bars, damage numbers and loot popups:
 * - Player attacks and the damage dealt
 * - Mob counter-attacks
 * - Deaths, rewards and individual loot drops
 */

#include "combat/CombatTypes.hpp"
#include "dungeon/GridTypes.hpp"
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace DelveEngine {

enum class CombatEventType : uint8_t {
    PlayerAttacked,     // Player committed an attack
    MobDamaged,         // Mob took damage (amount, remaining health)
    MobKilled,          // Mob reached 0 health
    PlayerDamaged,      // Mob counter-attack landed
    PlayerKilled,       // Player reached 0 health
    Victory,            // Rewards applied to the player
    LootDropped,        // One per dropped item
    EncounterCancelled  // Player ran before resolving
};

inline std::ostream& operator<<(std::ostream& os, const CombatEventType& type) {
    switch (type) {
        case CombatEventType::PlayerAttacked: return os << "PlayerAttacked";
        case CombatEventType::MobDamaged: return os << "MobDamaged";
        case CombatEventType::MobKilled: return os << "MobKilled";
        case CombatEventType::PlayerDamaged: return os << "PlayerDamaged";
        case CombatEventType::PlayerKilled: return os << "PlayerKilled";
        case CombatEventType::Victory: return os << "Victory";
        case CombatEventType::LootDropped: return os << "LootDropped";
        case CombatEventType::EncounterCancelled: return os << "EncounterCancelled";
        default: return os << "UNKNOWN";
    }
}

struct CombatEvent {
    CombatEventType type{CombatEventType::PlayerAttacked};
    EntityId mob{INVALID_ENTITY_ID};
    int damage{0};
    int remainingHealth{0};
    VictoryRewards rewards;   // Victory only
    LootDrop drop;            // LootDropped only

    [[nodiscard]] std::string describe() const;
};

using CombatEventList = std::vector<CombatEvent>;

} // namespace DelveEngine

#endif // COMBAT_EVENT_HPP
