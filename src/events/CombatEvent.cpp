/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "events/CombatEvent.hpp"
#include <sstream>

namespace DelveEngine {

std::string CombatEvent::describe() const {
    std::ostringstream oss;
    oss << type;

    switch (type) {
        case CombatEventType::PlayerAttacked:
        case CombatEventType::MobKilled:
        case CombatEventType::PlayerKilled:
        case CombatEventType::EncounterCancelled:
            break;
        case CombatEventType::MobDamaged:
        case CombatEventType::PlayerDamaged:
            oss << " damage=" << damage << " hp=" << remainingHealth;
            break;
        case CombatEventType::Victory:
            oss << " gold=" << rewards.gold << " xp=" << rewards.xp
                << " drops=" << rewards.drops.size();
            break;
        case CombatEventType::LootDropped:
            oss << " " << drop;
            break;
    }
    return oss.str();
}

} // namespace DelveEngine
