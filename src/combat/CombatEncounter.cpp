/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "combat/CombatEncounter.hpp"
#include "combat/CombatRules.hpp"
#include "core/Logger.hpp"
#include <utility>

namespace DelveEngine {

CombatEncounter::CombatEncounter(PlayerCombatant& player, MobInstance mob, EntityId mobEntity,
                                 RandomSource& rng)
    : m_player(player)
    , m_mob(std::move(mob))
    , m_mobEntity(mobEntity)
    , m_rng(rng) {}

bool CombatEncounter::start() {
    if (m_state != EncounterState::Idle) {
        COMBAT_WARN("Encounter already started (state " + std::string(stateName(m_state)) + ")");
        return false;
    }

    if (!m_mob.stats.isAlive() || !m_player.stats.isAlive()) {
        COMBAT_WARN("Cannot engage " + m_mob.name + ": a combatant is already defeated");
        return false;
    }

    COMBAT_INFO(m_player.name + " engages " + m_mob.name + " (HP " +
                std::to_string(m_mob.stats.health) + "/" + std::to_string(m_mob.stats.maxHealth) +
                ")");
    transitionTo(EncounterState::PlayerTurnPending);
    return true;
}

CombatEventList CombatEncounter::attack() {
    CombatEventList events;

    if (m_state != EncounterState::PlayerTurnPending) {
        COMBAT_WARN("Attack rejected in state " + std::string(stateName(m_state)));
        return events;
    }

    // Work on copies; nothing below touches the live combatants until commit
    PlayerCombatant player = m_player;
    MobInstance mob = m_mob;
    VictoryRewards rewards;
    EncounterState outcome = EncounterState::Ongoing;

    AttackResult hit = CombatRules::resolveAttack(player.stats, mob.stats, m_rng);
    if (hit.ignored) {
        // A defeated mob neither takes damage nor strikes back
        COMBAT_WARN("Attack on defeated " + m_mob.name + " ignored");
        return events;
    }

    transitionTo(EncounterState::Resolving);
    ++m_rounds;

    events.push_back(CombatEvent{CombatEventType::PlayerAttacked, m_mobEntity});
    CombatEvent damaged{CombatEventType::MobDamaged, m_mobEntity};
    damaged.damage = hit.damage;
    damaged.remainingHealth = hit.healthAfter;
    events.push_back(damaged);

    COMBAT_DEBUG("Round " + std::to_string(m_rounds) + ": " + player.name + " hits " + mob.name +
                 " for " + std::to_string(hit.damage) + " (raw " + std::to_string(hit.rawDamage) +
                 "), HP " + std::to_string(hit.healthBefore) + " -> " +
                 std::to_string(hit.healthAfter));

    if (hit.killed) {
        events.push_back(CombatEvent{CombatEventType::MobKilled, m_mobEntity});

        rewards = CombatRules::computeVictoryRewards(mob, player.stats, m_rng);
        CombatRules::applyVictoryRewards(player, rewards);

        CombatEvent victory{CombatEventType::Victory, m_mobEntity};
        victory.rewards = rewards;
        events.push_back(victory);

        for (const auto& drop : rewards.drops) {
            CombatEvent dropped{CombatEventType::LootDropped, m_mobEntity};
            dropped.drop = drop;
            events.push_back(dropped);
        }
        outcome = EncounterState::VictoryPending;
    } else {
        // Mob survived: it strikes back
        AttackResult counter = CombatRules::resolveAttack(mob.stats, player.stats, m_rng);
        CombatEvent playerHit{CombatEventType::PlayerDamaged, m_mobEntity};
        playerHit.damage = counter.damage;
        playerHit.remainingHealth = counter.healthAfter;
        events.push_back(playerHit);

        if (counter.killed) {
            events.push_back(CombatEvent{CombatEventType::PlayerKilled, m_mobEntity});
            CombatRules::applyPlayerDefeat(player);
            outcome = EncounterState::DefeatPending;
        }
    }

    // Commit the whole round at once
    m_player = std::move(player);
    m_mob = std::move(mob);
    m_rewards = std::move(rewards);

    if (outcome == EncounterState::VictoryPending) {
        COMBAT_INFO(m_mob.name + " defeated: +" + std::to_string(m_rewards.gold) + " gold, +" +
                    std::to_string(m_rewards.xp) + " xp, " +
                    std::to_string(m_rewards.drops.size()) + " drop(s)");
        transitionTo(EncounterState::VictoryPending);
    } else if (outcome == EncounterState::DefeatPending) {
        transitionTo(EncounterState::DefeatPending);
    } else {
        transitionTo(EncounterState::Ongoing);
        transitionTo(EncounterState::PlayerTurnPending);
    }

    return events;
}

CombatEventList CombatEncounter::cancel() {
    CombatEventList events;

    if (m_state != EncounterState::PlayerTurnPending) {
        COMBAT_WARN("Cannot run away in state " + std::string(stateName(m_state)));
        return events;
    }

    transitionTo(EncounterState::Cancelled);
    events.push_back(CombatEvent{CombatEventType::EncounterCancelled, m_mobEntity});
    return events;
}

bool CombatEncounter::isOver() const {
    return m_state == EncounterState::VictoryPending ||
           m_state == EncounterState::DefeatPending || m_state == EncounterState::Cancelled;
}

std::string_view CombatEncounter::stateName(EncounterState state) {
    switch (state) {
        case EncounterState::Idle:
            return "Idle";
        case EncounterState::PlayerTurnPending:
            return "PlayerTurnPending";
        case EncounterState::Resolving:
            return "Resolving";
        case EncounterState::Ongoing:
            return "Ongoing";
        case EncounterState::VictoryPending:
            return "VictoryPending";
        case EncounterState::DefeatPending:
            return "DefeatPending";
        case EncounterState::Cancelled:
            return "Cancelled";
        default:
            return "Unknown";
    }
}

void CombatEncounter::transitionTo(EncounterState next) {
    COMBAT_DEBUG(std::string(stateName(m_state)) + " -> " + std::string(stateName(next)));
    m_state = next;
}

} // namespace DelveEngine
