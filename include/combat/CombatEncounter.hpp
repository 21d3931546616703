/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_ENCOUNTER_HPP
#define COMBAT_ENCOUNTER_HPP

/**
 * @file CombatEncounter.hpp
 * @brief Turn-based fight between the player and one mob
 *
 * CombatEncounter handles:
 * - The encounter state machine (start, attack rounds, run away)
 * - Applying one round as a single unit: player hit, mob counter-attack and
 *   any death, reward or penalty effects
 * - Reporting what happened as CombatEvent values
 *
 * State flow:
 *   Idle -> PlayerTurnPending -> Resolving -> Ongoing -> PlayerTurnPending ...
 *                                          -> VictoryPending
 *                                          -> DefeatPending
 *   PlayerTurnPending -> Cancelled
 *
 * Ownership: the player is borrowed and must outlive the encounter; the mob
 * instance is owned. The RandomSource is borrowed.
 */

#include "combat/CombatTypes.hpp"
#include "dungeon/GridTypes.hpp"
#include "events/CombatEvent.hpp"
#include "utils/RandomSource.hpp"
#include <cstdint>
#include <ostream>
#include <string_view>

namespace DelveEngine {

enum class EncounterState : uint8_t {
    Idle,
    PlayerTurnPending,
    Resolving,
    Ongoing,
    VictoryPending,
    DefeatPending,
    Cancelled
};

class CombatEncounter {
public:
    CombatEncounter(PlayerCombatant& player, MobInstance mob, EntityId mobEntity,
                    RandomSource& rng);

    /**
     * @brief Open the encounter
     * @return false unless the encounter is Idle and both sides are alive
     */
    bool start();

    /**
     * @brief Commit the player's attack and resolve the whole round
     * @return Events in the order they happened; empty if it is not the
     *         player's turn or the mob is already defeated
     */
    CombatEventList attack();

    /**
     * @brief Run away before committing an attack
     * @return A single EncounterCancelled event, or empty if not allowed
     */
    CombatEventList cancel();

    [[nodiscard]] EncounterState getState() const { return m_state; }
    [[nodiscard]] bool isOver() const;
    [[nodiscard]] int getRoundCount() const { return m_rounds; }

    [[nodiscard]] const MobInstance& getMob() const { return m_mob; }
    [[nodiscard]] EntityId getMobEntity() const { return m_mobEntity; }
    [[nodiscard]] const PlayerCombatant& getPlayer() const { return m_player; }

    /// Rewards granted by the winning round, if any
    [[nodiscard]] const VictoryRewards& getRewards() const { return m_rewards; }

    [[nodiscard]] static std::string_view stateName(EncounterState state);

private:
    void transitionTo(EncounterState next);

    PlayerCombatant& m_player;
    MobInstance m_mob;
    EntityId m_mobEntity;
    RandomSource& m_rng;

    EncounterState m_state{EncounterState::Idle};
    VictoryRewards m_rewards;
    int m_rounds{0};
};

inline std::ostream& operator<<(std::ostream& os, const EncounterState& state) {
    return os << CombatEncounter::stateName(state);
}

} // namespace DelveEngine

#endif // COMBAT_ENCOUNTER_HPP
