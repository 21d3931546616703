/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_RULES_HPP
#define COMBAT_RULES_HPP

/**
 * @file CombatRules.hpp
 * @brief Stateless combat formulas: mitigation, damage, rewards, penalties
 *
 * Defense mitigates with diminishing returns: d / (d + 50). With 50 defense
 * half of the raw damage gets through, 100 defense lets a third through, and
 * no amount of defense reaches full immunity.
 */

#include "combat/CombatTypes.hpp"
#include "utils/IntRange.hpp"
#include "utils/RandomSource.hpp"

namespace DelveEngine::CombatRules {

constexpr double DEFENSE_CONSTANT{50.0};
constexpr double ATTACK_VARIANCE{0.25};
constexpr int DEFEAT_GOLD_LOSS_PERCENT{5};

/// Fraction of damage absorbed, in [0, 1); negative defense counts as 0
double mitigation(int defense);

/// round(raw * (1 - mitigation)); a negative raw value deals 0. May be 0.
int finalDamage(int rawDamage, int defense);

/// round(base * (1 + goldFind / 100))
int goldWithFind(int baseGold, int goldFind);

int xpReward(int baseXp);

/// [max(1, v - round(v * 0.25)), v + round(v * 0.25)]; [0, 0] for v <= 0
IntRange attackRangeFromValue(int attackValue);

/// Gold removed by a defeat: 5% of the purse, rounded down
int defeatGoldLoss(int gold);

/**
 * @brief Roll and apply one attack
 *
 * Raw damage is uniform over the attacker's attack range. A defender that is
 * already at 0 health is left alone and the result is flagged ignored.
 */
AttackResult resolveAttack(const CombatantStats& attacker, CombatantStats& defender,
                           RandomSource& rng);

/// Gold, xp and loot for defeating mob, using the player's find bonuses
VictoryRewards computeVictoryRewards(const MobInstance& mob, const CombatantStats& player,
                                     RandomSource& rng);

void applyVictoryRewards(PlayerCombatant& player, const VictoryRewards& rewards);

/// Take the gold penalty and restore health to max
DefeatPenalty applyPlayerDefeat(PlayerCombatant& player);

} // namespace DelveEngine::CombatRules

#endif // COMBAT_RULES_HPP
