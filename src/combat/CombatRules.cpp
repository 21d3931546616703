/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "combat/CombatRules.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace DelveEngine::CombatRules {

double mitigation(int defense) {
    const double d = static_cast<double>(std::max(defense, 0));
    return d / (d + DEFENSE_CONSTANT);
}

int finalDamage(int rawDamage, int defense) {
    const double raw = static_cast<double>(std::max(rawDamage, 0));
    return static_cast<int>(std::lround(raw * (1.0 - mitigation(defense))));
}

int goldWithFind(int baseGold, int goldFind) {
    const double multiplier = 1.0 + static_cast<double>(goldFind) / 100.0;
    return static_cast<int>(std::lround(static_cast<double>(baseGold) * multiplier));
}

int xpReward(int baseXp) {
    return static_cast<int>(std::lround(static_cast<double>(baseXp) * 1.0));
}

IntRange attackRangeFromValue(int attackValue) {
    if (attackValue <= 0) {
        return IntRange{0, 0};
    }
    const int variance =
        static_cast<int>(std::lround(static_cast<double>(attackValue) * ATTACK_VARIANCE));
    return IntRange{std::max(1, attackValue - variance), attackValue + variance};
}

int defeatGoldLoss(int gold) {
    if (gold <= 0) {
        return 0;
    }
    return gold * DEFEAT_GOLD_LOSS_PERCENT / 100;
}

AttackResult resolveAttack(const CombatantStats& attacker, CombatantStats& defender,
                           RandomSource& rng) {
    AttackResult result;
    result.healthBefore = defender.health;
    result.healthAfter = defender.health;

    if (!defender.isAlive()) {
        result.ignored = true;
        COMBAT_DEBUG("Attack on a defeated combatant ignored");
        return result;
    }

    result.rawDamage = attacker.attack.roll(rng);
    result.damage = finalDamage(result.rawDamage, defender.defense);

    defender.health = std::max(0, defender.health - result.damage);
    result.healthAfter = defender.health;
    result.killed = defender.health == 0;
    return result;
}

VictoryRewards computeVictoryRewards(const MobInstance& mob, const CombatantStats& player,
                                     RandomSource& rng) {
    VictoryRewards rewards;
    rewards.gold = goldWithFind(mob.baseGold, player.goldFind);
    rewards.xp = xpReward(mob.baseXp);
    rewards.drops = mob.loot.roll(player.magicFind, rng);
    return rewards;
}

void applyVictoryRewards(PlayerCombatant& player, const VictoryRewards& rewards) {
    player.gold += rewards.gold;
    player.xp += rewards.xp;
}

DefeatPenalty applyPlayerDefeat(PlayerCombatant& player) {
    DefeatPenalty penalty;
    penalty.goldLost = defeatGoldLoss(player.gold);
    player.gold -= penalty.goldLost;

    penalty.healthRestored = player.stats.maxHealth - player.stats.health;
    player.stats.health = player.stats.maxHealth;

    COMBAT_INFO(player.name + " defeated: lost " + std::to_string(penalty.goldLost) +
                " gold, health restored to " + std::to_string(player.stats.maxHealth));
    return penalty;
}

} // namespace DelveEngine::CombatRules
