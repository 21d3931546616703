/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE CombatEncounterTests
#include <boost/test/unit_test.hpp>

#include "combat/CombatEncounter.hpp"
#include "events/CombatEvent.hpp"
#include "utils/RandomSource.hpp"
#include <algorithm>

using namespace DelveEngine;

namespace {

constexpr EntityId MOB_ENTITY = 7;

MobInstance makeMob(int health, int attack, int defense) {
    MobInstance mob;
    mob.mobId = "goblin";
    mob.name = "Goblin";
    mob.stats.health = health;
    mob.stats.maxHealth = health;
    mob.stats.attack = IntRange{attack, attack};
    mob.stats.defense = defense;
    mob.baseGold = 10;
    mob.baseXp = 4;
    return mob;
}

bool hasEvent(const CombatEventList& events, CombatEventType type) {
    return std::any_of(events.begin(), events.end(),
                       [type](const CombatEvent& e) { return e.type == type; });
}

} // namespace

struct EncounterFixture {
    RandomSource rng{99};
    PlayerCombatant player;

    EncounterFixture() {
        player.name = "Tester";
        player.stats.health = 50;
        player.stats.maxHealth = 50;
        player.stats.attack = IntRange{10, 10};
        player.stats.defense = 0;
        player.gold = 100;
    }
};

BOOST_FIXTURE_TEST_SUITE(CombatEncounterTestSuite, EncounterFixture)

BOOST_AUTO_TEST_CASE(TestStartOnlyFromIdle) {
    CombatEncounter encounter(player, makeMob(30, 1, 0), MOB_ENTITY, rng);
    BOOST_CHECK_EQUAL(encounter.getState(), EncounterState::Idle);
    BOOST_CHECK(encounter.attack().empty());

    BOOST_CHECK(encounter.start());
    BOOST_CHECK_EQUAL(encounter.getState(), EncounterState::PlayerTurnPending);
    BOOST_CHECK(!encounter.start());
}

BOOST_AUTO_TEST_CASE(TestDefeatedMobCannotBeEngaged) {
    MobInstance corpse = makeMob(30, 7, 0);
    corpse.stats.health = 0;
    CombatEncounter encounter(player, corpse, MOB_ENTITY, rng);

    BOOST_CHECK(!encounter.start());
    BOOST_CHECK_EQUAL(encounter.getState(), EncounterState::Idle);

    // No damage either way and no rewards
    BOOST_CHECK(encounter.attack().empty());
    BOOST_CHECK_EQUAL(encounter.getPlayer().stats.health, 50);
    BOOST_CHECK_EQUAL(encounter.getPlayer().gold, 100);
    BOOST_CHECK_EQUAL(encounter.getMob().stats.health, 0);
    BOOST_CHECK_EQUAL(encounter.getRoundCount(), 0);
    BOOST_CHECK_EQUAL(encounter.getRewards().gold, 0);
}

BOOST_AUTO_TEST_CASE(TestDefeatedPlayerCannotEngage) {
    player.stats.health = 0;
    CombatEncounter encounter(player, makeMob(30, 7, 0), MOB_ENTITY, rng);
    BOOST_CHECK(!encounter.start());
    BOOST_CHECK(encounter.attack().empty());
    BOOST_CHECK_EQUAL(encounter.getMob().stats.health, 30);
}

BOOST_AUTO_TEST_CASE(TestRoundWithCounterAttack) {
    CombatEncounter encounter(player, makeMob(30, 4, 0), MOB_ENTITY, rng);
    BOOST_REQUIRE(encounter.start());

    CombatEventList events = encounter.attack();
    BOOST_REQUIRE_EQUAL(events.size(), 3u);
    BOOST_CHECK_EQUAL(events[0].type, CombatEventType::PlayerAttacked);
    BOOST_CHECK_EQUAL(events[1].type, CombatEventType::MobDamaged);
    BOOST_CHECK_EQUAL(events[1].damage, 10);
    BOOST_CHECK_EQUAL(events[1].remainingHealth, 20);
    BOOST_CHECK_EQUAL(events[2].type, CombatEventType::PlayerDamaged);
    BOOST_CHECK_EQUAL(events[2].damage, 4);
    for (const auto& event : events) {
        BOOST_CHECK_EQUAL(event.mob, MOB_ENTITY);
    }

    BOOST_CHECK_EQUAL(encounter.getState(), EncounterState::PlayerTurnPending);
    BOOST_CHECK_EQUAL(encounter.getRoundCount(), 1);
    BOOST_CHECK_EQUAL(encounter.getMob().stats.health, 20);
    BOOST_CHECK_EQUAL(player.stats.health, 46);
}

BOOST_AUTO_TEST_CASE(TestVictoryAppliesRewards) {
    MobInstance mob = makeMob(20, 3, 0);
    mob.loot.with("goblin_hide", 1, 1, IntRange{1, 1});
    CombatEncounter encounter(player, std::move(mob), MOB_ENTITY, rng);
    BOOST_REQUIRE(encounter.start());

    CombatEventList first = encounter.attack();
    BOOST_CHECK(!hasEvent(first, CombatEventType::MobKilled));

    CombatEventList second = encounter.attack();
    BOOST_REQUIRE(hasEvent(second, CombatEventType::MobKilled));
    BOOST_CHECK(hasEvent(second, CombatEventType::Victory));
    BOOST_CHECK(!hasEvent(second, CombatEventType::PlayerDamaged));
    BOOST_CHECK_EQUAL(second.back().type, CombatEventType::LootDropped);
    BOOST_CHECK_EQUAL(second.back().drop, (LootDrop{"goblin_hide", 1}));

    BOOST_CHECK_EQUAL(encounter.getState(), EncounterState::VictoryPending);
    BOOST_CHECK(encounter.isOver());
    BOOST_CHECK_EQUAL(player.gold, 110);
    BOOST_CHECK_EQUAL(player.xp, 4);
    BOOST_CHECK_EQUAL(encounter.getRewards().gold, 10);

    // Finished encounters ignore further input
    BOOST_CHECK(encounter.attack().empty());
    BOOST_CHECK(encounter.cancel().empty());
}

BOOST_AUTO_TEST_CASE(TestDefeatAppliesPenalty) {
    player.stats.health = 5;
    CombatEncounter encounter(player, makeMob(500, 8, 0), MOB_ENTITY, rng);
    BOOST_REQUIRE(encounter.start());

    CombatEventList events = encounter.attack();
    BOOST_CHECK(hasEvent(events, CombatEventType::PlayerKilled));
    BOOST_CHECK_EQUAL(encounter.getState(), EncounterState::DefeatPending);
    BOOST_CHECK_EQUAL(player.gold, 95);
    BOOST_CHECK_EQUAL(player.stats.health, player.stats.maxHealth);
    BOOST_CHECK_EQUAL(player.xp, 0);
}

BOOST_AUTO_TEST_CASE(TestCancelBeforeAttack) {
    CombatEncounter encounter(player, makeMob(30, 4, 0), MOB_ENTITY, rng);
    BOOST_CHECK(encounter.cancel().empty());
    BOOST_REQUIRE(encounter.start());

    CombatEventList events = encounter.cancel();
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK_EQUAL(events[0].type, CombatEventType::EncounterCancelled);
    BOOST_CHECK_EQUAL(encounter.getState(), EncounterState::Cancelled);
    BOOST_CHECK(encounter.attack().empty());
    BOOST_CHECK_EQUAL(player.stats.health, 50);
    BOOST_CHECK_EQUAL(player.gold, 100);
}

BOOST_AUTO_TEST_CASE(TestFightRunsToCompletion) {
    CombatEncounter encounter(player, makeMob(95, 2, 20), MOB_ENTITY, rng);
    BOOST_REQUIRE(encounter.start());

    int guard = 0;
    while (!encounter.isOver() && guard++ < 100) {
        BOOST_REQUIRE(!encounter.attack().empty());
    }

    // 10 raw vs 20 defense deals 7 per round
    BOOST_CHECK_EQUAL(encounter.getState(), EncounterState::VictoryPending);
    BOOST_CHECK_EQUAL(encounter.getRoundCount(), 14);
    BOOST_CHECK_EQUAL(player.stats.health, 50 - 2 * 13);
}

BOOST_AUTO_TEST_CASE(TestEventDescriptions) {
    CombatEvent event{CombatEventType::MobDamaged, MOB_ENTITY};
    event.damage = 6;
    event.remainingHealth = 14;
    BOOST_CHECK(!event.describe().empty());
    BOOST_CHECK_EQUAL(CombatEncounter::stateName(EncounterState::Cancelled), "Cancelled");
}

BOOST_AUTO_TEST_SUITE_END()
