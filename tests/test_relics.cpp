/**
 * Tests for the Relic Trigger System
 */

#include <sstream>
#include "relic_system.hpp"
#include "test_fixtures.hpp"

using namespace descent;
using namespace descent::fixtures;

// ============================================================================
// MATCHING / COUNTERS
// ============================================================================

TEST(RelicSystem, CounterFiresEveryThird) {
    std::vector<Relic> relics;
    relics.emplace_back(make_relic("scroll", RelicTrigger::CARD_DRAWN,
                                   RelicAction::DRAW_EVERY_N, 3));

    int fired = 0;
    for (int i = 1; i <= 9; ++i) {
        auto activations = RelicSystem::collect(relics, CombatEvent(RelicTrigger::CARD_DRAWN, 1));
        if (i % 3 == 0) {
            TEST_ASSERT_EQ(1u, activations.size());
            TEST_ASSERT_EQ(1, activations[0].amount);
            TEST_ASSERT_EQ(0, relics[0].counter);
            fired++;
        } else {
            TEST_ASSERT_TRUE(activations.empty());
            TEST_ASSERT_EQ(i % 3, relics[0].counter);
        }
    }
    TEST_ASSERT_EQ(3, fired);
}

TEST(RelicSystem, CounterIgnoresOtherEvents) {
    std::vector<Relic> relics;
    relics.emplace_back(make_relic("scroll", RelicTrigger::CARD_DRAWN,
                                   RelicAction::DRAW_EVERY_N, 3));

    RelicSystem::collect(relics, CombatEvent(RelicTrigger::CARD_PLAYED));
    RelicSystem::collect(relics, CombatEvent(RelicTrigger::TURN_START));
    TEST_ASSERT_EQ(0, relics[0].counter);
}

TEST(RelicSystem, DirectActionFiresEveryTime) {
    std::vector<Relic> relics;
    relics.emplace_back(make_relic("vajra", RelicTrigger::TURN_START,
                                   RelicAction::GAIN_STRENGTH, 1));

    for (int i = 0; i < 3; ++i) {
        auto activations = RelicSystem::collect(relics, CombatEvent(RelicTrigger::TURN_START));
        TEST_ASSERT_EQ(1u, activations.size());
        TEST_ASSERT_EQ(1, activations[0].amount);
        TEST_ASSERT_EQ(std::string("vajra"), activations[0].relic_id);
    }
    TEST_ASSERT_EQ(0, relics[0].counter);
}

TEST(RelicSystem, AmountOverridesPayoff) {
    std::vector<Relic> relics;
    relics.emplace_back(make_relic("nib", RelicTrigger::ATTACK_PLAYED,
                                   RelicAction::DAMAGE_ALL_EVERY_N, 2, 9));

    RelicSystem::collect(relics, CombatEvent(RelicTrigger::ATTACK_PLAYED));
    auto activations = RelicSystem::collect(relics, CombatEvent(RelicTrigger::ATTACK_PLAYED));
    TEST_ASSERT_EQ(1u, activations.size());
    TEST_ASSERT_EQ(9, activations[0].amount);
}

TEST(RelicSystem, DefaultCounterPayoffs) {
    TEST_ASSERT_EQ(1, RelicSystem::default_counter_payoff(RelicAction::DRAW_EVERY_N));
    TEST_ASSERT_EQ(2, RelicSystem::default_counter_payoff(RelicAction::ENERGY_EVERY_N));
    TEST_ASSERT_EQ(4, RelicSystem::default_counter_payoff(RelicAction::BLOCK_EVERY_N));
    TEST_ASSERT_EQ(5, RelicSystem::default_counter_payoff(RelicAction::DAMAGE_ALL_EVERY_N));
    TEST_ASSERT_EQ(1, RelicSystem::default_counter_payoff(RelicAction::INTANGIBLE_EVERY_N));
}

TEST(RelicSystem, EveryNTriggersAliasBaseEvents) {
    TEST_ASSERT_TRUE(RelicSystem::trigger_matches(RelicTrigger::CARD_EVERY_N,
                                                  RelicTrigger::CARD_PLAYED));
    TEST_ASSERT_TRUE(RelicSystem::trigger_matches(RelicTrigger::ATTACK_EVERY_N,
                                                  RelicTrigger::ATTACK_PLAYED));
    TEST_ASSERT_TRUE(RelicSystem::trigger_matches(RelicTrigger::SHUFFLE_EVERY_N,
                                                  RelicTrigger::SHUFFLE));
    TEST_ASSERT_TRUE(RelicSystem::trigger_matches(RelicTrigger::TURN_EVERY_N,
                                                  RelicTrigger::TURN_START));
    TEST_ASSERT_FALSE(RelicSystem::trigger_matches(RelicTrigger::ATTACK_EVERY_N,
                                                   RelicTrigger::SKILL_PLAYED));
    TEST_ASSERT_FALSE(RelicSystem::trigger_matches(RelicTrigger::UNKNOWN,
                                                   RelicTrigger::UNKNOWN));
}

TEST(RelicSystem, RelicsScannedInAcquisitionOrder) {
    std::vector<Relic> relics;
    relics.emplace_back(make_relic("first", RelicTrigger::COMBAT_START, RelicAction::BLOCK, 5));
    relics.emplace_back(make_relic("second", RelicTrigger::COMBAT_START, RelicAction::HEAL, 2));

    auto activations = RelicSystem::collect(relics, CombatEvent(RelicTrigger::COMBAT_START));
    TEST_ASSERT_EQ(2u, activations.size());
    TEST_ASSERT_EQ(std::string("first"), activations[0].relic_id);
    TEST_ASSERT_EQ(1u, activations[1].relic_index);
}

TEST(RelicSystem, ResetPolicyIsPerRelic) {
    std::vector<Relic> relics;
    relics.emplace_back(make_relic("kept", RelicTrigger::CARD_PLAYED, RelicAction::DRAW_EVERY_N, 10));
    RelicDef resetting = make_relic("reset", RelicTrigger::CARD_PLAYED,
                                    RelicAction::ENERGY_EVERY_N, 10);
    resetting.reset_counter_each_combat = true;
    relics.emplace_back(resetting);

    relics[0].counter = 4;
    relics[1].counter = 4;
    RelicSystem::reset_for_combat(relics);
    TEST_ASSERT_EQ(4, relics[0].counter);
    TEST_ASSERT_EQ(0, relics[1].counter);
}

// ============================================================================
// ACQUISITION
// ============================================================================

TEST(RelicSystem, ObtainAppliesOnObtainEffects) {
    Player player("Tester", 70);
    player.current_hp = 50;

    RelicDef strawberry = make_relic("strawberry", RelicTrigger::ON_OBTAIN,
                                     RelicAction::GAIN_MAX_HP, 7);
    TEST_ASSERT_TRUE(player.obtain_relic(strawberry));
    TEST_ASSERT_EQ(77, player.max_hp);
    TEST_ASSERT_EQ(57, player.current_hp);

    RelicDef belt = make_relic("belt", RelicTrigger::ON_OBTAIN, RelicAction::POTION_SLOT, 2);
    player.obtain_relic(belt);
    TEST_ASSERT_EQ(5u, player.potions.size());

    int gold = player.gold;
    player.obtain_relic(make_relic("purse", RelicTrigger::ON_OBTAIN, RelicAction::GAIN_GOLD, 25));
    TEST_ASSERT_EQ(gold + 25, player.gold);
}

TEST(RelicSystem, DuplicateRelicRejected) {
    Player player;
    RelicDef anchor = make_relic("anchor", RelicTrigger::COMBAT_START, RelicAction::BLOCK, 10);
    TEST_ASSERT_TRUE(player.obtain_relic(anchor));
    TEST_ASSERT_FALSE(player.obtain_relic(anchor));
    TEST_ASSERT_EQ(1u, player.relics.size());
    TEST_ASSERT_TRUE(player.has_relic("anchor"));
}

// ============================================================================
// IN COMBAT
// ============================================================================

TEST(RelicSystem, CombatStartBlock) {
    CardDatabase db;
    build_test_catalog(db);
    CombatEngine engine(db, exact_config(), make_seeded_random(11));

    Player player = engine.create_player(repeat_card("strike", 10));
    player.obtain_relic(make_relic("anchor", RelicTrigger::COMBAT_START, RelicAction::BLOCK, 10));

    CombatState state;
    ActionResult result = engine.start_combat(state, player, {"dummy"});
    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_EQ(10, state.player.block);
}

TEST(RelicSystem, FirstTurnEnergy) {
    CardDatabase db;
    build_test_catalog(db);
    CombatEngine engine(db, exact_config(), make_seeded_random(11));

    Player player = engine.create_player(repeat_card("strike", 10));
    player.obtain_relic(make_relic("lantern", RelicTrigger::FIRST_TURN, RelicAction::GAIN_ENERGY, 1));

    CombatState state;
    engine.start_combat(state, player, {"dummy"});
    TEST_ASSERT_EQ(4, state.player.energy);

    engine.end_turn(state);
    TEST_ASSERT_EQ(3, state.player.energy);
}

TEST(RelicSystem, CardCounterAcrossPlays) {
    CardDatabase db;
    build_test_catalog(db);
    CombatEngine engine(db, exact_config(), make_seeded_random(11));

    Player player = engine.create_player(repeat_card("offering", 10));
    player.obtain_relic(make_relic("kunai", RelicTrigger::CARD_EVERY_N,
                                   RelicAction::DEXTERITY_EVERY_N, 3));

    CombatState state;
    engine.start_combat(state, player, {"dummy"});
    engine.play_card(state, 0);
    engine.play_card(state, 0);
    TEST_ASSERT_EQ(0, state.player.get_status(StatusKey::DEXTERITY));
    TEST_ASSERT_EQ(2, state.player.relics[0].counter);

    ActionResult result = engine.play_card(state, 0);
    TEST_ASSERT_EQ(1, state.player.get_status(StatusKey::DEXTERITY));
    TEST_ASSERT_EQ(0, state.player.relics[0].counter);
    TEST_ASSERT_EQ(1, count_events(result.events, RelicTrigger::BUFF_GAINED));
}

TEST(RelicSystem, FirstAttackBonusDamage) {
    CardDatabase db;
    build_test_catalog(db);
    CombatEngine engine(db, exact_config(), make_seeded_random(11));

    Player player = engine.create_player(repeat_card("strike", 10));
    player.obtain_relic(make_relic("akabeko", RelicTrigger::COMBAT_START,
                                   RelicAction::BONUS_DAMAGE, 8));

    CombatState state;
    engine.start_combat(state, player, {"dummy"});
    TEST_ASSERT_EQ(8, state.first_attack_bonus);

    engine.play_card(state, 0, 0);
    TEST_ASSERT_EQ(40 - 14, state.enemies[0].current_hp);
    TEST_ASSERT_EQ(0, state.first_attack_bonus);

    engine.play_card(state, 0, 0);
    TEST_ASSERT_EQ(40 - 14 - 6, state.enemies[0].current_hp);
}

TEST(RelicSystem, LowHpTriggerFiresOnce) {
    CardDatabase db;
    build_test_catalog(db);
    CombatEngine engine(db, exact_config(), make_seeded_random(11));

    Player player = engine.create_player(repeat_card("defend", 10), 40);
    player.obtain_relic(make_relic("blood_vial", RelicTrigger::HP_BELOW_50, RelicAction::HEAL, 3));

    CombatState state;
    engine.start_combat(state, player, {"jaw"});

    // 40 -> 29 -> 18 (below half, heal to 21) -> 10
    engine.end_turn(state);
    TEST_ASSERT_EQ(29, state.player.current_hp);
    engine.end_turn(state);
    TEST_ASSERT_EQ(21, state.player.current_hp);
    engine.end_turn(state);
    TEST_ASSERT_EQ(10, state.player.current_hp);
    TEST_ASSERT_EQ(1, count_events(state.event_log, RelicTrigger::HP_BELOW_50));
}

TEST(RelicSystem, UnknownTriggerNeverFires) {
    CardDatabase db;
    build_test_catalog(db);
    CombatEngine engine(db, exact_config(), make_seeded_random(11));

    RelicDef moon = make_relic("moon", RelicTrigger::UNKNOWN, RelicAction::HEAL, 5);
    moon.effects[0].trigger_name = "onMoonRise";

    Player player = engine.create_player(repeat_card("strike", 10), 40);
    player.current_hp = 20;
    player.obtain_relic(moon);

    CombatState state;
    engine.start_combat(state, player, {"dummy"});
    engine.end_turn(state);
    TEST_ASSERT_EQ(20, state.player.current_hp);
}

// ============================================================================
// OUT OF COMBAT
// ============================================================================

TEST(RelicSystem, RunTriggers) {
    CardDatabase db;
    build_test_catalog(db);
    CombatEngine engine(db, exact_config(), make_seeded_random(11));

    Player player = engine.create_player(repeat_card("strike", 3), 60);
    player.current_hp = 30;
    player.obtain_relic(make_relic("pantograph", RelicTrigger::REST_SITE_ENTER,
                                   RelicAction::HEAL, 10));
    player.obtain_relic(make_relic("bottle", RelicTrigger::MERCHANT_ENTER,
                                   RelicAction::ENERGY_NEXT_COMBAT, 1));
    player.obtain_relic(make_relic("whetstone", RelicTrigger::TREASURE_ENTER,
                                   RelicAction::UPGRADE_RANDOM, 1));

    auto fired = engine.fire_run_trigger(player, RelicTrigger::REST_SITE_ENTER);
    TEST_ASSERT_EQ(1u, fired.size());
    TEST_ASSERT_EQ(40, player.current_hp);

    engine.fire_run_trigger(player, RelicTrigger::MERCHANT_ENTER);
    TEST_ASSERT_EQ(1, player.bonus_energy_next_combat);

    engine.fire_run_trigger(player, RelicTrigger::TREASURE_ENTER);
    int upgraded = 0;
    for (const auto& card : player.deck) {
        if (card.upgraded) upgraded++;
    }
    TEST_ASSERT_EQ(1, upgraded);

    // Bonus energy is spent by the next combat
    CombatState state;
    engine.start_combat(state, player, {"dummy"});
    TEST_ASSERT_EQ(4, state.player.energy);
    TEST_ASSERT_EQ(0, state.player.bonus_energy_next_combat);
}

TEST(RelicSystem, HealPercentSameRuleInAndOutOfCombat) {
    CardDatabase db;
    build_test_catalog(db);
    CombatEngine engine(db, exact_config(), make_seeded_random(11));

    Player player = engine.create_player(repeat_card("strike", 10), 80);
    player.obtain_relic(make_relic("campfire_charm", RelicTrigger::REST_SITE_ENTER,
                                   RelicAction::HEAL_PERCENT, 12));
    player.obtain_relic(make_relic("mending_vial", RelicTrigger::TURN_START,
                                   RelicAction::HEAL_PERCENT, 12));

    // Above half: nothing on either path
    player.current_hp = 70;
    TEST_ASSERT_EQ(1u, engine.fire_run_trigger(player, RelicTrigger::REST_SITE_ENTER).size());
    TEST_ASSERT_EQ(70, player.current_hp);

    CombatState state;
    engine.start_combat(state, player, {"dummy"});
    TEST_ASSERT_EQ(70, state.player.current_hp);

    // Below half: a flat 12 on both paths
    player.current_hp = 30;
    engine.fire_run_trigger(player, RelicTrigger::REST_SITE_ENTER);
    TEST_ASSERT_EQ(42, player.current_hp);

    player.current_hp = 30;
    CombatState low;
    engine.start_combat(low, player, {"dummy"});
    TEST_ASSERT_EQ(42, low.player.current_hp);
}
