/**
 * Tests for the Effect Resolution Engine
 */

#include <sstream>
#include "effect_engine.hpp"
#include "test_fixtures.hpp"

using namespace descent;
using namespace descent::fixtures;

static EffectContext card_context(TargetType default_target,
                                  std::optional<size_t> target = std::nullopt) {
    EffectContext ctx;
    ctx.source = EffectSource::CARD;
    ctx.source_id = "card_test";
    ctx.default_target = default_target;
    ctx.target = target;
    return ctx;
}

static void stock_zone(CombatState& state, const CardDatabase& db, Zone& zone,
                       const CardDefID& id, int count) {
    for (int i = 0; i < count; ++i) {
        zone.add_to_bottom(state.player.make_card(*db.get_card(id)));
    }
}

// ============================================================================
// DAMAGE
// ============================================================================

TEST(Effects, DamageAddsStrengthPerHit) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 2, 40);
    state.player.status.set(StatusKey::STRENGTH, 2);

    EffectContext ctx = card_context(TargetType::SINGLE_ENEMY, 0);
    auto results = engine.resolve_effects(state, {make_effect(EffectKind::DAMAGE, 6, std::nullopt, 3)}, ctx);

    TEST_ASSERT_EQ(1u, results.size());
    TEST_ASSERT_EQ(24, *results[0].value);
    TEST_ASSERT_EQ(16, state.enemies[0].current_hp);
    TEST_ASSERT_EQ(40, state.enemies[1].current_hp);
}

TEST(Effects, DamageAllSkipsDeadEnemies) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 3, 40);
    state.enemies[1].current_hp = 0;

    EffectContext ctx = card_context(TargetType::ALL_ENEMIES);
    engine.resolve_effects(state, {make_effect(EffectKind::DAMAGE_ALL, 5)}, ctx);

    TEST_ASSERT_EQ(35, state.enemies[0].current_hp);
    TEST_ASSERT_EQ(0, state.enemies[1].current_hp);
    TEST_ASSERT_EQ(35, state.enemies[2].current_hp);
    TEST_ASSERT_EQ(2, count_events(state.pending_events, RelicTrigger::DAMAGE_DEALT));
}

TEST(Effects, MissingSingleTargetHaltsSequence) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 2, 40);
    state.enemies[1].current_hp = 0;

    std::vector<EffectDef> effects = {make_effect(EffectKind::DAMAGE, 6),
                                      make_effect(EffectKind::BLOCK, 5, TargetType::SELF)};

    EffectContext no_target = card_context(TargetType::SINGLE_ENEMY);
    auto results = engine.resolve_effects(state, effects, no_target);
    TEST_ASSERT_EQ(1u, results.size());
    TEST_ASSERT_FALSE(results[0].success);
    TEST_ASSERT_FALSE(results[0].continue_sequence);

    // A dead enemy is not a valid target either
    EffectContext dead_target = card_context(TargetType::SINGLE_ENEMY, 1);
    results = engine.resolve_effects(state, effects, dead_target);
    TEST_ASSERT_EQ(1u, results.size());
    TEST_ASSERT_EQ(0, state.player.block);
}

TEST(Effects, KillEndsSequence) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 5);

    EffectContext ctx = card_context(TargetType::SINGLE_ENEMY, 0);
    auto results = engine.resolve_effects(state, {make_effect(EffectKind::DAMAGE, 6),
                                                  make_effect(EffectKind::BLOCK, 5, TargetType::SELF)},
                                          ctx);

    TEST_ASSERT_EQ(1u, results.size());
    TEST_ASSERT(state.phase == CombatPhase::VICTORY);
    TEST_ASSERT_TRUE(ctx.killed_enemy);
    TEST_ASSERT_EQ(0, state.player.block);
    TEST_ASSERT_EQ(1, count_events(state.pending_events, RelicTrigger::ENEMY_KILLED));
    TEST_ASSERT_EQ(1, count_events(state.pending_events, RelicTrigger::COMBAT_VICTORY));
}

TEST(Effects, DamageEqualBlock) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    state.player.block = 9;

    EffectContext ctx = card_context(TargetType::SINGLE_ENEMY, 0);
    engine.resolve_effects(state, {make_effect(EffectKind::DAMAGE_EQUAL_BLOCK, 0)}, ctx);
    TEST_ASSERT_EQ(31, state.enemies[0].current_hp);
    TEST_ASSERT_EQ(9, state.player.block);
}

TEST(Effects, DamageIgnoreBlock) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    state.enemies[0].block = 10;

    EffectContext ctx = card_context(TargetType::SINGLE_ENEMY, 0);
    engine.resolve_effects(state, {make_effect(EffectKind::DAMAGE_IGNORE_BLOCK, 7)}, ctx);
    TEST_ASSERT_EQ(33, state.enemies[0].current_hp);
    TEST_ASSERT_EQ(10, state.enemies[0].block);
}

TEST(Effects, DamageEqualPoison) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    state.enemies[0].status.set(StatusKey::POISON, 7);

    EffectContext ctx = card_context(TargetType::SINGLE_ENEMY, 0);
    engine.resolve_effects(state, {make_effect(EffectKind::DAMAGE_EQUAL_POISON, 0)}, ctx);
    TEST_ASSERT_EQ(33, state.enemies[0].current_hp);
    TEST_ASSERT_EQ(7, state.enemies[0].get_status(StatusKey::POISON));
}

TEST(Effects, DamagePerDiscard) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    stock_zone(state, db, state.discard_pile, "strike", 4);

    EffectContext ctx = card_context(TargetType::SINGLE_ENEMY, 0);
    engine.resolve_effects(state, {make_effect(EffectKind::DAMAGE_PER_DISCARD, 2)}, ctx);
    TEST_ASSERT_EQ(32, state.enemies[0].current_hp);
}

TEST(Effects, ConditionalVulnerableHitsTwice) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 2, 40);
    state.enemies[0].status.set(StatusKey::VULNERABLE, 1);

    std::vector<EffectDef> effects = {make_effect(EffectKind::CONDITIONAL_DAMAGE_VULNERABLE, 4)};

    // 4 * 1.5 = 6, twice
    EffectContext vulnerable = card_context(TargetType::SINGLE_ENEMY, 0);
    engine.resolve_effects(state, effects, vulnerable);
    TEST_ASSERT_EQ(28, state.enemies[0].current_hp);

    EffectContext plain = card_context(TargetType::SINGLE_ENEMY, 1);
    engine.resolve_effects(state, effects, plain);
    TEST_ASSERT_EQ(36, state.enemies[1].current_hp);
}

TEST(Effects, XCostValueUsesEnergySpent) {
    EffectContext ctx = card_context(TargetType::ALL_ENEMIES);
    ctx.is_x_cost = true;
    ctx.energy_spent = 3;
    TEST_ASSERT_EQ(3, EffectEngine::effect_value(make_effect(EffectKind::DAMAGE_ALL, 0), ctx));
    TEST_ASSERT_EQ(5, EffectEngine::effect_value(make_effect(EffectKind::DAMAGE_ALL, 5), ctx));
}

// ============================================================================
// BLOCK / DRAW
// ============================================================================

TEST(Effects, CardBlockUsesDexterityPotionBlockIsRaw) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    state.player.status.set(StatusKey::DEXTERITY, 2);

    EffectContext card = card_context(TargetType::SELF);
    engine.resolve_effects(state, {make_effect(EffectKind::BLOCK, 5)}, card);
    TEST_ASSERT_EQ(7, state.player.block);
    TEST_ASSERT_EQ(1, count_events(state.pending_events, RelicTrigger::BLOCK_GAINED));

    EffectContext potion = card_context(TargetType::SELF);
    potion.source = EffectSource::POTION;
    engine.resolve_effects(state, {make_effect(EffectKind::BLOCK, 5)}, potion);
    TEST_ASSERT_EQ(12, state.player.block);
}

TEST(Effects, DrawShufflesDiscardWhenDrawPileRunsOut) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    stock_zone(state, db, state.draw_pile, "strike", 2);
    stock_zone(state, db, state.discard_pile, "defend", 3);

    EffectContext ctx = card_context(TargetType::SELF);
    auto results = engine.resolve_effects(state, {make_effect(EffectKind::DRAW, 4)}, ctx);

    TEST_ASSERT_EQ(4, *results[0].value);
    TEST_ASSERT_EQ(4, state.hand.count());
    TEST_ASSERT_EQ(1, state.draw_pile.count());
    TEST_ASSERT_EQ(0, state.discard_pile.count());
    TEST_ASSERT_EQ(1, state.shuffle_count);
    TEST_ASSERT_EQ(4, count_events(state.pending_events, RelicTrigger::CARD_DRAWN));
    TEST_ASSERT_EQ(1, count_events(state.pending_events, RelicTrigger::SHUFFLE));
}

TEST(Effects, DrawStopsAtHandLimit) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    stock_zone(state, db, state.hand, "strike", 9);
    stock_zone(state, db, state.draw_pile, "defend", 5);

    EffectContext ctx = card_context(TargetType::SELF);
    engine.resolve_effects(state, {make_effect(EffectKind::DRAW, 3)}, ctx);
    TEST_ASSERT_EQ(10, state.hand.count());
    TEST_ASSERT_EQ(4, state.draw_pile.count());
}

TEST(Effects, ConditionalDrawOnlyWithoutBlock) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    stock_zone(state, db, state.draw_pile, "strike", 5);

    std::vector<EffectDef> effects = {make_effect(EffectKind::CONDITIONAL_DRAW_NO_BLOCK, 2)};
    EffectContext ctx = card_context(TargetType::SELF);

    state.player.block = 3;
    engine.resolve_effects(state, effects, ctx);
    TEST_ASSERT_EQ(0, state.hand.count());

    state.player.block = 0;
    engine.resolve_effects(state, effects, ctx);
    TEST_ASSERT_EQ(2, state.hand.count());
}

// ============================================================================
// STATUSES
// ============================================================================

TEST(Effects, ArtifactVoidsEnemyDebuff) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    state.enemies[0].status.set(StatusKey::ARTIFACT, 1);

    EffectContext ctx = card_context(TargetType::SINGLE_ENEMY, 0);
    std::vector<EffectDef> weaken = {make_effect(EffectKind::APPLY_WEAK, 2)};

    auto results = engine.resolve_effects(state, weaken, ctx);
    TEST_ASSERT_EQ(0, *results[0].value);
    TEST_ASSERT_EQ(0, state.enemies[0].get_status(StatusKey::WEAK));
    TEST_ASSERT_EQ(0, state.enemies[0].get_status(StatusKey::ARTIFACT));

    engine.resolve_effects(state, weaken, ctx);
    TEST_ASSERT_EQ(2, state.enemies[0].get_status(StatusKey::WEAK));
}

TEST(Effects, BuffDefaultsToPlayer) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);

    // Debuff follows the card's enemy target, buff lands on the player
    EffectContext ctx = card_context(TargetType::SINGLE_ENEMY, 0);
    engine.resolve_effects(state, {make_effect(EffectKind::APPLY_VULNERABLE, 2),
                                   make_effect(EffectKind::APPLY_STRENGTH, 2)}, ctx);

    TEST_ASSERT_EQ(2, state.enemies[0].get_status(StatusKey::VULNERABLE));
    TEST_ASSERT_EQ(0, state.player.get_status(StatusKey::VULNERABLE));
    TEST_ASSERT_EQ(2, state.player.get_status(StatusKey::STRENGTH));
    TEST_ASSERT_EQ(1, count_events(state.pending_events, RelicTrigger::BUFF_GAINED));
}

TEST(Effects, MisspelledTargetIsSkipped) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 2, 40);

    CardDatabase catalog;
    TEST_ASSERT_TRUE(catalog.load_from_string(R"JSON(
    { "cards": [ { "id": "miscast", "name": "Miscast", "type": "SKILL", "cost": 1,
                   "targetType": "SELF",
                   "effects": [ { "type": "APPLY_WEAK", "value": 2, "target": "ALL_ENEMY" },
                                { "type": "DAMAGE", "value": 6, "target": "ALL_ENEMY" },
                                { "type": "BLOCK", "value": 4 } ] } ] }
    )JSON"));
    const CardDef* miscast = catalog.get_card("miscast");
    TEST_ASSERT_NOT_NULL(miscast);
    TEST_ASSERT(miscast->effects[0].target == TargetType::UNKNOWN);

    EffectContext ctx = card_context(miscast->target_type);
    auto results = engine.resolve_effects(state, miscast->effects, ctx);
    TEST_ASSERT_EQ(3u, results.size());
    TEST_ASSERT_FALSE(results[0].success);
    TEST_ASSERT_FALSE(results[1].success);
    TEST_ASSERT_EQ(0, state.player.get_status(StatusKey::WEAK));
    TEST_ASSERT_EQ(0, state.enemies[0].get_status(StatusKey::WEAK));
    TEST_ASSERT_EQ(0, state.enemies[1].get_status(StatusKey::WEAK));
    TEST_ASSERT_EQ(40, state.enemies[0].current_hp);
    TEST_ASSERT_EQ(40, state.enemies[1].current_hp);
    TEST_ASSERT_EQ(4, state.player.block);
}

TEST(Effects, ReduceStrengthOnEnemy) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);

    EffectContext ctx = card_context(TargetType::SINGLE_ENEMY, 0);
    engine.resolve_effects(state, {make_effect(EffectKind::REDUCE_STRENGTH, 3)}, ctx);
    TEST_ASSERT_EQ(-3, state.enemies[0].get_status(StatusKey::STRENGTH));
}

TEST(Effects, PlayerArtifactPreventsSelfDebuff) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    state.player.status.set(StatusKey::ARTIFACT, 1);

    EffectContext ctx = card_context(TargetType::SELF);
    engine.resolve_effects(state, {make_effect(EffectKind::APPLY_FRAIL, 2, TargetType::SELF)}, ctx);
    TEST_ASSERT_EQ(0, state.player.get_status(StatusKey::FRAIL));
    TEST_ASSERT_EQ(1, count_events(state.pending_events, RelicTrigger::DEBUFF_PREVENTED));
}

// ============================================================================
// CARD CREATION / HAND MANIPULATION
// ============================================================================

TEST(Effects, UnknownCardIdFailsButContinues) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);

    EffectDef add = make_effect(EffectKind::ADD_TO_HAND, 1);
    add.card_ref = std::string("no_such_card");

    EffectContext ctx = card_context(TargetType::SELF);
    auto results = engine.resolve_effects(state, {add, make_effect(EffectKind::BLOCK, 5)}, ctx);
    TEST_ASSERT_EQ(2u, results.size());
    TEST_ASSERT_FALSE(results[0].success);
    TEST_ASSERT_EQ(0, state.hand.count());
    TEST_ASSERT_EQ(5, state.player.block);
}

TEST(Effects, AddToFullHandGoesToDiscard) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    stock_zone(state, db, state.hand, "strike", 10);

    EffectDef add = make_effect(EffectKind::ADD_TO_HAND, 2);
    add.card_ref = std::string("wound");

    EffectContext ctx = card_context(TargetType::SELF);
    engine.resolve_effects(state, {add}, ctx);
    TEST_ASSERT_EQ(10, state.hand.count());
    TEST_ASSERT_EQ(2, state.discard_pile.count());
    TEST_ASSERT_EQ(std::string("wound"), state.discard_pile.cards[0].card_id());
}

TEST(Effects, AddToDrawAtTop) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    stock_zone(state, db, state.draw_pile, "strike", 3);

    EffectDef add = make_effect(EffectKind::ADD_TO_DRAW, 1);
    add.card_ref = std::string("wound");
    add.position = PilePosition::TOP;

    EffectContext ctx = card_context(TargetType::SELF);
    engine.resolve_effects(state, {add}, ctx);
    TEST_ASSERT_EQ(4, state.draw_pile.count());
    TEST_ASSERT_EQ(std::string("wound"), state.draw_pile.cards[0].card_id());
}

TEST(Effects, DuplicateKeepsUpgrade) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);

    CardInstance source = state.player.make_card(*db.get_card("strike"));
    source.upgrade();

    EffectContext ctx = card_context(TargetType::SELF);
    ctx.source_card = &source;
    ctx.source_id = source.id;
    engine.resolve_effects(state, {make_effect(EffectKind::DUPLICATE_CARD, 2)}, ctx);

    TEST_ASSERT_EQ(2, state.hand.count());
    for (const auto& copy : state.hand.cards) {
        TEST_ASSERT_EQ(std::string("strike"), copy.card_id());
        TEST_ASSERT_TRUE(copy.upgraded);
        TEST_ASSERT_NE(source.id, copy.id);
    }
    TEST_ASSERT_NE(state.hand.cards[0].id, state.hand.cards[1].id);
}

TEST(Effects, ExhaustPrefersStatusCards) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    stock_zone(state, db, state.hand, "strike", 1);
    stock_zone(state, db, state.hand, "wound", 1);
    stock_zone(state, db, state.hand, "defend", 1);

    EffectContext ctx = card_context(TargetType::SELF);
    engine.resolve_effects(state, {make_effect(EffectKind::EXHAUST, 1)}, ctx);

    TEST_ASSERT_EQ(2, state.hand.count());
    TEST_ASSERT_EQ(1, state.exhaust_pile.count());
    TEST_ASSERT_EQ(std::string("wound"), state.exhaust_pile.cards[0].card_id());
    TEST_ASSERT_EQ(1, count_events(state.pending_events, RelicTrigger::CARD_EXHAUSTED));
}

TEST(Effects, UpgradeInHand) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    stock_zone(state, db, state.hand, "strike", 1);
    stock_zone(state, db, state.hand, "wound", 1);

    EffectContext ctx = card_context(TargetType::SELF);
    auto results = engine.resolve_effects(state, {make_effect(EffectKind::UPGRADE_CARD, 3)}, ctx);

    // Only the strike can take an upgrade
    TEST_ASSERT_EQ(1, *results[0].value);
    TEST_ASSERT_TRUE(state.hand.cards[0].upgraded);
    TEST_ASSERT_FALSE(state.hand.cards[1].upgraded);
}

TEST(Effects, NextCardTwiceQueuesReplay) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);

    EffectContext ctx = card_context(TargetType::SELF);
    engine.resolve_effects(state, {make_effect(EffectKind::NEXT_CARD_TWICE, 0)}, ctx);
    TEST_ASSERT_EQ(1, state.replay_next_card);
}

// ============================================================================
// HP
// ============================================================================

TEST(Effects, HealPercent) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    state.player.current_hp = 10;

    EffectContext ctx = card_context(TargetType::SELF);
    engine.resolve_effects(state, {make_effect(EffectKind::HEAL_PERCENT, 20)}, ctx);
    TEST_ASSERT_EQ(20, state.player.current_hp);

    EffectDef fruit = make_effect(EffectKind::HEAL_PERCENT, 0);
    fruit.percentage = 0.5;
    engine.resolve_effects(state, {fruit}, ctx);
    TEST_ASSERT_EQ(45, state.player.current_hp);
}

TEST(Effects, LoseHpCanEndCombat) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    state.player.block = 20;

    EffectContext ctx = card_context(TargetType::SELF);
    auto results = engine.resolve_effects(state, {make_effect(EffectKind::LOSE_HP, 60),
                                                  make_effect(EffectKind::BLOCK, 5)}, ctx);

    TEST_ASSERT_EQ(1u, results.size());
    TEST_ASSERT_EQ(0, state.player.current_hp);
    TEST_ASSERT_EQ(20, state.player.block);
    TEST_ASSERT(state.phase == CombatPhase::DEFEAT);
    TEST_ASSERT_EQ(1, count_events(state.pending_events, RelicTrigger::COMBAT_END));
    TEST_ASSERT_EQ(0, count_events(state.pending_events, RelicTrigger::COMBAT_VICTORY));
}

TEST(Effects, UnknownKindSkipped) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);

    EffectDef unknown;
    unknown.kind = EffectKind::UNKNOWN;
    unknown.kind_name = "SUMMON_DRAGON";
    unknown.value = 3;

    EffectContext ctx = card_context(TargetType::SELF);
    auto results = engine.resolve_effects(state, {unknown, make_effect(EffectKind::BLOCK, 4)}, ctx);
    TEST_ASSERT_EQ(2u, results.size());
    TEST_ASSERT_FALSE(results[0].success);
    TEST_ASSERT_TRUE(results[0].continue_sequence);
    TEST_ASSERT_EQ(4, state.player.block);
}

// ============================================================================
// ENEMY ACTIONS / THORNS
// ============================================================================

TEST(Effects, EnemyAttackUsesStrengthAndVulnerable) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    state.enemies[0].status.set(StatusKey::STRENGTH, 2);
    state.player.status.set(StatusKey::VULNERABLE, 1);
    state.player.block = 5;

    // (6 + 2) * 1.5 = 12 against 5 block
    engine.apply_enemy_action(state, 0, make_action(EnemyActionKind::DAMAGE, 6));
    TEST_ASSERT_EQ(0, state.player.block);
    TEST_ASSERT_EQ(43, state.player.current_hp);
    TEST_ASSERT_EQ(1, count_events(state.pending_events, RelicTrigger::PLAYER_DAMAGED));
    TEST_ASSERT_EQ(1, count_events(state.pending_events, RelicTrigger::BLOCK_BROKEN));
    TEST_ASSERT_EQ(1, count_events(state.pending_events, RelicTrigger::FIRST_DAMAGE_COMBAT));
}

TEST(Effects, EnemyMultiHitStopsAtDeath) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    state.player.current_hp = 7;

    engine.apply_enemy_action(state, 0, make_action(EnemyActionKind::DAMAGE, 5, 4));
    TEST_ASSERT_EQ(0, state.player.current_hp);
    TEST_ASSERT(state.phase == CombatPhase::DEFEAT);
    TEST_ASSERT_EQ(2, count_events(state.pending_events, RelicTrigger::PLAYER_DAMAGED));
}

TEST(Effects, ReduceDamageRelic) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    state.player.obtain_relic(make_relic("torii", RelicTrigger::PASSIVE,
                                         RelicAction::REDUCE_DAMAGE, 1));

    engine.apply_enemy_action(state, 0, make_action(EnemyActionKind::DAMAGE, 6, 2));
    TEST_ASSERT_EQ(40, state.player.current_hp);
}

TEST(Effects, PlayerThornsAnswerEachHit) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    state.player.status.set(StatusKey::THORNS, 3);
    state.enemies[0].status.set(StatusKey::VULNERABLE, 2);

    engine.apply_enemy_action(state, 0, make_action(EnemyActionKind::DAMAGE, 5, 2));
    TEST_ASSERT_EQ(40, state.player.current_hp);
    // Thorns skip vulnerable
    TEST_ASSERT_EQ(34, state.enemies[0].current_hp);
}

TEST(Effects, EnemyThornsAnswerCardsNotPotions) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    state.enemies[0].status.set(StatusKey::THORNS, 4);

    EffectContext card = card_context(TargetType::SINGLE_ENEMY, 0);
    engine.resolve_effects(state, {make_effect(EffectKind::DAMAGE, 6, std::nullopt, 2)}, card);
    TEST_ASSERT_EQ(42, state.player.current_hp);

    EffectContext potion = card_context(TargetType::SINGLE_ENEMY, 0);
    potion.source = EffectSource::POTION;
    engine.resolve_effects(state, {make_effect(EffectKind::DAMAGE, 6)}, potion);
    TEST_ASSERT_EQ(42, state.player.current_hp);
    TEST_ASSERT_EQ(22, state.enemies[0].current_hp);
}

TEST(Effects, PotionDamageIgnoresStrength) {
    CardDatabase db;
    build_test_catalog(db);
    RandomDraw random = make_seeded_random(3);
    EffectEngine engine(db, random);
    CombatState state = make_effect_state(db, 1, 40);
    state.player.status.set(StatusKey::STRENGTH, 5);
    state.player.status.set(StatusKey::WEAK, 2);
    state.enemies[0].status.set(StatusKey::VULNERABLE, 1);

    EffectContext potion = card_context(TargetType::SINGLE_ENEMY, 0);
    potion.source = EffectSource::POTION;
    engine.resolve_effects(state, {make_effect(EffectKind::DAMAGE, 20)}, potion);
    TEST_ASSERT_EQ(10, state.enemies[0].current_hp);
}
