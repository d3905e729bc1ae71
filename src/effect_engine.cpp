/**
 * Descent Combat Engine - Effect Resolution Engine Implementation
 */

#include "effect_engine.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace descent {

EffectEngine::EffectEngine(const CardDatabase& db, const RandomDraw& random)
    : db_(db)
    , random_(random)
{}

// ============================================================================
// HELPERS
// ============================================================================

int EffectEngine::effect_value(const EffectDef& effect, const EffectContext& ctx) {
    if (ctx.is_x_cost && effect.value == 0) {
        return ctx.energy_spent;
    }
    return effect.value;
}

EffectResult EffectEngine::unknown_target(const EffectDef& effect, const EffectContext& ctx) {
    std::cerr << "[EffectEngine] Skipping " << to_string(effect.kind)
              << " with unknown target from " << ctx.source_id << std::endl;
    return EffectResult::fail(std::string("unknown target for ") + to_string(effect.kind));
}

std::vector<size_t> EffectEngine::resolve_targets(const CombatState& state,
                                                  TargetType target_type,
                                                  std::optional<size_t> chosen) const {
    switch (target_type) {
        case TargetType::SELF:
            return {};
        case TargetType::SINGLE_ENEMY:
            if (chosen && state.is_valid_enemy_target(*chosen)) {
                return {*chosen};
            }
            return {};
        case TargetType::ALL_ENEMIES:
            return state.living_enemy_indices();
        case TargetType::RANDOM_ENEMY: {
            auto pick = random_living_enemy(state);
            if (pick) return {*pick};
            return {};
        }
        case TargetType::UNKNOWN:
            return {};
    }
    return {};
}

std::optional<size_t> EffectEngine::random_living_enemy(const CombatState& state) const {
    std::vector<size_t> living = state.living_enemy_indices();
    if (living.empty()) {
        return std::nullopt;
    }
    return living[static_cast<size_t>(random_index(random_, static_cast<int>(living.size())))];
}

const CardDef* EffectEngine::random_catalog_card(const CardDef* exclude) const {
    std::vector<const CardDef*> pool;
    for (const auto& id : db_.get_all_card_ids()) {
        const CardDef* def = db_.get_card(id);
        if (def->type == CardType::STATUS || def->type == CardType::CURSE) continue;
        if (exclude && def->card_id == exclude->card_id) continue;
        pool.push_back(def);
    }
    if (pool.empty()) {
        return nullptr;
    }
    return pool[static_cast<size_t>(random_index(random_, static_cast<int>(pool.size())))];
}

int EffectEngine::player_damage_reduction(const Player& player) {
    int reduction = 0;
    for (const auto& relic : player.relics) {
        for (const auto& effect : relic.def.effects) {
            if (effect.action == RelicAction::REDUCE_DAMAGE) {
                reduction += std::max(0, effect.value);
            }
        }
    }
    return reduction;
}

// ============================================================================
// DAMAGE PRIMITIVES
// ============================================================================

void EffectEngine::record_enemy_hit(CombatState& state, size_t enemy_index,
                                    const HitResult& hit, const std::string& source) const {
    if (hit.damage > 0) {
        state.emit(RelicTrigger::DAMAGE_DEALT, hit.hp_lost, source, static_cast<int>(enemy_index));
    }
    if (hit.killed) {
        state.emit(RelicTrigger::ENEMY_KILLED, 0, state.enemies[enemy_index].id,
                   static_cast<int>(enemy_index));
    }
}

HitResult EffectEngine::attack_enemy(CombatState& state, size_t enemy_index, int base_damage,
                                     EffectContext& ctx, bool ignore_block) const {
    if (!state.is_valid_enemy_target(enemy_index)) {
        return {};
    }
    Enemy& enemy = state.enemies[enemy_index];

    // Strength and weak modify attacks only; potion damage is flat
    const bool from_card = ctx.source == EffectSource::CARD;
    HitResult hit = enemy.take_damage(base_damage + ctx.bonus_damage_per_hit,
                                      from_card ? state.player.get_status(StatusKey::STRENGTH) : 0,
                                      from_card ? state.player.get_status(StatusKey::WEAK) : 0,
                                      ignore_block);
    record_enemy_hit(state, enemy_index, hit, ctx.source_id);
    if (hit.killed) {
        ctx.killed_enemy = true;
    }

    // Thorns answer attacks, not potions or relics
    int thorns = calc::thorns_damage(enemy.get_status(StatusKey::THORNS));
    if (ctx.source == EffectSource::CARD && thorns > 0 && state.player.is_alive()) {
        HitResult reflected = state.player.take_damage_direct(thorns);
        state.record_player_hit(reflected, static_cast<int>(enemy_index));
    }

    state.update_outcome();
    return hit;
}

HitResult EffectEngine::damage_enemy_direct(CombatState& state, size_t enemy_index, int amount,
                                            const std::string& source) const {
    if (!state.is_valid_enemy_target(enemy_index) || amount <= 0) {
        return {};
    }
    HitResult hit = state.enemies[enemy_index].take_damage_direct(amount);
    record_enemy_hit(state, enemy_index, hit, source);
    state.update_outcome();
    return hit;
}

// ============================================================================
// EFFECT LISTS
// ============================================================================

std::vector<EffectResult> EffectEngine::resolve_effects(CombatState& state,
                                                        const std::vector<EffectDef>& effects,
                                                        EffectContext& ctx) const {
    std::vector<EffectResult> results;
    results.reserve(effects.size());

    for (const auto& effect : effects) {
        if (state.is_over()) {
            break;
        }
        results.push_back(resolve_effect(state, effect, ctx));
        if (!results.back().continue_sequence) {
            break;
        }
    }

    return results;
}

EffectResult EffectEngine::resolve_effect(CombatState& state, const EffectDef& effect,
                                          EffectContext& ctx) const {
    EffectResult result;
    Player& player = state.player;
    const int value = effect_value(effect, ctx);

    switch (effect.kind) {
        // Damage
        case EffectKind::DAMAGE:
        case EffectKind::DAMAGE_ALL:
        case EffectKind::DAMAGE_RANDOM:
        case EffectKind::DAMAGE_EQUAL_BLOCK:
        case EffectKind::DAMAGE_IGNORE_BLOCK:
        case EffectKind::DAMAGE_EQUAL_POISON:
        case EffectKind::DAMAGE_PER_DISCARD:
        case EffectKind::CONDITIONAL_DAMAGE_VULNERABLE:
            result = resolve_damage(state, effect, ctx);
            break;

        // Block
        case EffectKind::BLOCK: {
            int gained = 0;
            for (int i = 0; i < effect.times; ++i) {
                gained += ctx.source == EffectSource::CARD ? player.gain_block(value)
                                                           : player.gain_block_raw(value);
            }
            if (gained > 0) {
                state.emit(RelicTrigger::BLOCK_GAINED, gained, ctx.source_id);
            }
            result = EffectResult::ok(gained);
            break;
        }
        case EffectKind::DOUBLE_BLOCK: {
            int gained = player.gain_block_raw(player.block);
            if (gained > 0) {
                state.emit(RelicTrigger::BLOCK_GAINED, gained, ctx.source_id);
            }
            result = EffectResult::ok(gained);
            break;
        }

        // Cards
        case EffectKind::DRAW:
            result = EffectResult::ok(state.draw_cards(value, random_));
            break;
        case EffectKind::CONDITIONAL_DRAW_NO_BLOCK:
            result = EffectResult::ok(player.block == 0 ? state.draw_cards(value, random_) : 0);
            break;
        case EffectKind::DISCARD:
            result = EffectResult::ok(discard_random_from_hand(state, value));
            break;
        case EffectKind::EXHAUST:
            result = EffectResult::ok(exhaust_from_hand(state, std::max(1, value)));
            break;
        case EffectKind::ADD_TO_HAND:
        case EffectKind::ADD_TO_DISCARD:
        case EffectKind::ADD_TO_DRAW:
        case EffectKind::DUPLICATE_CARD:
            result = resolve_card_creation(state, effect, ctx);
            break;
        case EffectKind::SHUFFLE_DISCARD:
            result = EffectResult::ok(state.shuffle_discard_into_draw(random_) ? 1 : 0);
            break;

        // Energy
        case EffectKind::GAIN_ENERGY:
            result = EffectResult::ok(player.gain_energy(value));
            break;
        case EffectKind::LOSE_ENERGY:
            result = EffectResult::ok(player.lose_energy(value));
            break;
        case EffectKind::CONDITIONAL_ENERGY_ON_KILL:
            result = EffectResult::ok(ctx.killed_enemy ? player.gain_energy(value) : 0);
            break;

        // HP
        case EffectKind::HEAL: {
            int amount = effect.percentage > 0.0
                ? static_cast<int>(std::floor(player.max_hp * effect.percentage))
                : value;
            result = EffectResult::ok(player.heal(amount));
            break;
        }
        case EffectKind::HEAL_PERCENT: {
            double fraction = effect.percentage > 0.0 ? effect.percentage : value / 100.0;
            result = EffectResult::ok(player.heal(static_cast<int>(std::floor(player.max_hp * fraction))));
            break;
        }
        case EffectKind::LOSE_HP: {
            int lost = player.lose_hp(value);
            state.record_player_hp_loss(lost);
            state.update_outcome();
            result = EffectResult::ok(lost);
            break;
        }
        case EffectKind::GAIN_MAX_HP:
            player.increase_max_hp(value);
            result = EffectResult::ok(value);
            break;

        // Statuses
        case EffectKind::APPLY_STRENGTH:
        case EffectKind::APPLY_DEXTERITY:
        case EffectKind::APPLY_ARTIFACT:
        case EffectKind::APPLY_PLATED_ARMOR:
        case EffectKind::APPLY_THORNS:
        case EffectKind::APPLY_RITUAL:
        case EffectKind::APPLY_INTANGIBLE:
        case EffectKind::APPLY_REGEN:
        case EffectKind::APPLY_VULNERABLE:
        case EffectKind::APPLY_WEAK:
        case EffectKind::APPLY_FRAIL:
        case EffectKind::APPLY_POISON:
        case EffectKind::REDUCE_STRENGTH:
            result = resolve_status(state, effect, ctx);
            break;

        // Special
        case EffectKind::UPGRADE_CARD:
            result = EffectResult::ok(upgrade_random_in_hand(state, std::max(1, value)));
            break;
        case EffectKind::TRANSFORM_CARD:
            result = EffectResult::ok(transform_random_in_hand(state, std::max(1, value)));
            break;
        case EffectKind::NEXT_CARD_TWICE:
            state.replay_next_card += std::max(1, value);
            result = EffectResult::ok(state.replay_next_card);
            break;
        case EffectKind::SCRY:
            result = EffectResult::ok(state.scry_auto(value));
            break;
        case EffectKind::RETAIN_HAND:
            state.retain_hand = true;
            result = EffectResult::ok();
            break;

        case EffectKind::UNKNOWN:
            std::cerr << "[EffectEngine] Skipping unknown effect '" << effect.kind_name
                      << "' from " << ctx.source_id << std::endl;
            result = EffectResult::fail("unknown effect: " + effect.kind_name);
            break;
    }

    if (state.is_over()) {
        result.continue_sequence = false;
    }
    return result;
}

// ============================================================================
// DAMAGE EFFECTS
// ============================================================================

EffectResult EffectEngine::resolve_damage(CombatState& state, const EffectDef& effect,
                                          EffectContext& ctx) const {
    const int value = effect_value(effect, ctx);
    TargetType target_type = effect.target.value_or(ctx.default_target);
    if (target_type == TargetType::UNKNOWN) {
        return unknown_target(effect, ctx);
    }

    if (effect.kind == EffectKind::DAMAGE_ALL) {
        target_type = TargetType::ALL_ENEMIES;
    } else if (effect.kind == EffectKind::DAMAGE_RANDOM) {
        target_type = TargetType::RANDOM_ENEMY;
    } else if (target_type == TargetType::SELF) {
        // Damage never aims at the player; fall back to the chosen enemy
        target_type = ctx.target ? TargetType::SINGLE_ENEMY : TargetType::RANDOM_ENEMY;
    }

    if (target_type == TargetType::SINGLE_ENEMY &&
        (!ctx.target || !state.is_valid_enemy_target(*ctx.target))) {
        return EffectResult::fail("no valid target", true);
    }

    int total = 0;
    for (int hit = 0; hit < effect.times; ++hit) {
        // Random targets are re-sampled every hit
        std::vector<size_t> targets = resolve_targets(state, target_type, ctx.target);
        if (targets.empty()) {
            break;
        }

        for (size_t index : targets) {
            const Enemy& enemy = state.enemies[index];
            int base = value;
            int repeats = 1;
            bool ignore_block = false;

            switch (effect.kind) {
                case EffectKind::DAMAGE_EQUAL_BLOCK:
                    base = state.player.block;
                    break;
                case EffectKind::DAMAGE_IGNORE_BLOCK:
                    ignore_block = true;
                    break;
                case EffectKind::DAMAGE_EQUAL_POISON:
                    base = enemy.get_status(StatusKey::POISON);
                    break;
                case EffectKind::DAMAGE_PER_DISCARD:
                    base = value * state.discard_pile.count();
                    break;
                case EffectKind::CONDITIONAL_DAMAGE_VULNERABLE:
                    repeats = enemy.get_status(StatusKey::VULNERABLE) > 0 ? 2 : 1;
                    break;
                default:
                    break;
            }

            for (int r = 0; r < repeats; ++r) {
                total += attack_enemy(state, index, base, ctx, ignore_block).hp_lost;
                if (state.is_over()) {
                    return EffectResult::ok(total);
                }
            }
        }
    }

    return EffectResult::ok(total);
}

// ============================================================================
// STATUS EFFECTS
// ============================================================================

EffectResult EffectEngine::resolve_status(CombatState& state, const EffectDef& effect,
                                          EffectContext& ctx) const {
    std::optional<StatusKey> key = status_for_effect(effect.kind);
    if (!key) {
        return EffectResult::fail("not a status effect");
    }

    int amount = effect_value(effect, ctx);
    if (effect.kind == EffectKind::REDUCE_STRENGTH) {
        amount = -amount;
    }

    // Debuffs default to the card's enemy target; buffs default to the player
    TargetType target_type = effect.target.value_or(
        is_debuff_effect(effect.kind) ? ctx.default_target : TargetType::SELF);
    if (target_type == TargetType::UNKNOWN) {
        return unknown_target(effect, ctx);
    }

    if (target_type == TargetType::SELF) {
        bool applied = state.player.apply_status(*key, amount);
        if (!applied) {
            state.emit(RelicTrigger::DEBUFF_PREVENTED, std::abs(amount), to_string(*key));
        } else if (is_buff_effect(effect.kind)) {
            state.emit(RelicTrigger::BUFF_GAINED, amount, to_string(*key));
        }
        return EffectResult::ok(applied ? amount : 0);
    }

    if (target_type == TargetType::SINGLE_ENEMY &&
        (!ctx.target || !state.is_valid_enemy_target(*ctx.target))) {
        return EffectResult::fail("no valid target", true);
    }

    std::vector<size_t> targets = resolve_targets(state, target_type, ctx.target);
    int applied_count = 0;
    for (size_t index : targets) {
        if (state.enemies[index].apply_status(*key, amount)) {
            applied_count++;
        }
    }

    EffectResult result = EffectResult::ok(applied_count > 0 ? amount : 0);
    result.success = !targets.empty();
    return result;
}

// ============================================================================
// CARD CREATION
// ============================================================================

EffectResult EffectEngine::resolve_card_creation(CombatState& state, const EffectDef& effect,
                                                 EffectContext& ctx) const {
    const CardDef* def = nullptr;
    if (effect.card_ref) {
        def = db_.get_card(*effect.card_ref);
        if (!def) {
            std::cerr << "[EffectEngine] " << to_string(effect.kind) << ": unknown card id '"
                      << *effect.card_ref << "'" << std::endl;
            return EffectResult::fail("unknown card id: " + *effect.card_ref);
        }
    } else if (effect.kind == EffectKind::DUPLICATE_CARD && ctx.source_card) {
        def = &ctx.source_card->def;
    } else {
        std::cerr << "[EffectEngine] " << to_string(effect.kind)
                  << ": no card to create" << std::endl;
        return EffectResult::fail("missing cardId");
    }

    int copies = std::max(1, effect_value(effect, ctx));
    for (int i = 0; i < copies; ++i) {
        CardInstance card = state.player.make_card(*def);
        if (effect.kind == EffectKind::DUPLICATE_CARD && ctx.source_card && !effect.card_ref) {
            card.upgraded = ctx.source_card->upgraded;
        }
        switch (effect.kind) {
            case EffectKind::ADD_TO_DISCARD:
                state.move_to_discard(std::move(card));
                break;
            case EffectKind::ADD_TO_DRAW:
                state.draw_pile.add_at(std::move(card), effect.position, random_);
                break;
            default:
                state.add_to_hand(std::move(card));
                break;
        }
    }

    return EffectResult::ok(copies);
}

// ============================================================================
// HAND MANIPULATION
// ============================================================================

int EffectEngine::discard_random_from_hand(CombatState& state, int count) const {
    int discarded = 0;
    for (int i = 0; i < count && !state.hand.is_empty(); ++i) {
        size_t index = static_cast<size_t>(random_index(random_, state.hand.count()));
        std::optional<CardInstance> card = state.hand.take_at(index);
        CardID id = card->id;
        state.move_to_discard(std::move(*card));
        state.emit(RelicTrigger::CARD_DISCARDED, 1, id);
        discarded++;
    }
    return discarded;
}

int EffectEngine::exhaust_from_hand(CombatState& state, int count) const {
    int exhausted = 0;
    for (int i = 0; i < count && !state.hand.is_empty(); ++i) {
        // Status and curse cards go first
        std::optional<size_t> index;
        for (size_t j = 0; j < state.hand.cards.size(); ++j) {
            CardType type = state.hand.cards[j].type();
            if (type == CardType::STATUS || type == CardType::CURSE) {
                index = j;
                break;
            }
        }
        if (!index) {
            index = static_cast<size_t>(random_index(random_, state.hand.count()));
        }
        std::optional<CardInstance> card = state.hand.take_at(*index);
        state.move_to_exhaust(std::move(*card));
        exhausted++;
    }
    return exhausted;
}

int EffectEngine::upgrade_random_in_hand(CombatState& state, int count) const {
    int upgraded = 0;
    for (int i = 0; i < count; ++i) {
        std::vector<size_t> candidates;
        for (size_t j = 0; j < state.hand.cards.size(); ++j) {
            if (state.hand.cards[j].can_upgrade()) {
                candidates.push_back(j);
            }
        }
        if (candidates.empty()) {
            break;
        }
        size_t pick = candidates[static_cast<size_t>(
            random_index(random_, static_cast<int>(candidates.size())))];
        if (state.hand.cards[pick].upgrade()) {
            upgraded++;
        }
    }
    return upgraded;
}

int EffectEngine::transform_random_in_hand(CombatState& state, int count) const {
    int transformed = 0;
    for (int i = 0; i < count && !state.hand.is_empty(); ++i) {
        size_t index = static_cast<size_t>(random_index(random_, state.hand.count()));
        CardInstance& card = state.hand.cards[index];
        const CardDef* replacement = random_catalog_card(&card.def);
        if (!replacement) {
            break;
        }
        // Same instance id, new contents
        card.def = *replacement;
        card.upgraded = false;
        transformed++;
    }
    return transformed;
}

// ============================================================================
// ENEMY ACTIONS
// ============================================================================

void EffectEngine::apply_enemy_action(CombatState& state, size_t enemy_index,
                                      const EnemyActionDef& action) const {
    if (enemy_index >= state.enemies.size()) {
        return;
    }
    Enemy& enemy = state.enemies[enemy_index];
    Player& player = state.player;

    auto debuff_player = [&state, &player](StatusKey key, int amount) {
        if (!player.apply_status(key, amount)) {
            state.emit(RelicTrigger::DEBUFF_PREVENTED, amount, to_string(key));
        }
    };

    switch (action.kind) {
        case EnemyActionKind::DAMAGE: {
            int reduction = player_damage_reduction(player);
            for (int i = 0; i < action.times; ++i) {
                if (enemy.is_dead() || player.is_dead()) break;

                int damage = calc::outgoing_damage(action.value,
                                                   enemy.get_status(StatusKey::STRENGTH),
                                                   enemy.get_status(StatusKey::WEAK));
                damage = calc::incoming_damage(damage,
                                               player.get_status(StatusKey::VULNERABLE),
                                               player.get_status(StatusKey::INTANGIBLE));
                damage = std::max(0, damage - reduction);

                HitResult hit = player.absorb_damage(damage);
                state.record_player_hit(hit, static_cast<int>(enemy_index));

                int thorns = calc::thorns_damage(player.get_status(StatusKey::THORNS));
                if (thorns > 0 && enemy.is_alive()) {
                    HitResult reflected = enemy.take_damage_direct(thorns);
                    record_enemy_hit(state, enemy_index, reflected, "thorns");
                }

                if (state.update_outcome()) break;
            }
            break;
        }
        case EnemyActionKind::APPLY_WEAK:
            debuff_player(StatusKey::WEAK, action.value);
            break;
        case EnemyActionKind::APPLY_VULNERABLE:
            debuff_player(StatusKey::VULNERABLE, action.value);
            break;
        case EnemyActionKind::APPLY_FRAIL:
            debuff_player(StatusKey::FRAIL, action.value);
            break;
        case EnemyActionKind::APPLY_POISON:
            debuff_player(StatusKey::POISON, action.value);
            break;
        case EnemyActionKind::APPLY_BLOCK_SELF:
            enemy.gain_block(action.value);
            break;
        case EnemyActionKind::APPLY_STRENGTH_SELF:
            enemy.apply_status(StatusKey::STRENGTH, action.value);
            break;
        case EnemyActionKind::APPLY_RITUAL_SELF:
            enemy.apply_status(StatusKey::RITUAL, action.value);
            break;
        case EnemyActionKind::APPLY_ARTIFACT_SELF:
            enemy.apply_status(StatusKey::ARTIFACT, action.value);
            break;
        case EnemyActionKind::APPLY_PLATED_ARMOR_SELF:
            enemy.apply_status(StatusKey::PLATED_ARMOR, action.value);
            break;
        case EnemyActionKind::APPLY_THORNS_SELF:
            enemy.apply_status(StatusKey::THORNS, action.value);
            break;
        case EnemyActionKind::UNKNOWN:
            std::cerr << "[EffectEngine] " << enemy.name << ": skipping unknown action '"
                      << action.kind_name << "'" << std::endl;
            break;
    }
}

// ============================================================================
// RELIC ACTIVATIONS
// ============================================================================

EffectResult EffectEngine::apply_relic_activation(CombatState& state,
                                                  const RelicActivation& activation,
                                                  const CombatEvent& event) const {
    Player& player = state.player;
    const RelicEffectDef& effect = activation.effect;
    const int amount = activation.amount;
    const std::string& source = activation.relic_id;

    switch (effect.action) {
        case RelicAction::HEAL:
            return EffectResult::ok(player.heal(amount));

        case RelicAction::BLOCK:
        case RelicAction::BLOCK_EVERY_N:
            return EffectResult::ok(player.gain_block_raw(amount));

        case RelicAction::DRAW:
        case RelicAction::DRAW_EVERY_N:
            if (amount <= 0) return EffectResult::ok(0);
            return EffectResult::ok(state.draw_cards(amount, random_));

        case RelicAction::GAIN_ENERGY:
        case RelicAction::ENERGY_EVERY_N:
        case RelicAction::ENERGY_SHUFFLE_N:
            return EffectResult::ok(player.gain_energy(amount));

        case RelicAction::GAIN_STRENGTH:
        case RelicAction::STRENGTH_EVERY_N:
            player.apply_status(StatusKey::STRENGTH, amount);
            state.emit(RelicTrigger::BUFF_GAINED, amount, to_string(StatusKey::STRENGTH));
            return EffectResult::ok(amount);

        case RelicAction::GAIN_DEXTERITY:
        case RelicAction::DEXTERITY_EVERY_N:
            player.apply_status(StatusKey::DEXTERITY, amount);
            state.emit(RelicTrigger::BUFF_GAINED, amount, to_string(StatusKey::DEXTERITY));
            return EffectResult::ok(amount);

        case RelicAction::INTANGIBLE_EVERY_N:
            player.apply_status(StatusKey::INTANGIBLE, amount);
            return EffectResult::ok(amount);

        case RelicAction::GAIN_MAX_HP:
            player.increase_max_hp(amount);
            return EffectResult::ok(amount);

        case RelicAction::GAIN_GOLD:
            player.gain_gold(amount);
            state.emit(RelicTrigger::GOLD_GAINED, amount, source);
            return EffectResult::ok(amount);

        case RelicAction::THORNS: {
            // Answer the attacker when the event names one
            std::optional<size_t> target;
            if (event.target_index >= 0 &&
                state.is_valid_enemy_target(static_cast<size_t>(event.target_index))) {
                target = static_cast<size_t>(event.target_index);
            } else {
                target = random_living_enemy(state);
            }
            if (!target) return EffectResult::fail("no living enemy");
            return EffectResult::ok(damage_enemy_direct(state, *target, amount, source).hp_lost);
        }

        case RelicAction::DAMAGE_RANDOM: {
            std::optional<size_t> target = random_living_enemy(state);
            if (!target) return EffectResult::fail("no living enemy");
            return EffectResult::ok(damage_enemy_direct(state, *target, amount, source).hp_lost);
        }

        case RelicAction::DAMAGE_ALL:
        case RelicAction::DAMAGE_ALL_EVERY_N: {
            int total = 0;
            for (size_t index : state.living_enemy_indices()) {
                total += damage_enemy_direct(state, index, amount, source).hp_lost;
            }
            return EffectResult::ok(total);
        }

        case RelicAction::BONUS_DAMAGE:
            if (state.counters.first_attack_played_this_combat) {
                return EffectResult::ok(0);
            }
            state.first_attack_bonus += amount;
            return EffectResult::ok(state.first_attack_bonus);

        case RelicAction::ENERGY_EVERY_N_TURNS: {
            int period = effect.value > 0 ? effect.value : 3;
            if (state.turn % period != 0) return EffectResult::ok(0);
            return EffectResult::ok(player.gain_energy(effect.amount.value_or(1)));
        }

        case RelicAction::DRAW_IF_ATTACKS: {
            int threshold = effect.value > 0 ? effect.value : 3;
            if (state.counters.attacks_played_this_turn >= threshold) return EffectResult::ok(0);
            return EffectResult::ok(state.draw_cards(effect.amount.value_or(3), random_));
        }

        case RelicAction::PLATED_ARMOR:
            if (player.block != 0) return EffectResult::ok(0);
            return EffectResult::ok(player.gain_block_raw(amount));

        case RelicAction::HEAL_PERCENT:
            return EffectResult::ok(player.heal_if_below_half(amount));

        case RelicAction::ADD_RANDOM_CARD: {
            const CardDef* def = random_catalog_card();
            if (!def) return EffectResult::fail("catalog has no cards");
            state.add_to_hand(player.make_card(*def));
            return EffectResult::ok(1);
        }

        case RelicAction::UPGRADE_RANDOM:
            return EffectResult::ok(upgrade_random_in_hand(state, std::max(1, amount)));

        case RelicAction::ENERGY_NEXT_COMBAT:
            player.bonus_energy_next_combat = amount;
            return EffectResult::ok(amount);

        case RelicAction::POTION_SLOT:
            if (amount > 0) {
                player.potions.resize(player.potions.size() + static_cast<size_t>(amount));
            }
            return EffectResult::ok(amount);

        case RelicAction::APPLY_VULNERABLE:
        case RelicAction::APPLY_WEAK: {
            StatusKey key = effect.action == RelicAction::APPLY_VULNERABLE
                ? StatusKey::VULNERABLE : StatusKey::WEAK;
            int applied = 0;
            for (size_t index : state.living_enemy_indices()) {
                if (state.enemies[index].apply_status(key, amount)) applied++;
            }
            return EffectResult::ok(applied);
        }

        case RelicAction::REDUCE_DAMAGE:
        case RelicAction::RUN_MODIFIER:
            // Passive or run-level: nothing to do in combat
            return EffectResult::ok();

        case RelicAction::UNKNOWN:
            std::cerr << "[EffectEngine] Relic " << source << ": unknown action '"
                      << effect.action_name << "'" << std::endl;
            return EffectResult::fail("unknown relic action: " + effect.action_name);
    }

    return EffectResult::fail("unhandled relic action");
}

} // namespace descent
