/**
 * Descent Combat Engine - Engine Implementation
 *
 * Combat state machine: setup, card and potion play, end of turn,
 * the enemy turn and the relic event pass.
 */

#include "engine.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>

namespace descent {

CombatEngine::CombatEngine(const CardDatabase& card_db, RandomDraw random)
    : CombatEngine(card_db, card_db.get_config(), std::move(random))
{}

CombatEngine::CombatEngine(const CardDatabase& card_db, EngineConfig config, RandomDraw random)
    : card_db_(card_db)
    , config_(config)
    , random_(std::move(random))
    , effects_(card_db_, random_)
{}

// ============================================================================
// CORE API
// ============================================================================

std::vector<CombatAction> CombatEngine::get_legal_actions(const CombatState& state) const {
    if (!state.is_player_turn()) {
        return {};
    }

    std::vector<CombatAction> actions;
    std::vector<size_t> living = state.living_enemy_indices();

    auto add_with_targets = [&actions, &living](bool needs_target, auto make) {
        if (!needs_target) {
            actions.push_back(make(std::nullopt));
            return;
        }
        for (size_t target : living) {
            actions.push_back(make(target));
        }
    };

    for (size_t i = 0; i < state.hand.cards.size(); ++i) {
        const CardInstance& card = state.hand.cards[i];
        if (!card.is_playable()) continue;
        if (!card.def.is_x_cost && card.cost() > state.player.energy) continue;

        add_with_targets(card.needs_target(), [i](std::optional<size_t> target) {
            return CombatAction::play_card(i, target);
        });
    }

    for (size_t slot = 0; slot < state.player.potions.size(); ++slot) {
        const auto& potion = state.player.potions[slot];
        if (!potion || potion->target_type == TargetType::UNKNOWN) continue;

        add_with_targets(potion->target_type == TargetType::SINGLE_ENEMY,
                         [slot](std::optional<size_t> target) {
            return CombatAction::use_potion(slot, target);
        });
    }

    actions.push_back(CombatAction::end_turn());
    return actions;
}

CombatState CombatEngine::step(const CombatState& state, const CombatAction& action) const {
    CombatState new_state = state.clone();
    step_inplace(new_state, action);
    return new_state;
}

ActionResult CombatEngine::step_inplace(CombatState& state, const CombatAction& action) const {
    switch (action.action_type) {
        case ActionType::PLAY_CARD:
            return play_card(state, action.index, action.target);
        case ActionType::USE_POTION:
            return use_potion(state, action.index, action.target);
        case ActionType::END_TURN:
            return end_turn(state);
    }
    return reject(state, "unknown action type");
}

// ============================================================================
// COMBAT SETUP
// ============================================================================

Player CombatEngine::create_player(const std::vector<CardDefID>& deck, int max_hp) const {
    Player player("Player", max_hp);
    player.max_energy = config_.base_energy;
    player.energy_cap_bonus = config_.energy_cap_bonus;

    for (const auto& card_id : deck) {
        const CardDef* def = card_db_.get_card(card_id);
        if (!def) {
            std::cerr << "[CombatEngine] Unknown card in starting deck: " << card_id << std::endl;
            continue;
        }
        player.add_card_to_deck(*def);
    }
    return player;
}

ActionResult CombatEngine::start_combat(CombatState& state, const Player& player,
                                        const std::vector<EnemyDefID>& enemy_ids) const {
    std::vector<Enemy> enemies;
    enemies.reserve(enemy_ids.size());

    for (const auto& enemy_id : enemy_ids) {
        const EnemyDef* def = card_db_.get_enemy(enemy_id);
        if (!def) {
            std::cerr << "[CombatEngine] Unknown enemy: " << enemy_id << std::endl;
            continue;
        }
        std::string instance_id = "enemy_" + std::to_string(enemies.size());
        enemies.push_back(Enemy::from_def(*def, instance_id, random_, config_.enemy_hp_variance));
    }

    return start_combat_with(state, player, std::move(enemies));
}

ActionResult CombatEngine::start_combat_with(CombatState& state, const Player& player,
                                             std::vector<Enemy> enemies) const {
    if (enemies.empty()) {
        return reject(state, "no enemies to fight");
    }
    if (player.is_dead()) {
        return reject(state, "player is dead");
    }

    state = CombatState();
    state.max_hand_size = config_.max_hand_size;
    state.player = player;
    state.enemies = std::move(enemies);

    Player& p = state.player;
    p.clear_combat_state();
    p.energy_cap_bonus = config_.energy_cap_bonus;
    RelicSystem::reset_for_combat(p.relics);

    for (auto& enemy : state.enemies) {
        enemy.history_limit = config_.move_history_size;
    }

    // Combat piles: a shuffled copy of the master deck, innate cards in hand
    std::vector<CardInstance> deck = p.deck;
    shuffle_with(deck, random_);
    for (auto& card : deck) {
        if (card.def.innate && !state.hand_is_full()) {
            state.hand.add_card(std::move(card));
        } else {
            state.draw_pile.add_to_bottom(std::move(card));
        }
    }

    state.turn = 1;
    state.phase = CombatPhase::PLAYER_TURN;

    state.draw_cards(config_.hand_size - state.hand.count(), random_);

    p.block = 0;
    p.energy = 0;
    p.gain_energy(p.max_energy + p.bonus_energy_next_combat);
    p.bonus_energy_next_combat = 0;

    state.emit(RelicTrigger::COMBAT_START);
    state.emit(RelicTrigger::FIRST_TURN, state.turn);
    state.emit(RelicTrigger::TURN_START, state.turn);

    for (auto& enemy : state.enemies) {
        enemy.roll_move(random_);
    }

    if (config_.verbose) {
        std::cout << "[CombatEngine] Combat started: " << state.enemies.size()
                  << " enemies, " << state.total_card_count() << " cards" << std::endl;
    }

    return finish_action(state, 0, "START COMBAT");
}

void CombatEngine::apply_combat_result(const CombatState& state, Player& player) const {
    const Player& p = state.player;
    player.current_hp = p.current_hp;
    player.max_hp = p.max_hp;
    player.gold = p.gold;
    player.relics = p.relics;
    player.potions = p.potions;
    player.bonus_energy_next_combat = p.bonus_energy_next_combat;
    player.next_card_serial = std::max(player.next_card_serial, p.next_card_serial);

    player.clear_combat_state();
    player.energy = 0;
}

// ============================================================================
// PLAYER ACTIONS
// ============================================================================

ActionResult CombatEngine::play_card(CombatState& state, size_t hand_index,
                                     std::optional<size_t> target) const {
    // Validate everything before touching the state
    if (!state.is_player_turn()) {
        return reject(state, "not the player's turn");
    }
    if (hand_index >= state.hand.cards.size()) {
        return reject(state, "no card at hand index " + std::to_string(hand_index));
    }

    const CardInstance& candidate = state.hand.cards[hand_index];
    if (candidate.def.has_unknown_tags()) {
        return reject(state, candidate.name() + " has an unknown card or target type");
    }
    if (!candidate.is_playable()) {
        return reject(state, candidate.name() + " is unplayable");
    }

    const bool x_cost = candidate.def.is_x_cost;
    const int cost = x_cost ? state.player.energy : candidate.cost();
    if (!x_cost && cost > state.player.energy) {
        return reject(state, "not enough energy for " + candidate.name() + " (" +
                      std::to_string(cost) + " > " + std::to_string(state.player.energy) + ")");
    }
    if (candidate.needs_target() && (!target || !state.is_valid_enemy_target(*target))) {
        return reject(state, candidate.name() + " needs a living enemy target");
    }

    const size_t log_start = state.event_log.size();

    CardInstance card = std::move(*state.hand.take_at(hand_index));
    state.player.lose_energy(cost);

    TurnCounters& counters = state.counters;
    const bool is_attack = card.type() == CardType::ATTACK;
    const bool first_attack_of_combat = is_attack && !counters.first_attack_played_this_combat;

    counters.cards_played_this_turn++;
    counters.cards_played_this_combat++;
    switch (card.type()) {
        case CardType::ATTACK:
            counters.attacks_played_this_turn++;
            counters.attacks_played_this_combat++;
            break;
        case CardType::SKILL:
            counters.skills_played_this_turn++;
            break;
        case CardType::POWER:
            counters.powers_played_this_combat++;
            break;
        default:
            break;
    }

    emit_card_played(state, card);

    if (config_.verbose) {
        std::cout << "[CombatEngine] Play " << card.name() << " (" << card.id << ")"
                  << " cost " << cost << std::endl;
    }

    // A pending "play twice" applies to this card
    int plays = 1;
    if (state.replay_next_card > 0) {
        state.replay_next_card--;
        plays = 2;
    }

    EffectContext ctx;
    ctx.source = EffectSource::CARD;
    ctx.source_id = card.id;
    ctx.default_target = card.def.target_type;
    ctx.target = target;
    ctx.source_card = &card;
    ctx.is_x_cost = x_cost;
    ctx.energy_spent = cost;
    ctx.bonus_damage_per_hit = first_attack_of_combat ? state.first_attack_bonus : 0;

    for (int i = 0; i < plays && !state.is_over(); ++i) {
        effects_.resolve_effects(state, card.def.effects, ctx);
    }

    if (is_attack) {
        counters.first_attack_played_this_combat = true;
        counters.first_attack_played_this_turn = true;
        state.first_attack_bonus = 0;
    }

    if (card.def.exhaust) {
        state.move_to_exhaust(std::move(card));
    } else {
        state.move_to_discard(std::move(card));
    }

    state.update_outcome();
    return finish_action(state, log_start, "PLAY CARD " + std::to_string(hand_index));
}

void CombatEngine::emit_card_played(CombatState& state, const CardInstance& card) const {
    const TurnCounters& counters = state.counters;

    state.emit(RelicTrigger::CARD_PLAYED, counters.cards_played_this_combat, card.id);

    switch (card.type()) {
        case CardType::ATTACK:
            state.emit(RelicTrigger::ATTACK_PLAYED, counters.attacks_played_this_turn, card.id);
            if (!counters.first_attack_played_this_combat) {
                state.emit(RelicTrigger::FIRST_ATTACK_COMBAT, 1, card.id);
            }
            if (!counters.first_attack_played_this_turn) {
                state.emit(RelicTrigger::FIRST_ATTACK_TURN, 1, card.id);
            }
            break;
        case CardType::SKILL:
            state.emit(RelicTrigger::SKILL_PLAYED, counters.skills_played_this_turn, card.id);
            break;
        case CardType::POWER:
            state.emit(RelicTrigger::POWER_PLAYED, counters.powers_played_this_combat, card.id);
            break;
        default:
            break;
    }
}

ActionResult CombatEngine::use_potion(CombatState& state, size_t slot,
                                      std::optional<size_t> target) const {
    if (!state.is_player_turn()) {
        return reject(state, "not the player's turn");
    }
    if (slot >= state.player.potions.size() || !state.player.potions[slot]) {
        return reject(state, "potion slot " + std::to_string(slot) + " is empty");
    }

    const PotionDef& candidate = *state.player.potions[slot];
    if (candidate.target_type == TargetType::UNKNOWN) {
        return reject(state, candidate.name + " has an unknown target type");
    }
    if (candidate.target_type == TargetType::SINGLE_ENEMY &&
        (!target || !state.is_valid_enemy_target(*target))) {
        return reject(state, candidate.name + " needs a living enemy target");
    }

    const size_t log_start = state.event_log.size();
    PotionDef potion = std::move(*state.player.take_potion(slot));

    if (config_.verbose) {
        std::cout << "[CombatEngine] Use potion " << potion.name << std::endl;
    }

    EffectContext ctx;
    ctx.source = EffectSource::POTION;
    ctx.source_id = potion.potion_id;
    ctx.default_target = potion.target_type;
    ctx.target = target;

    effects_.resolve_effects(state, potion.effects, ctx);
    state.emit(RelicTrigger::POTION_USED, 1, potion.potion_id);

    state.update_outcome();
    return finish_action(state, log_start, "USE POTION " + potion.potion_id);
}

ActionResult CombatEngine::scry(CombatState& state, int count,
                                const std::vector<int>& discard_indices) const {
    if (!state.is_player_turn()) {
        return reject(state, "not the player's turn");
    }

    const size_t log_start = state.event_log.size();
    int discarded = state.scry(count, discard_indices);

    if (config_.verbose) {
        std::cout << "[CombatEngine] Scry " << count << ": discarded " << discarded << std::endl;
    }

    return finish_action(state, log_start, "SCRY " + std::to_string(count));
}

// ============================================================================
// PHASE TRANSITIONS
// ============================================================================

ActionResult CombatEngine::end_turn(CombatState& state) const {
    if (!state.is_player_turn()) {
        return reject(state, "not the player's turn");
    }

    const size_t log_start = state.event_log.size();
    Player& player = state.player;

    state.emit(RelicTrigger::TURN_END, state.turn);
    if (state.hand.is_empty()) {
        state.emit(RelicTrigger::EMPTY_HAND_END_TURN, state.turn);
    }

    EndOfTurnTick tick = player.tick_end_of_turn();
    if (config_.verbose && (tick.plated_block > 0 || tick.ritual_strength > 0 || tick.regen_healed > 0)) {
        std::cout << "[CombatEngine] Player end of turn: +" << tick.plated_block << " block, +"
                  << tick.ritual_strength << " strength, +" << tick.regen_healed << " HP" << std::endl;
    }

    // End-of-turn relics resolve while the hand is still there
    process_events(state);
    if (state.is_over()) {
        return finish_action(state, log_start, "END TURN");
    }

    discard_hand_at_end_of_turn(state);

    state.phase = CombatPhase::ENEMY_TURN;
    run_enemy_turn(state);

    if (!state.is_over()) {
        start_player_turn(state);
    }

    return finish_action(state, log_start, "END TURN");
}

void CombatEngine::discard_hand_at_end_of_turn(CombatState& state) const {
    std::vector<CardInstance> kept;

    for (auto& card : state.hand.take_all()) {
        if (card.def.ethereal) {
            state.move_to_exhaust(std::move(card));
        } else if (state.retain_hand || card.def.retain) {
            kept.push_back(std::move(card));
        } else {
            state.move_to_discard(std::move(card));
        }
    }

    for (auto& card : kept) {
        state.hand.add_card(std::move(card));
    }
    state.retain_hand = false;
}

void CombatEngine::run_enemy_turn(CombatState& state) const {
    for (size_t i = 0; i < state.enemies.size(); ++i) {
        if (state.enemies[i].is_dead()) continue;

        int poison = state.enemies[i].tick_start_of_turn();
        if (poison > 0 && state.enemies[i].is_dead()) {
            state.emit(RelicTrigger::ENEMY_KILLED, 0, state.enemies[i].id, static_cast<int>(i));
        }
        if (state.update_outcome()) {
            process_events(state);
            return;
        }
        if (state.enemies[i].is_dead()) continue;

        std::vector<EnemyActionDef> actions = state.enemies[i].execute_move(random_);

        if (config_.verbose) {
            std::cout << "[CombatEngine] " << state.enemies[i].name << " acts ("
                      << actions.size() << " actions)" << std::endl;
        }

        for (const auto& action : actions) {
            effects_.apply_enemy_action(state, i, action);
            if (state.is_over() || state.enemies[i].is_dead()) break;
        }

        if (state.enemies[i].is_alive()) {
            state.enemies[i].tick_end_of_turn();
        }

        process_events(state);
        if (state.update_outcome()) {
            process_events(state);
            return;
        }
    }
}

void CombatEngine::start_player_turn(CombatState& state) const {
    Player& player = state.player;

    state.turn++;
    state.phase = CombatPhase::PLAYER_TURN;
    state.counters.reset_turn();

    int poison = player.tick_start_of_turn();
    if (poison > 0) {
        state.record_player_hp_loss(poison);
        if (state.update_outcome()) {
            return;
        }
    }

    player.energy = 0;
    player.gain_energy(player.max_energy);

    state.draw_cards(config_.hand_size, random_);
    state.emit(RelicTrigger::TURN_START, state.turn);
}

// ============================================================================
// RELICS
// ============================================================================

int CombatEngine::process_events(CombatState& state) const {
    int processed = 0;

    while (!state.pending_events.empty()) {
        if (processed >= config_.max_event_cascade) {
            std::cerr << "[CombatEngine] Event cascade limit (" << config_.max_event_cascade
                      << ") reached; " << state.pending_events.size()
                      << " events logged without relic processing" << std::endl;
            while (!state.pending_events.empty()) {
                state.event_log.push_back(std::move(state.pending_events.front()));
                state.pending_events.pop_front();
            }
            break;
        }

        CombatEvent event = std::move(state.pending_events.front());
        state.pending_events.pop_front();
        state.event_log.push_back(event);
        processed++;

        for (const auto& activation : RelicSystem::collect(state.player.relics, event)) {
            EffectResult result = effects_.apply_relic_activation(state, activation, event);
            if (config_.verbose) {
                std::cout << "[CombatEngine] Relic " << activation.relic_name << " -> "
                          << to_string(activation.effect.action) << " " << activation.amount
                          << (result.success ? "" : " (" + result.message + ")") << std::endl;
            }
        }
    }

    return processed;
}

std::vector<RelicActivation> CombatEngine::fire_run_trigger(Player& player, RelicTrigger trigger,
                                                            int amount) const {
    CombatEvent event(trigger, amount);
    std::vector<RelicActivation> activations = RelicSystem::collect(player.relics, event);

    for (const auto& activation : activations) {
        switch (activation.effect.action) {
            case RelicAction::HEAL:
                player.heal(activation.amount);
                break;
            case RelicAction::HEAL_PERCENT:
                player.heal_if_below_half(activation.amount);
                break;
            case RelicAction::GAIN_MAX_HP:
                player.increase_max_hp(activation.amount);
                break;
            case RelicAction::GAIN_GOLD:
                player.gain_gold(activation.amount);
                break;
            case RelicAction::POTION_SLOT:
                if (activation.amount > 0) {
                    player.potions.resize(player.potions.size() +
                                          static_cast<size_t>(activation.amount));
                }
                break;
            case RelicAction::ENERGY_NEXT_COMBAT:
                player.bonus_energy_next_combat = activation.amount;
                break;
            case RelicAction::UPGRADE_RANDOM: {
                std::vector<size_t> candidates;
                for (size_t i = 0; i < player.deck.size(); ++i) {
                    if (player.deck[i].can_upgrade()) candidates.push_back(i);
                }
                if (!candidates.empty()) {
                    size_t pick = candidates[static_cast<size_t>(
                        random_index(random_, static_cast<int>(candidates.size())))];
                    player.deck[pick].upgrade();
                }
                break;
            }
            default:
                if (config_.verbose) {
                    std::cout << "[CombatEngine] " << activation.relic_name << ": "
                              << to_string(activation.effect.action)
                              << " has no effect outside combat" << std::endl;
                }
                break;
        }
    }

    return activations;
}

// ============================================================================
// RESULTS
// ============================================================================

ActionResult CombatEngine::finish_action(CombatState& state, size_t log_start,
                                         const std::string& label) const {
    // Outcome checks can emit more events; drain until quiet
    do {
        process_events(state);
        state.update_outcome();
    } while (!state.pending_events.empty());

    ActionResult result;
    result.phase = state.phase;
    result.events.assign(state.event_log.begin() + static_cast<std::ptrdiff_t>(log_start),
                         state.event_log.end());

    check_invariants(state, label);

    if (logger_) {
        logger_->log_action(state.turn, label);
        logger_->log_events(result.events);
        logger_->log_state(state);
        if (state.is_over()) {
            logger_->log_combat_end(state);
        }
    }

    if (config_.verbose) {
        std::cout << "[CombatEngine] " << label << " -> " << to_string(state.phase)
                  << " (" << result.events.size() << " events)" << std::endl;
    }

    return result;
}

ActionResult CombatEngine::reject(const CombatState& state, const std::string& reason) const {
    if (config_.verbose) {
        std::cout << "[CombatEngine] Rejected: " << reason << std::endl;
    }
    return ActionResult::rejected(reason, state.phase);
}

void CombatEngine::check_invariants(const CombatState& state, const std::string& label) const {
    std::string error;
    if (!state.check_invariants(&error)) {
        std::cerr << "[CombatEngine] Invariant violated after " << label << ": "
                  << error << std::endl;
        assert(false && "combat state invariant violated");
    }
}

} // namespace descent
