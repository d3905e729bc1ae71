/**
 * Descent Combat Engine - Combat State
 *
 * The complete snapshot of one combat: phase, turn, the player, the enemy
 * roster, the four card piles, per-turn counters and the lifecycle event
 * queue. Plain value type; copying it gives an independent snapshot.
 */

#pragma once

#include "player_state.hpp"
#include "zone.hpp"
#include <deque>

namespace descent {

/**
 * Cards played this turn / this combat.
 */
struct TurnCounters {
    int cards_played_this_turn = 0;
    int attacks_played_this_turn = 0;
    int skills_played_this_turn = 0;

    int cards_played_this_combat = 0;
    int attacks_played_this_combat = 0;
    int powers_played_this_combat = 0;

    bool first_attack_played_this_turn = false;
    bool first_attack_played_this_combat = false;
    bool player_damaged_this_combat = false;

    void reset_turn() {
        cards_played_this_turn = 0;
        attacks_played_this_turn = 0;
        skills_played_this_turn = 0;
        first_attack_played_this_turn = false;
    }
};

/**
 * CombatState - One combat snapshot.
 *
 * hand + draw_pile + discard_pile + exhaust_pile always hold every card of
 * the combat deck exactly once.
 */
struct CombatState {
    CombatPhase phase = CombatPhase::NOT_STARTED;
    int turn = 0;

    Player player;
    std::vector<Enemy> enemies;

    // Piles (top of draw_pile is index 0)
    Zone hand;
    Zone draw_pile;
    Zone discard_pile;
    Zone exhaust_pile;

    TurnCounters counters;

    // Flags set by card effects
    bool retain_hand = false;         // Keep the whole hand this turn
    int replay_next_card = 0;         // Next N cards resolve twice
    int first_attack_bonus = 0;       // Added per hit to the first attack of combat

    int shuffle_count = 0;
    int max_hand_size = constants::MAX_HAND_SIZE;

    // HP threshold triggers fire once per combat
    bool hp_below_50_fired = false;
    bool hp_below_25_fired = false;

    // Events waiting for the relic pass, and everything emitted so far
    std::deque<CombatEvent> pending_events;
    std::vector<CombatEvent> event_log;

    // ========================================================================
    // PHASE
    // ========================================================================

    bool is_player_turn() const { return phase == CombatPhase::PLAYER_TURN; }

    bool is_over() const {
        return phase == CombatPhase::VICTORY || phase == CombatPhase::DEFEAT;
    }

    /**
     * Move to VICTORY/DEFEAT if the player or every enemy is dead.
     * Emits COMBAT_VICTORY and COMBAT_END once. Returns is_over().
     */
    bool update_outcome();

    // ========================================================================
    // ENEMIES
    // ========================================================================

    bool all_enemies_dead() const;

    std::vector<size_t> living_enemy_indices() const;

    bool is_valid_enemy_target(size_t index) const {
        return index < enemies.size() && enemies[index].is_alive();
    }

    // ========================================================================
    // EVENTS
    // ========================================================================

    void emit(RelicTrigger type, int amount = 0, std::string subject = "",
              int target_index = -1) {
        pending_events.emplace_back(type, amount, std::move(subject), target_index);
    }

    /**
     * Emit the player-side events of a hit (damaged, HP lost, block
     * broken, first damage, HP thresholds). attacker_index is -1 when
     * the damage has no enemy source.
     */
    void record_player_hit(const HitResult& hit, int attacker_index = -1);

    void record_player_hp_loss(int hp_lost);

    // ========================================================================
    // PILES
    // ========================================================================

    bool hand_is_full() const { return hand.count() >= max_hand_size; }

    /**
     * Draw up to `count` cards. Shuffles the discard pile into the draw
     * pile when it runs out; stops when both are empty or the hand is
     * full. Returns the number drawn.
     */
    int draw_cards(int count, const RandomDraw& draw);

    /**
     * Discard pile -> draw pile, shuffled. Emits SHUFFLE. False if the
     * discard pile was empty.
     */
    bool shuffle_discard_into_draw(const RandomDraw& draw);

    // Hand if there is room, otherwise the discard pile
    void add_to_hand(CardInstance card);

    void move_to_discard(CardInstance card);
    void move_to_exhaust(CardInstance card);

    /**
     * Discard the chosen cards among the top `count` of the draw pile.
     * Returns the number discarded.
     */
    int scry(int count, const std::vector<int>& discard_indices);

    /**
     * Scry without a chooser: discards STATUS and CURSE cards among the
     * top `count`.
     */
    int scry_auto(int count);

    int total_card_count() const {
        return hand.count() + draw_pile.count() + discard_pile.count() + exhaust_pile.count();
    }

    // ========================================================================
    // INVARIANTS
    // ========================================================================

    /**
     * HP within [0, max], block >= 0, energy >= 0, every card id in
     * exactly one pile. On failure, writes the first violation to error.
     */
    bool check_invariants(std::string* error = nullptr) const;

    CombatState clone() const {
        return *this;
    }
};

} // namespace descent
