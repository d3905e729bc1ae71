/**
 * Descent Combat Engine - Combatant Model
 *
 * Mutable combat state shared by the player and every enemy: HP, block
 * and the status bag, plus the primitive mutators (take damage, gain
 * block, heal, apply status, turn ticks).
 *
 * Enemy extends Combatant with its move table and the move-selection AI.
 */

#pragma once

#include "card_database.hpp"
#include "combat_calculations.hpp"
#include "random_source.hpp"
#include <array>
#include <deque>

namespace descent {

// ============================================================================
// STATUS BAG
// ============================================================================

/**
 * Twelve status counters indexed by StatusKey.
 * Strength and dexterity are signed; everything else is kept >= 0.
 */
struct StatusBag {
    std::array<int, STATUS_KEY_COUNT> values{};

    int get(StatusKey key) const {
        return values[static_cast<size_t>(key)];
    }

    void set(StatusKey key, int amount) {
        values[static_cast<size_t>(key)] = amount;
    }

    bool has(StatusKey key) const {
        return get(key) != 0;
    }

    void clear() {
        values.fill(0);
    }
};

/**
 * Outcome of one damage application against a combatant.
 */
struct HitResult {
    int damage = 0;           // Final damage after all modifiers
    int blocked = 0;
    int hp_lost = 0;          // Actual HP lost (clamped to the HP available)
    bool block_broken = false;
    bool killed = false;
};

/**
 * Bookkeeping from an end-of-turn tick.
 */
struct EndOfTurnTick {
    int plated_block = 0;
    int ritual_strength = 0;
    int regen_healed = 0;
};

// ============================================================================
// COMBATANT
// ============================================================================

struct Combatant {
    std::string id;
    std::string name;
    int max_hp = 1;
    int current_hp = 1;
    int block = 0;
    StatusBag status;

    // Set by any hit that reached HP; read and cleared by the plated armor tick
    bool took_unblocked_damage = false;

    Combatant() = default;

    Combatant(std::string id_, std::string name_, int max_hp_)
        : id(std::move(id_))
        , name(std::move(name_))
        , max_hp(max_hp_)
        , current_hp(max_hp_)
    {}

    bool is_dead() const { return current_hp <= 0; }
    bool is_alive() const { return current_hp > 0; }

    int get_status(StatusKey key) const { return status.get(key); }

    // ========================================================================
    // DAMAGE
    // ========================================================================

    /**
     * Full pipeline: attacker strength/weak, then own vulnerable/intangible,
     * then block. ignore_block skips the block step.
     */
    HitResult take_damage(int raw_damage, int attacker_strength = 0, int attacker_weak = 0,
                          bool ignore_block = false);

    /**
     * Damage that skips attacker and vulnerable modifiers (thorns, relic
     * damage). Intangible and block still apply.
     */
    HitResult take_damage_direct(int damage);

    // Block then HP, for damage that already went through the modifiers
    HitResult absorb_damage(int damage);

    /**
     * HP loss that ignores block and every modifier (LOSE_HP, poison).
     * Returns HP actually lost.
     */
    int lose_hp(int amount);

    // ========================================================================
    // BLOCK / HP
    // ========================================================================

    /**
     * Block modified by dexterity and frail. Returns the block gained.
     */
    int gain_block(int base);

    // Block with no modifiers (potions, relics, plated armor)
    int gain_block_raw(int amount);

    /**
     * Heal clamped to max HP. Returns HP actually restored.
     */
    int heal(int amount);

    void increase_max_hp(int amount);

    // ========================================================================
    // STATUS
    // ========================================================================

    /**
     * Apply a status. Duration counters (weak/vulnerable/frail/intangible)
     * take the max with the existing value; everything else adds.
     * A debuff is voided by one artifact stack; returns false in that case.
     */
    bool apply_status(StatusKey key, int amount);

    bool try_consume_artifact();

    // ========================================================================
    // TURN TICKS
    // ========================================================================

    /**
     * Start of own turn: block reset, poison tick, intangible decay.
     * Returns the poison damage dealt.
     */
    int tick_start_of_turn();

    /**
     * End of own turn: weak/vulnerable/frail decay, plated armor, ritual, regen.
     */
    EndOfTurnTick tick_end_of_turn();

    void clear_combat_state() {
        block = 0;
        status.clear();
        took_unblocked_damage = false;
    }
};

// ============================================================================
// ENEMY
// ============================================================================

/**
 * Enemy - Combatant with a weighted move table.
 *
 * The committed move is always the upcoming one; execute_move() returns its
 * actions and immediately rolls the next.
 */
struct Enemy : Combatant {
    EnemyDefID def_id;
    EnemyType type = EnemyType::NORMAL;
    std::vector<EnemyMoveDef> moves;
    std::deque<std::string> move_history;      // Oldest first
    std::optional<size_t> committed_move;
    Intent intent;
    int history_limit = constants::MOVE_HISTORY_SIZE;

    Enemy() = default;

    /**
     * Instantiate from a template. HP is drawn uniformly from
     * [floor(maxHp * (1 - variance)), floor(maxHp * (1 + variance))].
     */
    static Enemy from_def(const EnemyDef& def, std::string instance_id,
                          const RandomDraw& draw,
                          double hp_variance = constants::ENEMY_HP_VARIANCE);

    /**
     * Weighted selection with the anti-repeat rule. Commits the move,
     * sets the intent and records history. nullptr if there are no moves.
     */
    const EnemyMoveDef* roll_move(const RandomDraw& draw);

    /**
     * Actions of the committed move, then rolls the next intent.
     */
    std::vector<EnemyActionDef> execute_move(const RandomDraw& draw);

    const EnemyMoveDef* current_move() const;

    /**
     * Displayed intent number. Attack intents reflect current strength and weak.
     */
    std::optional<int> get_intent_value() const;

    const std::string* last_move() const {
        return move_history.empty() ? nullptr : &move_history.back();
    }

private:
    // Weighted pick over moves not named `excluded_name`
    std::optional<size_t> pick_weighted(const RandomDraw& draw,
                                        const std::string* excluded_name) const;
};

} // namespace descent
