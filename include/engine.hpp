/**
 * Descent Combat Engine - Main Engine Interface
 *
 * This is the primary interface for the combat engine.
 * Provides the player actions (start combat, play card, use potion,
 * end turn) plus get_legal_actions() and step() for search and replay.
 */

#pragma once

#include "action.hpp"
#include "combat_logger.hpp"
#include "effect_engine.hpp"
#include "engine_config.hpp"

namespace descent {

/**
 * Outcome of one engine call. A rejected action leaves the state untouched
 * and carries the reason; events holds everything emitted by the call.
 */
struct ActionResult {
    bool success = true;
    std::string reason;
    std::vector<CombatEvent> events;
    CombatPhase phase = CombatPhase::NOT_STARTED;

    static ActionResult rejected(std::string reason, CombatPhase phase) {
        ActionResult r;
        r.success = false;
        r.reason = std::move(reason);
        r.phase = phase;
        return r;
    }
};

/**
 * CombatEngine - The combat state machine.
 *
 * Holds no combat state of its own: every call mutates the CombatState it
 * is given. The catalog is borrowed and must outlive the engine.
 * Not copyable (the effect engine refers to the random source member).
 */
class CombatEngine {
public:
    explicit CombatEngine(const CardDatabase& card_db,
                          RandomDraw random = make_time_seeded_random());

    CombatEngine(const CardDatabase& card_db, EngineConfig config, RandomDraw random);

    CombatEngine(const CombatEngine&) = delete;
    CombatEngine& operator=(const CombatEngine&) = delete;

    // ========================================================================
    // CORE API
    // ========================================================================

    /**
     * Every action the player may take: each affordable card against each
     * valid target, each potion, and END_TURN. Empty outside the player turn.
     */
    std::vector<CombatAction> get_legal_actions(const CombatState& state) const;

    /**
     * Apply an action to a copy of the state and return the copy.
     * The original state is not modified.
     */
    CombatState step(const CombatState& state, const CombatAction& action) const;

    /**
     * Apply an action to a state in-place.
     */
    ActionResult step_inplace(CombatState& state, const CombatAction& action) const;

    // ========================================================================
    // COMBAT SETUP
    // ========================================================================

    /**
     * New player with the starting deck, configured energy and full HP.
     * Unknown card ids are logged and skipped.
     */
    Player create_player(const std::vector<CardDefID>& deck,
                         int max_hp = constants::DEFAULT_MAX_HP) const;

    /**
     * Start a combat against enemies instantiated from catalog ids.
     * Unknown ids are logged and skipped; rejected if none remain.
     */
    ActionResult start_combat(CombatState& state, const Player& player,
                              const std::vector<EnemyDefID>& enemy_ids) const;

    /**
     * Start a combat against ready-made enemies.
     *
     * Order: combat piles built from the player's deck (innate cards to
     * hand first), shuffled, opening hand drawn, block and energy reset,
     * COMBAT_START emitted, opening intents rolled, relic pass.
     */
    ActionResult start_combat_with(CombatState& state, const Player& player,
                                   std::vector<Enemy> enemies) const;

    /**
     * Copy run-persistent player state (HP, gold, relics, potions) out of
     * a finished combat. Statuses, block and energy are cleared.
     */
    void apply_combat_result(const CombatState& state, Player& player) const;

    // ========================================================================
    // PLAYER ACTIONS
    // ========================================================================

    /**
     * Play the card at hand_index. Rejected (state untouched) outside the
     * player turn, for a bad index, an unplayable card, insufficient energy
     * or a missing/dead target when the card needs one.
     */
    ActionResult play_card(CombatState& state, size_t hand_index,
                           std::optional<size_t> target = std::nullopt) const;

    /**
     * End the player turn, run the enemy turn and start the next player
     * turn (unless the combat ended on the way).
     */
    ActionResult end_turn(CombatState& state) const;

    ActionResult use_potion(CombatState& state, size_t slot,
                            std::optional<size_t> target = std::nullopt) const;

    /**
     * Look at the top `count` cards of the draw pile and discard the chosen
     * indices (relative to the top).
     */
    ActionResult scry(CombatState& state, int count,
                      const std::vector<int>& discard_indices) const;

    // ========================================================================
    // RELICS
    // ========================================================================

    /**
     * Drain the pending event queue: each event is logged and offered to
     * every relic; activations may emit further events. Stops after
     * max_event_cascade events. Returns the number processed.
     */
    int process_events(CombatState& state) const;

    /**
     * Fire an out-of-combat trigger (room entry, rest, gold...) against the
     * player's relics. Only run-level actions apply (heal, max HP, gold,
     * potion slot, next-combat energy, deck upgrade).
     */
    std::vector<RelicActivation> fire_run_trigger(Player& player, RelicTrigger trigger,
                                                  int amount = 0) const;

    // ========================================================================
    // ACCESSORS
    // ========================================================================

    const CardDatabase& get_card_database() const { return card_db_; }

    const EngineConfig& get_config() const { return config_; }
    void set_config(const EngineConfig& config) { config_ = config; }

    // Replace the random source (e.g., reseed between simulations)
    void set_random(RandomDraw random) { random_ = std::move(random); }

    // Not owned; pass nullptr to detach
    void attach_logger(CombatLogger* logger) { logger_ = logger; }

private:
    const CardDatabase& card_db_;
    EngineConfig config_;
    RandomDraw random_;
    EffectEngine effects_;
    CombatLogger* logger_ = nullptr;

    // ========================================================================
    // PHASE TRANSITIONS
    // ========================================================================

    void start_player_turn(CombatState& state) const;
    void discard_hand_at_end_of_turn(CombatState& state) const;
    void run_enemy_turn(CombatState& state) const;

    void emit_card_played(CombatState& state, const CardInstance& card) const;

    /**
     * Final relic pass, outcome check, invariant check and logging shared
     * by every successful action.
     */
    ActionResult finish_action(CombatState& state, size_t log_start,
                               const std::string& label) const;

    ActionResult reject(const CombatState& state, const std::string& reason) const;

    void check_invariants(const CombatState& state, const std::string& label) const;
};

} // namespace descent
