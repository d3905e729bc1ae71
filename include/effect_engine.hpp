/**
 * Descent Combat Engine - Effect Resolution Engine
 *
 * Executes declarative effect lists (cards, potions), enemy move actions
 * and relic activations against a CombatState. Every effect kind is
 * dispatched through one exhaustive switch.
 *
 * Nothing here throws for bad data or bad targets: each effect returns an
 * EffectResult, and continue_sequence == false halts the rest of the list.
 */

#pragma once

#include "combat_state.hpp"

namespace descent {

enum class EffectSource : uint8_t {
    CARD,
    POTION,
    RELIC
};

/**
 * Context of one effect list resolution. Damage effects write back
 * killed_enemy so later effects in the list can read it.
 */
struct EffectContext {
    EffectSource source = EffectSource::CARD;
    std::string source_id;
    TargetType default_target = TargetType::SELF;
    std::optional<size_t> target;
    const CardInstance* source_card = nullptr;

    bool is_x_cost = false;
    int energy_spent = 0;

    int bonus_damage_per_hit = 0;    // First-attack relic bonus
    bool killed_enemy = false;
};

struct EffectResult {
    bool success = true;
    std::optional<int> value;
    bool continue_sequence = true;
    std::string message;

    static EffectResult ok(std::optional<int> value = std::nullopt) {
        EffectResult r;
        r.value = value;
        return r;
    }

    static EffectResult fail(std::string message, bool halt = false) {
        EffectResult r;
        r.success = false;
        r.continue_sequence = !halt;
        r.message = std::move(message);
        return r;
    }
};

class EffectEngine {
public:
    EffectEngine(const CardDatabase& db, const RandomDraw& random);

    // ========================================================================
    // CARD / POTION EFFECTS
    // ========================================================================

    /**
     * Resolve effects in order. Stops after a result with
     * continue_sequence == false or once combat is over.
     */
    std::vector<EffectResult> resolve_effects(CombatState& state,
                                              const std::vector<EffectDef>& effects,
                                              EffectContext& ctx) const;

    EffectResult resolve_effect(CombatState& state, const EffectDef& effect,
                                EffectContext& ctx) const;

    /**
     * Magnitude of an effect. X-cost effects with value 0 use the energy spent.
     */
    static int effect_value(const EffectDef& effect, const EffectContext& ctx);

    // Logged skip for an effect whose target tag did not parse
    static EffectResult unknown_target(const EffectDef& effect, const EffectContext& ctx);

    /**
     * Enemy indices an effect aims at. SELF yields none; SINGLE_ENEMY
     * yields the chosen target only if it is alive.
     */
    std::vector<size_t> resolve_targets(const CombatState& state, TargetType target_type,
                                        std::optional<size_t> chosen) const;

    // ========================================================================
    // ENEMY ACTIONS
    // ========================================================================

    void apply_enemy_action(CombatState& state, size_t enemy_index,
                            const EnemyActionDef& action) const;

    // ========================================================================
    // RELIC ACTIVATIONS
    // ========================================================================

    EffectResult apply_relic_activation(CombatState& state, const RelicActivation& activation,
                                        const CombatEvent& event) const;

    /**
     * Flat reduction applied to enemy attack hits by REDUCE_DAMAGE relics.
     */
    static int player_damage_reduction(const Player& player);

    // ========================================================================
    // DAMAGE PRIMITIVES
    // ========================================================================

    /**
     * Player attack against one enemy: full modifier pipeline, events,
     * thorns reflection for card attacks, outcome check.
     */
    HitResult attack_enemy(CombatState& state, size_t enemy_index, int base_damage,
                           EffectContext& ctx, bool ignore_block = false) const;

    /**
     * Unmodified damage to an enemy (relics). Block and intangible apply.
     */
    HitResult damage_enemy_direct(CombatState& state, size_t enemy_index, int amount,
                                  const std::string& source) const;

    std::optional<size_t> random_living_enemy(const CombatState& state) const;

    // Random non-status, non-curse card from the catalog
    const CardDef* random_catalog_card(const CardDef* exclude = nullptr) const;

private:
    const CardDatabase& db_;
    const RandomDraw& random_;

    EffectResult resolve_damage(CombatState& state, const EffectDef& effect,
                                EffectContext& ctx) const;
    EffectResult resolve_status(CombatState& state, const EffectDef& effect,
                                EffectContext& ctx) const;
    EffectResult resolve_card_creation(CombatState& state, const EffectDef& effect,
                                       EffectContext& ctx) const;

    int discard_random_from_hand(CombatState& state, int count) const;
    int exhaust_from_hand(CombatState& state, int count) const;
    int upgrade_random_in_hand(CombatState& state, int count) const;
    int transform_random_in_hand(CombatState& state, int count) const;

    void record_enemy_hit(CombatState& state, size_t enemy_index, const HitResult& hit,
                          const std::string& source) const;
};

} // namespace descent
