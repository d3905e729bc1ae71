/**
 * Descent Combat Engine - Relic Trigger System
 *
 * Matches emitted lifecycle events against held relics. Direct actions
 * activate every time their trigger fires; counter actions ("every N")
 * advance the relic's counter and activate only when it reaches N, after
 * which the counter is reset to 0.
 *
 * The system only decides WHAT fires. Executing an activation against the
 * combat is the effect engine's job, so relic processing never re-enters
 * the state machine.
 */

#pragma once

#include "card_database.hpp"

namespace descent {

/**
 * A relic held by the player. The counter persists across combats unless
 * the relic resets it each combat.
 */
struct Relic {
    RelicDef def;
    int counter = 0;

    Relic() = default;
    explicit Relic(RelicDef def_) : def(std::move(def_)) {}

    const RelicDefID& relic_id() const { return def.relic_id; }
};

/**
 * One lifecycle event. amount carries the event's magnitude (damage,
 * block, gold...), subject the card/potion/relic id involved and
 * target_index the enemy index where one applies.
 */
struct CombatEvent {
    RelicTrigger type = RelicTrigger::UNKNOWN;
    int amount = 0;
    std::string subject;
    int target_index = -1;

    CombatEvent() = default;
    CombatEvent(RelicTrigger type_, int amount_ = 0, std::string subject_ = "",
                int target_index_ = -1)
        : type(type_)
        , amount(amount_)
        , subject(std::move(subject_))
        , target_index(target_index_)
    {}
};

/**
 * A relic effect that fired. amount is the magnitude to apply: the
 * effect's value for direct actions, the payoff for counter actions.
 */
struct RelicActivation {
    size_t relic_index = 0;
    RelicDefID relic_id;
    std::string relic_name;
    RelicEffectDef effect;
    int amount = 0;
};

class RelicSystem {
public:
    /**
     * Scan every relic, in acquisition order, for effects matching the
     * event. Advances counters as a side effect.
     */
    static std::vector<RelicActivation> collect(std::vector<Relic>& relics,
                                                const CombatEvent& event);

    /**
     * Whether an effect's trigger fires on an event of the given type.
     * The *_EVERY_N triggers fire on their base event; the counter
     * action does the counting.
     */
    static bool trigger_matches(RelicTrigger trigger, RelicTrigger event);

    /**
     * Payoff of a counter action when the effect has no explicit amount.
     */
    static int default_counter_payoff(RelicAction action);

    /**
     * Reset the counters of relics whose policy is per-combat.
     */
    static void reset_for_combat(std::vector<Relic>& relics);
};

} // namespace descent
