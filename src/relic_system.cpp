/**
 * Descent Combat Engine - Relic Trigger System Implementation
 */

#include "relic_system.hpp"
#include <algorithm>

namespace descent {

bool RelicSystem::trigger_matches(RelicTrigger trigger, RelicTrigger event) {
    if (trigger == RelicTrigger::UNKNOWN) {
        return false;
    }
    if (trigger == event) {
        return true;
    }
    switch (trigger) {
        case RelicTrigger::CARD_EVERY_N: return event == RelicTrigger::CARD_PLAYED;
        case RelicTrigger::ATTACK_EVERY_N: return event == RelicTrigger::ATTACK_PLAYED;
        case RelicTrigger::SKILL_EVERY_N: return event == RelicTrigger::SKILL_PLAYED;
        case RelicTrigger::TURN_EVERY_N: return event == RelicTrigger::TURN_START;
        case RelicTrigger::SHUFFLE_EVERY_N: return event == RelicTrigger::SHUFFLE;
        default: return false;
    }
}

int RelicSystem::default_counter_payoff(RelicAction action) {
    switch (action) {
        case RelicAction::DRAW_EVERY_N: return 1;
        case RelicAction::ENERGY_EVERY_N: return 2;
        case RelicAction::ENERGY_SHUFFLE_N: return 1;
        case RelicAction::STRENGTH_EVERY_N: return 1;
        case RelicAction::DEXTERITY_EVERY_N: return 1;
        case RelicAction::BLOCK_EVERY_N: return 4;
        case RelicAction::DAMAGE_ALL_EVERY_N: return 5;
        case RelicAction::INTANGIBLE_EVERY_N: return 1;
        default: return 0;
    }
}

std::vector<RelicActivation> RelicSystem::collect(std::vector<Relic>& relics,
                                                  const CombatEvent& event) {
    std::vector<RelicActivation> activations;

    for (size_t i = 0; i < relics.size(); ++i) {
        Relic& relic = relics[i];

        for (const auto& effect : relic.def.effects) {
            if (!trigger_matches(effect.trigger, event.type)) {
                continue;
            }

            RelicActivation activation;
            activation.relic_index = i;
            activation.relic_id = relic.def.relic_id;
            activation.relic_name = relic.def.name;
            activation.effect = effect;

            if (is_counter_action(effect.action)) {
                int threshold = std::max(1, effect.value);
                relic.counter++;
                if (relic.counter < threshold) {
                    continue;
                }
                relic.counter = 0;
                activation.amount = effect.amount.value_or(default_counter_payoff(effect.action));
            } else {
                activation.amount = effect.amount.value_or(effect.value);
            }

            activations.push_back(std::move(activation));
        }
    }

    return activations;
}

void RelicSystem::reset_for_combat(std::vector<Relic>& relics) {
    for (auto& relic : relics) {
        if (relic.def.reset_counter_each_combat) {
            relic.counter = 0;
        }
    }
}

} // namespace descent
