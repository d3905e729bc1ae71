/**
 * Descent Combat Engine - Player State Implementation
 */

#include "player_state.hpp"
#include <iostream>

namespace descent {

bool Player::obtain_relic(const RelicDef& def) {
    if (has_relic(def.relic_id)) {
        std::cerr << "[Player] Relic already held: " << def.relic_id << std::endl;
        return false;
    }

    relics.emplace_back(def);

    for (const auto& effect : def.effects) {
        if (effect.trigger != RelicTrigger::ON_OBTAIN) {
            continue;
        }
        switch (effect.action) {
            case RelicAction::GAIN_MAX_HP:
                increase_max_hp(effect.value);
                break;
            case RelicAction::GAIN_GOLD:
                gain_gold(effect.value);
                break;
            case RelicAction::POTION_SLOT:
                if (effect.value > 0) {
                    potions.resize(potions.size() + static_cast<size_t>(effect.value));
                }
                break;
            case RelicAction::HEAL:
                heal(effect.value);
                break;
            default:
                std::cerr << "[Player] Relic " << def.relic_id << ": ON_OBTAIN action "
                          << to_string(effect.action) << " has no effect" << std::endl;
                break;
        }
    }

    return true;
}

} // namespace descent
