/**
 * Descent Combat Engine - Engine Configuration
 *
 * Tunable rules of a combat. Defaults match the game constants; a catalog's
 * "rules" object or a standalone JSON file may override any subset.
 */

#pragma once

#include "types.hpp"
#include <nlohmann/json_fwd.hpp>

namespace descent {

struct EngineConfig {
    int hand_size = constants::DEFAULT_HAND_SIZE;
    int max_hand_size = constants::MAX_HAND_SIZE;
    int base_energy = constants::DEFAULT_ENERGY;
    int energy_cap_bonus = constants::MAX_ENERGY_BONUS;
    double enemy_hp_variance = constants::ENEMY_HP_VARIANCE;
    int move_history_size = constants::MOVE_HISTORY_SIZE;

    // Upper bound on events processed in one relic pass. Stops relic
    // chains that keep re-triggering each other.
    int max_event_cascade = 512;

    // Per-action chatter on stdout. Warnings are always printed.
    bool verbose = false;
};

/**
 * Overwrite the fields present in a JSON object. Unknown keys are ignored.
 */
void apply_config_json(const nlohmann::json& rules, EngineConfig& config);

/**
 * Load a standalone config file. Returns false (config untouched) on error.
 */
bool load_config_from_json(const std::string& filepath, EngineConfig& config);

} // namespace descent
