/**
 * Descent Combat Engine - Engine Configuration Implementation
 */

#include "engine_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace descent {

void apply_config_json(const json& rules, EngineConfig& config) {
    if (!rules.is_object()) {
        return;
    }

    config.hand_size = rules.value("handSize", config.hand_size);
    config.max_hand_size = rules.value("maxHandSize", config.max_hand_size);
    config.base_energy = rules.value("baseEnergy", config.base_energy);
    config.energy_cap_bonus = rules.value("energyCapBonus", config.energy_cap_bonus);
    config.enemy_hp_variance = rules.value("enemyHpVariance", config.enemy_hp_variance);
    config.move_history_size = rules.value("moveHistorySize", config.move_history_size);
    config.max_event_cascade = rules.value("maxEventCascade", config.max_event_cascade);
    config.verbose = rules.value("verbose", config.verbose);

    if (config.hand_size > config.max_hand_size) {
        std::cerr << "[EngineConfig] handSize " << config.hand_size
                  << " exceeds maxHandSize, clamping" << std::endl;
        config.hand_size = config.max_hand_size;
    }
    if (config.move_history_size < 1) {
        config.move_history_size = 1;
    }
}

bool load_config_from_json(const std::string& filepath, EngineConfig& config) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[EngineConfig] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        // Accept either a bare rules object or a catalog with a "rules" section
        const json& rules = data.contains("rules") ? data["rules"] : data;
        EngineConfig loaded = config;
        apply_config_json(rules, loaded);
        config = loaded;
        return true;
    } catch (const json::parse_error& e) {
        std::cerr << "[EngineConfig] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[EngineConfig] Error: " << e.what() << std::endl;
        return false;
    }
}

} // namespace descent
