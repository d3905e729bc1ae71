/**
 * Descent Combat Engine - C++ Implementation
 *
 * Deterministic, data-driven combat engine for a deck-building roguelike.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "random_source.hpp"
#include "combat_calculations.hpp"

// Data structures
#include "card_instance.hpp"
#include "zone.hpp"
#include "combatant.hpp"
#include "player_state.hpp"
#include "action.hpp"
#include "combat_state.hpp"

// Catalog and configuration
#include "card_database.hpp"
#include "engine_config.hpp"

// Relics and effects
#include "relic_system.hpp"
#include "effect_engine.hpp"

// Engine
#include "combat_logger.hpp"
#include "engine.hpp"

namespace descent {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace descent
