/**
 * Descent Combat Engine - Python Bindings
 *
 * pybind11 wrapper for the C++ engine.
 * Lets a Python host (UI, simulation, training) drive combats.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>
#include <pybind11/functional.h>

#include "descent_engine.hpp"

namespace py = pybind11;

PYBIND11_MODULE(descent_engine_cpp, m) {
    m.doc() = "Deterministic combat engine for a deck-building roguelike";

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<descent::CardType>(m, "CardType")
        .value("ATTACK", descent::CardType::ATTACK)
        .value("SKILL", descent::CardType::SKILL)
        .value("POWER", descent::CardType::POWER)
        .value("STATUS", descent::CardType::STATUS)
        .value("CURSE", descent::CardType::CURSE)
        .value("UNKNOWN", descent::CardType::UNKNOWN);

    py::enum_<descent::Rarity>(m, "Rarity")
        .value("STARTER", descent::Rarity::STARTER)
        .value("COMMON", descent::Rarity::COMMON)
        .value("UNCOMMON", descent::Rarity::UNCOMMON)
        .value("RARE", descent::Rarity::RARE)
        .value("SPECIAL", descent::Rarity::SPECIAL)
        .value("UNKNOWN", descent::Rarity::UNKNOWN);

    py::enum_<descent::TargetType>(m, "TargetType")
        .value("SELF", descent::TargetType::SELF)
        .value("SINGLE_ENEMY", descent::TargetType::SINGLE_ENEMY)
        .value("ALL_ENEMIES", descent::TargetType::ALL_ENEMIES)
        .value("RANDOM_ENEMY", descent::TargetType::RANDOM_ENEMY)
        .value("UNKNOWN", descent::TargetType::UNKNOWN);

    py::enum_<descent::StatusKey>(m, "StatusKey")
        .value("STRENGTH", descent::StatusKey::STRENGTH)
        .value("DEXTERITY", descent::StatusKey::DEXTERITY)
        .value("WEAK", descent::StatusKey::WEAK)
        .value("VULNERABLE", descent::StatusKey::VULNERABLE)
        .value("FRAIL", descent::StatusKey::FRAIL)
        .value("POISON", descent::StatusKey::POISON)
        .value("ARTIFACT", descent::StatusKey::ARTIFACT)
        .value("PLATED_ARMOR", descent::StatusKey::PLATED_ARMOR)
        .value("THORNS", descent::StatusKey::THORNS)
        .value("RITUAL", descent::StatusKey::RITUAL)
        .value("INTANGIBLE", descent::StatusKey::INTANGIBLE)
        .value("REGEN", descent::StatusKey::REGEN)
        .export_values();

    py::enum_<descent::IntentType>(m, "IntentType")
        .value("ATTACK", descent::IntentType::ATTACK)
        .value("DEFEND", descent::IntentType::DEFEND)
        .value("BUFF", descent::IntentType::BUFF)
        .value("DEBUFF", descent::IntentType::DEBUFF)
        .value("UNKNOWN", descent::IntentType::UNKNOWN);

    py::enum_<descent::EnemyType>(m, "EnemyType")
        .value("NORMAL", descent::EnemyType::NORMAL)
        .value("ELITE", descent::EnemyType::ELITE)
        .value("BOSS", descent::EnemyType::BOSS)
        .export_values();

    py::enum_<descent::CombatPhase>(m, "CombatPhase")
        .value("NOT_STARTED", descent::CombatPhase::NOT_STARTED)
        .value("PLAYER_TURN", descent::CombatPhase::PLAYER_TURN)
        .value("ENEMY_TURN", descent::CombatPhase::ENEMY_TURN)
        .value("VICTORY", descent::CombatPhase::VICTORY)
        .value("DEFEAT", descent::CombatPhase::DEFEAT)
        .export_values();

    py::enum_<descent::ActionType>(m, "ActionType")
        .value("PLAY_CARD", descent::ActionType::PLAY_CARD)
        .value("USE_POTION", descent::ActionType::USE_POTION)
        .value("END_TURN", descent::ActionType::END_TURN)
        .export_values();

    // Triggers are exposed by name so hosts can fire room events
    py::enum_<descent::RelicTrigger> trigger(m, "RelicTrigger");
    for (int i = 0; i <= static_cast<int>(descent::RelicTrigger::UNKNOWN); ++i) {
        auto value = static_cast<descent::RelicTrigger>(i);
        trigger.value(descent::to_string(value), value);
    }

    // ========================================================================
    // RANDOM SOURCES
    // ========================================================================

    m.def("make_seeded_random", &descent::make_seeded_random, py::arg("seed"));
    m.def("make_sequence_random", &descent::make_sequence_random, py::arg("values"));

    // ========================================================================
    // CATALOG RECORDS
    // ========================================================================

    py::class_<descent::EffectDef>(m, "EffectDef")
        .def(py::init<>())
        .def_readwrite("kind_name", &descent::EffectDef::kind_name)
        .def_readwrite("value", &descent::EffectDef::value)
        .def_readwrite("target", &descent::EffectDef::target)
        .def_readwrite("times", &descent::EffectDef::times)
        .def_readwrite("percentage", &descent::EffectDef::percentage)
        .def_readwrite("card_ref", &descent::EffectDef::card_ref)
        .def_property_readonly("kind", [](const descent::EffectDef& e) {
            return std::string(descent::to_string(e.kind));
        });

    py::class_<descent::CardDef>(m, "CardDef")
        .def_readonly("card_id", &descent::CardDef::card_id)
        .def_readonly("name", &descent::CardDef::name)
        .def_readonly("description", &descent::CardDef::description)
        .def_readonly("type", &descent::CardDef::type)
        .def_readonly("rarity", &descent::CardDef::rarity)
        .def_readonly("cost", &descent::CardDef::cost)
        .def_readonly("target_type", &descent::CardDef::target_type)
        .def_readonly("effects", &descent::CardDef::effects)
        .def_readonly("exhaust", &descent::CardDef::exhaust)
        .def_readonly("retain", &descent::CardDef::retain)
        .def_readonly("innate", &descent::CardDef::innate)
        .def_readonly("ethereal", &descent::CardDef::ethereal)
        .def_readonly("is_x_cost", &descent::CardDef::is_x_cost)
        .def("is_playable", &descent::CardDef::is_playable);

    py::class_<descent::Intent>(m, "Intent")
        .def_readonly("type", &descent::Intent::type)
        .def_readonly("value", &descent::Intent::value);

    py::class_<descent::EnemyDef>(m, "EnemyDef")
        .def_readonly("enemy_id", &descent::EnemyDef::enemy_id)
        .def_readonly("name", &descent::EnemyDef::name)
        .def_readonly("type", &descent::EnemyDef::type)
        .def_readonly("max_hp", &descent::EnemyDef::max_hp);

    py::class_<descent::RelicDef>(m, "RelicDef")
        .def_readonly("relic_id", &descent::RelicDef::relic_id)
        .def_readonly("name", &descent::RelicDef::name)
        .def_readonly("description", &descent::RelicDef::description)
        .def_readonly("rarity", &descent::RelicDef::rarity);

    py::class_<descent::PotionDef>(m, "PotionDef")
        .def_readonly("potion_id", &descent::PotionDef::potion_id)
        .def_readonly("name", &descent::PotionDef::name)
        .def_readonly("description", &descent::PotionDef::description)
        .def_readonly("target_type", &descent::PotionDef::target_type);

    py::class_<descent::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("hand_size", &descent::EngineConfig::hand_size)
        .def_readwrite("max_hand_size", &descent::EngineConfig::max_hand_size)
        .def_readwrite("base_energy", &descent::EngineConfig::base_energy)
        .def_readwrite("energy_cap_bonus", &descent::EngineConfig::energy_cap_bonus)
        .def_readwrite("enemy_hp_variance", &descent::EngineConfig::enemy_hp_variance)
        .def_readwrite("move_history_size", &descent::EngineConfig::move_history_size)
        .def_readwrite("max_event_cascade", &descent::EngineConfig::max_event_cascade)
        .def_readwrite("verbose", &descent::EngineConfig::verbose);

    py::class_<descent::CardDatabase>(m, "CardDatabase")
        .def(py::init<>())
        .def("load_from_json", &descent::CardDatabase::load_from_json)
        .def("load_from_string", &descent::CardDatabase::load_from_string)
        .def("get_card", &descent::CardDatabase::get_card, py::return_value_policy::reference)
        .def("get_enemy", &descent::CardDatabase::get_enemy, py::return_value_policy::reference)
        .def("get_relic", &descent::CardDatabase::get_relic, py::return_value_policy::reference)
        .def("get_potion", &descent::CardDatabase::get_potion, py::return_value_policy::reference)
        .def("has_card", &descent::CardDatabase::has_card)
        .def("get_all_card_ids", &descent::CardDatabase::get_all_card_ids)
        .def("card_count", &descent::CardDatabase::card_count)
        .def("enemy_count", &descent::CardDatabase::enemy_count)
        .def("relic_count", &descent::CardDatabase::relic_count)
        .def("potion_count", &descent::CardDatabase::potion_count)
        .def("get_config", &descent::CardDatabase::get_config);

    // ========================================================================
    // CARDS AND PILES
    // ========================================================================

    py::class_<descent::CardInstance>(m, "CardInstance")
        .def_readonly("id", &descent::CardInstance::id)
        .def_readonly("def_", &descent::CardInstance::def)
        .def_readonly("upgraded", &descent::CardInstance::upgraded)
        .def("card_id", &descent::CardInstance::card_id)
        .def("name", &descent::CardInstance::name)
        .def("type", &descent::CardInstance::type)
        .def("cost", &descent::CardInstance::cost)
        .def("is_playable", &descent::CardInstance::is_playable)
        .def("needs_target", &descent::CardInstance::needs_target)
        .def("describe", &descent::CardInstance::describe);

    py::class_<descent::Zone>(m, "Zone")
        .def(py::init<>())
        .def_readonly("cards", &descent::Zone::cards)
        .def("count", &descent::Zone::count)
        .def("is_empty", &descent::Zone::is_empty)
        .def("peek_top", &descent::Zone::peek_top);

    // ========================================================================
    // COMBATANTS
    // ========================================================================

    py::class_<descent::Combatant>(m, "Combatant")
        .def_readonly("id", &descent::Combatant::id)
        .def_readonly("name", &descent::Combatant::name)
        .def_readwrite("max_hp", &descent::Combatant::max_hp)
        .def_readwrite("current_hp", &descent::Combatant::current_hp)
        .def_readwrite("block", &descent::Combatant::block)
        .def("get_status", &descent::Combatant::get_status)
        .def("is_dead", &descent::Combatant::is_dead)
        .def("is_alive", &descent::Combatant::is_alive);

    py::class_<descent::Enemy, descent::Combatant>(m, "Enemy")
        .def_readonly("def_id", &descent::Enemy::def_id)
        .def_readonly("type", &descent::Enemy::type)
        .def_readonly("intent", &descent::Enemy::intent)
        .def("get_intent_value", &descent::Enemy::get_intent_value)
        .def_property_readonly("move_history", [](const descent::Enemy& e) {
            return std::vector<std::string>(e.move_history.begin(), e.move_history.end());
        });

    py::class_<descent::Player, descent::Combatant>(m, "Player")
        .def(py::init<>())
        .def(py::init<std::string, int>())
        .def_readwrite("energy", &descent::Player::energy)
        .def_readwrite("max_energy", &descent::Player::max_energy)
        .def_readwrite("gold", &descent::Player::gold)
        .def_readonly("deck", &descent::Player::deck)
        .def_readonly("potions", &descent::Player::potions)
        .def("add_card_to_deck", &descent::Player::add_card_to_deck,
             py::return_value_policy::reference_internal)
        .def("remove_card_from_deck", &descent::Player::remove_card_from_deck)
        .def("obtain_relic", &descent::Player::obtain_relic)
        .def("has_relic", &descent::Player::has_relic)
        .def("add_potion", &descent::Player::add_potion)
        .def("spend_gold", &descent::Player::spend_gold)
        .def("gain_gold", &descent::Player::gain_gold)
        .def("heal", &descent::Player::heal)
        .def_property_readonly("relic_ids", [](const descent::Player& p) {
            std::vector<std::string> ids;
            for (const auto& relic : p.relics) ids.push_back(relic.relic_id());
            return ids;
        });

    // ========================================================================
    // EVENTS, ACTIONS, STATE
    // ========================================================================

    py::class_<descent::CombatEvent>(m, "CombatEvent")
        .def_readonly("type", &descent::CombatEvent::type)
        .def_readonly("amount", &descent::CombatEvent::amount)
        .def_readonly("subject", &descent::CombatEvent::subject)
        .def_readonly("target_index", &descent::CombatEvent::target_index)
        .def("__repr__", &descent::CombatLogger::fmt_event);

    py::class_<descent::CombatAction>(m, "CombatAction")
        .def(py::init<>())
        .def_readwrite("action_type", &descent::CombatAction::action_type)
        .def_readwrite("index", &descent::CombatAction::index)
        .def_readwrite("target", &descent::CombatAction::target)
        .def_readwrite("display_label", &descent::CombatAction::display_label)
        .def("__str__", &descent::CombatAction::to_string)
        .def("__repr__", &descent::CombatAction::to_string)
        .def(py::self == py::self)
        .def(py::self != py::self)
        // Factory methods
        .def_static("end_turn", &descent::CombatAction::end_turn)
        .def_static("play_card", &descent::CombatAction::play_card,
                    py::arg("hand_index"), py::arg("target") = std::nullopt)
        .def_static("use_potion", &descent::CombatAction::use_potion,
                    py::arg("slot"), py::arg("target") = std::nullopt);

    py::class_<descent::ActionResult>(m, "ActionResult")
        .def_readonly("success", &descent::ActionResult::success)
        .def_readonly("reason", &descent::ActionResult::reason)
        .def_readonly("events", &descent::ActionResult::events)
        .def_readonly("phase", &descent::ActionResult::phase);

    py::class_<descent::CombatState>(m, "CombatState")
        .def(py::init<>())
        .def_readonly("phase", &descent::CombatState::phase)
        .def_readonly("turn", &descent::CombatState::turn)
        .def_readonly("player", &descent::CombatState::player)
        .def_readonly("enemies", &descent::CombatState::enemies)
        .def_readonly("hand", &descent::CombatState::hand)
        .def_readonly("draw_pile", &descent::CombatState::draw_pile)
        .def_readonly("discard_pile", &descent::CombatState::discard_pile)
        .def_readonly("exhaust_pile", &descent::CombatState::exhaust_pile)
        .def_readonly("event_log", &descent::CombatState::event_log)
        .def("is_player_turn", &descent::CombatState::is_player_turn)
        .def("is_over", &descent::CombatState::is_over)
        .def("living_enemy_indices", &descent::CombatState::living_enemy_indices)
        .def("check_invariants", [](const descent::CombatState& s) {
            std::string error;
            bool ok = s.check_invariants(&error);
            return py::make_tuple(ok, error);
        })
        .def("clone", &descent::CombatState::clone);

    // ========================================================================
    // ENGINE
    // ========================================================================

    py::class_<descent::CombatLogger>(m, "CombatLogger")
        .def(py::init<const std::string&>(), py::arg("output_dir") = "combat_logs")
        .def("get_log_path", &descent::CombatLogger::get_log_path)
        .def("set_enabled", &descent::CombatLogger::set_enabled);

    py::class_<descent::CombatEngine>(m, "CombatEngine")
        .def(py::init<const descent::CardDatabase&, descent::RandomDraw>(),
             py::arg("card_db"), py::arg("random"), py::keep_alive<1, 2>())
        .def(py::init<const descent::CardDatabase&, descent::EngineConfig, descent::RandomDraw>(),
             py::arg("card_db"), py::arg("config"), py::arg("random"), py::keep_alive<1, 2>())
        .def(py::init([](const descent::CardDatabase& db, uint32_t seed) {
                 return std::make_unique<descent::CombatEngine>(db, descent::make_seeded_random(seed));
             }),
             py::arg("card_db"), py::arg("seed"), py::keep_alive<1, 2>())
        .def("get_legal_actions", &descent::CombatEngine::get_legal_actions)
        .def("step", &descent::CombatEngine::step)
        .def("step_inplace", &descent::CombatEngine::step_inplace)
        .def("create_player", &descent::CombatEngine::create_player,
             py::arg("deck"), py::arg("max_hp") = descent::constants::DEFAULT_MAX_HP)
        .def("start_combat", &descent::CombatEngine::start_combat)
        .def("apply_combat_result", &descent::CombatEngine::apply_combat_result)
        .def("play_card", &descent::CombatEngine::play_card,
             py::arg("state"), py::arg("hand_index"), py::arg("target") = std::nullopt)
        .def("end_turn", &descent::CombatEngine::end_turn)
        .def("use_potion", &descent::CombatEngine::use_potion,
             py::arg("state"), py::arg("slot"), py::arg("target") = std::nullopt)
        .def("scry", &descent::CombatEngine::scry)
        .def("fire_run_trigger", [](const descent::CombatEngine& engine, descent::Player& player,
                                    descent::RelicTrigger trigger, int amount) {
                 return engine.fire_run_trigger(player, trigger, amount).size();
             },
             py::arg("player"), py::arg("trigger"), py::arg("amount") = 0)
        .def("attach_logger", &descent::CombatEngine::attach_logger, py::keep_alive<1, 2>())
        .def("get_config", &descent::CombatEngine::get_config)
        .def("set_config", &descent::CombatEngine::set_config);

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = descent::get_version();
    m.attr("__version__") = descent::get_version();
}
