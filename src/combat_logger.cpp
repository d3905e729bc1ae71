/**
 * Descent Combat Engine - Combat Logger Implementation
 */

#include "combat_logger.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace descent {

CombatLogger::CombatLogger(const std::string& output_dir) {
    // Create output directory if it doesn't exist
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[Combat Logger] Cannot create " << output_dir << ": "
                  << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    // Create timestamped log file
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream filename;
    filename << output_dir << "/combat_"
             << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
    log_path_ = filename.str();

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[Combat Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    // Write header
    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "COMBAT LOG - LINEAR STATE TRACE\n";

    std::ostringstream timestamp;
    timestamp << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    log_file_ << "Started: " << timestamp.str() << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[Combat Logger] Logging to: " << log_path_ << std::endl;
}

CombatLogger::~CombatLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

// ============================================================================
// FORMATTING
// ============================================================================

std::string CombatLogger::fmt_card(const CardInstance& card) {
    std::string label = card.name();
    if (card.def.is_x_cost) {
        label += " [X]";
    } else if (card.cost() >= 0) {
        label += " [" + std::to_string(card.cost()) + "]";
    }
    return label + " (" + card.id + ")";
}

std::string CombatLogger::fmt_statuses(const Combatant& combatant) {
    std::ostringstream out;
    bool first = true;
    for (int i = 0; i < STATUS_KEY_COUNT; ++i) {
        StatusKey key = static_cast<StatusKey>(i);
        int value = combatant.get_status(key);
        if (value == 0) continue;
        if (!first) out << ", ";
        out << to_string(key) << "=" << value;
        first = false;
    }
    return first ? "-" : out.str();
}

std::string CombatLogger::fmt_event(const CombatEvent& event) {
    std::ostringstream out;
    out << to_string(event.type);
    if (event.amount != 0) out << " " << event.amount;
    if (!event.subject.empty()) out << " [" << event.subject << "]";
    if (event.target_index >= 0) out << " @" << event.target_index;
    return out.str();
}

std::string CombatLogger::format_pile(const std::string& label, const Zone& zone) const {
    std::ostringstream line;
    line << label << " (" << zone.cards.size() << "): [";
    for (size_t i = 0; i < zone.cards.size(); i++) {
        if (i > 0) line << ", ";
        line << fmt_card(zone.cards[i]);
    }
    line << "]";
    return line.str();
}

std::string CombatLogger::format_enemy_line(const Enemy& enemy, size_t index) const {
    std::ostringstream line;
    line << "ENEMY " << index << ": " << enemy.name << " (" << enemy.id << ")"
         << " | HP: " << enemy.current_hp << "/" << enemy.max_hp
         << " | Block: " << enemy.block
         << " | Status: " << fmt_statuses(enemy);

    if (enemy.is_dead()) {
        line << " | DEAD";
        return line.str();
    }

    const EnemyMoveDef* move = enemy.current_move();
    line << " | Intent: " << to_string(enemy.intent.type);
    if (auto value = enemy.get_intent_value()) {
        line << " " << *value;
    }
    if (move) {
        line << " (" << move->name << ")";
    }
    return line.str();
}

// ============================================================================
// LOGGING
// ============================================================================

void CombatLogger::log_action(int turn, const std::string& label) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[TURN " << turn << "] ACTION: " << label << "\n";
    log_file_ << std::string(80, '#') << "\n\n";

    log_file_.flush();
}

void CombatLogger::log_events(const std::vector<CombatEvent>& events) {
    if (!enabled_ || !log_file_.is_open() || events.empty()) return;

    log_file_ << "EVENTS (" << events.size() << "):\n";
    for (const auto& event : events) {
        log_file_ << "  " << fmt_event(event) << "\n";
    }
    log_file_ << "\n";

    log_file_.flush();
}

void CombatLogger::log_state(const CombatState& state) {
    if (!enabled_ || !log_file_.is_open()) return;

    const Player& p = state.player;

    log_file_ << std::string(80, '=') << "\n";

    log_file_ << "[PLAYER]\n";
    log_file_ << p.name << " | HP: " << p.current_hp << "/" << p.max_hp
              << " | Block: " << p.block
              << " | Energy: " << p.energy << "/" << p.max_energy
              << " | Status: " << fmt_statuses(p) << "\n";

    log_file_ << format_pile("HAND", state.hand) << "\n";
    log_file_ << format_pile("DRAW", state.draw_pile) << "\n";
    log_file_ << format_pile("DISCARD", state.discard_pile) << "\n";
    log_file_ << format_pile("EXHAUST", state.exhaust_pile) << "\n";

    if (!p.relics.empty()) {
        log_file_ << "RELICS: [";
        for (size_t i = 0; i < p.relics.size(); i++) {
            if (i > 0) log_file_ << ", ";
            log_file_ << p.relics[i].def.name;
            if (p.relics[i].counter > 0) log_file_ << " {" << p.relics[i].counter << "}";
        }
        log_file_ << "]\n";
    }

    log_file_ << "\n[ENEMIES]\n";
    for (size_t i = 0; i < state.enemies.size(); i++) {
        log_file_ << format_enemy_line(state.enemies[i], i) << "\n";
    }

    log_file_ << "\n[GLOBAL]\n";
    log_file_ << "Phase: " << to_string(state.phase)
              << " | Turn: " << state.turn
              << " | Cards played this turn: " << state.counters.cards_played_this_turn
              << " | Shuffles: " << state.shuffle_count << "\n";

    log_file_ << std::string(80, '=') << "\n\n";

    log_file_.flush();
}

void CombatLogger::log_combat_end(const CombatState& state) {
    if (!enabled_ || !log_file_.is_open()) return;

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "COMBAT END\n";
    log_file_ << std::string(80, '=') << "\n";

    log_file_ << "Result: " << to_string(state.phase) << " on turn " << state.turn << "\n";
    log_file_ << "Player HP: " << state.player.current_hp << "/" << state.player.max_hp << "\n";

    std::ostringstream timestamp;
    timestamp << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    log_file_ << "Ended: " << timestamp.str() << "\n";

    log_file_ << std::string(80, '=') << "\n";

    log_file_.flush();
}

} // namespace descent
