/**
 * Descent Combat Engine - Combat Logger
 *
 * Complete combat visibility for debugging.
 * Logs every pile (including the draw pile order), both sides' stats and
 * statuses, enemy intents and the events each action emitted.
 * Shows card instance ids so exact card movement can be tracked.
 */

#pragma once

#include "combat_state.hpp"
#include "action.hpp"
#include <string>
#include <fstream>

namespace descent {

/**
 * CombatLogger - Linear state trace of one or more combats.
 *
 * The engine writes to it only when a logger is attached.
 */
class CombatLogger {
public:
    /**
     * Constructor - creates timestamped log file.
     *
     * @param output_dir Directory for log files (created if missing)
     */
    explicit CombatLogger(const std::string& output_dir = "combat_logs");

    ~CombatLogger();

    CombatLogger(const CombatLogger&) = delete;
    CombatLogger& operator=(const CombatLogger&) = delete;

    /**
     * Log an action header.
     *
     * @param turn Current turn number
     * @param label Action description
     */
    void log_action(int turn, const std::string& label);

    /**
     * Log the events an action emitted, in order.
     */
    void log_events(const std::vector<CombatEvent>& events);

    /**
     * Log complete combat state snapshot.
     */
    void log_state(const CombatState& state);

    /**
     * Log combat end result.
     */
    void log_combat_end(const CombatState& state);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }

    void set_enabled(bool enabled) { enabled_ = enabled; }

    // "Strike [1] (card_12)"
    static std::string fmt_card(const CardInstance& card);

    static std::string fmt_statuses(const Combatant& combatant);

    static std::string fmt_event(const CombatEvent& event);

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    std::string format_pile(const std::string& label, const Zone& zone) const;
    std::string format_enemy_line(const Enemy& enemy, size_t index) const;
};

} // namespace descent
