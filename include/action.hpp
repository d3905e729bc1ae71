/**
 * Descent Combat Engine - Action Representation
 *
 * Defines the CombatAction struct used by get_legal_actions() and step().
 */

#pragma once

#include "types.hpp"
#include <functional>
#include <optional>

namespace descent {

enum class ActionType : uint8_t {
    PLAY_CARD,
    USE_POTION,
    END_TURN
};

inline const char* to_string(ActionType type) {
    switch (type) {
        case ActionType::PLAY_CARD: return "PLAY_CARD";
        case ActionType::USE_POTION: return "USE_POTION";
        case ActionType::END_TURN: return "END_TURN";
        default: return "UNKNOWN";
    }
}

/**
 * CombatAction - A single player action.
 *
 * index is the hand index for PLAY_CARD and the potion slot for USE_POTION.
 * target is an enemy index.
 */
struct CombatAction {
    ActionType action_type = ActionType::END_TURN;
    size_t index = 0;
    std::optional<size_t> target;

    // Display label for UI/logging
    std::string display_label;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    CombatAction() = default;

    explicit CombatAction(ActionType type)
        : action_type(type)
    {}

    // ========================================================================
    // FACTORY METHODS
    // ========================================================================

    static CombatAction end_turn() {
        return CombatAction(ActionType::END_TURN);
    }

    static CombatAction play_card(size_t hand_index,
                                  std::optional<size_t> target = std::nullopt) {
        CombatAction a(ActionType::PLAY_CARD);
        a.index = hand_index;
        a.target = target;
        return a;
    }

    static CombatAction use_potion(size_t slot,
                                   std::optional<size_t> target = std::nullopt) {
        CombatAction a(ActionType::USE_POTION);
        a.index = slot;
        a.target = target;
        return a;
    }

    // ========================================================================
    // STRING REPRESENTATION
    // ========================================================================

    std::string to_string() const {
        if (!display_label.empty()) {
            return display_label;
        }

        std::string result = "Action(";
        result += descent::to_string(action_type);

        if (action_type != ActionType::END_TURN) {
            result += ", index=" + std::to_string(index);
        }
        if (target.has_value()) {
            result += ", target=" + std::to_string(*target);
        }
        result += ")";
        return result;
    }

    // ========================================================================
    // COMPARISON
    // ========================================================================

    bool operator==(const CombatAction& other) const {
        return action_type == other.action_type
            && index == other.index
            && target == other.target;
    }

    bool operator!=(const CombatAction& other) const {
        return !(*this == other);
    }
};

} // namespace descent

// Hash function for CombatAction (for use in unordered_set/map)
namespace std {
    template<>
    struct hash<descent::CombatAction> {
        size_t operator()(const descent::CombatAction& a) const {
            size_t h = hash<int>()(static_cast<int>(a.action_type));
            h ^= hash<size_t>()(a.index) << 1;
            if (a.target) h ^= hash<size_t>()(*a.target) << 2;
            return h;
        }
    };
}
