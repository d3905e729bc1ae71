/**
 * Descent Combat Engine - Core Type Definitions
 *
 * This file defines the closed vocabularies used throughout the engine:
 * effect kinds, targets, card types, rarities, status keys, relic
 * triggers and actions, enemy intents and the combat phase.
 * These map directly to the tags used in the JSON catalog.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <memory>

namespace descent {

// ============================================================================
// ENUMS - Match the catalog tags exactly
// ============================================================================

enum class EffectKind : uint8_t {
    // Damage
    DAMAGE,
    DAMAGE_ALL,
    DAMAGE_RANDOM,
    DAMAGE_EQUAL_BLOCK,
    DAMAGE_IGNORE_BLOCK,
    DAMAGE_EQUAL_POISON,
    DAMAGE_PER_DISCARD,
    CONDITIONAL_DAMAGE_VULNERABLE,

    // Block
    BLOCK,
    DOUBLE_BLOCK,

    // Card manipulation
    DRAW,
    CONDITIONAL_DRAW_NO_BLOCK,
    DISCARD,
    EXHAUST,
    ADD_TO_HAND,
    ADD_TO_DISCARD,
    ADD_TO_DRAW,
    DUPLICATE_CARD,
    SHUFFLE_DISCARD,

    // Energy
    GAIN_ENERGY,
    LOSE_ENERGY,
    CONDITIONAL_ENERGY_ON_KILL,

    // HP
    HEAL,
    HEAL_PERCENT,
    LOSE_HP,
    GAIN_MAX_HP,

    // Buffs (self)
    APPLY_STRENGTH,
    APPLY_DEXTERITY,
    APPLY_ARTIFACT,
    APPLY_PLATED_ARMOR,
    APPLY_THORNS,
    APPLY_RITUAL,
    APPLY_INTANGIBLE,
    APPLY_REGEN,

    // Debuffs
    APPLY_VULNERABLE,
    APPLY_WEAK,
    APPLY_FRAIL,
    APPLY_POISON,
    REDUCE_STRENGTH,

    // Special
    UPGRADE_CARD,
    TRANSFORM_CARD,
    NEXT_CARD_TWICE,
    SCRY,
    RETAIN_HAND,

    UNKNOWN
};

enum class TargetType : uint8_t {
    SELF,
    SINGLE_ENEMY,
    ALL_ENEMIES,
    RANDOM_ENEMY,
    UNKNOWN
};

enum class CardType : uint8_t {
    ATTACK,
    SKILL,
    POWER,
    STATUS,
    CURSE,
    UNKNOWN
};

enum class Rarity : uint8_t {
    STARTER,
    COMMON,
    UNCOMMON,
    RARE,
    SPECIAL,
    UNKNOWN
};

enum class StatusKey : uint8_t {
    STRENGTH,
    DEXTERITY,
    WEAK,
    VULNERABLE,
    FRAIL,
    POISON,
    ARTIFACT,
    PLATED_ARMOR,
    THORNS,
    RITUAL,
    INTANGIBLE,
    REGEN
};

constexpr int STATUS_KEY_COUNT = 12;

enum class RelicTrigger : uint8_t {
    // Combat lifecycle
    COMBAT_START,
    COMBAT_END,
    COMBAT_VICTORY,

    // Turn lifecycle
    TURN_START,
    TURN_END,
    FIRST_TURN,
    TURN_EVERY_N,

    // Card play
    CARD_PLAYED,
    ATTACK_PLAYED,
    SKILL_PLAYED,
    POWER_PLAYED,
    FIRST_ATTACK_COMBAT,
    FIRST_ATTACK_TURN,
    CARD_EVERY_N,
    ATTACK_EVERY_N,
    SKILL_EVERY_N,

    // Card manipulation
    CARD_DRAWN,
    CARD_DISCARDED,
    CARD_EXHAUSTED,
    SHUFFLE,
    SHUFFLE_EVERY_N,
    EMPTY_HAND_END_TURN,

    // Damage
    PLAYER_DAMAGED,
    FIRST_DAMAGE_COMBAT,
    PLAYER_HP_LOST,
    DAMAGE_DEALT,
    ENEMY_KILLED,

    // Block
    BLOCK_GAINED,
    BLOCK_BROKEN,

    // Status
    DEBUFF_PREVENTED,
    BUFF_GAINED,

    // Rooms
    REST_SITE_ENTER,
    REST_HEAL,
    REST_UPGRADE,
    MERCHANT_ENTER,
    EVENT_ENTER,
    TREASURE_ENTER,
    ROOM_ENTER,

    // Economy
    GOLD_GAINED,
    GOLD_SPENT,

    // Items
    POTION_GAINED,
    POTION_USED,

    // Acquisition
    ON_OBTAIN,
    RELIC_OBTAINED,
    CARD_OBTAINED,

    PASSIVE,

    // HP thresholds
    HP_BELOW_50,
    HP_BELOW_25,

    UNKNOWN
};

enum class RelicAction : uint8_t {
    // Direct
    HEAL,
    BLOCK,
    DRAW,
    GAIN_ENERGY,
    GAIN_STRENGTH,
    GAIN_DEXTERITY,
    GAIN_MAX_HP,
    GAIN_GOLD,
    THORNS,

    // Damage
    DAMAGE_RANDOM,
    DAMAGE_ALL,
    BONUS_DAMAGE,
    REDUCE_DAMAGE,

    // Counter-based ("every N")
    DRAW_EVERY_N,
    ENERGY_EVERY_N,
    DEXTERITY_EVERY_N,
    STRENGTH_EVERY_N,
    BLOCK_EVERY_N,
    DAMAGE_ALL_EVERY_N,
    ENERGY_SHUFFLE_N,
    INTANGIBLE_EVERY_N,

    // Conditional
    ENERGY_EVERY_N_TURNS,
    DRAW_IF_ATTACKS,
    PLATED_ARMOR,
    HEAL_PERCENT,

    // Cards
    ADD_RANDOM_CARD,
    UPGRADE_RANDOM,

    // Run-level
    ENERGY_NEXT_COMBAT,
    POTION_SLOT,

    // Debuffs on enemies
    APPLY_VULNERABLE,
    APPLY_WEAK,

    // Recognised modifiers handled outside the combat engine
    // (merchant discount, extra card choice, rest-site options, ...)
    RUN_MODIFIER,

    UNKNOWN
};

enum class IntentType : uint8_t {
    ATTACK,
    DEFEND,
    BUFF,
    DEBUFF,
    UNKNOWN
};

enum class EnemyActionKind : uint8_t {
    DAMAGE,
    APPLY_WEAK,
    APPLY_VULNERABLE,
    APPLY_FRAIL,
    APPLY_POISON,
    APPLY_BLOCK_SELF,
    APPLY_STRENGTH_SELF,
    APPLY_RITUAL_SELF,
    APPLY_ARTIFACT_SELF,
    APPLY_PLATED_ARMOR_SELF,
    APPLY_THORNS_SELF,
    UNKNOWN
};

enum class EnemyType : uint8_t {
    NORMAL,
    ELITE,
    BOSS
};

enum class CombatPhase : uint8_t {
    NOT_STARTED,
    PLAYER_TURN,
    ENEMY_TURN,
    VICTORY,
    DEFEAT
};

enum class PilePosition : uint8_t {
    TOP,
    BOTTOM,
    RANDOM
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using CardID = std::string;           // Unique instance ID (e.g., "card_12")
using CardDefID = std::string;        // Catalog card ID (e.g., "delve")
using EnemyDefID = std::string;
using RelicDefID = std::string;
using PotionDefID = std::string;

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline const char* to_string(EffectKind kind) {
    switch (kind) {
        case EffectKind::DAMAGE: return "DAMAGE";
        case EffectKind::DAMAGE_ALL: return "DAMAGE_ALL";
        case EffectKind::DAMAGE_RANDOM: return "DAMAGE_RANDOM";
        case EffectKind::DAMAGE_EQUAL_BLOCK: return "DAMAGE_EQUAL_BLOCK";
        case EffectKind::DAMAGE_IGNORE_BLOCK: return "DAMAGE_IGNORE_BLOCK";
        case EffectKind::DAMAGE_EQUAL_POISON: return "DAMAGE_EQUAL_POISON";
        case EffectKind::DAMAGE_PER_DISCARD: return "DAMAGE_PER_DISCARD";
        case EffectKind::CONDITIONAL_DAMAGE_VULNERABLE: return "CONDITIONAL_DAMAGE_VULNERABLE";
        case EffectKind::BLOCK: return "BLOCK";
        case EffectKind::DOUBLE_BLOCK: return "DOUBLE_BLOCK";
        case EffectKind::DRAW: return "DRAW";
        case EffectKind::CONDITIONAL_DRAW_NO_BLOCK: return "CONDITIONAL_DRAW_NO_BLOCK";
        case EffectKind::DISCARD: return "DISCARD";
        case EffectKind::EXHAUST: return "EXHAUST";
        case EffectKind::ADD_TO_HAND: return "ADD_TO_HAND";
        case EffectKind::ADD_TO_DISCARD: return "ADD_TO_DISCARD";
        case EffectKind::ADD_TO_DRAW: return "ADD_TO_DRAW";
        case EffectKind::DUPLICATE_CARD: return "DUPLICATE_CARD";
        case EffectKind::SHUFFLE_DISCARD: return "SHUFFLE_DISCARD";
        case EffectKind::GAIN_ENERGY: return "GAIN_ENERGY";
        case EffectKind::LOSE_ENERGY: return "LOSE_ENERGY";
        case EffectKind::CONDITIONAL_ENERGY_ON_KILL: return "CONDITIONAL_ENERGY_ON_KILL";
        case EffectKind::HEAL: return "HEAL";
        case EffectKind::HEAL_PERCENT: return "HEAL_PERCENT";
        case EffectKind::LOSE_HP: return "LOSE_HP";
        case EffectKind::GAIN_MAX_HP: return "GAIN_MAX_HP";
        case EffectKind::APPLY_STRENGTH: return "APPLY_STRENGTH";
        case EffectKind::APPLY_DEXTERITY: return "APPLY_DEXTERITY";
        case EffectKind::APPLY_ARTIFACT: return "APPLY_ARTIFACT";
        case EffectKind::APPLY_PLATED_ARMOR: return "APPLY_PLATED_ARMOR";
        case EffectKind::APPLY_THORNS: return "APPLY_THORNS";
        case EffectKind::APPLY_RITUAL: return "APPLY_RITUAL";
        case EffectKind::APPLY_INTANGIBLE: return "APPLY_INTANGIBLE";
        case EffectKind::APPLY_REGEN: return "APPLY_REGEN";
        case EffectKind::APPLY_VULNERABLE: return "APPLY_VULNERABLE";
        case EffectKind::APPLY_WEAK: return "APPLY_WEAK";
        case EffectKind::APPLY_FRAIL: return "APPLY_FRAIL";
        case EffectKind::APPLY_POISON: return "APPLY_POISON";
        case EffectKind::REDUCE_STRENGTH: return "REDUCE_STRENGTH";
        case EffectKind::UPGRADE_CARD: return "UPGRADE_CARD";
        case EffectKind::TRANSFORM_CARD: return "TRANSFORM_CARD";
        case EffectKind::NEXT_CARD_TWICE: return "NEXT_CARD_TWICE";
        case EffectKind::SCRY: return "SCRY";
        case EffectKind::RETAIN_HAND: return "RETAIN_HAND";
        default: return "UNKNOWN";
    }
}

inline const char* to_string(TargetType target) {
    switch (target) {
        case TargetType::SELF: return "SELF";
        case TargetType::SINGLE_ENEMY: return "SINGLE_ENEMY";
        case TargetType::ALL_ENEMIES: return "ALL_ENEMIES";
        case TargetType::RANDOM_ENEMY: return "RANDOM_ENEMY";
        default: return "UNKNOWN";
    }
}

inline const char* to_string(CardType type) {
    switch (type) {
        case CardType::ATTACK: return "ATTACK";
        case CardType::SKILL: return "SKILL";
        case CardType::POWER: return "POWER";
        case CardType::STATUS: return "STATUS";
        case CardType::CURSE: return "CURSE";
        default: return "UNKNOWN";
    }
}

inline const char* to_string(Rarity rarity) {
    switch (rarity) {
        case Rarity::STARTER: return "STARTER";
        case Rarity::COMMON: return "COMMON";
        case Rarity::UNCOMMON: return "UNCOMMON";
        case Rarity::RARE: return "RARE";
        case Rarity::SPECIAL: return "SPECIAL";
        default: return "UNKNOWN";
    }
}

// Status keys use the lower-camel-case spelling of the catalog.
inline const char* to_string(StatusKey key) {
    switch (key) {
        case StatusKey::STRENGTH: return "strength";
        case StatusKey::DEXTERITY: return "dexterity";
        case StatusKey::WEAK: return "weak";
        case StatusKey::VULNERABLE: return "vulnerable";
        case StatusKey::FRAIL: return "frail";
        case StatusKey::POISON: return "poison";
        case StatusKey::ARTIFACT: return "artifact";
        case StatusKey::PLATED_ARMOR: return "platedArmor";
        case StatusKey::THORNS: return "thorns";
        case StatusKey::RITUAL: return "ritual";
        case StatusKey::INTANGIBLE: return "intangible";
        case StatusKey::REGEN: return "regen";
        default: return "unknown";
    }
}

inline const char* to_string(RelicTrigger trigger) {
    switch (trigger) {
        case RelicTrigger::COMBAT_START: return "COMBAT_START";
        case RelicTrigger::COMBAT_END: return "COMBAT_END";
        case RelicTrigger::COMBAT_VICTORY: return "COMBAT_VICTORY";
        case RelicTrigger::TURN_START: return "TURN_START";
        case RelicTrigger::TURN_END: return "TURN_END";
        case RelicTrigger::FIRST_TURN: return "FIRST_TURN";
        case RelicTrigger::TURN_EVERY_N: return "TURN_EVERY_N";
        case RelicTrigger::CARD_PLAYED: return "CARD_PLAYED";
        case RelicTrigger::ATTACK_PLAYED: return "ATTACK_PLAYED";
        case RelicTrigger::SKILL_PLAYED: return "SKILL_PLAYED";
        case RelicTrigger::POWER_PLAYED: return "POWER_PLAYED";
        case RelicTrigger::FIRST_ATTACK_COMBAT: return "FIRST_ATTACK_COMBAT";
        case RelicTrigger::FIRST_ATTACK_TURN: return "FIRST_ATTACK_TURN";
        case RelicTrigger::CARD_EVERY_N: return "CARD_EVERY_N";
        case RelicTrigger::ATTACK_EVERY_N: return "ATTACK_EVERY_N";
        case RelicTrigger::SKILL_EVERY_N: return "SKILL_EVERY_N";
        case RelicTrigger::CARD_DRAWN: return "CARD_DRAWN";
        case RelicTrigger::CARD_DISCARDED: return "CARD_DISCARDED";
        case RelicTrigger::CARD_EXHAUSTED: return "CARD_EXHAUSTED";
        case RelicTrigger::SHUFFLE: return "SHUFFLE";
        case RelicTrigger::SHUFFLE_EVERY_N: return "SHUFFLE_EVERY_N";
        case RelicTrigger::EMPTY_HAND_END_TURN: return "EMPTY_HAND_END_TURN";
        case RelicTrigger::PLAYER_DAMAGED: return "PLAYER_DAMAGED";
        case RelicTrigger::FIRST_DAMAGE_COMBAT: return "FIRST_DAMAGE_COMBAT";
        case RelicTrigger::PLAYER_HP_LOST: return "PLAYER_HP_LOST";
        case RelicTrigger::DAMAGE_DEALT: return "DAMAGE_DEALT";
        case RelicTrigger::ENEMY_KILLED: return "ENEMY_KILLED";
        case RelicTrigger::BLOCK_GAINED: return "BLOCK_GAINED";
        case RelicTrigger::BLOCK_BROKEN: return "BLOCK_BROKEN";
        case RelicTrigger::DEBUFF_PREVENTED: return "DEBUFF_PREVENTED";
        case RelicTrigger::BUFF_GAINED: return "BUFF_GAINED";
        case RelicTrigger::REST_SITE_ENTER: return "REST_SITE_ENTER";
        case RelicTrigger::REST_HEAL: return "REST_HEAL";
        case RelicTrigger::REST_UPGRADE: return "REST_UPGRADE";
        case RelicTrigger::MERCHANT_ENTER: return "MERCHANT_ENTER";
        case RelicTrigger::EVENT_ENTER: return "EVENT_ENTER";
        case RelicTrigger::TREASURE_ENTER: return "TREASURE_ENTER";
        case RelicTrigger::ROOM_ENTER: return "ROOM_ENTER";
        case RelicTrigger::GOLD_GAINED: return "GOLD_GAINED";
        case RelicTrigger::GOLD_SPENT: return "GOLD_SPENT";
        case RelicTrigger::POTION_GAINED: return "POTION_GAINED";
        case RelicTrigger::POTION_USED: return "POTION_USED";
        case RelicTrigger::ON_OBTAIN: return "ON_OBTAIN";
        case RelicTrigger::RELIC_OBTAINED: return "RELIC_OBTAINED";
        case RelicTrigger::CARD_OBTAINED: return "CARD_OBTAINED";
        case RelicTrigger::PASSIVE: return "PASSIVE";
        case RelicTrigger::HP_BELOW_50: return "HP_BELOW_50";
        case RelicTrigger::HP_BELOW_25: return "HP_BELOW_25";
        default: return "UNKNOWN";
    }
}

inline const char* to_string(RelicAction action) {
    switch (action) {
        case RelicAction::HEAL: return "HEAL";
        case RelicAction::BLOCK: return "BLOCK";
        case RelicAction::DRAW: return "DRAW";
        case RelicAction::GAIN_ENERGY: return "GAIN_ENERGY";
        case RelicAction::GAIN_STRENGTH: return "GAIN_STRENGTH";
        case RelicAction::GAIN_DEXTERITY: return "GAIN_DEXTERITY";
        case RelicAction::GAIN_MAX_HP: return "GAIN_MAX_HP";
        case RelicAction::GAIN_GOLD: return "GAIN_GOLD";
        case RelicAction::THORNS: return "THORNS";
        case RelicAction::DAMAGE_RANDOM: return "DAMAGE_RANDOM";
        case RelicAction::DAMAGE_ALL: return "DAMAGE_ALL";
        case RelicAction::BONUS_DAMAGE: return "BONUS_DAMAGE";
        case RelicAction::REDUCE_DAMAGE: return "REDUCE_DAMAGE";
        case RelicAction::DRAW_EVERY_N: return "DRAW_EVERY_N";
        case RelicAction::ENERGY_EVERY_N: return "ENERGY_EVERY_N";
        case RelicAction::DEXTERITY_EVERY_N: return "DEXTERITY_EVERY_N";
        case RelicAction::STRENGTH_EVERY_N: return "STRENGTH_EVERY_N";
        case RelicAction::BLOCK_EVERY_N: return "BLOCK_EVERY_N";
        case RelicAction::DAMAGE_ALL_EVERY_N: return "DAMAGE_ALL_EVERY_N";
        case RelicAction::ENERGY_SHUFFLE_N: return "ENERGY_SHUFFLE_N";
        case RelicAction::INTANGIBLE_EVERY_N: return "INTANGIBLE_EVERY_N";
        case RelicAction::ENERGY_EVERY_N_TURNS: return "ENERGY_EVERY_N_TURNS";
        case RelicAction::DRAW_IF_ATTACKS: return "DRAW_IF_ATTACKS";
        case RelicAction::PLATED_ARMOR: return "PLATED_ARMOR";
        case RelicAction::HEAL_PERCENT: return "HEAL_PERCENT";
        case RelicAction::ADD_RANDOM_CARD: return "ADD_RANDOM_CARD";
        case RelicAction::UPGRADE_RANDOM: return "UPGRADE_RANDOM";
        case RelicAction::ENERGY_NEXT_COMBAT: return "ENERGY_NEXT_COMBAT";
        case RelicAction::POTION_SLOT: return "POTION_SLOT";
        case RelicAction::APPLY_VULNERABLE: return "APPLY_VULNERABLE";
        case RelicAction::APPLY_WEAK: return "APPLY_WEAK";
        case RelicAction::RUN_MODIFIER: return "RUN_MODIFIER";
        default: return "UNKNOWN";
    }
}

inline const char* to_string(IntentType type) {
    switch (type) {
        case IntentType::ATTACK: return "ATTACK";
        case IntentType::DEFEND: return "DEFEND";
        case IntentType::BUFF: return "BUFF";
        case IntentType::DEBUFF: return "DEBUFF";
        default: return "UNKNOWN";
    }
}

inline const char* to_string(EnemyActionKind kind) {
    switch (kind) {
        case EnemyActionKind::DAMAGE: return "DAMAGE";
        case EnemyActionKind::APPLY_WEAK: return "APPLY_WEAK";
        case EnemyActionKind::APPLY_VULNERABLE: return "APPLY_VULNERABLE";
        case EnemyActionKind::APPLY_FRAIL: return "APPLY_FRAIL";
        case EnemyActionKind::APPLY_POISON: return "APPLY_POISON";
        case EnemyActionKind::APPLY_BLOCK_SELF: return "APPLY_BLOCK_SELF";
        case EnemyActionKind::APPLY_STRENGTH_SELF: return "APPLY_STRENGTH_SELF";
        case EnemyActionKind::APPLY_RITUAL_SELF: return "APPLY_RITUAL_SELF";
        case EnemyActionKind::APPLY_ARTIFACT_SELF: return "APPLY_ARTIFACT_SELF";
        case EnemyActionKind::APPLY_PLATED_ARMOR_SELF: return "APPLY_PLATED_ARMOR_SELF";
        case EnemyActionKind::APPLY_THORNS_SELF: return "APPLY_THORNS_SELF";
        default: return "UNKNOWN";
    }
}

inline const char* to_string(EnemyType type) {
    switch (type) {
        case EnemyType::NORMAL: return "normal";
        case EnemyType::ELITE: return "elite";
        case EnemyType::BOSS: return "boss";
        default: return "unknown";
    }
}

inline const char* to_string(CombatPhase phase) {
    switch (phase) {
        case CombatPhase::NOT_STARTED: return "not_started";
        case CombatPhase::PLAYER_TURN: return "player_turn";
        case CombatPhase::ENEMY_TURN: return "enemy_turn";
        case CombatPhase::VICTORY: return "victory";
        case CombatPhase::DEFEAT: return "defeat";
        default: return "unknown";
    }
}

// ============================================================================
// CLASSIFICATION PREDICATES
// ============================================================================

inline bool is_damage_effect(EffectKind kind) {
    switch (kind) {
        case EffectKind::DAMAGE:
        case EffectKind::DAMAGE_ALL:
        case EffectKind::DAMAGE_RANDOM:
        case EffectKind::DAMAGE_EQUAL_BLOCK:
        case EffectKind::DAMAGE_IGNORE_BLOCK:
        case EffectKind::DAMAGE_EQUAL_POISON:
        case EffectKind::DAMAGE_PER_DISCARD:
        case EffectKind::CONDITIONAL_DAMAGE_VULNERABLE:
            return true;
        default:
            return false;
    }
}

inline bool is_block_effect(EffectKind kind) {
    return kind == EffectKind::BLOCK || kind == EffectKind::DOUBLE_BLOCK;
}

inline bool is_debuff_effect(EffectKind kind) {
    switch (kind) {
        case EffectKind::APPLY_VULNERABLE:
        case EffectKind::APPLY_WEAK:
        case EffectKind::APPLY_FRAIL:
        case EffectKind::APPLY_POISON:
        case EffectKind::REDUCE_STRENGTH:
            return true;
        default:
            return false;
    }
}

inline bool is_buff_effect(EffectKind kind) {
    switch (kind) {
        case EffectKind::APPLY_STRENGTH:
        case EffectKind::APPLY_DEXTERITY:
        case EffectKind::APPLY_ARTIFACT:
        case EffectKind::APPLY_PLATED_ARMOR:
        case EffectKind::APPLY_THORNS:
        case EffectKind::APPLY_RITUAL:
        case EffectKind::APPLY_INTANGIBLE:
        case EffectKind::APPLY_REGEN:
            return true;
        default:
            return false;
    }
}

/**
 * Status key written by an APPLY_* effect, if any.
 * REDUCE_STRENGTH maps to STRENGTH (applied as a negative amount).
 */
inline std::optional<StatusKey> status_for_effect(EffectKind kind) {
    switch (kind) {
        case EffectKind::APPLY_STRENGTH: return StatusKey::STRENGTH;
        case EffectKind::APPLY_DEXTERITY: return StatusKey::DEXTERITY;
        case EffectKind::APPLY_ARTIFACT: return StatusKey::ARTIFACT;
        case EffectKind::APPLY_PLATED_ARMOR: return StatusKey::PLATED_ARMOR;
        case EffectKind::APPLY_THORNS: return StatusKey::THORNS;
        case EffectKind::APPLY_RITUAL: return StatusKey::RITUAL;
        case EffectKind::APPLY_INTANGIBLE: return StatusKey::INTANGIBLE;
        case EffectKind::APPLY_REGEN: return StatusKey::REGEN;
        case EffectKind::APPLY_VULNERABLE: return StatusKey::VULNERABLE;
        case EffectKind::APPLY_WEAK: return StatusKey::WEAK;
        case EffectKind::APPLY_FRAIL: return StatusKey::FRAIL;
        case EffectKind::APPLY_POISON: return StatusKey::POISON;
        case EffectKind::REDUCE_STRENGTH: return StatusKey::STRENGTH;
        default: return std::nullopt;
    }
}

// Duration counters combine with "max with existing"; the rest add.
inline bool is_duration_status(StatusKey key) {
    return key == StatusKey::WEAK || key == StatusKey::VULNERABLE ||
           key == StatusKey::FRAIL || key == StatusKey::INTANGIBLE;
}

inline bool is_debuff_status(StatusKey key) {
    return key == StatusKey::WEAK || key == StatusKey::VULNERABLE ||
           key == StatusKey::FRAIL || key == StatusKey::POISON;
}

inline bool is_combat_trigger(RelicTrigger trigger) {
    switch (trigger) {
        case RelicTrigger::COMBAT_START:
        case RelicTrigger::COMBAT_END:
        case RelicTrigger::COMBAT_VICTORY:
        case RelicTrigger::TURN_START:
        case RelicTrigger::TURN_END:
        case RelicTrigger::FIRST_TURN:
        case RelicTrigger::TURN_EVERY_N:
        case RelicTrigger::CARD_PLAYED:
        case RelicTrigger::ATTACK_PLAYED:
        case RelicTrigger::SKILL_PLAYED:
        case RelicTrigger::POWER_PLAYED:
        case RelicTrigger::FIRST_ATTACK_COMBAT:
        case RelicTrigger::FIRST_ATTACK_TURN:
        case RelicTrigger::CARD_EVERY_N:
        case RelicTrigger::ATTACK_EVERY_N:
        case RelicTrigger::SKILL_EVERY_N:
        case RelicTrigger::CARD_DRAWN:
        case RelicTrigger::CARD_DISCARDED:
        case RelicTrigger::CARD_EXHAUSTED:
        case RelicTrigger::SHUFFLE:
        case RelicTrigger::SHUFFLE_EVERY_N:
        case RelicTrigger::EMPTY_HAND_END_TURN:
        case RelicTrigger::PLAYER_DAMAGED:
        case RelicTrigger::FIRST_DAMAGE_COMBAT:
        case RelicTrigger::PLAYER_HP_LOST:
        case RelicTrigger::DAMAGE_DEALT:
        case RelicTrigger::ENEMY_KILLED:
        case RelicTrigger::BLOCK_GAINED:
        case RelicTrigger::BLOCK_BROKEN:
        case RelicTrigger::DEBUFF_PREVENTED:
        case RelicTrigger::BUFF_GAINED:
        case RelicTrigger::POTION_USED:
        case RelicTrigger::HP_BELOW_50:
        case RelicTrigger::HP_BELOW_25:
            return true;
        default:
            return false;
    }
}

inline bool is_room_trigger(RelicTrigger trigger) {
    switch (trigger) {
        case RelicTrigger::REST_SITE_ENTER:
        case RelicTrigger::MERCHANT_ENTER:
        case RelicTrigger::EVENT_ENTER:
        case RelicTrigger::TREASURE_ENTER:
        case RelicTrigger::ROOM_ENTER:
            return true;
        default:
            return false;
    }
}

inline bool is_counter_action(RelicAction action) {
    switch (action) {
        case RelicAction::DRAW_EVERY_N:
        case RelicAction::ENERGY_EVERY_N:
        case RelicAction::DEXTERITY_EVERY_N:
        case RelicAction::STRENGTH_EVERY_N:
        case RelicAction::BLOCK_EVERY_N:
        case RelicAction::DAMAGE_ALL_EVERY_N:
        case RelicAction::ENERGY_SHUFFLE_N:
        case RelicAction::INTANGIBLE_EVERY_N:
            return true;
        default:
            return false;
    }
}

// ============================================================================
// GAME CONSTANTS
// ============================================================================

namespace constants {

constexpr double WEAK_DAMAGE_MULTIPLIER = 0.75;
constexpr double VULNERABLE_DAMAGE_MULTIPLIER = 1.5;
constexpr double FRAIL_BLOCK_MULTIPLIER = 0.75;
constexpr int INTANGIBLE_DAMAGE = 1;

constexpr int DEFAULT_HAND_SIZE = 5;
constexpr int MAX_HAND_SIZE = 10;
constexpr int DEFAULT_ENERGY = 3;
constexpr int MAX_ENERGY_BONUS = 10;      // energy never exceeds max_energy + this

constexpr int DEFAULT_MAX_HP = 80;
constexpr int DEFAULT_STARTING_GOLD = 99;
constexpr int DEFAULT_MAX_POTIONS = 3;

constexpr double ENEMY_HP_VARIANCE = 0.1;
constexpr int MOVE_HISTORY_SIZE = 3;

constexpr double LOW_HP_THRESHOLD = 0.5;

} // namespace constants

} // namespace descent
