/**
 * Descent Combat Engine - Card Database
 *
 * Stores immutable card, enemy, relic and potion templates loaded from JSON.
 * Provides fast lookup by id. Constructed once by the host and passed into
 * the engine; nothing here is global.
 */

#pragma once

#include "types.hpp"
#include "engine_config.hpp"
#include <algorithm>
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace descent {

/**
 * One declarative effect of a card or potion.
 */
struct EffectDef {
    EffectKind kind = EffectKind::UNKNOWN;
    std::string kind_name;                 // Tag as written in the catalog
    int value = 0;
    std::optional<TargetType> target;      // Overrides the card's target type
    int times = 1;                         // Multi-hit repeat count
    double percentage = 0.0;               // Potions: fraction of max HP
    std::optional<CardDefID> card_ref;     // ADD_TO_* / DUPLICATE_CARD
    PilePosition position = PilePosition::RANDOM;  // ADD_TO_DRAW
};

/**
 * Upgrade delta ("upgradedStats"). Only present fields override.
 */
struct CardUpgrade {
    std::optional<int> cost;
    std::optional<std::string> description;
    std::optional<std::vector<EffectDef>> effects;
    std::optional<TargetType> target_type;
    std::optional<bool> exhaust;
    std::optional<bool> retain;
    std::optional<bool> innate;
    std::optional<bool> ethereal;
};

/**
 * Card definition (immutable template).
 *
 * cost == -1 marks an unplayable card unless is_x_cost is set, in which
 * case the card spends all remaining energy.
 */
struct CardDef {
    CardDefID card_id;
    std::string name;
    std::string description;   // Template with {0}, {1}... value placeholders
    CardType type = CardType::SKILL;
    Rarity rarity = Rarity::COMMON;
    int cost = 0;
    TargetType target_type = TargetType::SELF;
    std::vector<EffectDef> effects;

    // Keywords
    bool exhaust = false;
    bool retain = false;
    bool innate = false;
    bool ethereal = false;
    bool is_x_cost = false;
    bool unplayable = false;

    std::optional<CardUpgrade> upgrade;

    bool has_unknown_tags() const {
        return type == CardType::UNKNOWN || target_type == TargetType::UNKNOWN;
    }

    bool is_playable() const {
        return !unplayable && !has_unknown_tags() && (is_x_cost || cost >= 0);
    }
};

/**
 * Enemy intent: what the enemy shows before acting.
 */
struct Intent {
    IntentType type = IntentType::UNKNOWN;
    std::optional<int> value;
};

struct EnemyActionDef {
    EnemyActionKind kind = EnemyActionKind::UNKNOWN;
    std::string kind_name;
    int value = 0;
    int times = 1;
};

struct EnemyMoveDef {
    std::string name;
    Intent intent;
    int weight = 1;
    std::vector<EnemyActionDef> actions;
};

struct EnemyDef {
    EnemyDefID enemy_id;
    std::string name;
    EnemyType type = EnemyType::NORMAL;
    int max_hp = 1;
    std::vector<EnemyMoveDef> moves;
    std::vector<std::pair<StatusKey, int>> starting_status;
};

/**
 * (trigger, action, value) triple. Unknown trigger names are kept in
 * trigger_name so they can be reported; they never match an event.
 */
struct RelicEffectDef {
    RelicTrigger trigger = RelicTrigger::UNKNOWN;
    std::string trigger_name;
    RelicAction action = RelicAction::UNKNOWN;
    std::string action_name;
    int value = 0;
    std::optional<int> amount;   // Overrides the payoff of counter actions
};

struct RelicDef {
    RelicDefID relic_id;
    std::string name;
    std::string description;
    Rarity rarity = Rarity::COMMON;
    std::vector<RelicEffectDef> effects;
    bool reset_counter_each_combat = false;

    bool has_trigger(RelicTrigger trigger) const {
        return std::any_of(effects.begin(), effects.end(),
                           [trigger](const RelicEffectDef& e) { return e.trigger == trigger; });
    }
};

struct PotionDef {
    PotionDefID potion_id;
    std::string name;
    std::string description;
    Rarity rarity = Rarity::COMMON;
    TargetType target_type = TargetType::SELF;
    std::vector<EffectDef> effects;
};

/**
 * CardDatabase - Central catalog lookup.
 *
 * Loads every record type from one JSON document:
 *   { "cards": [...], "enemies": [...], "relics": [...], "potions": [...], "rules": {...} }
 * Every section is optional. Records can also be registered directly,
 * which is how tests build synthetic catalogs.
 */
class CardDatabase {
public:
    CardDatabase();
    ~CardDatabase() = default;

    /**
     * Load records from a JSON file. Returns false on I/O or parse error.
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Load records from JSON text.
     */
    bool load_from_string(const std::string& json_text);

    // ========================================================================
    // REGISTRATION
    // ========================================================================

    void add_card(CardDef card);
    void add_enemy(EnemyDef enemy);
    void add_relic(RelicDef relic);
    void add_potion(PotionDef potion);

    // ========================================================================
    // LOOKUP (nullptr if not found)
    // ========================================================================

    const CardDef* get_card(const CardDefID& card_id) const;
    const EnemyDef* get_enemy(const EnemyDefID& enemy_id) const;
    const RelicDef* get_relic(const RelicDefID& relic_id) const;
    const PotionDef* get_potion(const PotionDefID& potion_id) const;

    bool has_card(const CardDefID& card_id) const;

    /**
     * All card IDs, sorted so that random picks are reproducible.
     */
    std::vector<CardDefID> get_all_card_ids() const;

    std::vector<const CardDef*> get_cards_by_rarity(Rarity rarity) const;

    size_t card_count() const { return cards_.size(); }
    size_t enemy_count() const { return enemies_.size(); }
    size_t relic_count() const { return relics_.size(); }
    size_t potion_count() const { return potions_.size(); }

    /**
     * Rules loaded from the "rules" section (defaults otherwise).
     */
    const EngineConfig& get_config() const { return config_; }
    void set_config(const EngineConfig& config) { config_ = config; }

    // ========================================================================
    // TAG PARSING - public for use by other components
    // ========================================================================

    static EffectKind parse_effect_kind(const std::string& s);
    static TargetType parse_target_type(const std::string& s);
    static CardType parse_card_type(const std::string& s);
    static Rarity parse_rarity(const std::string& s);
    static RelicAction parse_relic_action(const std::string& s);
    static IntentType parse_intent_type(const std::string& s);
    static EnemyActionKind parse_enemy_action(const std::string& s);
    static EnemyType parse_enemy_type(const std::string& s);
    static std::optional<StatusKey> parse_status_key(const std::string& s);
    static PilePosition parse_pile_position(const std::string& s);

    /**
     * Map legacy trigger spellings (camelCase, START_TURN, ...) to the
     * canonical UPPER_SNAKE name. Unknown names are logged and returned
     * unchanged.
     */
    static std::string normalize_trigger(const std::string& trigger);

    /**
     * normalize_trigger() followed by enum lookup. UNKNOWN if unrecognised.
     */
    static RelicTrigger parse_relic_trigger(const std::string& s);

private:
    std::unordered_map<CardDefID, CardDef> cards_;
    std::unordered_map<EnemyDefID, EnemyDef> enemies_;
    std::unordered_map<RelicDefID, RelicDef> relics_;
    std::unordered_map<PotionDefID, PotionDef> potions_;
    EngineConfig config_;

    bool load_document(const nlohmann::json& data);

    // Parse helpers
    CardDef parse_card(const nlohmann::json& card_json) const;
    CardUpgrade parse_upgrade(const nlohmann::json& upgrade_json) const;
    EffectDef parse_effect(const nlohmann::json& effect_json) const;
    std::vector<EffectDef> parse_effect_list(const nlohmann::json& list_json) const;
    EnemyDef parse_enemy(const nlohmann::json& enemy_json) const;
    EnemyMoveDef parse_move(const nlohmann::json& move_json) const;
    RelicDef parse_relic(const nlohmann::json& relic_json) const;
    PotionDef parse_potion(const nlohmann::json& potion_json) const;
};

} // namespace descent
