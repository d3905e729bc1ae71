/**
 * Descent Combat Engine - Card Database Implementation
 *
 * Loads card, enemy, relic and potion templates from JSON using nlohmann/json.
 * Every tag is parsed into a closed enum; unknown tags are logged and mapped
 * to UNKNOWN so the resolution engine can skip them.
 */

#include "card_database.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace descent {

namespace {

// Legacy trigger spellings found in older relic data.
const std::unordered_map<std::string, std::string>& trigger_migration_map() {
    static const std::unordered_map<std::string, std::string> map = {
        // camelCase
        {"onCombatStart", "COMBAT_START"},
        {"onCombatEnd", "COMBAT_END"},
        {"onCombatVictory", "COMBAT_VICTORY"},
        {"onTurnStart", "TURN_START"},
        {"onTurnEnd", "TURN_END"},
        {"onFirstTurn", "FIRST_TURN"},
        {"onCardPlayed", "CARD_PLAYED"},
        {"onAttackPlayed", "ATTACK_PLAYED"},
        {"onSkillPlayed", "SKILL_PLAYED"},
        {"onPowerPlayed", "POWER_PLAYED"},
        {"onFirstAttack", "FIRST_ATTACK_COMBAT"},
        {"onCardDrawn", "CARD_DRAWN"},
        {"onCardDiscarded", "CARD_DISCARDED"},
        {"onCardExhausted", "CARD_EXHAUSTED"},
        {"onShuffle", "SHUFFLE"},
        {"onPlayerDamaged", "PLAYER_DAMAGED"},
        {"onDamageDealt", "DAMAGE_DEALT"},
        {"onEnemyKilled", "ENEMY_KILLED"},
        {"onBlockGained", "BLOCK_GAINED"},
        {"onDebuffPrevented", "DEBUFF_PREVENTED"},
        {"onRestSite", "REST_SITE_ENTER"},
        {"onMerchant", "MERCHANT_ENTER"},
        {"onEvent", "EVENT_ENTER"},
        {"onTreasure", "TREASURE_ENTER"},
        {"onRoomEnter", "ROOM_ENTER"},
        {"onGoldGained", "GOLD_GAINED"},
        {"onGoldSpent", "GOLD_SPENT"},
        {"onPotionGained", "POTION_GAINED"},
        {"onPotionUsed", "POTION_USED"},
        {"onObtain", "ON_OBTAIN"},
        {"onRelicObtained", "RELIC_OBTAINED"},
        {"onCardObtained", "CARD_OBTAINED"},
        {"passive", "PASSIVE"},

        // Mixed forms
        {"START_COMBAT", "COMBAT_START"},
        {"END_COMBAT", "COMBAT_END"},
        {"START_TURN", "TURN_START"},
        {"END_TURN", "TURN_END"},
        {"CARD_PLAY", "CARD_PLAYED"},
        {"ATTACK_PLAY", "ATTACK_PLAYED"},
        {"SKILL_PLAY", "SKILL_PLAYED"},
        {"POWER_PLAY", "POWER_PLAYED"},
    };
    return map;
}

// Run-level relic actions that only the surrounding application acts on.
bool is_run_modifier_action(const std::string& s) {
    static const char* const names[] = {
        "ELITE_BONUS_RELIC", "CURSES_PLAYABLE", "VULNERABLE_BONUS",
        "MORE_EVENT_OPTIONS", "MERCHANT_BONUS", "EXTRA_CARD_REWARD",
        "REST_REMOVE_CARD", "REST_DIG", "REDUCE_SMALL_DAMAGE", "RETAIN_ENERGY",
        "EVENT_TO_TREASURE", "REVIVE", "AUTO_UPGRADE_SKILLS", "AUTO_UPGRADE_POWERS",
        "REDUCE_RANDOM_COST", "DISCARD_DRAW", "RUN_MODIFIER",
    };
    for (const char* name : names) {
        if (s == name) return true;
    }
    return false;
}

// "onCardDrawn" -> "ON_CARD_DRAWN", "cardDrawn" -> "CARD_DRAWN"
std::string camel_to_upper_snake(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 4);
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (i > 0 && std::isupper(static_cast<unsigned char>(c)) &&
            std::islower(static_cast<unsigned char>(s[i - 1]))) {
            out.push_back('_');
        }
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

std::optional<RelicTrigger> exact_trigger(const std::string& s) {
    for (int i = 0; i < static_cast<int>(RelicTrigger::UNKNOWN); ++i) {
        auto trigger = static_cast<RelicTrigger>(i);
        if (s == to_string(trigger)) return trigger;
    }
    return std::nullopt;
}

template<typename E>
E parse_by_name(const std::string& s, E unknown, const char* what) {
    for (int i = 0; i < static_cast<int>(unknown); ++i) {
        auto value = static_cast<E>(i);
        if (s == to_string(value)) return value;
    }
    std::cerr << "[CardDatabase] Unknown " << what << ": '" << s << "'" << std::endl;
    return unknown;
}

} // namespace

CardDatabase::CardDatabase() {}

bool CardDatabase::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[CardDatabase] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[CardDatabase] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[CardDatabase] Error: " << e.what() << std::endl;
        return false;
    }
}

bool CardDatabase::load_from_string(const std::string& json_text) {
    try {
        json data = json::parse(json_text);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[CardDatabase] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[CardDatabase] Error: " << e.what() << std::endl;
        return false;
    }
}

bool CardDatabase::load_document(const json& data) {
    if (!data.is_object()) {
        std::cerr << "[CardDatabase] Catalog root must be an object" << std::endl;
        return false;
    }

    int card_count = 0;
    int enemy_count = 0;
    int relic_count = 0;
    int potion_count = 0;

    if (data.contains("cards") && data["cards"].is_array()) {
        for (const auto& card_json : data["cards"]) {
            CardDef card = parse_card(card_json);
            if (!card.card_id.empty()) {
                add_card(std::move(card));
                card_count++;
            }
        }
    }

    if (data.contains("enemies") && data["enemies"].is_array()) {
        for (const auto& enemy_json : data["enemies"]) {
            EnemyDef enemy = parse_enemy(enemy_json);
            if (!enemy.enemy_id.empty()) {
                add_enemy(std::move(enemy));
                enemy_count++;
            }
        }
    }

    if (data.contains("relics") && data["relics"].is_array()) {
        for (const auto& relic_json : data["relics"]) {
            RelicDef relic = parse_relic(relic_json);
            if (!relic.relic_id.empty()) {
                add_relic(std::move(relic));
                relic_count++;
            }
        }
    }

    if (data.contains("potions") && data["potions"].is_array()) {
        for (const auto& potion_json : data["potions"]) {
            PotionDef potion = parse_potion(potion_json);
            if (!potion.potion_id.empty()) {
                add_potion(std::move(potion));
                potion_count++;
            }
        }
    }

    if (data.contains("rules") && data["rules"].is_object()) {
        apply_config_json(data["rules"], config_);
    }

    std::cout << "[CardDatabase] Loaded " << card_count << " cards, "
              << enemy_count << " enemies, " << relic_count << " relics, "
              << potion_count << " potions" << std::endl;
    return true;
}

// ============================================================================
// RECORD PARSING
// ============================================================================

CardDef CardDatabase::parse_card(const json& card_json) const {
    CardDef card;

    card.card_id = card_json.value("id", "");
    card.name = card_json.value("name", "");

    if (card.card_id.empty()) {
        std::cerr << "[CardDatabase] Skipping card without id" << std::endl;
        return card;
    }

    card.description = card_json.value("description", "");
    card.type = parse_card_type(card_json.value("type", "SKILL"));
    card.rarity = parse_rarity(card_json.value("rarity", "COMMON"));
    card.cost = card_json.value("cost", 0);
    card.target_type = parse_target_type(card_json.value("targetType", "SELF"));

    if (card_json.contains("effects")) {
        card.effects = parse_effect_list(card_json["effects"]);
    }

    card.exhaust = card_json.value("exhaust", false);
    card.retain = card_json.value("retain", false);
    card.innate = card_json.value("innate", false);
    card.ethereal = card_json.value("ethereal", false);
    card.is_x_cost = card_json.value("isXCost", false);
    card.unplayable = card_json.value("unplayable", false);

    if (card_json.contains("upgradedStats") && card_json["upgradedStats"].is_object()) {
        card.upgrade = parse_upgrade(card_json["upgradedStats"]);
    }

    return card;
}

CardUpgrade CardDatabase::parse_upgrade(const json& upgrade_json) const {
    CardUpgrade upgrade;

    if (upgrade_json.contains("cost") && upgrade_json["cost"].is_number_integer()) {
        upgrade.cost = upgrade_json["cost"].get<int>();
    }
    if (upgrade_json.contains("description") && upgrade_json["description"].is_string()) {
        upgrade.description = upgrade_json["description"].get<std::string>();
    }
    if (upgrade_json.contains("effects") && upgrade_json["effects"].is_array()) {
        upgrade.effects = parse_effect_list(upgrade_json["effects"]);
    }
    if (upgrade_json.contains("targetType") && upgrade_json["targetType"].is_string()) {
        upgrade.target_type = parse_target_type(upgrade_json["targetType"].get<std::string>());
    }

    auto read_flag = [&upgrade_json](const char* key, std::optional<bool>& out) {
        if (upgrade_json.contains(key) && upgrade_json[key].is_boolean()) {
            out = upgrade_json[key].get<bool>();
        }
    };
    read_flag("exhaust", upgrade.exhaust);
    read_flag("retain", upgrade.retain);
    read_flag("innate", upgrade.innate);
    read_flag("ethereal", upgrade.ethereal);

    return upgrade;
}

EffectDef CardDatabase::parse_effect(const json& effect_json) const {
    EffectDef effect;

    effect.kind_name = effect_json.value("type", "");
    effect.kind = parse_effect_kind(effect.kind_name);
    effect.value = effect_json.value("value", 0);
    effect.times = std::max(1, effect_json.value("times", 1));
    effect.percentage = effect_json.value("percentage", 0.0);

    if (effect_json.contains("target") && effect_json["target"].is_string()) {
        effect.target = parse_target_type(effect_json["target"].get<std::string>());
    }
    if (effect_json.contains("cardId") && effect_json["cardId"].is_string()) {
        effect.card_ref = effect_json["cardId"].get<std::string>();
    }
    if (effect_json.contains("position") && effect_json["position"].is_string()) {
        effect.position = parse_pile_position(effect_json["position"].get<std::string>());
    }

    return effect;
}

std::vector<EffectDef> CardDatabase::parse_effect_list(const json& list_json) const {
    std::vector<EffectDef> effects;
    if (!list_json.is_array()) {
        return effects;
    }
    effects.reserve(list_json.size());
    for (const auto& effect_json : list_json) {
        effects.push_back(parse_effect(effect_json));
    }
    return effects;
}

EnemyDef CardDatabase::parse_enemy(const json& enemy_json) const {
    EnemyDef enemy;

    enemy.enemy_id = enemy_json.value("id", "");
    enemy.name = enemy_json.value("name", enemy.enemy_id);

    if (enemy.enemy_id.empty()) {
        std::cerr << "[CardDatabase] Skipping enemy without id" << std::endl;
        return enemy;
    }

    enemy.type = parse_enemy_type(enemy_json.value("type", "normal"));
    enemy.max_hp = std::max(1, enemy_json.value("maxHp", 1));

    if (enemy_json.contains("moves") && enemy_json["moves"].is_array()) {
        for (const auto& move_json : enemy_json["moves"]) {
            enemy.moves.push_back(parse_move(move_json));
        }
    }

    if (enemy_json.contains("startingStatus") && enemy_json["startingStatus"].is_object()) {
        for (const auto& [key, value] : enemy_json["startingStatus"].items()) {
            auto status = parse_status_key(key);
            if (!status) {
                std::cerr << "[CardDatabase] Enemy " << enemy.enemy_id
                          << ": unknown status '" << key << "'" << std::endl;
                continue;
            }
            enemy.starting_status.emplace_back(*status, value.get<int>());
        }
    }

    if (enemy.moves.empty()) {
        std::cerr << "[CardDatabase] Enemy " << enemy.enemy_id << " has no moves" << std::endl;
    }

    return enemy;
}

EnemyMoveDef CardDatabase::parse_move(const json& move_json) const {
    EnemyMoveDef move;

    move.name = move_json.value("name", "");
    move.weight = move_json.value("weight", 1);

    if (move_json.contains("intent") && move_json["intent"].is_object()) {
        const auto& intent_json = move_json["intent"];
        move.intent.type = parse_intent_type(intent_json.value("type", "UNKNOWN"));
        if (intent_json.contains("value") && intent_json["value"].is_number()) {
            move.intent.value = intent_json["value"].get<int>();
        }
    }

    if (move_json.contains("actions") && move_json["actions"].is_array()) {
        for (const auto& action_json : move_json["actions"]) {
            EnemyActionDef action;
            action.kind_name = action_json.value("type", "");
            action.kind = parse_enemy_action(action.kind_name);
            action.value = action_json.value("value", 0);
            action.times = std::max(1, action_json.value("times", 1));
            move.actions.push_back(std::move(action));
        }
    }

    return move;
}

RelicDef CardDatabase::parse_relic(const json& relic_json) const {
    RelicDef relic;

    relic.relic_id = relic_json.value("id", "");
    relic.name = relic_json.value("name", relic.relic_id);

    if (relic.relic_id.empty()) {
        std::cerr << "[CardDatabase] Skipping relic without id" << std::endl;
        return relic;
    }

    relic.description = relic_json.value("description", "");
    relic.rarity = parse_rarity(relic_json.value("rarity", "COMMON"));
    relic.reset_counter_each_combat = relic_json.value("resetCounterEachCombat", false);

    if (relic_json.contains("effects") && relic_json["effects"].is_array()) {
        for (const auto& effect_json : relic_json["effects"]) {
            RelicEffectDef effect;
            effect.trigger_name = normalize_trigger(effect_json.value("trigger", ""));
            effect.trigger = exact_trigger(effect.trigger_name).value_or(RelicTrigger::UNKNOWN);
            effect.action_name = effect_json.value("action", "");
            effect.action = parse_relic_action(effect.action_name);
            effect.value = effect_json.value("value", 0);
            if (effect_json.contains("amount") && effect_json["amount"].is_number()) {
                effect.amount = effect_json["amount"].get<int>();
            }
            relic.effects.push_back(std::move(effect));
        }
    }

    return relic;
}

PotionDef CardDatabase::parse_potion(const json& potion_json) const {
    PotionDef potion;

    potion.potion_id = potion_json.value("id", "");
    potion.name = potion_json.value("name", potion.potion_id);

    if (potion.potion_id.empty()) {
        std::cerr << "[CardDatabase] Skipping potion without id" << std::endl;
        return potion;
    }

    potion.description = potion_json.value("description", "");
    potion.rarity = parse_rarity(potion_json.value("rarity", "COMMON"));
    potion.target_type = parse_target_type(potion_json.value("targetType", "SELF"));

    if (potion_json.contains("effects")) {
        potion.effects = parse_effect_list(potion_json["effects"]);
    }

    return potion;
}

// ============================================================================
// REGISTRATION / LOOKUP
// ============================================================================

void CardDatabase::add_card(CardDef card) {
    CardDefID id = card.card_id;
    cards_[id] = std::move(card);
}

void CardDatabase::add_enemy(EnemyDef enemy) {
    EnemyDefID id = enemy.enemy_id;
    enemies_[id] = std::move(enemy);
}

void CardDatabase::add_relic(RelicDef relic) {
    RelicDefID id = relic.relic_id;
    relics_[id] = std::move(relic);
}

void CardDatabase::add_potion(PotionDef potion) {
    PotionDefID id = potion.potion_id;
    potions_[id] = std::move(potion);
}

const CardDef* CardDatabase::get_card(const CardDefID& card_id) const {
    auto it = cards_.find(card_id);
    if (it == cards_.end()) {
        return nullptr;
    }
    return &it->second;
}

const EnemyDef* CardDatabase::get_enemy(const EnemyDefID& enemy_id) const {
    auto it = enemies_.find(enemy_id);
    return it == enemies_.end() ? nullptr : &it->second;
}

const RelicDef* CardDatabase::get_relic(const RelicDefID& relic_id) const {
    auto it = relics_.find(relic_id);
    return it == relics_.end() ? nullptr : &it->second;
}

const PotionDef* CardDatabase::get_potion(const PotionDefID& potion_id) const {
    auto it = potions_.find(potion_id);
    return it == potions_.end() ? nullptr : &it->second;
}

bool CardDatabase::has_card(const CardDefID& card_id) const {
    return cards_.find(card_id) != cards_.end();
}

std::vector<CardDefID> CardDatabase::get_all_card_ids() const {
    std::vector<CardDefID> ids;
    ids.reserve(cards_.size());
    for (const auto& [id, _] : cards_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<const CardDef*> CardDatabase::get_cards_by_rarity(Rarity rarity) const {
    std::vector<const CardDef*> result;
    for (const auto& id : get_all_card_ids()) {
        const CardDef* card = get_card(id);
        if (card->rarity == rarity) {
            result.push_back(card);
        }
    }
    return result;
}

// ============================================================================
// TAG PARSING
// ============================================================================

EffectKind CardDatabase::parse_effect_kind(const std::string& s) {
    if (s == "SELF_DAMAGE") return EffectKind::LOSE_HP;
    return parse_by_name(s, EffectKind::UNKNOWN, "effect kind");
}

TargetType CardDatabase::parse_target_type(const std::string& s) {
    if (s == "SELF") return TargetType::SELF;
    if (s == "SINGLE_ENEMY") return TargetType::SINGLE_ENEMY;
    if (s == "ALL_ENEMIES") return TargetType::ALL_ENEMIES;
    if (s == "RANDOM_ENEMY") return TargetType::RANDOM_ENEMY;
    std::cerr << "[CardDatabase] Unknown target type '" << s << "'" << std::endl;
    return TargetType::UNKNOWN;
}

CardType CardDatabase::parse_card_type(const std::string& s) {
    if (s == "ATTACK") return CardType::ATTACK;
    if (s == "SKILL") return CardType::SKILL;
    if (s == "POWER") return CardType::POWER;
    if (s == "STATUS") return CardType::STATUS;
    if (s == "CURSE") return CardType::CURSE;
    std::cerr << "[CardDatabase] Unknown card type '" << s << "'" << std::endl;
    return CardType::UNKNOWN;
}

Rarity CardDatabase::parse_rarity(const std::string& s) {
    if (s == "STARTER") return Rarity::STARTER;
    if (s == "COMMON") return Rarity::COMMON;
    if (s == "UNCOMMON") return Rarity::UNCOMMON;
    if (s == "RARE") return Rarity::RARE;
    if (s == "SPECIAL") return Rarity::SPECIAL;
    std::cerr << "[CardDatabase] Unknown rarity '" << s << "'" << std::endl;
    return Rarity::UNKNOWN;
}

RelicAction CardDatabase::parse_relic_action(const std::string& s) {
    if (s == "MAX_HP") return RelicAction::GAIN_MAX_HP;
    if (is_run_modifier_action(s)) return RelicAction::RUN_MODIFIER;
    return parse_by_name(s, RelicAction::UNKNOWN, "relic action");
}

IntentType CardDatabase::parse_intent_type(const std::string& s) {
    if (s == "ATTACK") return IntentType::ATTACK;
    if (s == "DEFEND") return IntentType::DEFEND;
    if (s == "BUFF") return IntentType::BUFF;
    if (s == "DEBUFF") return IntentType::DEBUFF;
    return IntentType::UNKNOWN;
}

EnemyActionKind CardDatabase::parse_enemy_action(const std::string& s) {
    return parse_by_name(s, EnemyActionKind::UNKNOWN, "enemy action");
}

EnemyType CardDatabase::parse_enemy_type(const std::string& s) {
    if (s == "elite" || s == "ELITE") return EnemyType::ELITE;
    if (s == "boss" || s == "BOSS") return EnemyType::BOSS;
    return EnemyType::NORMAL;
}

std::optional<StatusKey> CardDatabase::parse_status_key(const std::string& s) {
    for (int i = 0; i < STATUS_KEY_COUNT; ++i) {
        auto key = static_cast<StatusKey>(i);
        const std::string name = to_string(key);
        if (s == name || s == camel_to_upper_snake(name)) {
            return key;
        }
    }
    return std::nullopt;
}

PilePosition CardDatabase::parse_pile_position(const std::string& s) {
    if (s == "TOP" || s == "top") return PilePosition::TOP;
    if (s == "BOTTOM" || s == "bottom") return PilePosition::BOTTOM;
    return PilePosition::RANDOM;
}

std::string CardDatabase::normalize_trigger(const std::string& trigger) {
    const auto& migration = trigger_migration_map();
    auto it = migration.find(trigger);
    if (it != migration.end()) {
        return it->second;
    }

    if (exact_trigger(trigger)) {
        return trigger;
    }

    std::string converted = camel_to_upper_snake(trigger);
    if (exact_trigger(converted)) {
        return converted;
    }

    std::cerr << "[CardDatabase] Unknown trigger: " << trigger << std::endl;
    return trigger;
}

RelicTrigger CardDatabase::parse_relic_trigger(const std::string& s) {
    return exact_trigger(normalize_trigger(s)).value_or(RelicTrigger::UNKNOWN);
}

} // namespace descent
