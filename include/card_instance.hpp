/**
 * Descent Combat Engine - Card Instance
 *
 * Represents a physical card in a deck or pile. Holds a value copy of its
 * template, so upgrades never touch the catalog, plus a unique instance id.
 */

#pragma once

#include "card_database.hpp"

namespace descent {

/**
 * CardInstance - A physical card owned by the player.
 *
 * Two copies of the same template are distinct instances with different ids.
 */
struct CardInstance {
    CardID id;               // Unique instance ID (e.g., "card_12")
    CardDef def;             // Effective record (upgrade applied)
    bool upgraded = false;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    CardInstance() = default;

    CardInstance(CardID id_, CardDef def_)
        : id(std::move(id_))
        , def(std::move(def_))
    {}

    // ========================================================================
    // ACCESSORS
    // ========================================================================

    const CardDefID& card_id() const { return def.card_id; }
    const std::string& name() const { return def.name; }
    CardType type() const { return def.type; }
    int cost() const { return def.cost; }
    bool is_playable() const { return def.is_playable(); }

    bool needs_target() const {
        return def.target_type == TargetType::SINGLE_ENEMY;
    }

    bool can_upgrade() const {
        return !upgraded && def.upgrade.has_value();
    }

    // ========================================================================
    // UPGRADE
    // ========================================================================

    /**
     * Apply the upgrade delta once. Returns false if already upgraded
     * or the card has no upgrade.
     */
    bool upgrade() {
        if (!can_upgrade()) {
            return false;
        }

        const CardUpgrade& delta = *def.upgrade;
        if (delta.cost) def.cost = *delta.cost;
        if (delta.description) def.description = *delta.description;
        if (delta.effects) def.effects = *delta.effects;
        if (delta.target_type) def.target_type = *delta.target_type;
        if (delta.exhaust) def.exhaust = *delta.exhaust;
        if (delta.retain) def.retain = *delta.retain;
        if (delta.innate) def.innate = *delta.innate;
        if (delta.ethereal) def.ethereal = *delta.ethereal;

        def.name += "+";
        upgraded = true;
        return true;
    }

    /**
     * Description with {n} replaced by the value of effect n.
     */
    std::string describe() const {
        std::string text = def.description;
        for (size_t i = 0; i < def.effects.size(); ++i) {
            const std::string token = "{" + std::to_string(i) + "}";
            const std::string value = std::to_string(def.effects[i].value);
            size_t pos = 0;
            while ((pos = text.find(token, pos)) != std::string::npos) {
                text.replace(pos, token.size(), value);
                pos += value.size();
            }
        }
        return text;
    }
};

} // namespace descent
