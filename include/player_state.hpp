/**
 * Descent Combat Engine - Player State
 *
 * The player's run-persistent state: HP and statuses (as a Combatant),
 * energy, gold, the master deck, relics and potion slots.
 */

#pragma once

#include "combatant.hpp"
#include "card_instance.hpp"
#include "relic_system.hpp"

namespace descent {

/**
 * Player - Combatant plus everything carried between combats.
 */
struct Player : Combatant {
    // Energy
    int energy = 0;
    int max_energy = constants::DEFAULT_ENERGY;
    int energy_cap_bonus = constants::MAX_ENERGY_BONUS;
    int bonus_energy_next_combat = 0;

    // Economy
    int gold = constants::DEFAULT_STARTING_GOLD;

    // Master deck (copied into the piles at combat start)
    std::vector<CardInstance> deck;

    std::vector<Relic> relics;

    // Fixed-size slot array; empty slots are nullopt
    std::vector<std::optional<PotionDef>> potions;

    // Source of unique card instance ids for this run
    int next_card_serial = 0;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Player()
        : Combatant("player", "Player", constants::DEFAULT_MAX_HP)
        , potions(constants::DEFAULT_MAX_POTIONS)
    {}

    Player(std::string name_, int max_hp_)
        : Combatant("player", std::move(name_), max_hp_)
        , potions(constants::DEFAULT_MAX_POTIONS)
    {}

    // ========================================================================
    // ENERGY
    // ========================================================================

    int energy_cap() const { return max_energy + energy_cap_bonus; }

    // Returns energy actually gained
    int gain_energy(int amount) {
        if (amount <= 0) return 0;
        int before = energy;
        energy = std::min(energy_cap(), energy + amount);
        return energy - before;
    }

    int lose_energy(int amount) {
        if (amount <= 0) return 0;
        int before = energy;
        energy = std::max(0, energy - amount);
        return before - energy;
    }

    // ========================================================================
    // DECK
    // ========================================================================

    CardID allocate_card_id() {
        return "card_" + std::to_string(next_card_serial++);
    }

    CardInstance make_card(const CardDef& def) {
        return CardInstance(allocate_card_id(), def);
    }

    CardInstance& add_card_to_deck(const CardDef& def) {
        deck.push_back(make_card(def));
        return deck.back();
    }

    bool remove_card_from_deck(const CardID& card_id) {
        for (auto it = deck.begin(); it != deck.end(); ++it) {
            if (it->id == card_id) {
                deck.erase(it);
                return true;
            }
        }
        return false;
    }

    // Flat heal that only applies while below half of max HP
    int heal_if_below_half(int amount) {
        if (current_hp * 2 >= max_hp) return 0;
        return heal(amount);
    }

    // ========================================================================
    // GOLD
    // ========================================================================

    void gain_gold(int amount) {
        if (amount > 0) gold += amount;
    }

    bool spend_gold(int amount) {
        if (amount < 0 || amount > gold) return false;
        gold -= amount;
        return true;
    }

    // ========================================================================
    // RELICS
    // ========================================================================

    bool has_relic(const RelicDefID& relic_id) const {
        return find_relic(relic_id) != nullptr;
    }

    const Relic* find_relic(const RelicDefID& relic_id) const {
        for (const auto& relic : relics) {
            if (relic.relic_id() == relic_id) return &relic;
        }
        return nullptr;
    }

    /**
     * Add a relic and apply its ON_OBTAIN effects (max HP, gold, potion
     * slots, heal). Returns false if the relic is already held.
     */
    bool obtain_relic(const RelicDef& def);

    // ========================================================================
    // POTIONS
    // ========================================================================

    // Place in the first empty slot; false if every slot is full
    bool add_potion(const PotionDef& potion) {
        for (auto& slot : potions) {
            if (!slot) {
                slot = potion;
                return true;
            }
        }
        return false;
    }

    std::optional<PotionDef> take_potion(size_t slot) {
        if (slot >= potions.size() || !potions[slot]) {
            return std::nullopt;
        }
        std::optional<PotionDef> potion = std::move(potions[slot]);
        potions[slot].reset();
        return potion;
    }

    int potion_count() const {
        int count = 0;
        for (const auto& slot : potions) {
            if (slot) count++;
        }
        return count;
    }
};

} // namespace descent
