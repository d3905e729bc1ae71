/**
 * Descent Combat Engine - Combat State Implementation
 */

#include "combat_state.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace descent {

// ============================================================================
// PHASE
// ============================================================================

bool CombatState::update_outcome() {
    if (is_over() || phase == CombatPhase::NOT_STARTED) {
        return is_over();
    }

    if (player.is_dead()) {
        phase = CombatPhase::DEFEAT;
        emit(RelicTrigger::COMBAT_END);
    } else if (all_enemies_dead()) {
        phase = CombatPhase::VICTORY;
        emit(RelicTrigger::COMBAT_VICTORY);
        emit(RelicTrigger::COMBAT_END);
    }
    return is_over();
}

bool CombatState::all_enemies_dead() const {
    return std::all_of(enemies.begin(), enemies.end(),
                       [](const Enemy& e) { return e.is_dead(); });
}

std::vector<size_t> CombatState::living_enemy_indices() const {
    std::vector<size_t> indices;
    for (size_t i = 0; i < enemies.size(); ++i) {
        if (enemies[i].is_alive()) {
            indices.push_back(i);
        }
    }
    return indices;
}

// ============================================================================
// EVENTS
// ============================================================================

void CombatState::record_player_hit(const HitResult& hit, int attacker_index) {
    if (hit.damage > 0) {
        emit(RelicTrigger::PLAYER_DAMAGED, hit.damage, "", attacker_index);
    }
    if (hit.block_broken) {
        emit(RelicTrigger::BLOCK_BROKEN, hit.blocked);
    }
    record_player_hp_loss(hit.hp_lost);
}

void CombatState::record_player_hp_loss(int hp_lost) {
    if (hp_lost <= 0) {
        return;
    }

    emit(RelicTrigger::PLAYER_HP_LOST, hp_lost);
    if (!counters.player_damaged_this_combat) {
        counters.player_damaged_this_combat = true;
        emit(RelicTrigger::FIRST_DAMAGE_COMBAT, hp_lost);
    }

    // Thresholds compare in integers: hp * 2 < max means below 50%
    if (!hp_below_50_fired && player.current_hp * 2 < player.max_hp) {
        hp_below_50_fired = true;
        emit(RelicTrigger::HP_BELOW_50, player.current_hp);
    }
    if (!hp_below_25_fired && player.current_hp * 4 < player.max_hp) {
        hp_below_25_fired = true;
        emit(RelicTrigger::HP_BELOW_25, player.current_hp);
    }
}

// ============================================================================
// PILES
// ============================================================================

int CombatState::draw_cards(int count, const RandomDraw& draw) {
    int drawn = 0;
    for (int i = 0; i < count; ++i) {
        if (hand_is_full()) {
            break;
        }
        if (draw_pile.is_empty() && !shuffle_discard_into_draw(draw)) {
            break;
        }
        std::optional<CardInstance> card = draw_pile.draw_top();
        if (!card) {
            break;
        }
        CardID id = card->id;
        hand.add_card(std::move(*card));
        emit(RelicTrigger::CARD_DRAWN, 1, id);
        drawn++;
    }
    return drawn;
}

bool CombatState::shuffle_discard_into_draw(const RandomDraw& draw) {
    if (discard_pile.is_empty()) {
        return false;
    }
    for (auto& card : discard_pile.take_all()) {
        draw_pile.add_to_bottom(std::move(card));
    }
    draw_pile.shuffle(draw);
    shuffle_count++;
    emit(RelicTrigger::SHUFFLE, shuffle_count);
    return true;
}

void CombatState::add_to_hand(CardInstance card) {
    if (hand_is_full()) {
        discard_pile.add_to_top(std::move(card));
    } else {
        hand.add_card(std::move(card));
    }
}

void CombatState::move_to_discard(CardInstance card) {
    discard_pile.add_to_top(std::move(card));
}

void CombatState::move_to_exhaust(CardInstance card) {
    CardID id = card.id;
    exhaust_pile.add_to_top(std::move(card));
    emit(RelicTrigger::CARD_EXHAUSTED, 1, id);
}

int CombatState::scry(int count, const std::vector<int>& discard_indices) {
    std::vector<CardInstance> removed = draw_pile.take_from_top(discard_indices, count);
    int discarded = static_cast<int>(removed.size());
    for (auto& card : removed) {
        CardID id = card.id;
        move_to_discard(std::move(card));
        emit(RelicTrigger::CARD_DISCARDED, 1, id);
    }
    return discarded;
}

int CombatState::scry_auto(int count) {
    std::vector<int> indices;
    int limit = std::min(count, draw_pile.count());
    for (int i = 0; i < limit; ++i) {
        CardType type = draw_pile.cards[static_cast<size_t>(i)].type();
        if (type == CardType::STATUS || type == CardType::CURSE) {
            indices.push_back(i);
        }
    }
    return scry(count, indices);
}

// ============================================================================
// INVARIANTS
// ============================================================================

bool CombatState::check_invariants(std::string* error) const {
    std::ostringstream why;

    auto check_combatant = [&why](const Combatant& c) {
        if (c.current_hp < 0 || c.current_hp > c.max_hp) {
            why << c.id << " HP " << c.current_hp << " outside [0, " << c.max_hp << "]";
            return false;
        }
        if (c.block < 0) {
            why << c.id << " has negative block " << c.block;
            return false;
        }
        return true;
    };

    bool ok = check_combatant(player);
    for (size_t i = 0; ok && i < enemies.size(); ++i) {
        ok = check_combatant(enemies[i]);
    }

    if (ok && player.energy < 0) {
        why << "negative energy " << player.energy;
        ok = false;
    }

    if (ok) {
        std::unordered_set<CardID> seen;
        for (const Zone* zone : {&hand, &draw_pile, &discard_pile, &exhaust_pile}) {
            for (const auto& card : zone->cards) {
                if (!seen.insert(card.id).second) {
                    why << "card " << card.id << " present in more than one pile";
                    ok = false;
                    break;
                }
            }
            if (!ok) break;
        }
    }

    if (ok && hand.count() > max_hand_size) {
        why << "hand size " << hand.count() << " exceeds " << max_hand_size;
        ok = false;
    }

    if (!ok && error) {
        *error = why.str();
    }
    return ok;
}

} // namespace descent
