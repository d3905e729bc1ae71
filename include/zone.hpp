/**
 * Descent Combat Engine - Zone Container
 *
 * Represents a card pile (hand, draw, discard, exhaust).
 * The top of a pile is index 0.
 */

#pragma once

#include "card_instance.hpp"
#include "random_source.hpp"
#include <algorithm>

namespace descent {

/**
 * Zone - Ordered container for cards.
 */
struct Zone {
    std::vector<CardInstance> cards;

    // ========================================================================
    // BASIC OPERATIONS
    // ========================================================================

    void add_card(CardInstance card, int position = -1) {
        if (position < 0 || position >= static_cast<int>(cards.size())) {
            cards.push_back(std::move(card));
        } else {
            cards.insert(cards.begin() + position, std::move(card));
        }
    }

    // Remove and return card (move semantics)
    std::optional<CardInstance> take_card(const CardID& card_id) {
        for (auto it = cards.begin(); it != cards.end(); ++it) {
            if (it->id == card_id) {
                CardInstance removed = std::move(*it);
                cards.erase(it);
                return removed;
            }
        }
        return std::nullopt;
    }

    std::optional<CardInstance> take_at(size_t index) {
        if (index >= cards.size()) {
            return std::nullopt;
        }
        CardInstance removed = std::move(cards[index]);
        cards.erase(cards.begin() + static_cast<std::ptrdiff_t>(index));
        return removed;
    }

    CardInstance* find_card(const CardID& card_id) {
        for (auto& card : cards) {
            if (card.id == card_id) {
                return &card;
            }
        }
        return nullptr;
    }

    const CardInstance* find_card(const CardID& card_id) const {
        for (const auto& card : cards) {
            if (card.id == card_id) {
                return &card;
            }
        }
        return nullptr;
    }

    int count() const {
        return static_cast<int>(cards.size());
    }

    bool is_empty() const {
        return cards.empty();
    }

    // Empties the zone, returning its cards in order
    std::vector<CardInstance> take_all() {
        std::vector<CardInstance> out = std::move(cards);
        cards.clear();
        return out;
    }

    // ========================================================================
    // DRAW PILE OPERATIONS
    // ========================================================================

    // Draw from top (index 0)
    std::optional<CardInstance> draw_top() {
        if (cards.empty()) {
            return std::nullopt;
        }
        CardInstance top = std::move(cards.front());
        cards.erase(cards.begin());
        return top;
    }

    // Copies of the top `count` cards, top first
    std::vector<CardInstance> peek_top(int count) const {
        size_t n = std::min(cards.size(), static_cast<size_t>(std::max(0, count)));
        return std::vector<CardInstance>(cards.begin(), cards.begin() + static_cast<std::ptrdiff_t>(n));
    }

    void add_to_bottom(CardInstance card) {
        cards.push_back(std::move(card));
    }

    void add_to_top(CardInstance card) {
        cards.insert(cards.begin(), std::move(card));
    }

    void add_at_random(CardInstance card, const RandomDraw& draw) {
        int position = random_index(draw, count() + 1);
        cards.insert(cards.begin() + position, std::move(card));
    }

    void add_at(CardInstance card, PilePosition position, const RandomDraw& draw) {
        switch (position) {
            case PilePosition::TOP: add_to_top(std::move(card)); break;
            case PilePosition::BOTTOM: add_to_bottom(std::move(card)); break;
            case PilePosition::RANDOM: add_at_random(std::move(card), draw); break;
        }
    }

    /**
     * Remove the cards at `indices` (relative to the top, only within the
     * top `window` cards). Returns removed cards in top-to-bottom order.
     * Out-of-window and duplicate indices are ignored.
     */
    std::vector<CardInstance> take_from_top(const std::vector<int>& indices, int window) {
        int limit = std::min(window, count());
        std::vector<int> picked;
        for (int index : indices) {
            if (index >= 0 && index < limit &&
                std::find(picked.begin(), picked.end(), index) == picked.end()) {
                picked.push_back(index);
            }
        }
        std::sort(picked.begin(), picked.end());

        std::vector<CardInstance> removed;
        removed.reserve(picked.size());
        for (int index : picked) {
            removed.push_back(cards[static_cast<size_t>(index)]);
        }
        // Erase from the back so earlier indices stay valid
        for (auto it = picked.rbegin(); it != picked.rend(); ++it) {
            cards.erase(cards.begin() + *it);
        }
        return removed;
    }

    void shuffle(const RandomDraw& draw) {
        shuffle_with(cards, draw);
    }
};

} // namespace descent
