/**
 * Descent Combat Engine - Random Source
 *
 * The engine never owns global random state. Every random decision
 * (move selection, target sampling, shuffles, HP variance) goes through
 * a RandomDraw: a callable returning a uniform double in [0, 1).
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <vector>

namespace descent {

using RandomDraw = std::function<double()>;

/**
 * Seeded Mersenne Twister wrapped as a RandomDraw.
 * Two sources built from the same seed produce the same sequence.
 */
inline RandomDraw make_seeded_random(uint32_t seed) {
    auto rng = std::make_shared<std::mt19937>(seed);
    return [rng]() {
        // generate_canonical may return 1.0 on some implementations
        double r = std::generate_canonical<double, 32>(*rng);
        while (r >= 1.0) {
            r = std::generate_canonical<double, 32>(*rng);
        }
        return r;
    };
}

/**
 * Time-seeded source (used when the host does not inject one).
 */
inline RandomDraw make_time_seeded_random() {
    auto seed = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return make_seeded_random(static_cast<uint32_t>(seed));
}

/**
 * Replays a fixed list of draws, cycling when exhausted.
 * Intended for tests that need exact control over each roll.
 */
inline RandomDraw make_sequence_random(std::vector<double> values) {
    auto data = std::make_shared<std::vector<double>>(std::move(values));
    auto pos = std::make_shared<size_t>(0);
    return [data, pos]() {
        if (data->empty()) return 0.0;
        double r = (*data)[*pos % data->size()];
        (*pos)++;
        return r;
    };
}

/**
 * Uniform index in [0, count). count must be > 0.
 */
inline int random_index(const RandomDraw& draw, int count) {
    int index = static_cast<int>(draw() * count);
    return std::clamp(index, 0, count - 1);
}

/**
 * Fisher-Yates shuffle driven by a RandomDraw.
 */
template<typename T>
void shuffle_with(std::vector<T>& items, const RandomDraw& draw) {
    for (int i = static_cast<int>(items.size()) - 1; i > 0; --i) {
        int j = random_index(draw, i + 1);
        std::swap(items[i], items[j]);
    }
}

} // namespace descent
