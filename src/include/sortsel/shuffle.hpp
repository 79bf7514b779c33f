#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

#include "exceptions.hpp"
#include "types.hpp"

namespace sortsel {

// one generator per thread, seeded once from the OS entropy source
inline std::mt19937_64 &default_generator() {
    thread_local std::mt19937_64 generator(std::random_device{}());
    return generator;
}

// Knuth shuffle: walk i from n-1 down to 1 and swap keys[i] with a
// uniformly chosen keys[j], j in [0, i].
template <typename key_type, typename URBG>
void shuffle(key_type *keys, size_t n, URBG &generator) {
    if (keys == nullptr && n > 0) {
        throw invalid_argument("shuffle: null sequence");
    }
    for (index_t i = static_cast<index_t>(n) - 1; i > 0; --i) {
        std::uniform_int_distribution<index_t> pick(0, i);
        const index_t j = pick(generator);
        std::swap(keys[i], keys[j]);
    }
}

template <typename key_type, typename URBG>
void shuffle(std::vector<key_type> &keys, URBG &generator) {
    shuffle(keys.data(), keys.size(), generator);
}

template <typename key_type>
void shuffle(std::vector<key_type> &keys) {
    shuffle(keys.data(), keys.size(), default_generator());
}

}  // namespace sortsel
