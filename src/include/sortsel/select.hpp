#pragma once

#include <functional>
#include <string>
#include <vector>

#include "exceptions.hpp"
#include "shuffle.hpp"
#include "sort.hpp"
#include "utils/metrics.hpp"

namespace sortsel {

// return the kth smallest key (k is 0-based)
// post: keys is rearranged so that keys[k] holds the result, with no larger
// key before it and no smaller key after it
template <typename key_type, typename URBG,
          typename Compare = std::less<key_type>>
key_type select(key_type *keys, size_t n, index_t k, URBG &generator,
                Compare less = Compare(), metrics::Stats *stats = nullptr) {
    detail::check_sequence(keys, n, "select");
    if (k < 0 || k >= static_cast<index_t>(n)) {
        throw invalid_argument("select: rank " + std::to_string(k) +
                               " outside [0, " + std::to_string(n) + ")");
    }
    sortsel::shuffle(keys, n, generator);

    index_t low = 0;
    index_t high = static_cast<index_t>(n) - 1;
    while (low <= high) {
        if (stats) stats->enter(0);
        const index_t j = sortsel::partition(keys, low, high, less, stats);
        if (j > k) {
            high = j - 1;
        } else if (j < k) {
            low = j + 1;
        } else {
            return keys[j];
        }
    }
    // not reached: [low, high] always contains k
    return keys[k];
}

template <typename key_type, typename Compare = std::less<key_type>>
key_type select(std::vector<key_type> &keys, index_t k,
                Compare less = Compare(), metrics::Stats *stats = nullptr) {
    return sortsel::select(keys.data(), keys.size(), k, default_generator(),
                           less, stats);
}

// return the median if n is odd
// return the greater of the middle 2 keys if n is even
template <typename key_type, typename Compare = std::less<key_type>>
key_type median(std::vector<key_type> &keys, Compare less = Compare()) {
    if (keys.empty()) {
        throw invalid_argument("median: empty sequence");
    }
    return sortsel::select(keys, static_cast<index_t>(keys.size() / 2), less);
}

}  // namespace sortsel
