#pragma once

#include <bit>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "exceptions.hpp"
#include "shuffle.hpp"
#include "utils/metrics.hpp"

namespace sortsel {

// ranges of at most this many keys are finished by insertion sort in introsort
constexpr index_t INSERTION_SORT_CUTOFF = 16;

namespace detail {
template <typename key_type>
inline void exchange(key_type *keys, index_t i, index_t j,
                     metrics::Stats *stats) {
    std::swap(keys[i], keys[j]);
    if (stats) ++stats->exchanges;
}

template <typename key_type>
inline void check_sequence(const key_type *keys, size_t n, const char *op) {
    if (keys == nullptr && n > 0) {
        throw invalid_argument(std::string(op) + ": null sequence");
    }
}

// an empty range [low, low-1] is only accepted when allow_empty is set
inline void check_range(size_t n, index_t low, index_t high, const char *op,
                        bool allow_empty = false) {
    const index_t last = allow_empty ? high + 1 : high;
    if (low < 0 || low > last || high >= static_cast<index_t>(n)) {
        throw invalid_argument(std::string(op) + ": range [" +
                               std::to_string(low) + ", " +
                               std::to_string(high) + "] outside sequence");
    }
}
}  // namespace detail

// Hoare partition of keys[low..high] around v = keys[low].
// Returns j with keys[low..j-1] <= keys[j] == v <= keys[j+1..high].
// The pointer form cannot see the sequence length: high is trusted to be a
// valid index, only null and empty ranges are rejected.
template <typename key_type, typename Compare = std::less<key_type>>
index_t partition(key_type *keys, index_t low, index_t high,
                  Compare less = Compare(), metrics::Stats *stats = nullptr) {
    if (keys == nullptr || low < 0 || low > high) {
        throw invalid_argument("partition: range [" + std::to_string(low) +
                               ", " + std::to_string(high) +
                               "] is empty or has no sequence");
    }
    if (low == high) return low;
    if (stats) ++stats->partitions;

    const key_type v = keys[low];
    index_t i = low;
    index_t j = high + 1;
    while (true) {
        // both scans stop on keys equal to v
        while (less(keys[++i], v)) {
            if (i == high) break;
        }
        while (less(v, keys[--j])) {
            if (j == low) break;
        }
        if (i >= j) break;
        detail::exchange(keys, i, j, stats);
    }
    detail::exchange(keys, low, j, stats);
    return j;
}

template <typename key_type, typename Compare = std::less<key_type>>
index_t partition(std::vector<key_type> &keys, index_t low, index_t high,
                  Compare less = Compare(), metrics::Stats *stats = nullptr) {
    detail::check_range(keys.size(), low, high, "partition");
    return partition(keys.data(), low, high, less, stats);
}

namespace detail {
// Recurses on the smaller side and loops on the larger one, so the stack
// never grows past log2(N) frames.
template <typename key_type, typename Compare>
void quicksort(key_type *keys, index_t low, index_t high, Compare less,
               metrics::Stats *stats, uint32_t depth) {
    while (true) {
        if (stats) stats->enter(depth);
        if (low >= high) return;

        const index_t j = sortsel::partition(keys, low, high, less, stats);
        if (j - low < high - j) {
            quicksort(keys, low, j - 1, less, stats, depth + 1);
            low = j + 1;
        } else {
            quicksort(keys, j + 1, high, less, stats, depth + 1);
            high = j - 1;
        }
    }
}

template <typename key_type, typename Compare>
void quicksort3way(key_type *keys, index_t low, index_t high, Compare less,
                   metrics::Stats *stats, uint32_t depth) {
    while (true) {
        if (stats) stats->enter(depth);
        if (low >= high) return;
        if (stats) ++stats->partitions;

        const key_type v = keys[low];
        index_t lt = low;
        index_t gt = high;
        index_t i = low + 1;
        while (i <= gt) {
            if (less(keys[i], v)) {
                exchange(keys, lt++, i++, stats);
            } else if (less(v, keys[i])) {
                // keys[i] now holds an unexamined key from the right
                exchange(keys, i, gt--, stats);
            } else {
                ++i;
            }
        }

        // keys[lt..gt] are all equal to v and never revisited
        if (lt - low < high - gt) {
            quicksort3way(keys, low, lt - 1, less, stats, depth + 1);
            low = gt + 1;
        } else {
            quicksort3way(keys, gt + 1, high, less, stats, depth + 1);
            high = lt - 1;
        }
    }
}
}  // namespace detail

// Sorts keys[low..high] without shuffling first.
template <typename key_type, typename Compare = std::less<key_type>>
void quicksort(key_type *keys, index_t low, index_t high,
               Compare less = Compare(), metrics::Stats *stats = nullptr) {
    detail::quicksort(keys, low, high, less, stats, 0);
}

template <typename key_type, typename Compare = std::less<key_type>>
void quicksort3way(key_type *keys, index_t low, index_t high,
                   Compare less = Compare(), metrics::Stats *stats = nullptr) {
    detail::quicksort3way(keys, low, high, less, stats, 0);
}

template <typename key_type, typename Compare = std::less<key_type>>
void quicksort(std::vector<key_type> &keys, index_t low, index_t high,
               Compare less = Compare(), metrics::Stats *stats = nullptr) {
    detail::check_range(keys.size(), low, high, "quicksort", true);
    quicksort(keys.data(), low, high, less, stats);
}

template <typename key_type, typename Compare = std::less<key_type>>
void quicksort3way(std::vector<key_type> &keys, index_t low, index_t high,
                   Compare less = Compare(), metrics::Stats *stats = nullptr) {
    detail::check_range(keys.size(), low, high, "quicksort3way", true);
    quicksort3way(keys.data(), low, high, less, stats);
}

// 2-way randomized quicksort. The whole sequence is shuffled exactly once.
template <typename key_type, typename URBG,
          typename Compare = std::less<key_type>>
void sort(key_type *keys, size_t n, URBG &generator, Compare less = Compare(),
          metrics::Stats *stats = nullptr) {
    detail::check_sequence(keys, n, "sort");
    sortsel::shuffle(keys, n, generator);
    quicksort(keys, 0, static_cast<index_t>(n) - 1, less, stats);
}

template <typename key_type, typename Compare = std::less<key_type>>
void sort(std::vector<key_type> &keys, Compare less = Compare(),
          metrics::Stats *stats = nullptr) {
    sort(keys.data(), keys.size(), default_generator(), less, stats);
}

// 3-way (Dutch national flag) randomized quicksort, linear on inputs with
// few distinct keys.
template <typename key_type, typename URBG,
          typename Compare = std::less<key_type>>
void sort3way(key_type *keys, size_t n, URBG &generator,
              Compare less = Compare(), metrics::Stats *stats = nullptr) {
    detail::check_sequence(keys, n, "sort3way");
    sortsel::shuffle(keys, n, generator);
    quicksort3way(keys, 0, static_cast<index_t>(n) - 1, less, stats);
}

template <typename key_type, typename Compare = std::less<key_type>>
void sort3way(std::vector<key_type> &keys, Compare less = Compare(),
              metrics::Stats *stats = nullptr) {
    sort3way(keys.data(), keys.size(), default_generator(), less, stats);
}

// 0-based sink over the heap keys[0, n): children of k are 2k+1 and 2k+2.
// On equal children the right one is taken.
template <typename key_type, typename Compare = std::less<key_type>>
void sink(key_type *keys, index_t k, index_t n, Compare less = Compare(),
          metrics::Stats *stats = nullptr) {
    while (2 * k + 1 < n) {
        index_t child = 2 * k + 1;
        if (child + 1 < n && !less(keys[child + 1], keys[child])) {
            ++child;
        }
        if (!less(keys[k], keys[child])) break;
        detail::exchange(keys, k, child, stats);
        k = child;
    }
}

template <typename key_type, typename Compare = std::less<key_type>>
void heapsort(key_type *keys, size_t count, Compare less = Compare(),
              metrics::Stats *stats = nullptr) {
    detail::check_sequence(keys, count, "heapsort");
    index_t n = static_cast<index_t>(count);

    // leaves are already heaps
    for (index_t i = n / 2 - 1; i >= 0; --i) {
        sink(keys, i, n, less, stats);
    }

    while (n > 1) {
        detail::exchange(keys, 0, n - 1, stats);
        --n;
        sink(keys, 0, n, less, stats);
    }
}

template <typename key_type, typename Compare = std::less<key_type>>
void heapsort(std::vector<key_type> &keys, Compare less = Compare(),
              metrics::Stats *stats = nullptr) {
    heapsort(keys.data(), keys.size(), less, stats);
}

template <typename key_type, typename Compare = std::less<key_type>>
void insertion_sort(key_type *keys, index_t low, index_t high,
                    Compare less = Compare(), metrics::Stats *stats = nullptr) {
    for (index_t i = low + 1; i <= high; ++i) {
        for (index_t j = i; j > low && less(keys[j], keys[j - 1]); --j) {
            detail::exchange(keys, j, j - 1, stats);
        }
    }
}

// Orders keys[low], keys[mid], keys[high] and moves the median to keys[low],
// where partition() takes its pivot from.
template <typename key_type, typename Compare = std::less<key_type>>
void median_of_three(key_type *keys, index_t low, index_t high,
                     Compare less = Compare(), metrics::Stats *stats = nullptr) {
    const index_t mid = low + (high - low) / 2;

    if (less(keys[mid], keys[low])) detail::exchange(keys, low, mid, stats);
    if (less(keys[high], keys[low])) detail::exchange(keys, low, high, stats);
    if (less(keys[high], keys[mid])) detail::exchange(keys, mid, high, stats);

    detail::exchange(keys, low, mid, stats);
}

namespace detail {
template <typename key_type, typename Compare>
void introsort(key_type *keys, index_t low, index_t high, int depth_limit,
               Compare less, metrics::Stats *stats, uint32_t depth) {
    while (true) {
        if (stats) stats->enter(depth);
        if (high - low < INSERTION_SORT_CUTOFF) {
            insertion_sort(keys, low, high, less, stats);
            return;
        }

        if (depth_limit == 0) {
            heapsort(keys + low, static_cast<size_t>(high - low + 1), less,
                     stats);
            return;
        }
        --depth_limit;

        median_of_three(keys, low, high, less, stats);
        const index_t j = sortsel::partition(keys, low, high, less, stats);
        if (j - low < high - j) {
            introsort(keys, low, j - 1, depth_limit, less, stats, depth + 1);
            low = j + 1;
        } else {
            introsort(keys, j + 1, high, depth_limit, less, stats, depth + 1);
            high = j - 1;
        }
    }
}
}  // namespace detail

// Quicksort with median-of-three pivots and an insertion-sort cutoff that
// falls back to heapsort after 2*floor(log2 N) levels. Deterministic, no
// shuffle.
template <typename key_type, typename Compare = std::less<key_type>>
void introsort(key_type *keys, size_t n, Compare less = Compare(),
               metrics::Stats *stats = nullptr) {
    detail::check_sequence(keys, n, "introsort");
    if (n < 2) return;
    const int depth_limit = 2 * (static_cast<int>(std::bit_width(n)) - 1);
    detail::introsort(keys, 0, static_cast<index_t>(n) - 1, depth_limit, less,
                      stats, 0);
}

template <typename key_type, typename Compare = std::less<key_type>>
void introsort(std::vector<key_type> &keys, Compare less = Compare(),
               metrics::Stats *stats = nullptr) {
    introsort(keys.data(), keys.size(), less, stats);
}

}  // namespace sortsel
