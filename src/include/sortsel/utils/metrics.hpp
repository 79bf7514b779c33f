#pragma once
#include <cstdint>
#include <functional>

namespace sortsel::metrics {
struct Stats {
    uint64_t calls = 0;
    uint64_t partitions = 0;
    uint64_t exchanges = 0;
    uint64_t compares = 0;
    uint32_t max_depth = 0;

    void reset() { *this = Stats{}; }

    void enter(uint32_t depth) {
        ++calls;
        if (depth > max_depth) max_depth = depth;
    }
};

// comparator adaptor that counts every invocation into stats->compares
template <typename Compare>
struct counting_less {
    Compare less;
    Stats *stats;

    counting_less(Compare less, Stats *stats) : less(less), stats(stats) {}

    template <typename T>
    bool operator()(const T &a, const T &b) const {
        ++stats->compares;
        return less(a, b);
    }
};
}  // namespace sortsel::metrics
