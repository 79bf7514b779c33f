#pragma once

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include "exceptions.hpp"
#include "types.hpp"
#include "utils/metrics.hpp"

namespace sortsel {

// Binary max-heap over a growable buffer. Positions are 1-based: the
// children of k are 2k and 2k+1 and its parent is k/2. Position k is stored
// at heap[k-1], so key_type needs no default constructor.
template <typename key_type, typename Compare = std::less<key_type>>
class PriorityQueue {
   public:
    explicit PriorityQueue(Compare less = Compare(),
                           metrics::Stats *stats = nullptr)
        : heap(), n(0), less(less), stats(stats) {}

    // bottom-up construction: sink every internal node, last one first
    explicit PriorityQueue(std::vector<key_type> keys, Compare less = Compare(),
                           metrics::Stats *stats = nullptr)
        : heap(std::move(keys)),
          n(static_cast<index_t>(heap.size())),
          less(less),
          stats(stats) {
        for (index_t k = n / 2; k >= 1; --k) {
            sink(k);
        }
    }

    void reserve(size_t capacity) { heap.reserve(capacity); }

    void insert(const key_type &key) {
        heap.push_back(key);
        ++n;
        swim(n);
    }

    void insert(key_type &&key) {
        heap.push_back(std::move(key));
        ++n;
        swim(n);
    }

    key_type max() const {
        if (n == 0) throw empty_queue("max: priority queue is empty");
        return at(1);
    }

    key_type del_max() {
        if (n == 0) throw empty_queue("del_max: priority queue is empty");
        exchange(1, n);
        key_type top = std::move(at(n));
        // drop the vacated slot so no stale key is retained
        heap.pop_back();
        --n;
        sink(1);
        return top;
    }

    size_t size() const { return static_cast<size_t>(n); }

    bool empty() const { return n == 0; }

    bool is_heap_ordered() const {
        for (index_t k = 2; k <= n; ++k) {
            if (less(at(k / 2), at(k))) return false;
        }
        return true;
    }

   private:
    std::vector<key_type> heap;
    index_t n;
    Compare less;
    metrics::Stats *stats;

    key_type &at(index_t k) { return heap[k - 1]; }
    const key_type &at(index_t k) const { return heap[k - 1]; }

    void exchange(index_t i, index_t j) {
        std::swap(at(i), at(j));
        if (stats) ++stats->exchanges;
    }

    void swim(index_t k) {
        while (k > 1 && less(at(k / 2), at(k))) {
            exchange(k / 2, k);
            k = k / 2;
        }
    }

    // the larger child is taken, the right one when both are equal
    void sink(index_t k) {
        while (2 * k <= n) {
            index_t child = 2 * k;
            if (child < n && !less(at(child + 1), at(child))) ++child;
            if (!less(at(k), at(child))) break;
            exchange(k, child);
            k = child;
        }
    }
};

template <typename key_type>
using MaxPQ = PriorityQueue<key_type, std::less<key_type>>;

template <typename key_type>
using MinPQ = PriorityQueue<key_type, std::greater<key_type>>;

}  // namespace sortsel
