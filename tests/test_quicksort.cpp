#include <catch2/catch.hpp>

#include <functional>
#include <random>
#include <string>
#include <vector>

#include "sortsel/sort.hpp"
#include "test_helpers.hpp"

using namespace sortsel;

TEST_CASE("Quicksort orders a small sequence", "[quicksort]") {
    std::vector<int> keys{5, 3, 8, 1, 9, 2};
    sortsel::sort(keys);
    REQUIRE(keys == std::vector<int>{1, 2, 3, 5, 8, 9});
}

TEST_CASE("Quicksort of sorted input is a fixpoint", "[quicksort]") {
    auto keys = test::sorted_copy(test::random_keys(300, 50, 2));
    const auto expected = keys;

    sortsel::sort(keys);
    REQUIRE(keys == expected);
    sortsel::sort(keys);
    REQUIRE(keys == expected);

    sortsel::sort3way(keys);
    REQUIRE(keys == expected);
}

TEST_CASE("Quicksort matches std::sort on random input", "[quicksort]") {
    std::mt19937_64 generator(99);
    for (size_t n : {0, 1, 2, 3, 10, 100, 1000}) {
        for (int distinct : {1, 2, 10, 1 << 20}) {
            auto keys = test::random_keys(n, distinct, n * 31 + distinct);
            const auto expected = test::sorted_copy(keys);

            auto two_way = keys;
            sortsel::sort(two_way.data(), two_way.size(), generator);
            REQUIRE(two_way == expected);

            auto three_way = keys;
            sortsel::sort3way(three_way.data(), three_way.size(), generator);
            REQUIRE(three_way == expected);
        }
    }
}

TEST_CASE("Quicksort with a custom order", "[quicksort]") {
    std::vector<std::string> words{"pear", "apple", "fig", "kiwi", "apple"};

    sortsel::sort(words, std::greater<std::string>());
    REQUIRE(words == std::vector<std::string>{"pear", "kiwi", "fig", "apple",
                                              "apple"});

    auto by_length = [](const std::string &a, const std::string &b) {
        return a.size() < b.size();
    };
    sortsel::sort3way(words, by_length);
    for (size_t i = 1; i < words.size(); ++i) {
        REQUIRE(words[i - 1].size() <= words[i].size());
    }
}

TEST_CASE("Three-way quicksort skips the equal-key band", "[quicksort]") {
    SECTION("pivot band in the middle") {
        std::vector<int> keys{3, 3, 3, 3, 1, 2};
        metrics::Stats stats;

        quicksort3way(keys.data(), 0, 5, std::less<int>(), &stats);

        REQUIRE(keys == std::vector<int>{1, 2, 3, 3, 3, 3});
        // [0,5] around 3, then [0,1] around 1; keys[2..5] are never entered
        REQUIRE(stats.partitions == 2);
        REQUIRE(stats.calls == 5);
    }
    SECTION("all keys equal") {
        std::vector<int> keys(1000, 7);
        metrics::Stats stats;

        sortsel::sort3way(keys, std::less<int>(), &stats);

        REQUIRE(keys == std::vector<int>(1000, 7));
        REQUIRE(stats.partitions == 1);
        REQUIRE(stats.exchanges == 0);
    }
    SECTION("few distinct keys") {
        auto keys = test::random_keys(10000, 3, 17);
        metrics::Stats stats;

        sortsel::sort3way(keys, std::less<int>(), &stats);

        REQUIRE(keys == test::sorted_copy(keys));
        REQUIRE(stats.partitions <= 3);
    }
}

TEST_CASE("Quicksort stack depth stays logarithmic", "[quicksort]") {
    // already sorted and never shuffled: the worst case for the pivot
    std::vector<int> keys(4096);
    for (int i = 0; i < 4096; ++i) {
        keys[i] = i;
    }
    metrics::Stats stats;

    quicksort(keys.data(), 0, 4095, std::less<int>(), &stats);

    REQUIRE(keys == test::sorted_copy(keys));
    REQUIRE(stats.partitions == 4095);
    REQUIRE(stats.max_depth <= 13);
}

TEST_CASE("Quicksort counts comparisons through a counting order",
          "[quicksort]") {
    auto keys = test::random_keys(2000, 1 << 30, 23);
    metrics::Stats stats;
    metrics::counting_less<std::less<int>> less(std::less<int>(), &stats);
    std::mt19937_64 generator(5);

    sortsel::sort(keys.data(), keys.size(), generator, less, &stats);

    REQUIRE(keys == test::sorted_copy(keys));
    // about 2 N ln N = 30400 on average
    REQUIRE(stats.compares > 2000);
    REQUIRE(stats.compares < 100000);
}

TEST_CASE("Quicksort rejects a null sequence", "[quicksort]") {
    std::mt19937_64 generator(1);
    REQUIRE_THROWS_AS(
        sortsel::sort(static_cast<int *>(nullptr), 3, generator),
        sortsel::invalid_argument);
    REQUIRE_THROWS_AS(
        sortsel::sort3way(static_cast<int *>(nullptr), 3, generator),
        sortsel::invalid_argument);
    REQUIRE_NOTHROW(sortsel::sort(static_cast<int *>(nullptr), 0, generator));
}

TEST_CASE("Quicksort of a sub-range", "[quicksort]") {
    std::vector<int> keys{9, 5, 3, 8, 1, 0};

    quicksort(keys, 1, 4);
    REQUIRE(keys == std::vector<int>{9, 1, 3, 5, 8, 0});

    quicksort3way(keys, 0, 2);
    REQUIRE(keys == std::vector<int>{1, 3, 9, 5, 8, 0});

    // an empty range inside the sequence is a no-op
    quicksort(keys, 3, 2);
    quicksort3way(keys, 6, 5);
    REQUIRE(keys == std::vector<int>{1, 3, 9, 5, 8, 0});
}

TEST_CASE("Quicksort rejects ranges outside the sequence", "[quicksort]") {
    std::vector<int> keys{3, 1, 2};
    REQUIRE_THROWS_AS(quicksort(keys, 0, 3), sortsel::invalid_argument);
    REQUIRE_THROWS_AS(quicksort(keys, -1, 1), sortsel::invalid_argument);
    REQUIRE_THROWS_AS(quicksort(keys, 2, 0), sortsel::invalid_argument);
    REQUIRE_THROWS_AS(quicksort3way(keys, 0, 5), sortsel::invalid_argument);
    REQUIRE_THROWS_AS(quicksort3way(keys, -2, 1), sortsel::invalid_argument);
    REQUIRE(keys == std::vector<int>{3, 1, 2});
}
