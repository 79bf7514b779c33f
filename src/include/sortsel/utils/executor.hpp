#pragma once
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <string>
#include <vector>

#include "../config.hpp"
#include "../priority_queue.hpp"
#include "../select.hpp"
#include "../sort.hpp"
#include "logging.hpp"
#include "metrics.hpp"

namespace sortsel::utils::executor {
struct Result {
    std::string algorithm;
    size_t n = 0;
    int64_t nanos = 0;
    metrics::Stats stats;
    bool valid = true;
};

inline std::ostream &operator<<(std::ostream &os, const Result &result) {
    os << result.algorithm << ", " << result.n << ", " << result.nanos << ", "
       << result.stats.compares << ", " << result.stats.exchanges << ", "
       << result.stats.partitions << ", " << result.stats.max_depth << ", "
       << (result.valid ? "valid" : "invalid");
    return os;
}

template <typename key_type>
class Workload {
    using less_t = metrics::counting_less<std::less<key_type>>;

    const Config &conf;
    std::ofstream results;
    std::mt19937_64 generator;
    logging::Logger &log;

   public:
    explicit Workload(const Config &conf)
        : conf(conf),
          results(conf.results_csv, std::ofstream::app),
          generator(conf.seed),
          log(logging::Logger::get_instance()) {
        if (!results) {
            log.error("could not open results file {}", conf.results_csv);
        }
    }

    // returns the number of results that failed validation
    size_t run_all(const std::vector<std::vector<key_type>> &data) {
        size_t failures = 0;
        for (int j = 0; j < conf.runs; ++j) {
            for (size_t k = 0; k < data.size(); ++k) {
                failures += run(conf.files[k], data[k]);
            }
        }
        return failures;
    }

    size_t run(const std::string &name, const std::vector<key_type> &data) {
        const std::string file =
            std::filesystem::path(name).filename().string();
        size_t failures = 0;
        for (const auto &algorithm : conf.algorithms) {
            if (algorithm == "select" && data.empty()) {
                log.warn("{}: select skipped, no keys", file);
                continue;
            }
            Result result = measure(algorithm, data);
            log.info("{} {}: {} keys, {} ns, {} compares, {} exchanges",
                     result.algorithm, file, result.n, result.nanos,
                     result.stats.compares, result.stats.exchanges);
            if (!result.valid) {
                log.error("{} {}: result failed validation", result.algorithm,
                          file);
                ++failures;
            }
            results << file << ", " << result << std::endl;
        }
        return failures;
    }

    Result measure(const std::string &algorithm,
                   const std::vector<key_type> &data) {
        Result result;
        result.algorithm = algorithm;
        result.n = data.size();

        std::vector<key_type> keys(data);
        less_t less(std::less<key_type>(), &result.stats);
        const index_t k = rank(data.size());
        key_type selected{};

        auto start = std::chrono::high_resolution_clock::now();
        if (algorithm == "quick") {
            sortsel::sort(keys.data(), keys.size(), generator, less,
                          &result.stats);
        } else if (algorithm == "quick3") {
            sortsel::sort3way(keys.data(), keys.size(), generator, less,
                              &result.stats);
        } else if (algorithm == "heap") {
            sortsel::heapsort(keys.data(), keys.size(), less, &result.stats);
        } else if (algorithm == "intro") {
            sortsel::introsort(keys.data(), keys.size(), less, &result.stats);
        } else if (algorithm == "select") {
            selected = sortsel::select(keys.data(), keys.size(), k,
                                       generator, less, &result.stats);
        } else if (algorithm == "pq") {
            drain(keys, less, &result.stats);
        } else {
            throw invalid_argument("unknown algorithm: " + algorithm);
        }
        auto duration = std::chrono::high_resolution_clock::now() - start;
        result.nanos =
            std::chrono::duration_cast<std::chrono::nanoseconds>(duration)
                .count();

        if (conf.validate) {
            std::vector<key_type> reference(data);
            if (algorithm == "select") {
                auto nth = reference.begin() + k;
                std::nth_element(reference.begin(), nth, reference.end());
                result.valid = selected == *nth;
            } else {
                std::sort(reference.begin(), reference.end());
                result.valid = keys == reference;
            }
        }
        return result;
    }

   private:
    index_t rank(size_t n) const {
        if (n == 0) return 0;
        return static_cast<index_t>(conf.select_rank *
                                    static_cast<double>(n - 1));
    }

    // insert every key, then refill from the back with del_max so the
    // sequence ends up ascending
    static void drain(std::vector<key_type> &keys, less_t less,
                      metrics::Stats *stats) {
        PriorityQueue<key_type, less_t> pq(less, stats);
        pq.reserve(keys.size());
        for (const auto &key : keys) {
            pq.insert(key);
        }
        for (size_t i = keys.size(); i > 0; --i) {
            keys[i - 1] = pq.del_max();
        }
    }
};

}  // namespace sortsel::utils::executor
