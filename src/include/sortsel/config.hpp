#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "utils/logging.hpp"

namespace sortsel {
struct Config {
    std::vector<std::string> files;
    std::vector<std::string> algorithms{"quick", "quick3", "heap",
                                        "intro", "select", "pq"};
    std::string results_csv = "results.csv";
    int runs = 1;
    uint64_t seed = 0;
    double select_rank = 0.5;
    bool binary_input = false;
    bool validate = false;
    bool verbose = false;
    bool help = false;

    static const std::vector<std::string> known_algorithms;

    // INI style "key = value" lines; returns false if the file cannot be
    // opened, leaving every field untouched
    bool parse(const char *config_file);

    // command line values override anything set from a file
    void parse(int argc, char **argv);

    // throws sortsel::invalid_argument on out-of-range or unknown values
    void check() const;

    void print(utils::logging::Logger &log) const;

    std::string usage() const;
};
}  // namespace sortsel
