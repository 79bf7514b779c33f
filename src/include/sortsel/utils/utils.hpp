#pragma once
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config.hpp"
#include "logging.hpp"

namespace sortsel::utils {
namespace infra {
namespace file_ops {
// one unsigned decimal key per line, blank lines skipped. Signs, trailing
// text and values that do not fit key_type are rejected.
template <typename key_type>
std::vector<key_type> read_txt(const std::string &filename) {
    std::ifstream ifs(filename);
    if (!ifs.is_open()) {
        throw std::runtime_error("could not open input file " + filename);
    }
    std::vector<key_type> data;
    std::string line;
    size_t line_no = 0;
    while (std::getline(ifs, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        const std::string where =
            filename + ":" + std::to_string(line_no) + ": ";
        const size_t first = line.find_first_not_of(" \t");
        if (line[first] == '-' || line[first] == '+') {
            throw std::runtime_error(where + "not a key: " + line);
        }
        size_t pos = 0;
        unsigned long long value = 0;
        try {
            value = std::stoull(line, &pos);
        } catch (const std::logic_error &) {
            throw std::runtime_error(where + "not a key: " + line);
        }
        if (line.find_first_not_of(" \t\r", pos) != std::string::npos) {
            throw std::runtime_error(where + "not a key: " + line);
        }
        if (value > std::numeric_limits<key_type>::max()) {
            throw std::runtime_error(where + "key out of range: " + line);
        }
        data.push_back(static_cast<key_type>(value));
    }
    return data;
}

template <typename key_type>
std::vector<key_type> read_bin(const std::string &filename) {
    std::ifstream inputFile(filename, std::ios::binary);
    if (!inputFile.is_open()) {
        throw std::runtime_error("could not open input file " + filename);
    }
    inputFile.seekg(0, std::ios::end);
    const std::streamoff fileSize = inputFile.tellg();
    inputFile.seekg(0, std::ios::beg);
    if (fileSize % static_cast<std::streamoff>(sizeof(key_type)) != 0) {
        throw std::runtime_error(filename + ": size is not a multiple of " +
                                 std::to_string(sizeof(key_type)) + " bytes");
    }
    std::vector<key_type> data(fileSize / sizeof(key_type));
    inputFile.read(reinterpret_cast<char *>(data.data()), fileSize);
    return data;
}
}  // namespace file_ops

namespace config {
inline bool load_configurations(Config &conf, const std::string &config_file) {
    return conf.parse(config_file.c_str());
}

inline void load_configurations(Config &conf, int argc, char **argv) {
    conf.parse(argc, argv);
}

inline void print_configurations(const Config &conf) {
    auto &log = logging::Logger::get_instance();
    if (conf.verbose) conf.print(log);
}
}  // namespace config

namespace load {
template <typename key_type>
void load_data(std::vector<std::vector<key_type>> &data, const Config &conf) {
    auto &log = logging::Logger::get_instance();
    for (const auto &file : conf.files) {
        std::filesystem::path fsPath(file);
        log.trace("Reading {}", fsPath.filename().string());
        if (conf.binary_input) {
            data.emplace_back(file_ops::read_bin<key_type>(file));
        } else {
            data.emplace_back(file_ops::read_txt<key_type>(file));
        }
        log.trace("{} keys", data.back().size());
    }
}
}  // namespace load
}  // namespace infra
}  // namespace sortsel::utils
