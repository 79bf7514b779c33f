#pragma once

#include <stdexcept>
#include <string>

namespace sortsel {

// k out of range, nullptr sequence, bad configuration value
class invalid_argument : public std::invalid_argument {
   public:
    explicit invalid_argument(const std::string &what)
        : std::invalid_argument(what) {}
};

// max() or del_max() on a queue with no entries
class empty_queue : public std::out_of_range {
   public:
    explicit empty_queue(const std::string &what) : std::out_of_range(what) {}
};

}  // namespace sortsel
