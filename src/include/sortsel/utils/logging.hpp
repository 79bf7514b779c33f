#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace sortsel::utils::logging {
class Logger {
   private:
    std::shared_ptr<spdlog::logger> logger;

   public:
    explicit Logger(const std::string& name) : logger(spdlog::get(name)) {
        if (!logger) {
            logger = spdlog::stdout_color_mt(name);
        }
        logger->set_level(spdlog::level::info);
    }

    static Logger& get_instance() {
        static Logger instance("sortsel");
        return instance;
    }

    void set_verbose(bool verbose) {
        logger->set_level(verbose ? spdlog::level::trace
                                  : spdlog::level::info);
    }

    template <typename... Args>
    Logger& trace(const std::string& format, Args&&... args) {
        logger->trace(fmt::runtime(format), std::forward<Args>(args)...);
        return *this;
    }

    template <typename... Args>
    Logger& debug(const std::string& format, Args&&... args) {
        logger->debug(fmt::runtime(format), std::forward<Args>(args)...);
        return *this;
    }

    template <typename... Args>
    Logger& info(const std::string& format, Args&&... args) {
        logger->info(fmt::runtime(format), std::forward<Args>(args)...);
        return *this;
    }

    template <typename... Args>
    Logger& warn(const std::string& format, Args&&... args) {
        logger->warn(fmt::runtime(format), std::forward<Args>(args)...);
        return *this;
    }

    template <typename... Args>
    Logger& error(const std::string& format, Args&&... args) {
        logger->error(fmt::runtime(format), std::forward<Args>(args)...);
        return *this;
    }
};
}  // namespace sortsel::utils::logging
