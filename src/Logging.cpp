/**
 * @file Logging.cpp
 * @brief Library logger setup
 */

#include "jpatch/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace jpatch {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

} // namespace jpatch
