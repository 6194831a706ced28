/**
 * @file Logging.hpp
 * @brief Library logger
 *
 * jpatch logs through a named spdlog logger ("jpatch"). If the application
 * registered a logger under that name before first use, it is reused;
 * otherwise a stderr logger at level "warn" is created.
 */

#ifndef JPATCH_LOGGING_HPP
#define JPATCH_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>

namespace jpatch {

constexpr const char* kLoggerName = "jpatch";

/**
 * @brief Get the library logger
 */
std::shared_ptr<spdlog::logger> logger();

} // namespace jpatch

#endif // JPATCH_LOGGING_HPP
