/**
 * @file logging.hpp
 * @brief Logger construction for geministream
 */

#ifndef GEMINISTREAM_LOGGING_HPP
#define GEMINISTREAM_LOGGING_HPP

#include "types.hpp"
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace geministream {

constexpr const char* DEFAULT_LOGGER_NAME = "geministream";

/**
 * Map a LogLevel onto the spdlog level it enables
 */
spdlog::level::level_enum to_spdlog_level(LogLevel level);

/**
 * Create a standalone logger writing to stderr
 *
 * The logger is not registered with spdlog's global registry; pass it to
 * the components that should use it. LogLevel::None yields a logger with a
 * null sink.
 *
 * @param name Logger name shown in each line
 * @param level Verbosity
 */
std::shared_ptr<spdlog::logger> make_logger(const std::string& name = DEFAULT_LOGGER_NAME,
                                            LogLevel level = LogLevel::Warning);

/**
 * Logger that discards everything
 */
std::shared_ptr<spdlog::logger> make_null_logger(const std::string& name = DEFAULT_LOGGER_NAME);

} // namespace geministream

#endif // GEMINISTREAM_LOGGING_HPP
