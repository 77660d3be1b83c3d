#ifndef ARBITER_HELPERS_LOG_HPP
#define ARBITER_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Process-wide spdlog setup for the arbiter library and tools.
 *
 * Components log through the spdlog default logger (spdlog::info(...)).
 * init() installs a stderr logger named "arbiter" as that default.
 */

#include <optional>    // std::optional
#include <string>
#include <string_view> // std::string_view

#include <spdlog/spdlog.h>

namespace arbiter {
namespace helpers {
namespace log {

/// Environment variable consulted for the log level.
inline constexpr const char* LOG_LEVEL_ENV = "ARBITER_LOG_LEVEL";

/// Name of the installed logger.
inline constexpr const char* LOGGER_NAME = "arbiter";

/**
 * @brief Parse a level name (trace, debug, info, warn/warning, error, critical, off).
 * @return Level, or std::nullopt for unknown names. Case-insensitive.
 */
[[nodiscard]] std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) noexcept;

/**
 * @brief Install the "arbiter" logger as spdlog's default.
 * @param level Explicit level name; when empty, ARBITER_LOG_LEVEL is used, then "info".
 * @note Safe to call more than once; later calls only adjust the level.
 */
void init(std::string_view level = {});

} // namespace log
} // namespace helpers
} // namespace arbiter

#endif // ARBITER_HELPERS_LOG_HPP
