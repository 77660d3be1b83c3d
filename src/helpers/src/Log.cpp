/**
 * @file Log.cpp
 * @brief spdlog logger installation.
 */

#include "src/helpers/inc/Log.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <cstdlib>
#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace arbiter {
namespace helpers {
namespace log {

std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) noexcept {
  using strings::iequals;
  if (iequals(name, "trace")) {
    return spdlog::level::trace;
  }
  if (iequals(name, "debug")) {
    return spdlog::level::debug;
  }
  if (iequals(name, "info")) {
    return spdlog::level::info;
  }
  if (iequals(name, "warn") || iequals(name, "warning")) {
    return spdlog::level::warn;
  }
  if (iequals(name, "error")) {
    return spdlog::level::err;
  }
  if (iequals(name, "critical")) {
    return spdlog::level::critical;
  }
  if (iequals(name, "off")) {
    return spdlog::level::off;
  }
  return std::nullopt;
}

void init(std::string_view level) {
  auto logger = spdlog::get(LOGGER_NAME);
  if (!logger) {
    logger = spdlog::stderr_color_mt(LOGGER_NAME);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] [t%t] %v");
    spdlog::set_default_logger(logger);
  }

  std::string_view chosen = level;
  if (chosen.empty()) {
    const char* env = std::getenv(LOG_LEVEL_ENV);
    chosen = (env != nullptr) ? std::string_view(env) : std::string_view("info");
  }

  const auto PARSED = parseLevel(chosen);
  logger->set_level(PARSED.value_or(spdlog::level::info));
  if (!PARSED) {
    logger->warn("Unknown log level '{}', using info", chosen);
  }
}

} // namespace log
} // namespace helpers
} // namespace arbiter
