/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#include "Log.hpp"
#include "Errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace cadastre::log {

namespace {

constexpr auto LoggerName = "cadastre";

std::shared_ptr<spdlog::logger> Create() {
  auto logger = spdlog::get(LoggerName);
  if (!logger)
    logger = spdlog::stderr_color_mt(LoggerName);
  logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
  return logger;
} // Create

} // local

void Init(spdlog::level::level_enum level) {
  Create()->set_level(level);
} // Init

spdlog::logger& Logger() {
  static auto logger = Create();
  return *logger;
} // Logger

spdlog::level::level_enum ParseLevel(std::string_view name) {
  const auto level = spdlog::level::from_str(std::string{name});
  // from_str maps unknown names to "off"
  if (level == spdlog::level::off && name != "off")
    throw ConfigError{"unknown log level '" + std::string{name} + "'"};
  return level;
} // ParseLevel

} // cadastre::log
