/// @file
/// @copyright 2025 Terry Golubiewski, all rights reserved.
/// @author Terry Golubiewski

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace cadastre::log {

/// Creates (or reconfigures) the "cadastre" logger, writing to stderr.
void Init(spdlog::level::level_enum level = spdlog::level::info);

/// The "cadastre" logger; initialised on first use if Init was not called.
spdlog::logger& Logger();

/// Parses "trace", "debug", "info", "warn", "error", "critical" or "off".
/// Throws ConfigError for anything else.
spdlog::level::level_enum ParseLevel(std::string_view name);

} // cadastre::log
