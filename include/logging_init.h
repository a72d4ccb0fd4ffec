// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file logging_init.h
 * @brief Logger setup for the library and the command-line tools
 *
 * Builds the default spdlog logger from a console sink and an optional
 * rotating file sink. Library code never calls this; it logs through the
 * logger it was handed (or spdlog's default logger).
 */

#include <spdlog/spdlog.h>

#include <string>

namespace iconsmith {

class Config;

namespace logging {

/// Where log output goes in addition to the console
enum class LogTarget {
    Auto,    ///< File when a log file is configured, else console only
    Console, ///< Console only
    File     ///< Rotating file sink
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    std::string file_path;       ///< Used by File (and Auto when non-empty)
    bool enable_console = true; ///< Console sink writes to stderr
};

/**
 * @brief Install the default logger described by @p config
 *
 * Safe to call more than once; each call replaces the default logger.
 */
void init(const LogConfig& config);

/**
 * @brief Build a LogConfig from `/log_level`, `/log_target` and `/log_file`
 *
 * @param level_override Level name that wins over the config (empty = none)
 */
LogConfig log_config_from(Config& config, const std::string& level_override = "");

/**
 * @brief Parse "auto", "console" or "file"; anything else maps to Auto
 */
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Parse a level name ("trace" .. "off", also "warning")
 * @return false if @p str is not a level name (@p out untouched)
 */
bool parse_log_level(const std::string& str, spdlog::level::level_enum& out);

} // namespace logging
} // namespace iconsmith
