// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include "config.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <filesystem>
#include <vector>

namespace iconsmith {
namespace logging {

namespace {

/// Resolve Auto to a concrete target
LogTarget resolve_target(const LogConfig& config) {
    if (config.target != LogTarget::Auto) {
        return config.target;
    }
    return config.file_path.empty() ? LogTarget::Console : LogTarget::File;
}

/// Add the file sink; returns false when the path cannot be opened
bool add_file_sink(std::vector<spdlog::sink_ptr>& sinks, const std::string& file_path) {
    std::string path = file_path.empty() ? "iconsmith.log" : file_path;

    std::error_code ec;
    std::filesystem::path dir = std::filesystem::path(path).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
    }

    try {
        // 5MB max size, 3 rotated files
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
        return true;
    } catch (const spdlog::spdlog_ex& e) {
        // The default logger is not built yet
        std::fprintf(stderr, "[Logging] Cannot open log file %s: %s\n", path.c_str(), e.what());
        return false;
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (always, unless explicitly disabled)
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    LogTarget effective_target = resolve_target(config);
    bool file_ok = true;
    if (effective_target == LogTarget::File) {
        file_ok = add_file_sink(sinks, config.file_path);
    }

    auto logger = std::make_shared<spdlog::logger>("iconsmith", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] Initialized: target={}, console={}, file={}",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no",
                  file_ok ? "ok" : "unavailable");
}

LogConfig log_config_from(Config& config, const std::string& level_override) {
    LogConfig log_config;
    std::string level_name =
        level_override.empty() ? config.get<std::string>("/log_level", "warn") : level_override;
    if (!parse_log_level(level_name, log_config.level)) {
        spdlog::warn("[Logging] Unknown log level '{}', using warn", level_name);
    }
    log_config.target = parse_log_target(config.get<std::string>("/log_target", "auto"));
    log_config.file_path = config.get<std::string>("/log_file", "");
    return log_config;
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto; // Default for "auto" or unrecognized
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Console:
        return "console";
    case LogTarget::File:
        return "file";
    }
    return "unknown";
}

bool parse_log_level(const std::string& str, spdlog::level::level_enum& out) {
    if (str == "warning") {
        out = spdlog::level::warn;
        return true;
    }
    auto level = spdlog::level::from_str(str);
    // from_str() maps unknown names to off; only accept "off" when asked for
    if (level == spdlog::level::off && str != "off") {
        return false;
    }
    out = level;
    return true;
}

} // namespace logging
} // namespace iconsmith
