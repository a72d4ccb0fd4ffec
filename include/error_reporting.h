// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cstdio>

/**
 * @file error_reporting.h
 * @brief Convenience macros for error reporting from tools and library code
 *
 * Usage Examples:
 * ```cpp
 * // Internal error (logged only)
 * LOG_ERROR_INTERNAL("Failed to open config file for writing: {}", path);
 *
 * // User-facing error (logged + printed on stderr)
 * NOTIFY_ERROR("Could not read scene file {}", path);
 * ```
 */

// ============================================================================
// Internal Errors (Log Only)
// ============================================================================

/**
 * @brief Log internal error (not shown to user)
 */
#define LOG_ERROR_INTERNAL(msg, ...) spdlog::error("[INTERNAL] " msg, ##__VA_ARGS__)

/**
 * @brief Log internal warning (not shown to user)
 */
#define LOG_WARN_INTERNAL(msg, ...) spdlog::warn("[INTERNAL] " msg, ##__VA_ARGS__)

// ============================================================================
// User-Facing Errors (Log + stderr)
// ============================================================================

/**
 * @brief Report an error the person running the tool must see
 *
 * The console sink may be disabled or filtered by level, so the message is
 * also written to stderr directly.
 */
#define NOTIFY_ERROR(msg, ...)                                                                     \
    do {                                                                                           \
        std::string formatted_msg = fmt::format(msg, ##__VA_ARGS__);                               \
        spdlog::error("[USER] {}", formatted_msg);                                                 \
        std::fprintf(stderr, "error: %s\n", formatted_msg.c_str());                                \
    } while (0)
