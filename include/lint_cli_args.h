// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file lint_cli_args.h
 * @brief Command-line argument parsing for icon-lint
 */

#include "icon_policy.h"

#include <optional>
#include <string>

namespace iconsmith {

/**
 * @brief Which validators icon-lint runs
 */
enum class LintMode {
    READINESS, ///< Structural readiness (default)
    MASTER,    ///< Size, stroke and safety zone of a master frame
    ICON_SET,  ///< Component set of functional variants
};

/**
 * @brief Parsed command-line arguments
 */
struct LintCliArgs {
    std::string config_path = "iconsmith.json";
    std::string log_level; // empty = use config value
    std::optional<IconCategory> category; // nullopt = detect
    LintMode mode = LintMode::READINESS;
    std::optional<std::string> name; // nullopt = root node name
    std::string scene_path;
    bool help = false;
};

/**
 * @brief Parse argv into @p args
 *
 * Prints a diagnostic for unknown options or missing values.
 *
 * @return true if parsing succeeded (including --help), false on usage errors
 */
bool parse_lint_cli_args(int argc, const char* const* argv, LintCliArgs& args);

void print_lint_help(const char* program_name);

} // namespace iconsmith
