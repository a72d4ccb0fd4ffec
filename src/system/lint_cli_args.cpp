// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lint_cli_args.h"

#include "logging_init.h"

#include <cstdio>
#include <cstring>

namespace iconsmith {

namespace {

bool require_value(int argc, int i, const char* option) {
    if (i + 1 >= argc) {
        fprintf(stderr, "Error: %s requires an argument\n", option);
        return false;
    }
    return true;
}

} // namespace

void print_lint_help(const char* program_name) {
    printf("Usage: %s [options] <scene.json>\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>     Config file (default: iconsmith.json)\n");
    printf("  -l, --log-level <lvl>   trace, debug, info, warn, error, critical, off\n");
    printf("  --category <type>       functional | illustrative (default: detect)\n");
    printf("  --master                Check frame size, stroke width and safety zone\n");
    printf("  --set                   Check a component set of icon variants\n");
    printf("  --name <name>           Icon name to check (default: root node name)\n");
    printf("  -h, --help              Show this help\n");
    printf("\nExit status: 0 valid, 1 validation errors, 2 usage or I/O error\n");
}

bool parse_lint_cli_args(int argc, const char* const* argv, LintCliArgs& args) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            args.help = true;
            return true;
        } else if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (!require_value(argc, i, argv[i]))
                return false;
            args.config_path = argv[++i];
        } else if (strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--log-level") == 0) {
            if (!require_value(argc, i, argv[i]))
                return false;
            spdlog::level::level_enum level;
            if (!logging::parse_log_level(argv[i + 1], level)) {
                fprintf(stderr, "Error: unknown log level: %s\n", argv[i + 1]);
                return false;
            }
            args.log_level = argv[++i];
        } else if (strcmp(argv[i], "--category") == 0) {
            if (!require_value(argc, i, argv[i]))
                return false;
            args.category = parse_icon_category(argv[++i]);
            if (!args.category) {
                fprintf(stderr, "Error: --category must be functional or illustrative: %s\n",
                        argv[i]);
                return false;
            }
        } else if (strcmp(argv[i], "--master") == 0) {
            args.mode = LintMode::MASTER;
        } else if (strcmp(argv[i], "--set") == 0) {
            args.mode = LintMode::ICON_SET;
        } else if (strcmp(argv[i], "--name") == 0) {
            if (!require_value(argc, i, argv[i]))
                return false;
            args.name = argv[++i];
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            fprintf(stderr, "Error: unknown option: %s\n", argv[i]);
            return false;
        } else if (args.scene_path.empty()) {
            args.scene_path = argv[i];
        } else {
            fprintf(stderr, "Error: more than one scene file given: %s\n", argv[i]);
            return false;
        }
    }

    if (args.scene_path.empty()) {
        fprintf(stderr, "Error: no scene file given\n");
        return false;
    }
    return true;
}

} // namespace iconsmith
