// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lint_cli_args.h"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace iconsmith;

namespace {

bool parse(std::vector<const char*> argv, LintCliArgs& args) {
    argv.insert(argv.begin(), "icon-lint");
    return parse_lint_cli_args(static_cast<int>(argv.size()), argv.data(), args);
}

} // namespace

TEST_CASE("parse_lint_cli_args: defaults", "[cli]") {
    LintCliArgs args;
    REQUIRE(parse({"icon.json"}, args));

    CHECK(args.scene_path == "icon.json");
    CHECK(args.config_path == "iconsmith.json");
    CHECK(args.log_level.empty());
    CHECK_FALSE(args.category.has_value());
    CHECK(args.mode == LintMode::READINESS);
    CHECK_FALSE(args.name.has_value());
    CHECK_FALSE(args.help);
}

TEST_CASE("parse_lint_cli_args: options", "[cli]") {
    LintCliArgs args;

    SECTION("config and log level") {
        REQUIRE(parse({"-c", "alt.json", "--log-level", "debug", "icon.json"}, args));
        CHECK(args.config_path == "alt.json");
        CHECK(args.log_level == "debug");
    }

    SECTION("long config and short log level") {
        REQUIRE(parse({"icon.json", "--config", "x.json", "-l", "warning"}, args));
        CHECK(args.config_path == "x.json");
        CHECK(args.log_level == "warning");
    }

    SECTION("category") {
        REQUIRE(parse({"--category", "illustrative", "icon.json"}, args));
        REQUIRE(args.category.has_value());
        CHECK(*args.category == IconCategory::ILLUSTRATIVE);
    }

    SECTION("master mode") {
        REQUIRE(parse({"--master", "icon.json"}, args));
        CHECK(args.mode == LintMode::MASTER);
    }

    SECTION("set mode with name") {
        REQUIRE(parse({"--set", "--name", "arrow-left", "set.json"}, args));
        CHECK(args.mode == LintMode::ICON_SET);
        REQUIRE(args.name.has_value());
        CHECK(*args.name == "arrow-left");
    }

    SECTION("stdin-style dash is a positional") {
        REQUIRE(parse({"-"}, args));
        CHECK(args.scene_path == "-");
    }
}

TEST_CASE("parse_lint_cli_args: help short-circuits", "[cli]") {
    // Options before --help are still checked
    LintCliArgs args;
    CHECK_FALSE(parse({"--bogus", "-h"}, args));

    LintCliArgs help_args;
    REQUIRE(parse({"--help", "--bogus"}, help_args));
    CHECK(help_args.help);
    CHECK(help_args.scene_path.empty());
}

TEST_CASE("parse_lint_cli_args: usage errors", "[cli]") {
    LintCliArgs args;

    SECTION("no scene file") {
        CHECK_FALSE(parse({}, args));
        CHECK_FALSE(parse({"--master"}, args));
    }

    SECTION("two scene files") {
        CHECK_FALSE(parse({"a.json", "b.json"}, args));
    }

    SECTION("unknown option") {
        CHECK_FALSE(parse({"--verbose", "a.json"}, args));
    }

    SECTION("missing option values") {
        CHECK_FALSE(parse({"a.json", "--config"}, args));
        CHECK_FALSE(parse({"a.json", "-l"}, args));
        CHECK_FALSE(parse({"a.json", "--category"}, args));
        CHECK_FALSE(parse({"a.json", "--name"}, args));
    }

    SECTION("bad category") {
        CHECK_FALSE(parse({"--category", "decorative", "a.json"}, args));
    }

    SECTION("bad log level") {
        CHECK_FALSE(parse({"--log-level", "loud", "a.json"}, args));
    }
}
