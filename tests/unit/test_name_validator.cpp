// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "name_validator.h"

#include <catch2/catch_test_macros.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include <sstream>
#include <string>
#include <vector>

using namespace iconsmith;

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("NameValidator - functional names are kebab-case", "[name]") {
    NameValidator validator(IconCategory::FUNCTIONAL);

    for (const char* good : {"home", "arrow-left", "chevron-down-2", "a1b2c3"}) {
        CAPTURE(good);
        auto result = validator.validate(good);
        CHECK(result.is_valid());
        CHECK_FALSE(result.suggestion.has_value());
    }

    for (const char* bad :
         {"Home", "arrow_left", "arrow--left", "-arrow", "arrow-", "arrow left"}) {
        CAPTURE(bad);
        CHECK_FALSE(validator.validate(bad).is_valid());
    }
}

TEST_CASE("NameValidator - illustrative names are snake_case", "[name]") {
    NameValidator validator(IconCategory::ILLUSTRATIVE);

    for (const char* good : {"rocket", "rocket_launch", "user_group_2"}) {
        CAPTURE(good);
        CHECK(validator.validate(good).is_valid());
    }

    for (const char* bad : {"rocket-launch", "Rocket_Launch", "rocket__launch", "_rocket"}) {
        CAPTURE(bad);
        CHECK_FALSE(validator.validate(bad).is_valid());
    }
}

TEST_CASE("NameValidator - whitespace-only names are rejected", "[name]") {
    for (IconCategory category : {IconCategory::FUNCTIONAL, IconCategory::ILLUSTRATIVE}) {
        NameValidator validator(category);
        for (const char* blank : {"", " ", "   ", "\t", " \n "}) {
            CAPTURE(blank);
            CHECK_FALSE(validator.validate(blank).is_valid());
        }
    }
}

TEST_CASE("NameValidator - length limits", "[name]") {
    NameValidator validator(IconCategory::FUNCTIONAL);

    auto too_short = validator.validate("ab");
    REQUIRE(too_short.errors.size() == 1);
    CHECK(too_short.errors[0] == "Name must be between 3 and 50 characters");

    CHECK(validator.validate("abc").is_valid());
    CHECK(validator.validate(std::string(50, 'a')).is_valid());

    auto too_long = validator.validate(std::string(51, 'a'));
    REQUIRE(too_long.errors.size() == 1);
    CHECK(too_long.errors[0] == "Name must be between 3 and 50 characters");
}

TEST_CASE("NameValidator - each rule reports its own error", "[name]") {
    NameValidator validator(IconCategory::FUNCTIONAL);

    auto result = validator.validate("Home Icon!");
    REQUIRE(result.errors.size() == 2);
    CHECK(result.errors[0] == "Name must be in kebab-case format (lowercase with hyphens)");
    CHECK(result.errors[1] ==
          "Name must not contain special characters (only letters, numbers, and separators)");
    REQUIRE(result.suggestion);
    CHECK(*result.suggestion == "home-icon");

    auto all_three = validator.validate("A!");
    CHECK(all_three.errors.size() == 3);
}

// ============================================================================
// Suggestions
// ============================================================================

TEST_CASE("NameValidator - suggestion normalizes names", "[name][suggestion]") {
    NameValidator functional(IconCategory::FUNCTIONAL);
    NameValidator illustrative(IconCategory::ILLUSTRATIVE);

    CHECK(functional.generate_suggestion("Arrow Left") == "arrow-left");
    CHECK(functional.generate_suggestion("  --Arrow__Left--  ") == "arrow-left");
    CHECK(functional.generate_suggestion("Ümlaut Icon") == "mlaut-icon");
    CHECK(illustrative.generate_suggestion("Rocket-Launch") == "rocket_launch");
    CHECK(illustrative.generate_suggestion("User  Group") == "user_group");
}

TEST_CASE("NameValidator - short suggestions fall back to icon", "[name][suggestion]") {
    NameValidator validator(IconCategory::FUNCTIONAL);

    CHECK(validator.generate_suggestion("") == "icon");
    CHECK(validator.generate_suggestion("A") == "icon");
    CHECK(validator.generate_suggestion("!!!") == "icon");
    CHECK(validator.generate_suggestion("a!") == "icon");
    CHECK(validator.generate_suggestion("a b") == "a-b");
}

TEST_CASE("NameValidator - long suggestions are truncated", "[name][suggestion]") {
    NameValidator validator(IconCategory::FUNCTIONAL);

    CHECK(validator.generate_suggestion(std::string(60, 'a')) == std::string(50, 'a'));

    // Cut lands right after a separator
    std::string name = std::string(49, 'a') + "-" + std::string(10, 'b');
    std::string suggestion = validator.generate_suggestion(name);
    CHECK(suggestion == std::string(49, 'a'));
    CHECK(validator.validate(suggestion).is_valid());
}

TEST_CASE("NameValidator - suggestion is idempotent and valid", "[name][suggestion]") {
    const std::vector<std::string> samples = {
        "Home",           "arrow left",  "ARROW__LEFT", "x",
        "  spaced  out ", "a-b_c d",     "___",         std::string(49, 'a') + "_zz" + "yy",
        "Ünïcödé Näme",   "icon--name!", "123",         std::string(80, 'q'),
    };

    for (IconCategory category : {IconCategory::FUNCTIONAL, IconCategory::ILLUSTRATIVE}) {
        NameValidator validator(category);
        for (const auto& sample : samples) {
            CAPTURE(sample);
            std::string once = validator.generate_suggestion(sample);
            CHECK(validator.generate_suggestion(once) == once);
            CHECK(validator.validate(once).is_valid());
        }
    }
}

TEST_CASE("NameValidator - logs through the injected logger", "[name]") {
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    auto logger = std::make_shared<spdlog::logger>("name-test", sink);
    logger->set_level(spdlog::level::debug);
    logger->set_pattern("%v");

    NameValidator validator(IconCategory::FUNCTIONAL, logger);
    CHECK(validator.validate("arrow-left").is_valid());
    logger->flush();
    CHECK(captured.str().empty());

    CHECK_FALSE(validator.validate("Arrow Left").is_valid());
    logger->flush();
    CHECK(captured.str().find("[NameValidator] 'Arrow Left' invalid") != std::string::npos);
    CHECK(captured.str().find("suggesting 'arrow-left'") != std::string::npos);
}

TEST_CASE("NameValidator - null logger falls back to the default", "[name]") {
    NameValidator validator(IconCategory::ILLUSTRATIVE, nullptr);
    CHECK_FALSE(validator.validate("Bad Name").is_valid());
}
