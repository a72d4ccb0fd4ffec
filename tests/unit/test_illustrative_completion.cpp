// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "illustrative_completion.h"
#include "readiness_validator.h"

#include "../test_scene_builders.h"

#include <catch2/catch_test_macros.hpp>

using namespace iconsmith;
using namespace test_scenes;

namespace {

Paint bound(Paint paint, const std::string& key) {
    paint.bound_variable = key;
    return paint;
}

/// Component > Container > Vectors > Base + Pulse
std::unique_ptr<SceneNode> handed_over_icon(bool bind_colors = true) {
    auto icon = icon_frame("ii_rocket", 64, NodeKind::COMPONENT);
    auto& vectors = container_of(*icon).add_child(group(kVectorsLayer));
    vectors.add_child(filled_vector(kBaseLayer, 8, 8, 40, 40,
                                    bind_colors ? bound(black(), "base-key") : black()));
    vectors.add_child(filled_vector(kPulseLayer, 30, 30, 20, 20,
                                    bind_colors ? bound(red(), "pulse-key") : red()));
    return icon;
}

} // namespace

TEST_CASE("IllustrativeCompletion - finished icon", "[completion]") {
    auto icon = handed_over_icon();

    IllustrativeCompletion completion = check_illustrative_completion(*icon);
    CHECK(completion.is_component);
    CHECK(completion.has_correct_structure);
    CHECK(completion.missing_layers.empty());
    CHECK(completion.has_color_variables);
    CHECK(completion.complete());
    CHECK(is_illustrative_icon_complete(*icon));

    nlohmann::json j = completion.to_json();
    CHECK(j["isComplete"] == true);
    CHECK(j["missingLayers"].empty());
}

TEST_CASE("IllustrativeCompletion - incomplete icons", "[completion]") {
    SECTION("still a frame") {
        auto icon = handed_over_icon();
        icon->kind = NodeKind::FRAME;
        IllustrativeCompletion completion = check_illustrative_completion(*icon);
        CHECK_FALSE(completion.is_component);
        CHECK(completion.has_color_variables);
        CHECK_FALSE(completion.complete());
    }

    SECTION("no children") {
        auto icon = node(NodeKind::COMPONENT, "ii_rocket", 0, 0, 64, 64);
        IllustrativeCompletion completion = check_illustrative_completion(*icon);
        CHECK_FALSE(completion.has_correct_structure);
        CHECK_FALSE(completion.complete());
    }

    SECTION("no Vectors layer") {
        auto icon = icon_frame("ii_rocket", 64, NodeKind::COMPONENT);
        container_of(*icon).add_child(filled_vector("Vector", 8, 8, 40, 40));
        IllustrativeCompletion completion = check_illustrative_completion(*icon);
        CHECK_FALSE(completion.has_correct_structure);
        CHECK(completion.missing_layers.empty());
        CHECK_FALSE(completion.complete());
    }

    SECTION("missing layers are listed") {
        auto icon = icon_frame("ii_rocket", 64, NodeKind::COMPONENT);
        auto& vectors = container_of(*icon).add_child(group(kVectorsLayer));
        vectors.add_child(filled_vector("Shape", 8, 8, 40, 40));

        IllustrativeCompletion completion = check_illustrative_completion(*icon);
        CHECK(completion.has_correct_structure);
        CHECK(completion.missing_layers == std::vector<std::string>{"Base", "Pulse"});
        CHECK(completion.to_json()["missingLayers"].size() == 2);
        CHECK_FALSE(completion.complete());
    }

    SECTION("unbound colors") {
        auto icon = handed_over_icon(false);
        IllustrativeCompletion completion = check_illustrative_completion(*icon);
        CHECK(completion.has_correct_structure);
        CHECK(completion.missing_layers.empty());
        CHECK_FALSE(completion.has_color_variables);
        CHECK_FALSE(completion.complete());
    }
}

TEST_CASE("IllustrativeCompletion - Base and Pulse layers need no flatten", "[completion]") {
    StructuralReadinessValidator validator(IconCategory::ILLUSTRATIVE);

    auto icon = handed_over_icon();
    ReadinessReport report = validator.analyze(*icon);
    CHECK(report.black_count == 1);
    CHECK(report.red_count == 1);
    CHECK(report.ready());

    // Same two shapes without the layer names still need one
    auto loose = icon_frame("ii_rocket", 64, NodeKind::COMPONENT);
    container_of(*loose).add_child(filled_vector("body", 8, 8, 40, 40));
    container_of(*loose).add_child(filled_vector("flame", 30, 30, 20, 20, red()));
    CHECK(validator.analyze(*loose).needs(RepairAction::FLATTEN));
}
