// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "icon_errors.h"
#include "master_icon_validator.h"
#include "scene_json.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <fstream>
#include <string>

using namespace iconsmith;
using json = nlohmann::json;

namespace {

json sample_icon() {
    return json::parse(R"({
        "id": "1:2",
        "type": "FRAME",
        "name": "ic-home",
        "x": 0, "y": 0, "width": 24, "height": 24,
        "absoluteBoundingBox": {"x": 100, "y": 200, "width": 24, "height": 24},
        "children": [{
            "id": "1:3",
            "type": "FRAME",
            "name": "Container",
            "x": 0, "y": 0, "width": 24, "height": 24,
            "children": [{
                "id": "1:4",
                "type": "VECTOR",
                "name": "Vector",
                "x": 4, "y": 4, "width": 16, "height": 16,
                "fills": [{"type": "SOLID", "color": {"r": 0, "g": 0, "b": 0}, "visible": true}],
                "strokes": [{"type": "SOLID", "color": {"r": 0.1, "g": 0.1, "b": 0.1}}],
                "strokeWeight": 2
            }]
        }]
    })");
}

} // namespace

TEST_CASE("SceneJson - parses a node tree", "[scene][json]") {
    auto root = scene_node_from_json(sample_icon());

    CHECK(root->kind == NodeKind::FRAME);
    CHECK(root->id == "1:2");
    CHECK(root->name == "ic-home");
    CHECK(root->width == 24.0);
    REQUIRE(root->absolute_bounding_box);
    CHECK(root->absolute_bounding_box->x == 100.0);
    CHECK_FALSE(root->absolute_render_bounds.has_value());

    REQUIRE(root->children.size() == 1);
    const SceneNode& holder = *root->children[0];
    REQUIRE(holder.children.size() == 1);
    const SceneNode& vec = *holder.children[0];
    CHECK(vec.kind == NodeKind::VECTOR);
    CHECK(vec.x == std::optional<double>(4.0));
    REQUIRE(vec.fills);
    REQUIRE(vec.fills->paints.size() == 1);
    CHECK(vec.fills->paints[0].type == PaintType::SOLID);
    REQUIRE(vec.strokes.size() == 1);
    CHECK(vec.strokes[0].visible);
    CHECK(vec.strokes[0].color.r == 0.1);
    CHECK(vec.stroke_weight == 2.0);
    CHECK(vec.has_visible_strokes());
}

TEST_CASE("SceneJson - mixed fills and unknown kinds", "[scene][json]") {
    auto n = scene_node_from_json(
        json{{"type", "TEXT"}, {"name", "Label"}, {"fills", "mixed"}, {"width", 10}});

    CHECK(n->kind == NodeKind::OTHER);
    REQUIRE(n->fills);
    CHECK(n->fills->mixed);
    CHECK_FALSE(n->has_position());
}

TEST_CASE("SceneJson - malformed input", "[scene][json]") {
    CHECK_THROWS_AS(scene_node_from_json(json::array()), SceneParseError);
    CHECK_THROWS_AS(scene_node_from_json(json{{"name", "no type"}}), SceneParseError);
    CHECK_THROWS_AS(scene_node_from_json(json{{"type", "VECTOR"}, {"width", "wide"}}),
                    SceneParseError);
    CHECK_THROWS_AS(scene_node_from_json(json{{"type", "FRAME"}, {"children", 3}}),
                    SceneParseError);
    CHECK_THROWS_AS(scene_node_from_json(json{{"type", "VECTOR"}, {"fills", 1}}),
                    SceneParseError);

    SECTION("mistyped string and boolean fields") {
        CHECK_THROWS_AS(scene_node_from_json(json::parse(R"({"type":"FRAME","name":5})")),
                        SceneParseError);
        CHECK_THROWS_AS(scene_node_from_json(json::parse(R"({"type":"FRAME","id":[1]})")),
                        SceneParseError);
        CHECK_THROWS_AS(
            scene_node_from_json(json::parse(R"({"type":"FRAME","description":false})")),
            SceneParseError);
        CHECK_THROWS_AS(scene_node_from_json(json::parse(
                            R"({"type":"VECTOR","fills":[{"type":"SOLID","visible":"yes"}]})")),
                        SceneParseError);
        CHECK_THROWS_AS(
            scene_node_from_json(json::parse(R"({"type":"VECTOR","strokes":[{"type":3}]})")),
            SceneParseError);
    }
}

TEST_CASE("SceneJson - bound color variables", "[scene][json]") {
    auto vec = scene_node_from_json(json::parse(R"({"type":"VECTOR","name":"Base",
        "fills":[{"type":"SOLID","color":{"r":0,"g":0,"b":0},"boundVariable":"base-key"},
                 {"type":"SOLID","color":{"r":0,"g":0,"b":0}}]})"));
    REQUIRE(vec->fills->paints.size() == 2);
    CHECK(vec->fills->paints[0].bound_variable == "base-key");
    CHECK(vec->fills->paints[1].bound_variable.empty());

    json encoded = scene_node_to_json(*vec);
    CHECK(encoded["fills"][0]["boundVariable"] == "base-key");
    CHECK_FALSE(encoded["fills"][1].contains("boundVariable"));
}

TEST_CASE("SceneJson - encoding keeps what validators read", "[scene][json]") {
    auto root = scene_node_from_json(sample_icon());
    json encoded = scene_node_to_json(*root);

    CHECK(encoded["type"] == "FRAME");
    CHECK(encoded["absoluteBoundingBox"]["y"] == 200.0);
    const json& vec = encoded["children"][0]["children"][0];
    CHECK(vec["strokeWeight"] == 2.0);
    CHECK(vec["fills"][0]["color"]["r"] == 0.0);

    auto reparsed = scene_node_from_json(encoded);
    MasterIconValidator validator(IconCategory::FUNCTIONAL);
    CHECK(validator.validate(*reparsed).is_valid());
}

TEST_CASE("SceneJson - load_scene_file", "[scene][json]") {
    const std::string path = "test_scene_json_fixture.json";

    SECTION("bare node document") {
        std::ofstream(path) << sample_icon().dump();
        auto root = load_scene_file(path);
        CHECK(root->name == "ic-home");
    }

    SECTION("document with a root key") {
        std::ofstream(path) << json{{"root", sample_icon()}}.dump();
        auto root = load_scene_file(path);
        CHECK(root->children.size() == 1);
    }

    SECTION("invalid JSON") {
        std::ofstream(path) << "{not json";
        CHECK_THROWS_AS(load_scene_file(path), SceneParseError);
    }

    std::remove(path.c_str());

    CHECK_THROWS_AS(load_scene_file("/nonexistent/dir/scene.json"), SceneParseError);
}
