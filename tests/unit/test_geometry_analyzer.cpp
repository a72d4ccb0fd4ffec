// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "geometry_analyzer.h"

#include "../test_scene_builders.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace iconsmith;
using namespace test_scenes;
using Catch::Approx;

// ============================================================================
// find_primitives
// ============================================================================

TEST_CASE("GeometryAnalyzer - find_primitives walks nested containers", "[geometry]") {
    auto holder = node(NodeKind::FRAME, "Container", 0, 0, 32, 32);
    holder->add_child(filled_vector("top-level", 4, 4, 8, 8));
    auto& g = holder->add_child(group("Group", 2, 2));
    g.add_child(filled_vector("in-group", 0, 0, 8, 8));
    auto& inner = holder->add_child(node(NodeKind::FRAME, "Inner", 10, 10, 12, 12));
    inner.add_child(filled_vector("in-frame", 1, 1, 4, 4));

    GeometryAnalyzer analyzer;
    auto prims = analyzer.find_primitives(*holder);

    REQUIRE(prims.size() == 3);
    CHECK(prims[0].node->name == "top-level");
    CHECK(prims[0].ancestors.empty());
    CHECK(prims[1].node->name == "in-group");
    REQUIRE(prims[1].ancestors.size() == 1);
    CHECK(prims[1].ancestors[0]->name == "Group");
    CHECK(prims[2].node->name == "in-frame");
    REQUIRE(prims[2].ancestors.size() == 1);
    CHECK(prims[2].ancestors[0]->name == "Inner");
}

TEST_CASE("GeometryAnalyzer - boolean operands are not reported", "[geometry]") {
    auto holder = node(NodeKind::FRAME, "Container", 0, 0, 32, 32);
    auto& op = holder->add_child(node(NodeKind::BOOLEAN_OPERATION, "Union", 4, 4, 20, 20));
    op.add_child(filled_vector("a", 0, 0, 10, 10));
    op.add_child(filled_vector("b", 10, 10, 10, 10));

    GeometryAnalyzer analyzer;
    auto prims = analyzer.find_primitives(*holder);

    REQUIRE(prims.size() == 1);
    CHECK(prims[0].node->name == "Union");
}

TEST_CASE("GeometryAnalyzer - empty holder has no primitives", "[geometry]") {
    auto holder = node(NodeKind::FRAME, "Container", 0, 0, 32, 32);
    holder->add_child(node(NodeKind::OTHER, "Text", 0, 0, 5, 5));

    GeometryAnalyzer analyzer;
    CHECK(analyzer.find_primitives(*holder).empty());
}

// ============================================================================
// compute_edge_distances
// ============================================================================

TEST_CASE("GeometryAnalyzer - distances from accumulated local offsets", "[geometry]") {
    GeometryAnalyzer analyzer;

    SECTION("primitive at origin touches the left and top edges") {
        auto v = filled_vector("v", 0, 0, 10, 10);
        auto d = analyzer.compute_edge_distances(*v, {}, 32);
        REQUIRE(d);
        CHECK(d->left == 0.0);
        CHECK(d->top == 0.0);
        CHECK(d->right == 22.0);
        CHECK(d->bottom == 22.0);
    }

    SECTION("ancestor offsets are summed") {
        auto g = group("Group", 4, 6);
        auto v = filled_vector("v", 2, 3, 10, 10);
        auto d = analyzer.compute_edge_distances(*v, {g.get()}, 32);
        REQUIRE(d);
        CHECK(d->left == 6.0);
        CHECK(d->top == 9.0);
        CHECK(d->right == 16.0);
        CHECK(d->bottom == 13.0);
    }

    SECTION("local offsets never get a half-stroke adjustment") {
        auto v = stroked_vector("v", 3, 3, 10, 10, 2.0);
        auto d = analyzer.compute_edge_distances(*v, {}, 32);
        REQUIRE(d);
        CHECK(d->left == 3.0);
        CHECK(d->right == 19.0);
    }

    SECTION("distances are rounded to two decimals") {
        auto v = filled_vector("v", 1.236, 2.0, 10, 10);
        auto d = analyzer.compute_edge_distances(*v, {}, 32);
        REQUIRE(d);
        CHECK(d->left == Approx(1.24));
        CHECK(d->right == Approx(20.76));
    }

    SECTION("node without position is skipped") {
        SceneNode v(NodeKind::VECTOR, "floating");
        v.width = 10;
        v.height = 10;
        CHECK_FALSE(analyzer.compute_edge_distances(v, {}, 32).has_value());
    }
}

TEST_CASE("GeometryAnalyzer - render bounds are preferred when available", "[geometry]") {
    GeometryAnalyzer analyzer;
    auto holder = node(NodeKind::FRAME, "Container", 0, 0, 32, 32);
    holder->absolute_bounding_box = Bounds{100, 200, 32, 32};

    SECTION("stroked node measured from the stroke center-line") {
        auto v = stroked_vector("v", 0, 0, 10, 10, 2.0);
        v->absolute_render_bounds = Bounds{103, 204, 12, 12};
        auto d = analyzer.compute_edge_distances(*v, {}, 32, holder.get());
        REQUIRE(d);
        CHECK(d->left == 4.0);
        CHECK(d->top == 5.0);
        CHECK(d->right == 18.0);
        CHECK(d->bottom == 17.0);
    }

    SECTION("fill-only node uses render bounds as is") {
        auto v = filled_vector("v", 0, 0, 10, 10);
        v->absolute_render_bounds = Bounds{105, 205, 10, 10};
        auto d = analyzer.compute_edge_distances(*v, {}, 32, holder.get());
        REQUIRE(d);
        CHECK(d->left == 5.0);
        CHECK(d->top == 5.0);
        CHECK(d->right == 17.0);
        CHECK(d->bottom == 17.0);
    }

    SECTION("container without absolute box falls back to local offsets") {
        holder->absolute_bounding_box.reset();
        auto v = filled_vector("v", 7, 7, 10, 10);
        v->absolute_render_bounds = Bounds{105, 205, 10, 10};
        auto d = analyzer.compute_edge_distances(*v, {}, 32, holder.get());
        REQUIRE(d);
        CHECK(d->left == 7.0);
    }
}

// ============================================================================
// position_info / content_bounds
// ============================================================================

TEST_CASE("GeometryAnalyzer - position snapshot", "[geometry]") {
    auto holder = node(NodeKind::FRAME, "Container", 0, 0, 32, 32);
    auto& inner = holder->add_child(node(NodeKind::FRAME, "Inner", 4, 4, 20, 20));
    inner.add_child(stroked_vector("Line", 2, 3, 10, 1, 2.0));
    holder->add_child(filled_vector("Dot", 20, 20, 4, 4));

    GeometryAnalyzer analyzer;
    auto prims = analyzer.find_primitives(*holder);
    REQUIRE(prims.size() == 2);

    auto line = analyzer.position_info(prims[0], 32, holder.get());
    REQUIRE(line);
    CHECK(line->name == "Line");
    CHECK(line->x == 6.0);
    CHECK(line->y == 7.0);
    CHECK(line->relative_x == 2.0);
    CHECK(line->relative_y == 3.0);
    CHECK(line->is_in_frame);
    CHECK(line->parent_frame_name == "Inner");
    REQUIRE(line->stroke_weight);
    CHECK(*line->stroke_weight == 2.0);
    CHECK(line->layer_path == std::vector<std::string>{"Inner"});

    auto dot = analyzer.position_info(prims[1], 32, holder.get());
    REQUIRE(dot);
    CHECK_FALSE(dot->is_in_frame);
    CHECK_FALSE(dot->stroke_weight.has_value());
    CHECK(dot->layer_path.empty());
    CHECK(dot->distances.right == 8.0);
}

TEST_CASE("GeometryAnalyzer - content bounds cover every placed primitive", "[geometry]") {
    auto holder = node(NodeKind::FRAME, "Container", 0, 0, 64, 64);
    holder->add_child(filled_vector("a", 4, 4, 10, 10));
    holder->add_child(filled_vector("b", 20, 20, 8, 8));

    GeometryAnalyzer analyzer;
    auto bounds = analyzer.content_bounds(analyzer.find_primitives(*holder), holder.get());

    REQUIRE(bounds);
    CHECK(bounds->x == 4.0);
    CHECK(bounds->y == 4.0);
    CHECK(bounds->width == 24.0);
    CHECK(bounds->height == 24.0);
}

TEST_CASE("GeometryAnalyzer - round2", "[geometry]") {
    CHECK(GeometryAnalyzer::round2(1.0) == 1.0);
    CHECK(GeometryAnalyzer::round2(2.456) == Approx(2.46));
    CHECK(GeometryAnalyzer::round2(-0.004) == Approx(0.0));
}
