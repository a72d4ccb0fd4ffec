// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file test_scene_builders.h
 * @brief Small factories for scene trees used across the unit tests
 *
 * Every icon built here follows the host layout the validators expect:
 * outer frame → "Container" frame (same size, at 0,0) → content.
 */

#include "scene_node.h"

#include <memory>
#include <string>

namespace test_scenes {

using iconsmith::NodeKind;
using iconsmith::Paint;
using iconsmith::SceneNode;

inline Paint black() {
    return Paint::solid(0.0, 0.0, 0.0);
}

inline Paint dark_gray() {
    return Paint::solid(0.15, 0.15, 0.15);
}

inline Paint red() {
    return Paint::solid(0.9, 0.1, 0.1);
}

inline Paint blue() {
    return Paint::solid(0.1, 0.2, 0.9);
}

inline std::unique_ptr<SceneNode> node(NodeKind kind, const std::string& name, double x, double y,
                                       double w, double h) {
    auto n = std::make_unique<SceneNode>(kind, name);
    n->x = x;
    n->y = y;
    n->width = w;
    n->height = h;
    return n;
}

/// Fill-only vector
inline std::unique_ptr<SceneNode> filled_vector(const std::string& name, double x, double y,
                                                double w, double h, Paint fill = black()) {
    auto n = node(NodeKind::VECTOR, name, x, y, w, h);
    n->fills = iconsmith::FillSet{};
    n->fills->paints.push_back(fill);
    return n;
}

/// Stroke-only vector (empty fill list)
inline std::unique_ptr<SceneNode> stroked_vector(const std::string& name, double x, double y,
                                                 double w, double h, double weight,
                                                 Paint stroke = black()) {
    auto n = node(NodeKind::VECTOR, name, x, y, w, h);
    n->fills = iconsmith::FillSet{};
    n->strokes.push_back(stroke);
    n->stroke_weight = weight;
    return n;
}

inline std::unique_ptr<SceneNode> group(const std::string& name, double x = 0.0, double y = 0.0) {
    return node(NodeKind::GROUP, name, x, y, 0.0, 0.0);
}

/**
 * @brief Outer icon frame with an empty "Container" frame of the same size
 */
inline std::unique_ptr<SceneNode> icon_frame(const std::string& name, double size,
                                             NodeKind kind = NodeKind::FRAME) {
    auto frame = node(kind, name, 0.0, 0.0, size, size);
    frame->add_child(node(NodeKind::FRAME, "Container", 0.0, 0.0, size, size));
    return frame;
}

inline SceneNode& container_of(SceneNode& icon) {
    return *icon.children.front();
}

/**
 * @brief Component-set variant `Size=<n>, Variant=<type>` holding one centered vector
 *
 * The vector is half the variant size, within every per-size constraint.
 * Pass @p stroked = false for an already outlined (fill-only) vector.
 */
inline std::unique_ptr<SceneNode> variant(int size, const std::string& type, bool stroked = true) {
    auto v = icon_frame("Size=" + std::to_string(size) + ", Variant=" + type, size,
                        NodeKind::COMPONENT);
    const double extent = size / 2.0;
    const double offset = (size - extent) / 2.0;
    if (stroked) {
        container_of(*v).add_child(stroked_vector("Vector", offset, offset, extent, extent, 2.0));
    } else {
        container_of(*v).add_child(filled_vector("Vector", offset, offset, extent, extent));
    }
    return v;
}

} // namespace test_scenes
