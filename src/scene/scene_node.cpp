// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scene_node.h"

#include <algorithm>

namespace iconsmith {

const char* node_kind_to_string(NodeKind kind) {
    switch (kind) {
    case NodeKind::FRAME:
        return "FRAME";
    case NodeKind::COMPONENT:
        return "COMPONENT";
    case NodeKind::COMPONENT_SET:
        return "COMPONENT_SET";
    case NodeKind::GROUP:
        return "GROUP";
    case NodeKind::BOOLEAN_OPERATION:
        return "BOOLEAN_OPERATION";
    case NodeKind::VECTOR:
        return "VECTOR";
    case NodeKind::ELLIPSE:
        return "ELLIPSE";
    case NodeKind::RECTANGLE:
        return "RECTANGLE";
    case NodeKind::STAR:
        return "STAR";
    case NodeKind::LINE:
        return "LINE";
    case NodeKind::POLYGON:
        return "POLYGON";
    case NodeKind::OTHER:
        return "OTHER";
    }
    return "OTHER";
}

NodeKind node_kind_from_string(const std::string& tag) {
    if (tag == "FRAME")
        return NodeKind::FRAME;
    if (tag == "COMPONENT")
        return NodeKind::COMPONENT;
    if (tag == "COMPONENT_SET")
        return NodeKind::COMPONENT_SET;
    if (tag == "GROUP")
        return NodeKind::GROUP;
    if (tag == "BOOLEAN_OPERATION")
        return NodeKind::BOOLEAN_OPERATION;
    if (tag == "VECTOR")
        return NodeKind::VECTOR;
    if (tag == "ELLIPSE")
        return NodeKind::ELLIPSE;
    if (tag == "RECTANGLE")
        return NodeKind::RECTANGLE;
    if (tag == "STAR")
        return NodeKind::STAR;
    if (tag == "LINE")
        return NodeKind::LINE;
    if (tag == "POLYGON")
        return NodeKind::POLYGON;
    return NodeKind::OTHER;
}

bool is_primitive(NodeKind kind) {
    switch (kind) {
    case NodeKind::VECTOR:
    case NodeKind::ELLIPSE:
    case NodeKind::RECTANGLE:
    case NodeKind::STAR:
    case NodeKind::LINE:
    case NodeKind::POLYGON:
    case NodeKind::BOOLEAN_OPERATION:
        return true;
    case NodeKind::FRAME:
    case NodeKind::COMPONENT:
    case NodeKind::COMPONENT_SET:
    case NodeKind::GROUP:
    case NodeKind::OTHER:
        return false;
    }
    return false;
}

bool is_container_like(NodeKind kind) {
    switch (kind) {
    case NodeKind::FRAME:
    case NodeKind::COMPONENT:
    case NodeKind::COMPONENT_SET:
    case NodeKind::GROUP:
    case NodeKind::BOOLEAN_OPERATION:
        return true;
    case NodeKind::VECTOR:
    case NodeKind::ELLIPSE:
    case NodeKind::RECTANGLE:
    case NodeKind::STAR:
    case NodeKind::LINE:
    case NodeKind::POLYGON:
    case NodeKind::OTHER:
        return false;
    }
    return false;
}

bool SceneNode::has_visible_strokes() const {
    if (stroke_weight <= 0.0) {
        return false;
    }
    return std::any_of(strokes.begin(), strokes.end(), [](const Paint& p) { return p.visible; });
}

SceneNode& SceneNode::add_child(std::unique_ptr<SceneNode> child) {
    children.push_back(std::move(child));
    return *children.back();
}

std::unique_ptr<SceneNode> SceneNode::clone() const {
    auto copy = std::make_unique<SceneNode>(kind, name);
    copy->id = id;
    copy->width = width;
    copy->height = height;
    copy->x = x;
    copy->y = y;
    copy->fills = fills;
    copy->strokes = strokes;
    copy->stroke_weight = stroke_weight;
    copy->absolute_bounding_box = absolute_bounding_box;
    copy->absolute_render_bounds = absolute_render_bounds;
    copy->description = description;
    copy->children.reserve(children.size());
    for (const auto& child : children) {
        copy->children.push_back(child->clone());
    }
    return copy;
}

} // namespace iconsmith
