// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "geometry_analyzer.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace iconsmith {

GeometryAnalyzer::GeometryAnalyzer(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

double GeometryAnalyzer::round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::vector<PrimitiveRef> GeometryAnalyzer::find_primitives(const SceneNode& root) const {
    std::vector<PrimitiveRef> result;
    std::vector<const SceneNode*> chain;
    for (const auto& child : root.children) {
        collect(*child, chain, result);
    }
    logger_->trace("[GeometryAnalyzer] '{}': {} primitive(s)", root.name, result.size());
    return result;
}

void GeometryAnalyzer::collect(const SceneNode& node, std::vector<const SceneNode*>& chain,
                               std::vector<PrimitiveRef>& out) const {
    if (is_primitive(node.kind)) {
        out.push_back(PrimitiveRef{&node, chain});
        return;
    }
    if (!is_container_like(node.kind)) {
        return;
    }

    chain.push_back(&node);
    for (const auto& child : node.children) {
        collect(*child, chain, out);
    }
    chain.pop_back();
}

std::optional<GeometryAnalyzer::Placement>
GeometryAnalyzer::place(const SceneNode& node, const std::vector<const SceneNode*>& ancestors,
                        const SceneNode* container) const {
    if (node.absolute_render_bounds && container && container->absolute_bounding_box) {
        const Bounds& rb = *node.absolute_render_bounds;
        const Bounds& origin = *container->absolute_bounding_box;
        Placement p;
        p.box = Bounds{rb.x - origin.x, rb.y - origin.y, rb.width, rb.height};
        p.from_render_bounds = true;
        return p;
    }

    if (!node.has_position()) {
        return std::nullopt;
    }

    double abs_x = *node.x;
    double abs_y = *node.y;
    for (const SceneNode* ancestor : ancestors) {
        if (ancestor->has_position()) {
            abs_x += *ancestor->x;
            abs_y += *ancestor->y;
        }
    }

    Placement p;
    p.box = Bounds{abs_x, abs_y, node.width, node.height};
    return p;
}

std::optional<EdgeDistances>
GeometryAnalyzer::compute_edge_distances(const SceneNode& node,
                                         const std::vector<const SceneNode*>& ancestors,
                                         double container_size, const SceneNode* container) const {
    auto placement = place(node, ancestors, container);
    if (!placement) {
        logger_->debug("[GeometryAnalyzer] '{}' has no position, skipping", node.name);
        return std::nullopt;
    }

    const Bounds& box = placement->box;
    double left = box.x;
    double top = box.y;
    double right = container_size - (box.x + box.width);
    double bottom = container_size - (box.y + box.height);

    // Render bounds include the outward half of the stroke
    if (placement->from_render_bounds && node.stroke_weight > 0.0 && !node.strokes.empty()) {
        double half = node.stroke_weight / 2.0;
        left += half;
        top += half;
        right += half;
        bottom += half;
    }

    return EdgeDistances{round2(left), round2(top), round2(right), round2(bottom)};
}

std::optional<VectorPositionInfo> GeometryAnalyzer::position_info(const PrimitiveRef& ref,
                                                                  double container_size,
                                                                  const SceneNode* container) const {
    const SceneNode& node = *ref.node;
    auto placement = place(node, ref.ancestors, container);
    auto distances = compute_edge_distances(node, ref.ancestors, container_size, container);
    if (!placement || !distances) {
        return std::nullopt;
    }

    VectorPositionInfo info;
    info.name = node.name;
    info.x = placement->box.x;
    info.y = placement->box.y;
    info.relative_x = node.x.value_or(0.0);
    info.relative_y = node.y.value_or(0.0);
    info.width = node.width;
    info.height = node.height;
    info.distances = *distances;
    if (node.stroke_weight > 0.0) {
        info.stroke_weight = node.stroke_weight;
    }

    if (!ref.ancestors.empty()) {
        const SceneNode* parent = ref.ancestors.back();
        if (parent->kind == NodeKind::FRAME && parent != container) {
            info.is_in_frame = true;
            info.parent_frame_name = parent->name;
        }
    }

    info.layer_path.reserve(ref.ancestors.size());
    for (const SceneNode* ancestor : ref.ancestors) {
        info.layer_path.push_back(ancestor->name);
    }
    return info;
}

std::optional<Bounds> GeometryAnalyzer::content_bounds(const std::vector<PrimitiveRef>& primitives,
                                                       const SceneNode* container) const {
    double min_x = std::numeric_limits<double>::infinity();
    double min_y = std::numeric_limits<double>::infinity();
    double max_x = -std::numeric_limits<double>::infinity();
    double max_y = -std::numeric_limits<double>::infinity();
    bool any = false;

    for (const auto& ref : primitives) {
        auto placement = place(*ref.node, ref.ancestors, container);
        if (!placement) {
            continue;
        }
        const Bounds& b = placement->box;
        min_x = std::min(min_x, b.x);
        min_y = std::min(min_y, b.y);
        max_x = std::max(max_x, b.x + b.width);
        max_y = std::max(max_y, b.y + b.height);
        any = true;
    }

    if (!any) {
        return std::nullopt;
    }
    return Bounds{min_x, min_y, max_x - min_x, max_y - min_y};
}

} // namespace iconsmith
