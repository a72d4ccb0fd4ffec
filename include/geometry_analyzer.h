// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file geometry_analyzer.h
 * @brief Absolute placement of primitives inside an icon container
 *
 * Positions are accumulated from local offsets along the ancestor chain, or
 * taken from the host's absolute render bounds when both the primitive and
 * the container expose absolute boxes. Safety-zone distances are measured
 * from the path center-line, so render-bound distances of stroked shapes
 * are shifted inward by half the stroke weight.
 */

#include "scene_node.h"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace iconsmith {

/**
 * @brief A primitive plus the intermediate nodes between it and the root
 *
 * The chain is ordered outermost first, excludes the root the search started
 * from and ends with the primitive's direct parent (when that is not the root).
 */
struct PrimitiveRef {
    const SceneNode* node = nullptr;
    std::vector<const SceneNode*> ancestors;
};

/// Distance from each container edge, rounded to 2 decimals
struct EdgeDistances {
    double left = 0.0;
    double top = 0.0;
    double right = 0.0;
    double bottom = 0.0;
};

/**
 * @brief Derived placement snapshot of one primitive
 */
struct VectorPositionInfo {
    std::string name;
    double x = 0.0;          ///< Absolute offset inside the container
    double y = 0.0;
    double relative_x = 0.0; ///< Offset inside the direct parent
    double relative_y = 0.0;
    double width = 0.0;
    double height = 0.0;
    EdgeDistances distances;
    std::optional<double> stroke_weight;
    bool is_in_frame = false;      ///< Direct parent is an intermediate frame
    std::string parent_frame_name; ///< Set when is_in_frame
    std::vector<std::string> layer_path;
};

class GeometryAnalyzer {
  public:
    explicit GeometryAnalyzer(std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Depth-first search for primitives below @p root
     *
     * Descends through frames, groups and components; stops at primitives,
     * so boolean-operation operands are never reported on their own.
     */
    [[nodiscard]] std::vector<PrimitiveRef> find_primitives(const SceneNode& root) const;

    /**
     * @brief Distances from the four edges of a square container
     *
     * @param node Primitive to measure
     * @param ancestors Chain from find_primitives()
     * @param container_size Edge length of the container
     * @param container Container node; enables the absolute-bounds strategy
     * @return Distances, or nullopt when the node has neither a local offset
     *         nor usable absolute bounds
     */
    [[nodiscard]] std::optional<EdgeDistances>
    compute_edge_distances(const SceneNode& node, const std::vector<const SceneNode*>& ancestors,
                           double container_size, const SceneNode* container = nullptr) const;

    /**
     * @brief Full position snapshot for a primitive
     *
     * @return Snapshot, or nullopt when the node cannot be placed
     */
    [[nodiscard]] std::optional<VectorPositionInfo>
    position_info(const PrimitiveRef& ref, double container_size,
                  const SceneNode* container = nullptr) const;

    /**
     * @brief Union box of all placeable primitives in container coordinates
     *
     * Uses render bounds (visual outer edge) where available.
     */
    [[nodiscard]] std::optional<Bounds> content_bounds(const std::vector<PrimitiveRef>& primitives,
                                                       const SceneNode* container = nullptr) const;

    /// Round to 2 decimal places
    static double round2(double value);

  private:
    struct Placement {
        Bounds box;
        bool from_render_bounds = false;
    };

    [[nodiscard]] std::optional<Placement> place(const SceneNode& node,
                                                 const std::vector<const SceneNode*>& ancestors,
                                                 const SceneNode* container) const;

    void collect(const SceneNode& node, std::vector<const SceneNode*>& chain,
                 std::vector<PrimitiveRef>& out) const;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace iconsmith
