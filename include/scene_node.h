// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file scene_node.h
 * @brief Read-only snapshot of the host's icon scene graph
 *
 * Mirrors the subset of the host scene tree that the validators read:
 * kind, name, local geometry, paints, stroke weight, optional absolute
 * bounds and children. The host owns the real nodes; validators only borrow
 * a `const SceneNode&` for the duration of one pass.
 *
 * @threading Immutable after construction; safe to share across threads
 */

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace iconsmith {

/**
 * @brief Closed vocabulary of node kinds understood by the validators
 */
enum class NodeKind {
    FRAME,
    COMPONENT,
    COMPONENT_SET,
    GROUP,
    BOOLEAN_OPERATION,
    VECTOR,
    ELLIPSE,
    RECTANGLE,
    STAR,
    LINE,
    POLYGON,
    OTHER ///< Text, slices, instances... never inspected
};

/**
 * @brief Host type tag for a node kind ("FRAME", "VECTOR", ...)
 */
const char* node_kind_to_string(NodeKind kind);

/**
 * @brief Parse a host type tag; unknown tags map to NodeKind::OTHER
 */
NodeKind node_kind_from_string(const std::string& tag);

/**
 * @brief True for leaf shapes that carry their own fills/strokes
 *
 * Boolean operations count as primitives: their operands are an
 * implementation detail of one visible shape.
 */
bool is_primitive(NodeKind kind);

/// True for kinds that may hold children
bool is_container_like(NodeKind kind);

/// Color channels in [0, 1]
struct RGB {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
};

enum class PaintType { SOLID, OTHER };

struct Paint {
    PaintType type = PaintType::SOLID;
    RGB color;
    bool visible = true;
    std::string bound_variable; ///< Color variable key, empty when unbound

    static Paint solid(double r, double g, double b, bool visible = true) {
        return Paint{PaintType::SOLID, RGB{r, g, b}, visible, {}};
    }
};

/**
 * @brief Fill list of a node, or the host's "mixed" marker
 *
 * A mixed fill set means the shape has several differently colored regions
 * that cannot be inspected through the read contract.
 */
struct FillSet {
    bool mixed = false;
    std::vector<Paint> paints;

    [[nodiscard]] bool empty() const {
        return !mixed && paints.empty();
    }

    static FillSet make_mixed() {
        FillSet f;
        f.mixed = true;
        return f;
    }
};

/// Axis-aligned box in absolute (page) coordinates
struct Bounds {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
};

/**
 * @brief One node of the scene snapshot
 *
 * Optional members model properties that only some kinds expose: `fills` is
 * absent on groups, `position` is absent on nodes the host cannot place.
 */
struct SceneNode {
    NodeKind kind = NodeKind::OTHER;
    std::string id;
    std::string name;
    double width = 0.0;
    double height = 0.0;

    /// Local offset relative to the direct parent
    std::optional<double> x;
    std::optional<double> y;

    std::optional<FillSet> fills;
    std::vector<Paint> strokes;
    double stroke_weight = 0.0;

    /// Geometry box (excludes stroke extension)
    std::optional<Bounds> absolute_bounding_box;
    /// Rendered box (includes outward stroke extension)
    std::optional<Bounds> absolute_render_bounds;

    std::string description;

    std::vector<std::unique_ptr<SceneNode>> children;

    SceneNode() = default;
    SceneNode(NodeKind k, std::string node_name) : kind(k), name(std::move(node_name)) {}

    SceneNode(const SceneNode&) = delete;
    SceneNode& operator=(const SceneNode&) = delete;
    SceneNode(SceneNode&&) = default;
    SceneNode& operator=(SceneNode&&) = default;

    [[nodiscard]] bool has_position() const {
        return x.has_value() && y.has_value();
    }

    /// Stroke weight > 0 and at least one visible stroke paint
    [[nodiscard]] bool has_visible_strokes() const;

    /// Any fill entry at all (including non-solid paints and the mixed marker)
    [[nodiscard]] bool has_fills() const {
        return fills.has_value() && !fills->empty();
    }

    /**
     * @brief Append a child and return a reference to it
     */
    SceneNode& add_child(std::unique_ptr<SceneNode> child);

    /**
     * @brief Deep copy, including children
     *
     * Node ids are copied verbatim; callers that need fresh ids assign them.
     */
    [[nodiscard]] std::unique_ptr<SceneNode> clone() const;
};

} // namespace iconsmith
