// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file scene_host.h
 * @brief Write contract with the host application's scene graph
 *
 * The host owns every node and performs all geometry work (boolean unions,
 * flattening, outlining strokes). Repair steps only issue these calls and
 * read back the resulting snapshot through find_node().
 *
 * Implementations report failures by throwing ProcessingError.
 */

#include "scene_node.h"

#include <string>
#include <vector>

namespace iconsmith {

class SceneHost {
  public:
    virtual ~SceneHost() = default;

    /**
     * @brief Current snapshot of a node
     * @return Node, or nullptr if no node has that id
     */
    virtual const SceneNode* find_node(const std::string& id) const = 0;

    /// Deep copy placed next to the original; returns the copy's id
    virtual std::string clone_node(const std::string& id) = 0;

    /// Collapse @p ids into one vector node inside @p parent_id; returns its id
    virtual std::string flatten_nodes(const std::vector<std::string>& ids,
                                      const std::string& parent_id) = 0;

    /// Boolean-union @p ids into one node inside @p parent_id; returns its id
    virtual std::string union_nodes(const std::vector<std::string>& ids,
                                    const std::string& parent_id) = 0;

    /// Replace a stroked path by its filled outline; returns the new node id
    virtual std::string outline_stroke(const std::string& id) = 0;

    virtual void resize_node(const std::string& id, double width, double height) = 0;

    /// Scale geometry (and stroke weight) by @p factor around the node origin
    virtual void rescale_node(const std::string& id, double factor) = 0;

    virtual void move_node(const std::string& id, double x, double y) = 0;
    virtual void rename_node(const std::string& id, const std::string& name) = 0;
    virtual void append_child(const std::string& parent_id, const std::string& child_id) = 0;
    virtual void remove_node(const std::string& id) = 0;

    /// Bind every solid fill of the node to a design-token color variable
    virtual void bind_fill_variable(const std::string& id, const std::string& variable_key) = 0;

    virtual void set_description(const std::string& id, const std::string& text) = 0;
};

/**
 * @brief find_node() that throws ProcessingError when the id is unknown
 */
const SceneNode& require_node(const SceneHost& host, const std::string& id);

/**
 * @brief The content holder of an icon frame (its first child, when that is a frame or group)
 * @return Holder, or nullptr when the icon has none
 */
const SceneNode* content_holder_of(const SceneNode& icon);

/**
 * @brief Icon frames addressed by a repair target
 *
 * A component set yields its variants; anything else is a single icon.
 */
std::vector<std::string> icon_ids_of(const SceneNode& target);

} // namespace iconsmith
