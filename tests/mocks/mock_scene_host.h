// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file mock_scene_host.h
 * @brief In-memory SceneHost for repair-step tests
 *
 * Holds one scene tree and performs every host operation on it directly:
 * - union_nodes() wraps the nodes in a BOOLEAN_OPERATION
 * - flatten_nodes() replaces them by a single VECTOR carrying all their fills
 * - outline_stroke() turns the stroke into a fill and grows the box by the weight
 *
 * Nodes without an id get "n<k>" ids when the tree is loaded. Every call is
 * recorded in calls() so tests can check what a processor asked for.
 *
 * @example
 * MockSceneHost host(test_scenes::icon_frame("ic-home", 24));
 * OutlineProcessor(host).process(host.root().id);
 */

#include "scene_host.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace iconsmith;

class MockSceneHost : public SceneHost {
  public:
    explicit MockSceneHost(std::unique_ptr<SceneNode> root);
    ~MockSceneHost() override = default;

    MockSceneHost(const MockSceneHost&) = delete;
    MockSceneHost& operator=(const MockSceneHost&) = delete;

    const SceneNode* find_node(const std::string& id) const override;
    std::string clone_node(const std::string& id) override;
    std::string flatten_nodes(const std::vector<std::string>& ids,
                              const std::string& parent_id) override;
    std::string union_nodes(const std::vector<std::string>& ids,
                            const std::string& parent_id) override;
    std::string outline_stroke(const std::string& id) override;
    void resize_node(const std::string& id, double width, double height) override;
    void rescale_node(const std::string& id, double factor) override;
    void move_node(const std::string& id, double x, double y) override;
    void rename_node(const std::string& id, const std::string& name) override;
    void append_child(const std::string& parent_id, const std::string& child_id) override;
    void remove_node(const std::string& id) override;
    void bind_fill_variable(const std::string& id, const std::string& variable_key) override;
    void set_description(const std::string& id, const std::string& text) override;

    SceneNode& root() {
        return *root_;
    }

    /// Mutable lookup; throws ProcessingError for unknown ids
    SceneNode& node(const std::string& id);

    /// First node with @p name (depth-first), or nullptr
    SceneNode* find_by_name(const std::string& name);

    /// Names of host operations in call order ("union_nodes", ...)
    const std::vector<std::string>& calls() const {
        return calls_;
    }

    size_t call_count(const std::string& operation) const;

    /// Variable key bound to each node id
    const std::map<std::string, std::string>& bindings() const {
        return bindings_;
    }

    /// Make the named operation throw ProcessingError("host refused <op>")
    void fail_on(const std::string& operation) {
        fail_operation_ = operation;
    }

  private:
    struct Location {
        SceneNode* parent = nullptr;
        size_t index = 0;
    };

    void record(const std::string& operation);
    std::string next_id();
    void assign_ids(SceneNode& node, bool fresh);
    Location locate(const std::string& id) const;
    std::unique_ptr<SceneNode> detach(const std::string& id);

    std::unique_ptr<SceneNode> root_;
    int id_counter_ = 0;
    std::vector<std::string> calls_;
    std::map<std::string, std::string> bindings_;
    std::string fail_operation_;
};
