// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scene_host.h"

#include "icon_errors.h"

namespace iconsmith {

const SceneNode& require_node(const SceneHost& host, const std::string& id) {
    const SceneNode* node = host.find_node(id);
    if (!node) {
        throw ProcessingError("Node not found: " + id);
    }
    return *node;
}

const SceneNode* content_holder_of(const SceneNode& icon) {
    if (icon.children.empty()) {
        return nullptr;
    }
    const SceneNode* first = icon.children.front().get();
    switch (first->kind) {
    case NodeKind::FRAME:
    case NodeKind::GROUP:
    case NodeKind::COMPONENT:
        return first;
    default:
        return nullptr;
    }
}

std::vector<std::string> icon_ids_of(const SceneNode& target) {
    std::vector<std::string> ids;
    if (target.kind == NodeKind::COMPONENT_SET) {
        for (const auto& child : target.children) {
            ids.push_back(child->id);
        }
    } else {
        ids.push_back(target.id);
    }
    return ids;
}

} // namespace iconsmith
