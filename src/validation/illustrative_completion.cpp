// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "illustrative_completion.h"

namespace iconsmith {

const char* const kVectorsLayer = "Vectors";
const char* const kBaseLayer = "Base";
const char* const kPulseLayer = "Pulse";

namespace {

const SceneNode* find_child(const SceneNode& parent, const char* name) {
    for (const auto& child : parent.children) {
        if (child->name == name) {
            return child.get();
        }
    }
    return nullptr;
}

bool has_bound_fill(const SceneNode& node) {
    if (!node.fills || node.fills->mixed) {
        return false;
    }
    for (const auto& paint : node.fills->paints) {
        if (paint.type == PaintType::SOLID && !paint.bound_variable.empty()) {
            return true;
        }
    }
    return false;
}

} // namespace

nlohmann::json IllustrativeCompletion::to_json() const {
    return {{"isComplete", complete()},
            {"hasCorrectStructure", has_correct_structure},
            {"hasColorVariables", has_color_variables},
            {"missingLayers", missing_layers}};
}

IllustrativeCompletion check_illustrative_completion(const SceneNode& icon) {
    IllustrativeCompletion result;
    result.is_component = icon.kind == NodeKind::COMPONENT;

    if (icon.children.empty()) {
        return result;
    }
    const SceneNode& container = *icon.children.front();

    const SceneNode* vectors = nullptr;
    for (const auto& child : container.children) {
        if ((child->kind == NodeKind::GROUP || child->kind == NodeKind::FRAME) &&
            child->name == kVectorsLayer) {
            vectors = child.get();
            break;
        }
    }
    if (!vectors) {
        return result;
    }
    result.has_correct_structure = true;

    const SceneNode* base = find_child(*vectors, kBaseLayer);
    const SceneNode* pulse = find_child(*vectors, kPulseLayer);
    if (!base) {
        result.missing_layers.emplace_back(kBaseLayer);
    }
    if (!pulse) {
        result.missing_layers.emplace_back(kPulseLayer);
    }
    if (!result.missing_layers.empty()) {
        return result;
    }

    result.has_color_variables = has_bound_fill(*base) && has_bound_fill(*pulse);
    return result;
}

} // namespace iconsmith
