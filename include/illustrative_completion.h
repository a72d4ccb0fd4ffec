// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file illustrative_completion.h
 * @brief Detects an illustrative icon that has already been handed over
 *
 * A finished illustrative icon is a component laid out as
 * Component > Container > "Vectors" > "Base" + "Pulse", with a color
 * variable bound to a solid fill of both layers.
 */

#include "scene_node.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace iconsmith {

extern const char* const kVectorsLayer;
extern const char* const kBaseLayer;
extern const char* const kPulseLayer;

struct IllustrativeCompletion {
    bool is_component = false;
    bool has_correct_structure = false; ///< Container holds a "Vectors" group or frame
    bool has_color_variables = false;   ///< Base and Pulse both carry a bound variable
    std::vector<std::string> missing_layers;

    [[nodiscard]] bool complete() const {
        return is_component && has_correct_structure && missing_layers.empty() &&
               has_color_variables;
    }

    /// `{isComplete, hasCorrectStructure, hasColorVariables, missingLayers}`
    [[nodiscard]] nlohmann::json to_json() const;
};

IllustrativeCompletion check_illustrative_completion(const SceneNode& icon);

inline bool is_illustrative_icon_complete(const SceneNode& icon) {
    return check_illustrative_completion(icon).complete();
}

} // namespace iconsmith
