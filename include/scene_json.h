// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file scene_json.h
 * @brief JSON encoding of scene snapshots
 *
 * Field names follow the host's node API: `type` (upper-case tag), `name`,
 * `x`, `y`, `width`, `height`, `fills` (array of paints or the string
 * "mixed"), `strokes`, `strokeWeight`, `absoluteBoundingBox`,
 * `absoluteRenderBounds`, `description`, `children`.
 */

#include "scene_node.h"

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace iconsmith {

/**
 * @brief Build a node tree from JSON
 * @throws SceneParseError on missing or mistyped fields
 */
std::unique_ptr<SceneNode> scene_node_from_json(const nlohmann::json& j);

nlohmann::json scene_node_to_json(const SceneNode& node);

/**
 * @brief Read and parse a scene snapshot file
 * @throws SceneParseError if the file cannot be read or parsed
 */
std::unique_ptr<SceneNode> load_scene_file(const std::string& path);

} // namespace iconsmith
