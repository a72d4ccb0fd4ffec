// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scene_json.h"

#include "icon_errors.h"

#include <spdlog/spdlog.h>

#include <fstream>

using json = nlohmann::json;

namespace iconsmith {

namespace {

std::string where(const json& j) {
    if (j.is_object() && j.contains("name") && j["name"].is_string()) {
        return " in node '" + j["name"].get<std::string>() + "'";
    }
    return "";
}

double number_field(const json& j, const char* key, double fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j[key].is_number()) {
        throw SceneParseError(std::string("Field '") + key + "' must be a number" + where(j));
    }
    return j[key].get<double>();
}

std::string string_field(const json& j, const char* key, const std::string& fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j[key].is_string()) {
        throw SceneParseError(std::string("Field '") + key + "' must be a string" + where(j));
    }
    return j[key].get<std::string>();
}

bool bool_field(const json& j, const char* key, bool fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j[key].is_boolean()) {
        throw SceneParseError(std::string("Field '") + key + "' must be a boolean" + where(j));
    }
    return j[key].get<bool>();
}

Paint paint_from_json(const json& j) {
    if (!j.is_object()) {
        throw SceneParseError("Paint must be an object");
    }
    Paint paint;
    paint.type =
        string_field(j, "type", "SOLID") == "SOLID" ? PaintType::SOLID : PaintType::OTHER;
    paint.visible = bool_field(j, "visible", true);
    paint.bound_variable = string_field(j, "boundVariable", "");
    if (j.contains("color")) {
        const json& c = j["color"];
        paint.color = RGB{number_field(c, "r", 0.0), number_field(c, "g", 0.0),
                          number_field(c, "b", 0.0)};
    }
    return paint;
}

json paint_to_json(const Paint& paint) {
    json j = {{"type", paint.type == PaintType::SOLID ? "SOLID" : "OTHER"},
              {"color", {{"r", paint.color.r}, {"g", paint.color.g}, {"b", paint.color.b}}},
              {"visible", paint.visible}};
    if (!paint.bound_variable.empty()) {
        j["boundVariable"] = paint.bound_variable;
    }
    return j;
}

std::vector<Paint> paints_from_json(const json& j, const char* key) {
    if (!j[key].is_array()) {
        throw SceneParseError(std::string("Field '") + key + "' must be an array" + where(j));
    }
    std::vector<Paint> paints;
    for (const auto& p : j[key]) {
        paints.push_back(paint_from_json(p));
    }
    return paints;
}

std::optional<Bounds> bounds_from_json(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    const json& b = j[key];
    if (!b.is_object()) {
        throw SceneParseError(std::string("Field '") + key + "' must be an object" + where(j));
    }
    return Bounds{number_field(b, "x", 0.0), number_field(b, "y", 0.0),
                  number_field(b, "width", 0.0), number_field(b, "height", 0.0)};
}

json bounds_to_json(const Bounds& b) {
    return {{"x", b.x}, {"y", b.y}, {"width", b.width}, {"height", b.height}};
}

} // namespace

std::unique_ptr<SceneNode> scene_node_from_json(const json& j) {
    if (!j.is_object()) {
        throw SceneParseError("Scene node must be a JSON object");
    }
    if (!j.contains("type") || !j["type"].is_string()) {
        throw SceneParseError("Scene node is missing a string 'type'" + where(j));
    }

    auto node = std::make_unique<SceneNode>(node_kind_from_string(j["type"].get<std::string>()),
                                            string_field(j, "name", ""));
    node->id = string_field(j, "id", "");
    node->width = number_field(j, "width", 0.0);
    node->height = number_field(j, "height", 0.0);
    if (j.contains("x") && j.contains("y")) {
        node->x = number_field(j, "x", 0.0);
        node->y = number_field(j, "y", 0.0);
    }

    if (j.contains("fills")) {
        const json& fills = j["fills"];
        if (fills.is_string() && fills.get<std::string>() == "mixed") {
            node->fills = FillSet::make_mixed();
        } else {
            FillSet set;
            set.paints = paints_from_json(j, "fills");
            node->fills = std::move(set);
        }
    }
    if (j.contains("strokes")) {
        node->strokes = paints_from_json(j, "strokes");
    }
    node->stroke_weight = number_field(j, "strokeWeight", 0.0);
    node->absolute_bounding_box = bounds_from_json(j, "absoluteBoundingBox");
    node->absolute_render_bounds = bounds_from_json(j, "absoluteRenderBounds");
    node->description = string_field(j, "description", "");

    if (j.contains("children")) {
        if (!j["children"].is_array()) {
            throw SceneParseError("Field 'children' must be an array" + where(j));
        }
        for (const auto& child : j["children"]) {
            node->add_child(scene_node_from_json(child));
        }
    }
    return node;
}

json scene_node_to_json(const SceneNode& node) {
    json j = {{"type", node_kind_to_string(node.kind)},
              {"name", node.name},
              {"width", node.width},
              {"height", node.height}};
    if (!node.id.empty()) {
        j["id"] = node.id;
    }
    if (node.has_position()) {
        j["x"] = *node.x;
        j["y"] = *node.y;
    }
    if (node.fills) {
        if (node.fills->mixed) {
            j["fills"] = "mixed";
        } else {
            j["fills"] = json::array();
            for (const auto& p : node.fills->paints) {
                j["fills"].push_back(paint_to_json(p));
            }
        }
    }
    if (!node.strokes.empty()) {
        j["strokes"] = json::array();
        for (const auto& p : node.strokes) {
            j["strokes"].push_back(paint_to_json(p));
        }
        j["strokeWeight"] = node.stroke_weight;
    }
    if (node.absolute_bounding_box) {
        j["absoluteBoundingBox"] = bounds_to_json(*node.absolute_bounding_box);
    }
    if (node.absolute_render_bounds) {
        j["absoluteRenderBounds"] = bounds_to_json(*node.absolute_render_bounds);
    }
    if (!node.description.empty()) {
        j["description"] = node.description;
    }
    if (!node.children.empty()) {
        j["children"] = json::array();
        for (const auto& child : node.children) {
            j["children"].push_back(scene_node_to_json(*child));
        }
    }
    return j;
}

std::unique_ptr<SceneNode> load_scene_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw SceneParseError("Cannot open scene file: " + path);
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::exception& e) {
        throw SceneParseError("Invalid JSON in " + path + ": " + e.what());
    }

    spdlog::debug("[SceneJson] Loaded {}", path);
    // Accept either a bare node or a {"root": node} document
    if (doc.is_object() && doc.contains("root") && !doc.contains("type")) {
        return scene_node_from_json(doc["root"]);
    }
    return scene_node_from_json(doc);
}

} // namespace iconsmith
