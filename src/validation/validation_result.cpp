// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "validation_result.h"

#include <algorithm>

using json = nlohmann::json;

namespace iconsmith {

const char* issue_kind_to_string(IssueKind kind) {
    switch (kind) {
    case IssueKind::STRUCTURAL:
        return "structural";
    case IssueKind::GEOMETRY:
        return "geometry";
    case IssueKind::NAME:
        return "name";
    }
    return "geometry";
}

void ValidationResult::add_error(IssueKind kind, std::string message,
                                 std::optional<std::string> node) {
    errors.push_back(ValidationIssue{kind, std::move(message), std::move(node)});
}

void ValidationResult::add_warning(IssueKind kind, std::string message,
                                   std::optional<std::string> node) {
    warnings.push_back(ValidationIssue{kind, std::move(message), std::move(node)});
}

void ValidationResult::merge(const ValidationResult& other) {
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    vector_positions.insert(vector_positions.end(), other.vector_positions.begin(),
                            other.vector_positions.end());
}

bool ValidationResult::has_errors_of(IssueKind kind) const {
    return std::any_of(errors.begin(), errors.end(),
                       [kind](const ValidationIssue& issue) { return issue.kind == kind; });
}

namespace {

json issue_to_json(const ValidationIssue& issue) {
    json j = {{"message", issue.message}};
    if (issue.node) {
        j["node"] = *issue.node;
    }
    return j;
}

} // namespace

json to_json(const VectorPositionInfo& info) {
    json j = {{"name", info.name},
              {"x", info.x},
              {"y", info.y},
              {"relativeX", info.relative_x},
              {"relativeY", info.relative_y},
              {"width", info.width},
              {"height", info.height},
              {"distanceFromEdges",
               {{"left", info.distances.left},
                {"top", info.distances.top},
                {"right", info.distances.right},
                {"bottom", info.distances.bottom}}},
              {"isInFrame", info.is_in_frame},
              {"layerPath", info.layer_path}};
    if (info.stroke_weight) {
        j["strokeWeight"] = *info.stroke_weight;
    }
    if (info.is_in_frame) {
        j["parentFrameName"] = info.parent_frame_name;
    }
    return j;
}

json ValidationResult::to_json() const {
    json j;
    j["isValid"] = is_valid();

    j["errors"] = json::array();
    for (const auto& e : errors) {
        j["errors"].push_back(issue_to_json(e));
    }

    if (!warnings.empty()) {
        j["warnings"] = json::array();
        for (const auto& w : warnings) {
            json wj = issue_to_json(w);
            wj["canProceed"] = true;
            j["warnings"].push_back(std::move(wj));
        }
    }

    if (!vector_positions.empty()) {
        j["vectorPositions"] = json::array();
        for (const auto& p : vector_positions) {
            j["vectorPositions"].push_back(iconsmith::to_json(p));
        }
    }
    return j;
}

} // namespace iconsmith
