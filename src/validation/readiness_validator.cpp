// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "readiness_validator.h"

#include "illustrative_completion.h"

#include <algorithm>
#include <sstream>

namespace iconsmith {

const char* repair_action_to_string(RepairAction action) {
    switch (action) {
    case RepairAction::CREATE_COMPONENT:
        return "create-component";
    case RepairAction::OUTLINE_STROKES:
        return "outline";
    case RepairAction::UNION_BLACK:
        return "union-black";
    case RepairAction::UNION_RED:
        return "union-red";
    case RepairAction::FLATTEN:
        return "flatten";
    }
    return "unknown";
}

bool ReadinessReport::needs(RepairAction action) const {
    return std::find(actions.begin(), actions.end(), action) != actions.end();
}

StructuralReadinessValidator::StructuralReadinessValidator(IconCategory category,
                                                           const ValidationPolicy& policy,
                                                           std::shared_ptr<spdlog::logger> logger)
    : category_(category), classifier_(policy.colors), geometry_(logger),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

ReadinessReport StructuralReadinessValidator::analyze(const SceneNode& container) const {
    ReadinessReport report;

    if (container.children.empty()) {
        report.empty_container = true;
        return report;
    }

    const SceneNode& holder = *container.children.front();
    std::vector<PrimitiveRef> primitives;
    if (is_primitive(holder.kind)) {
        primitives.push_back(PrimitiveRef{&holder, {}});
    } else if (holder.children.empty()) {
        report.empty_container = true;
        return report;
    } else {
        primitives = geometry_.find_primitives(holder);
    }

    if (primitives.empty()) {
        report.no_vector_content = true;
        return report;
    }

    const bool track_red = category_ == IconCategory::ILLUSTRATIVE;
    const SceneNode* black_node = nullptr;
    const SceneNode* red_node = nullptr;

    report.primitive_count = primitives.size();
    for (const auto& ref : primitives) {
        const SceneNode& node = *ref.node;
        if (node.has_visible_strokes()) {
            report.has_strokes = true;
        }

        ColorMembership colors = classifier_.classify(node);
        bool tracked = false;
        if (colors.black) {
            ++report.black_count;
            black_node = &node;
            tracked = true;
        }
        if (track_red && colors.red) {
            ++report.red_count;
            red_node = &node;
            tracked = true;
        }
        if (!tracked) {
            ++report.unclassified_count;
        }
    }

    if (track_red && container.kind == NodeKind::FRAME) {
        report.actions.push_back(RepairAction::CREATE_COMPONENT);
    }
    if (report.has_strokes) {
        report.actions.push_back(RepairAction::OUTLINE_STROKES);
    }
    if (report.black_count > 1) {
        report.actions.push_back(RepairAction::UNION_BLACK);
    }
    if (report.red_count > 1) {
        report.actions.push_back(RepairAction::UNION_RED);
    }

    report.post_union_count = report.unclassified_count + (report.black_count > 0 ? 1 : 0) +
                              (report.red_count > 0 ? 1 : 0);

    // One flattened shape carrying both colors counts once
    bool single_multicolor_shape = report.black_count == 1 && report.red_count == 1 &&
                                   report.unclassified_count == 0 && black_node == red_node;
    if (single_multicolor_shape) {
        report.post_union_count = 1;
    }
    // Separate "Base" and "Pulse" layers are the finished illustrative layout
    bool base_pulse_layers = false;
    if (track_red) {
        IllustrativeCompletion layout = check_illustrative_completion(container);
        base_pulse_layers = layout.has_correct_structure && layout.missing_layers.empty();
    }
    if (report.post_union_count != 1 && !base_pulse_layers) {
        report.actions.push_back(RepairAction::FLATTEN);
    }

    logger_->debug("[ReadinessValidator] '{}': {} primitive(s), black={}, red={}, other={}, "
                   "strokes={}, actions={}",
                   container.name, report.primitive_count, report.black_count, report.red_count,
                   report.unclassified_count, report.has_strokes, report.actions.size());
    return report;
}

std::string StructuralReadinessValidator::checklist_message(const ReadinessReport& report) const {
    std::ostringstream msg;
    msg << "Please prepare your " << icon_category_to_string(category_) << " icon:";
    for (RepairAction action : report.actions) {
        msg << "<br>";
        switch (action) {
        case RepairAction::CREATE_COMPONENT:
            msg << "➔ Create component (icon is a frame)";
            break;
        case RepairAction::OUTLINE_STROKES:
            msg << "➔ Outline Stroke (strokes not converted)";
            break;
        case RepairAction::UNION_BLACK:
            msg << "➔ Union black shapes (" << report.black_count << " found)";
            break;
        case RepairAction::UNION_RED:
            msg << "➔ Union red shapes (" << report.red_count << " found)";
            break;
        case RepairAction::FLATTEN:
            msg << "➔ Flatten Selection (" << report.post_union_count
                << " separate shapes, expected 1)";
            break;
        }
    }
    return msg.str();
}

ValidationResult StructuralReadinessValidator::validate(const SceneNode& container) const {
    ValidationResult result;
    ReadinessReport report = analyze(container);

    if (report.empty_container) {
        result.add_error(IssueKind::STRUCTURAL,
                         "Icon has an empty container<br>Expected: Vector paths or shapes",
                         container.name);
    } else if (report.no_vector_content) {
        result.add_error(IssueKind::STRUCTURAL,
                         "Container has no vector content<br>Expected: Vector paths, shapes, or "
                         "groups containing vectors",
                         container.name);
    } else if (!report.actions.empty()) {
        result.add_error(IssueKind::STRUCTURAL, checklist_message(report), container.name);
    }

    logger_->debug("[ReadinessValidator] '{}' ready: {}", container.name, result.is_valid());
    return result;
}

} // namespace iconsmith
