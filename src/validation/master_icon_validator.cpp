// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "master_icon_validator.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace iconsmith {

namespace {

constexpr double kEpsilon = 1e-6;

bool nearly_equal(double a, double b) {
    return std::fabs(a - b) < kEpsilon;
}

std::string join_sizes(const std::vector<int>& sizes) {
    std::string out;
    for (size_t i = 0; i < sizes.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += std::to_string(sizes[i]) + "px";
    }
    return out;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool has_stroke(const SceneNode& node) {
    return node.has_visible_strokes();
}

} // namespace

MasterIconValidator::MasterIconValidator(IconCategory category, const ValidationPolicy& policy,
                                         std::shared_ptr<spdlog::logger> logger)
    : category_(category), policy_(policy), classifier_(policy.colors), geometry_(logger),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

StrokeVerdict MasterIconValidator::check_stroke_width(double weight) const {
    if (nearly_equal(weight, kRequiredStrokeWidth)) {
        return StrokeVerdict::OK;
    }
    if (category_ == IconCategory::FUNCTIONAL &&
        (nearly_equal(weight, 1.75) || nearly_equal(weight, 1.5))) {
        return StrokeVerdict::WARNING;
    }
    return StrokeVerdict::ERROR;
}

const SceneNode* MasterIconValidator::find_content_holder(const SceneNode& frame) {
    for (const auto& child : frame.children) {
        if (child->kind == NodeKind::FRAME &&
            to_lower(child->name).find("container") != std::string::npos) {
            return child.get();
        }
    }
    return nullptr;
}

ValidationResult MasterIconValidator::validate(const SceneNode& frame) const {
    ValidationResult result;
    logger_->debug("[MasterIconValidator] Validating '{}' as {} ({}x{})", frame.name,
                   icon_category_to_string(category_), frame.width, frame.height);

    validate_frame_size(frame, result);

    if (frame.children.empty()) {
        result.add_error(IssueKind::STRUCTURAL,
                         "Frame is empty<br>Expected: Container frame with icon content",
                         frame.name);
        return result;
    }

    const SceneNode* holder = find_content_holder(frame);
    if (!holder) {
        result.add_error(
            IssueKind::STRUCTURAL,
            "No Container frame found<br>Expected: A frame named \"Container\" with icon content",
            frame.name);
        return result;
    }

    if (holder->name != "Container") {
        result.add_error(IssueKind::STRUCTURAL,
                         fmt::format("Container frame should be named \"Container\"<br>Found: "
                                     "\"{}\"",
                                     holder->name),
                         frame.name);
    }

    if (!nearly_equal(holder->width, frame.width) || !nearly_equal(holder->height, frame.height)) {
        result.add_error(IssueKind::GEOMETRY,
                         fmt::format("Container size mismatch: {}x{}px<br>Expected: {}x{}px (same "
                                     "as parent frame)",
                                     holder->width, holder->height, frame.width, frame.height),
                         frame.name);
    }

    if (holder->children.empty()) {
        result.add_error(IssueKind::STRUCTURAL,
                         "Container is empty<br>Expected: Vector paths or shapes", frame.name);
        return result;
    }

    validate_primitives(frame, *holder, result);

    logger_->debug("[MasterIconValidator] '{}': {} error(s), {} warning(s)", frame.name,
                   result.errors.size(), result.warnings.size());
    return result;
}

void MasterIconValidator::validate_frame_size(const SceneNode& frame,
                                              ValidationResult& result) const {
    if (!nearly_equal(frame.width, frame.height)) {
        result.add_error(IssueKind::GEOMETRY,
                         fmt::format("Frame must be square: {}x{}px<br>Expected: {}x{}px",
                                     frame.width, frame.height, frame.width, frame.width),
                         frame.name);
        return;
    }

    const auto& sizes = ValidationPolicy::sizes_for(category_);
    bool valid = std::any_of(sizes.begin(), sizes.end(), [&frame](int size) {
        return nearly_equal(frame.width, static_cast<double>(size));
    });
    if (!valid) {
        result.add_error(IssueKind::GEOMETRY,
                         fmt::format("Invalid frame size: {}x{}px<br>Expected sizes for {}: {}",
                                     frame.width, frame.height,
                                     icon_category_to_string(category_), join_sizes(sizes)),
                         frame.name);
    }
}

void MasterIconValidator::validate_primitives(const SceneNode& frame, const SceneNode& holder,
                                              ValidationResult& result) const {
    std::vector<PrimitiveRef> primitives = geometry_.find_primitives(holder);
    if (primitives.empty()) {
        result.add_error(IssueKind::STRUCTURAL,
                         "Container has no vector content<br>Expected: Vector paths, shapes, or "
                         "groups containing vectors",
                         frame.name);
        return;
    }

    const double container_size = holder.width;

    for (const auto& ref : primitives) {
        const SceneNode& node = *ref.node;
        const bool stroked = has_stroke(node);
        if (!stroked && !node.has_fills()) {
            logger_->trace("[MasterIconValidator] '{}' has no paint, skipping", node.name);
            continue;
        }

        std::string stroke_problem;
        if (stroked) {
            switch (check_stroke_width(node.stroke_weight)) {
            case StrokeVerdict::OK:
                break;
            case StrokeVerdict::WARNING:
                result.add_warning(IssueKind::GEOMETRY,
                                   fmt::format("Vector \"{}\" has stroke width {}px. Check if the "
                                               "modified stroke width is necessary.",
                                               node.name, node.stroke_weight),
                                   frame.name);
                break;
            case StrokeVerdict::ERROR:
                stroke_problem =
                    category_ == IconCategory::FUNCTIONAL
                        ? fmt::format("incorrect stroke width: {}px<br>Expected: 2px (or 1.75px, "
                                      "1.5px with warning) for functional icons",
                                      node.stroke_weight)
                        : fmt::format("incorrect stroke width: {}px<br>Expected: 2px for "
                                      "illustrative icons",
                                      node.stroke_weight);
                break;
            }
        }

        std::vector<std::string> violations;
        auto info = geometry_.position_info(ref, container_size, &holder);
        if (info) {
            const double min = stroked ? policy_.safety.stroke_min : policy_.safety.fill_min;
            const EdgeDistances& d = info->distances;
            auto check_edge = [&violations, min](const char* edge, double distance) {
                if (distance < min) {
                    violations.push_back(fmt::format(
                        "{} edge is in safety area ({:.2f}px, min: {}px)", edge, distance, min));
                }
            };
            check_edge("left", d.left);
            check_edge("top", d.top);
            check_edge("right", d.right);
            check_edge("bottom", d.bottom);
            result.vector_positions.push_back(std::move(*info));
        }

        if (violations.empty() && stroke_problem.empty()) {
            continue;
        }

        std::string message;
        if (violations.empty()) {
            message = fmt::format("Vector \"{}\" has {}", node.name, stroke_problem);
        } else {
            message = fmt::format("Check position of \"{}\" ({}):", node.name,
                                  stroked ? "stroke" : "fill");
            if (!stroke_problem.empty()) {
                message += "<br>" + stroke_problem;
            }
            for (const auto& v : violations) {
                message += "<br>" + v;
            }
        }
        logger_->debug("[MasterIconValidator] {}", message);
        result.add_error(IssueKind::GEOMETRY, std::move(message), frame.name);
    }

    if (category_ == IconCategory::ILLUSTRATIVE) {
        validate_illustrative_content(frame, holder, primitives, result);
    }
}

void MasterIconValidator::validate_illustrative_content(const SceneNode& frame,
                                                        const SceneNode& holder,
                                                        const std::vector<PrimitiveRef>& primitives,
                                                        ValidationResult& result) const {
    auto cap = policy_.content_cap(category_, frame.width);
    auto bounds = geometry_.content_bounds(primitives, &holder);
    if (cap && bounds) {
        const double width = GeometryAnalyzer::round2(bounds->width);
        const double height = GeometryAnalyzer::round2(bounds->height);
        if (width > *cap || height > *cap) {
            auto emphasize = [cap](double v) {
                return v > *cap ? fmt::format("<strong>{:.2f}px</strong>", v)
                                : fmt::format("{:.2f}px", v);
            };
            result.add_error(IssueKind::GEOMETRY,
                             fmt::format("<strong>Icon size too large:</strong> {} × {}<br>"
                                         "Maximum: {}px × {}px (with {}px safety zone)",
                                         emphasize(width), emphasize(height), *cap, *cap,
                                         policy_.illustrative_inset),
                             frame.name);
        }
    }

    ColorMembership colors;
    for (const auto& ref : primitives) {
        ColorMembership c = classifier_.classify(*ref.node);
        colors.black = colors.black || c.black;
        colors.red = colors.red || c.red;
    }
    if (!colors.black) {
        result.add_warning(IssueKind::GEOMETRY,
                           "<strong>Missing black color</strong><br>Illustrative icons must "
                           "contain both black and red vectors",
                           frame.name);
    }
    if (!colors.red) {
        result.add_warning(IssueKind::GEOMETRY,
                           "<strong>Missing red color</strong><br>Illustrative icons must contain "
                           "both black (or dark gray) and red vectors",
                           frame.name);
    }
}

} // namespace iconsmith
