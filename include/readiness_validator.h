// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file readiness_validator.h
 * @brief Detects which repair steps an icon still needs
 *
 * An icon is "ready" when its content holder contains exactly one outlined
 * primitive per tracked color (or one flattened multi-color shape). Anything
 * else is reported as an ordered checklist of repair actions: outline
 * strokes, union same-color shapes, flatten what is left. An illustrative
 * icon handed over as a frame must also be turned into a component first.
 */

#include "color_classifier.h"
#include "geometry_analyzer.h"
#include "icon_policy.h"
#include "validation_result.h"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <vector>

namespace iconsmith {

enum class RepairAction {
    CREATE_COMPONENT, ///< Illustrative icon is still a plain frame
    OUTLINE_STROKES,
    UNION_BLACK,
    UNION_RED,
    FLATTEN,
};

const char* repair_action_to_string(RepairAction action);

/**
 * @brief Structured readiness state of one icon
 */
struct ReadinessReport {
    bool empty_container = false;   ///< Terminal
    bool no_vector_content = false; ///< Terminal
    bool has_strokes = false;
    size_t primitive_count = 0;
    size_t black_count = 0;
    size_t red_count = 0;
    size_t unclassified_count = 0; ///< Primitives in no tracked group
    size_t post_union_count = 0;   ///< Shapes left once every group is unioned
    std::vector<RepairAction> actions;

    [[nodiscard]] bool ready() const {
        return !empty_container && !no_vector_content && actions.empty();
    }

    [[nodiscard]] bool needs(RepairAction action) const;
};

/**
 * @brief Structural readiness validator
 *
 * Functional icons track the black group, illustrative icons track black and
 * red. Never throws; all findings are returned as data.
 *
 * @code
 * StructuralReadinessValidator validator(IconCategory::FUNCTIONAL);
 * ValidationResult result = validator.validate(frame);
 * @endcode
 */
class StructuralReadinessValidator {
  public:
    explicit StructuralReadinessValidator(
        IconCategory category, const ValidationPolicy& policy = {},
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Compute the readiness report
     * @param container Icon frame; its first child is the content holder
     */
    [[nodiscard]] ReadinessReport analyze(const SceneNode& container) const;

    /**
     * @brief Readiness as a ValidationResult
     *
     * Terminal states give one error each; otherwise every pending action is
     * combined into a single checklist message.
     */
    [[nodiscard]] ValidationResult validate(const SceneNode& container) const;

    [[nodiscard]] IconCategory category() const {
        return category_;
    }

  private:
    [[nodiscard]] std::string checklist_message(const ReadinessReport& report) const;

    IconCategory category_;
    ColorClassifier classifier_;
    GeometryAnalyzer geometry_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace iconsmith
