// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file master_icon_validator.h
 * @brief Size, stroke-width and safety-zone rules for a master icon frame
 *
 * Checks run in a fixed order:
 * 1. Frame is square and its size is valid for the category
 * 2. A content holder frame named "Container" exists, same size as the frame
 * 3. The content holder contains at least one primitive
 * 4. Stroke width of every stroked primitive
 * 5. Safety-zone clearance of every painted primitive
 *
 * Stroke and position problems of one primitive are merged into a single
 * message listing every violated edge.
 */

#include "color_classifier.h"
#include "geometry_analyzer.h"
#include "icon_policy.h"
#include "validation_result.h"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace iconsmith {

enum class StrokeVerdict {
    OK,
    WARNING, ///< Tolerated deviation (functional 1.75px / 1.5px)
    ERROR,
};

class MasterIconValidator {
  public:
    explicit MasterIconValidator(IconCategory category, const ValidationPolicy& policy = {},
                                 std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Validate a master icon frame
     *
     * Never throws. Position snapshots of every placed primitive are returned
     * in ValidationResult::vector_positions.
     */
    [[nodiscard]] ValidationResult validate(const SceneNode& frame) const;

    /// Stroke width policy for this validator's category
    [[nodiscard]] StrokeVerdict check_stroke_width(double weight) const;

    /**
     * @brief First FRAME child whose name contains "container" (any case)
     * @return Content holder, or nullptr
     */
    [[nodiscard]] static const SceneNode* find_content_holder(const SceneNode& frame);

  private:
    void validate_frame_size(const SceneNode& frame, ValidationResult& result) const;
    void validate_primitives(const SceneNode& frame, const SceneNode& holder,
                             ValidationResult& result) const;
    void validate_illustrative_content(const SceneNode& frame, const SceneNode& holder,
                                       const std::vector<PrimitiveRef>& primitives,
                                       ValidationResult& result) const;

    IconCategory category_;
    ValidationPolicy policy_;
    ColorClassifier classifier_;
    GeometryAnalyzer geometry_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace iconsmith
