// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file repair_pipeline.h
 * @brief The outline → union → flatten → colorize → scale → describe sequence
 *
 * The pipeline is a WorkflowOrchestrator filled with one step per processor,
 * preceded by a "Validation" step that re-checks the target and refuses to
 * touch it when geometry errors remain.
 */

#include "color_applicator.h"
#include "description_editor.h"
#include "icon_policy.h"
#include "readiness_validator.h"
#include "scene_host.h"
#include "validation_result.h"
#include "workflow_orchestrator.h"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

namespace iconsmith {

struct RepairOptions {
    IconCategory category = IconCategory::FUNCTIONAL;
    ValidationPolicy policy;
    ColorVariables variables;
    std::optional<DescriptionData> description; ///< Adds the "Description" step when set
};

/**
 * @brief Whether the repair pipeline may run on an icon
 *
 * Structural problems are what the pipeline fixes, so they never block.
 * Geometry errors (size, stroke width, safety zone) and an icon with nothing
 * to repair (empty container, no vector content) do.
 */
bool repair_allowed(const ReadinessReport& readiness, const ValidationResult& master);

class RepairPipeline {
  public:
    RepairPipeline(SceneHost& host, RepairOptions options,
                   std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Append the pipeline's steps for @p target_id to @p orchestrator
     *
     * The target is an icon frame or, for functional icons, a component set.
     * "Scaling" is only added for functional component sets.
     */
    void build(WorkflowOrchestrator& orchestrator, const std::string& target_id);

    /**
     * @brief Build a fresh orchestrator and run it
     */
    WorkflowResult run(const std::string& target_id,
                       const WorkflowProgressCallback& on_progress = nullptr);

    /**
     * @brief Master or icon-set validation of the target's current state
     */
    [[nodiscard]] ValidationResult validate_target(const std::string& target_id) const;

  private:
    SceneHost& host_;
    RepairOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace iconsmith
