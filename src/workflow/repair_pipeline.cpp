// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "repair_pipeline.h"

#include "flatten_processor.h"
#include "icon_errors.h"
#include "icon_set_validator.h"
#include "master_icon_validator.h"
#include "outline_processor.h"
#include "scale_processor.h"
#include "union_processor.h"

#include <algorithm>

namespace iconsmith {

bool repair_allowed(const ReadinessReport& readiness, const ValidationResult& master) {
    if (readiness.empty_container || readiness.no_vector_content) {
        return false;
    }
    return !master.has_errors_of(IssueKind::GEOMETRY);
}

RepairPipeline::RepairPipeline(SceneHost& host, RepairOptions options,
                               std::shared_ptr<spdlog::logger> logger)
    : host_(host), options_(std::move(options)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

ValidationResult RepairPipeline::validate_target(const std::string& target_id) const {
    const SceneNode& target = require_node(host_, target_id);
    if (target.kind == NodeKind::COMPONENT_SET) {
        return IconSetValidator(options_.policy, logger_).validate(target);
    }
    return MasterIconValidator(options_.category, options_.policy, logger_).validate(target);
}

void RepairPipeline::build(WorkflowOrchestrator& orchestrator, const std::string& target_id) {
    orchestrator.add_step("Validation", [this, target_id]() {
        ValidationResult result = validate_target(target_id);
        auto blocking = std::find_if(
            result.errors.begin(), result.errors.end(),
            [](const ValidationIssue& issue) { return issue.kind != IssueKind::STRUCTURAL; });
        if (blocking != result.errors.end()) {
            throw ProcessingError("Validation failed: " + blocking->message);
        }
    });

    orchestrator.add_step("Outline Conversion", [this, target_id]() {
        OutlineProcessor(host_, logger_).process(target_id);
    });

    orchestrator.add_step("Union", [this, target_id]() {
        UnionProcessor(host_, options_.category, options_.policy.colors, logger_)
            .process(target_id);
    });

    orchestrator.add_step("Flatten", [this, target_id]() {
        FlattenProcessor(host_, logger_).process(target_id);
    });

    orchestrator.add_step("Color Application", [this, target_id]() {
        ColorApplicator(host_, options_.category, options_.variables, options_.policy.colors,
                        logger_)
            .process(target_id);
    });

    // A missing target is reported by the Validation step
    const SceneNode* target = host_.find_node(target_id);
    if (options_.category == IconCategory::FUNCTIONAL && target &&
        target->kind == NodeKind::COMPONENT_SET) {
        orchestrator.add_step("Scaling", [this, target_id]() {
            ScaleProcessor(host_, logger_).process(target_id);
        });
    }

    if (options_.description) {
        orchestrator.add_step("Description", [this, target_id]() {
            DescriptionEditor(options_.category).update(host_, target_id, *options_.description);
        });
    }

    logger_->debug("[RepairPipeline] {} step(s) queued for {}", orchestrator.step_count(),
                   target_id);
}

WorkflowResult RepairPipeline::run(const std::string& target_id,
                                   const WorkflowProgressCallback& on_progress) {
    WorkflowOrchestrator orchestrator(logger_);
    build(orchestrator, target_id);
    return orchestrator.run(on_progress);
}

} // namespace iconsmith
