// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "workflow_orchestrator.h"

#include <exception>
#include <stdexcept>

using json = nlohmann::json;

namespace iconsmith {

json WorkflowResult::to_json() const {
    json j = {{"success", success}, {"completedSteps", completed_steps}};
    if (failed_step) {
        j["failedStep"] = *failed_step;
    }
    if (error) {
        j["error"] = *error;
    }
    return j;
}

json progress_to_json(const std::string& step_name, int index, int total) {
    return {{"step", step_name}, {"index", index}, {"total", total}};
}

WorkflowOrchestrator::WorkflowOrchestrator(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

void WorkflowOrchestrator::add_step(std::string name, WorkflowStepFn execute) {
    steps_.push_back(WorkflowStep{std::move(name), std::move(execute)});
}

void WorkflowOrchestrator::clear() {
    steps_.clear();
}

std::vector<std::string> WorkflowOrchestrator::step_names() const {
    std::vector<std::string> names;
    names.reserve(steps_.size());
    for (const auto& step : steps_) {
        names.push_back(step.name);
    }
    return names;
}

WorkflowResult WorkflowOrchestrator::run(const WorkflowProgressCallback& on_progress) const {
    WorkflowResult result;
    const int total = static_cast<int>(steps_.size());

    logger_->debug("[Workflow] Starting run with {} step(s)", total);

    for (int i = 0; i < total; ++i) {
        const WorkflowStep& step = steps_[static_cast<size_t>(i)];

        if (on_progress) {
            on_progress(step.name, i + 1, total);
        }

        std::optional<std::string> failure;
        try {
            if (!step.execute) {
                throw std::logic_error("step has no operation");
            }
            step.execute();
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (const std::string& s) {
            failure = s;
        } catch (const char* s) {
            failure = s ? std::string(s) : std::string("unknown error");
        } catch (...) {
            failure = "unknown error";
        }

        if (failure) {
            logger_->warn("[Workflow] Step '{}' ({}/{}) failed: {}", step.name, i + 1, total,
                          *failure);
            result.success = false;
            result.failed_step = step.name;
            result.error = std::move(failure);
            return result;
        }

        logger_->debug("[Workflow] Step '{}' ({}/{}) done", step.name, i + 1, total);
        result.completed_steps.push_back(step.name);
    }

    logger_->info("[Workflow] Completed {} step(s)", total);
    return result;
}

std::future<WorkflowResult>
WorkflowOrchestrator::run_async(WorkflowProgressCallback on_progress) const {
    return std::async(std::launch::async,
                      [this, on_progress = std::move(on_progress)]() { return run(on_progress); });
}

} // namespace iconsmith
