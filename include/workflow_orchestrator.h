// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file workflow_orchestrator.h
 * @brief Sequential runner for named repair steps
 *
 * Steps run strictly in insertion order, one at a time. The first step that
 * throws stops the run; later steps never execute. Work already done by
 * earlier steps is left in place (there is no rollback).
 *
 * @threading run() executes on the calling thread. run_async() executes the
 * same sequence on one worker thread; the orchestrator must outlive the
 * returned future and must not be modified while it is pending.
 */

#include <spdlog/spdlog.h>

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace iconsmith {

/**
 * @brief Progress callback, invoked before each step starts
 * @param step_name Name of the step about to run
 * @param index 1-based position of the step
 * @param total Number of steps in the run
 */
using WorkflowProgressCallback =
    std::function<void(const std::string& step_name, int index, int total)>;

/// A step signals failure by throwing
using WorkflowStepFn = std::function<void()>;

struct WorkflowStep {
    std::string name;
    WorkflowStepFn execute;
};

struct WorkflowResult {
    bool success = true;
    std::vector<std::string> completed_steps;
    std::optional<std::string> failed_step;
    std::optional<std::string> error;

    /// `{success, completedSteps, failedStep?, error?}`
    [[nodiscard]] nlohmann::json to_json() const;
};

/// Progress message `{step, index, total}`
nlohmann::json progress_to_json(const std::string& step_name, int index, int total);

class WorkflowOrchestrator {
  public:
    explicit WorkflowOrchestrator(
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /// Append a step to the end of the queue
    void add_step(std::string name, WorkflowStepFn execute);

    /**
     * @brief Execute every step in order, stopping at the first failure
     *
     * Exceptions thrown by a step never escape; they become the result's
     * error string (`what()` for std::exception, the text itself for thrown
     * strings).
     */
    WorkflowResult run(const WorkflowProgressCallback& on_progress = nullptr) const;

    /**
     * @brief run() on a worker thread
     */
    [[nodiscard]] std::future<WorkflowResult>
    run_async(WorkflowProgressCallback on_progress = nullptr) const;

    /// Remove all steps so the orchestrator can be reused
    void clear();

    [[nodiscard]] size_t step_count() const {
        return steps_.size();
    }

    [[nodiscard]] std::vector<std::string> step_names() const;

  private:
    std::vector<WorkflowStep> steps_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace iconsmith
