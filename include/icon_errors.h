// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <stdexcept>
#include <string>

namespace iconsmith {

/**
 * @brief A repair step could not complete
 *
 * Thrown by processors and the scene host; the workflow orchestrator turns it
 * into a failed WorkflowResult.
 */
class ProcessingError : public std::runtime_error {
  public:
    explicit ProcessingError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A scene snapshot document is malformed
 */
class SceneParseError : public std::runtime_error {
  public:
    explicit SceneParseError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace iconsmith
