// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "color_classifier.h"
#include "icon_policy.h"
#include "scene_host.h"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>

namespace iconsmith {

class Config;

/// Design-token variable keys bound by the color applicator
struct ColorVariables {
    std::string base;  ///< Black shapes
    std::string pulse; ///< Red shapes (illustrative only)

    /// Read `/variables/base` and `/variables/pulse`
    static ColorVariables from_config(Config& config);
};

/**
 * @brief Binds icon fills to the design-system color variables
 *
 * Functional icons bind every filled primitive to the base variable.
 * Illustrative icons bind black shapes to base and red shapes to pulse;
 * shapes showing both or neither color are left untouched.
 */
class ColorApplicator {
  public:
    ColorApplicator(SceneHost& host, IconCategory category, ColorVariables variables,
                    const ColorThresholds& colors = {},
                    std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @return Number of primitives bound
     * @throws ProcessingError when a variable key is missing or the host fails
     */
    size_t process(const std::string& target_id);

  private:
    SceneHost& host_;
    IconCategory category_;
    ColorVariables variables_;
    ColorClassifier classifier_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace iconsmith
