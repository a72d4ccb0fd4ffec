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

/**
 * @brief Boolean-unions same-color shapes of each icon
 *
 * Functional icons union their black shapes; illustrative icons union black
 * and red shapes separately. Shapes showing both colors are left alone.
 */
class UnionProcessor {
  public:
    UnionProcessor(SceneHost& host, IconCategory category, const ColorThresholds& colors = {},
                   std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @return Number of union operations issued
     * @throws ProcessingError when the host rejects an operation
     */
    size_t process(const std::string& target_id);

  private:
    SceneHost& host_;
    IconCategory category_;
    ColorClassifier classifier_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace iconsmith
