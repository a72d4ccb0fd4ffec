// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "scene_host.h"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>

namespace iconsmith {

/**
 * @brief Converts every stroked primitive of an icon (or icon set) to fills
 */
class OutlineProcessor {
  public:
    explicit OutlineProcessor(SceneHost& host,
                              std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Outline all stroked primitives below @p target_id
     * @return Number of primitives outlined
     * @throws ProcessingError when the host rejects an operation
     */
    size_t process(const std::string& target_id);

  private:
    SceneHost& host_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace iconsmith
