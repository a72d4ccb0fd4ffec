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
 * @brief Collapses each icon's content into a single node named "Vector"
 *
 * The flattened node keeps the top-left corner of the shapes it replaced.
 */
class FlattenProcessor {
  public:
    static constexpr const char* kFlattenedName = "Vector";

    explicit FlattenProcessor(SceneHost& host,
                              std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @return Number of icons flattened
     * @throws ProcessingError when the host rejects an operation
     */
    size_t process(const std::string& target_id);

  private:
    SceneHost& host_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace iconsmith
