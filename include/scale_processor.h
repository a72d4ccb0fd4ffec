// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "scene_host.h"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace iconsmith {

/**
 * @brief Completes a functional icon set by scaling existing variants
 *
 * Every size missing for a variant type is created from the nearest larger
 * hand-drawn size of the same type: the source is cloned, resized, its
 * content rescaled by `target / source` (positions included) and renamed to
 * `Size=<n>, Variant=<type>`.
 */
class ScaleProcessor {
  public:
    explicit ScaleProcessor(SceneHost& host,
                            std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @param icon_set_id Component set holding the variants
     * @return Number of variants created
     * @throws ProcessingError if the target is not a component set or the host fails
     */
    size_t process(const std::string& icon_set_id);

    /**
     * @brief Smallest size in @p existing that is larger than @p target
     */
    static std::optional<int> nearest_larger(const std::vector<int>& existing, int target);

  private:
    void create_scaled(const std::string& source_id, int source_size, int target_size,
                       const std::string& variant_type);

    SceneHost& host_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace iconsmith
