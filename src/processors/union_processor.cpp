// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "union_processor.h"

#include "geometry_analyzer.h"
#include "icon_errors.h"

#include <vector>

namespace iconsmith {

UnionProcessor::UnionProcessor(SceneHost& host, IconCategory category,
                               const ColorThresholds& colors,
                               std::shared_ptr<spdlog::logger> logger)
    : host_(host), category_(category), classifier_(colors),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

size_t UnionProcessor::process(const std::string& target_id) {
    size_t unions = 0;
    try {
        GeometryAnalyzer geometry(logger_);
        for (const auto& icon_id : icon_ids_of(require_node(host_, target_id))) {
            const SceneNode* holder = content_holder_of(require_node(host_, icon_id));
            if (!holder) {
                logger_->warn("[UnionProcessor] No container in {}, skipping", icon_id);
                continue;
            }

            const std::string holder_id = holder->id;
            std::vector<std::string> black;
            std::vector<std::string> red;
            for (const auto& ref : geometry.find_primitives(*holder)) {
                ColorMembership colors = classifier_.classify(*ref.node);
                if (colors.black && colors.red) {
                    continue;
                }
                if (colors.black) {
                    black.push_back(ref.node->id);
                } else if (colors.red && category_ == IconCategory::ILLUSTRATIVE) {
                    red.push_back(ref.node->id);
                }
            }

            if (black.size() > 1) {
                host_.union_nodes(black, holder_id);
                ++unions;
            }
            if (red.size() > 1) {
                host_.union_nodes(red, holder_id);
                ++unions;
            }
            logger_->debug("[UnionProcessor] {}: black={}, red={}", icon_id, black.size(),
                           red.size());
        }
    } catch (const std::exception& e) {
        throw ProcessingError(std::string("Failed to union shapes: ") + e.what());
    }
    return unions;
}

} // namespace iconsmith
