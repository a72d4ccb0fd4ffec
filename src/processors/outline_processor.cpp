// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "outline_processor.h"

#include "geometry_analyzer.h"
#include "icon_errors.h"

#include <vector>

namespace iconsmith {

OutlineProcessor::OutlineProcessor(SceneHost& host, std::shared_ptr<spdlog::logger> logger)
    : host_(host), logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

size_t OutlineProcessor::process(const std::string& target_id) {
    size_t outlined = 0;
    try {
        GeometryAnalyzer geometry(logger_);
        for (const auto& icon_id : icon_ids_of(require_node(host_, target_id))) {
            const SceneNode* holder = content_holder_of(require_node(host_, icon_id));
            if (!holder) {
                logger_->warn("[OutlineProcessor] No container in {}, skipping", icon_id);
                continue;
            }

            // Collect first; outlining replaces nodes in the host tree
            std::vector<std::string> stroked;
            for (const auto& ref : geometry.find_primitives(*holder)) {
                if (ref.node->has_visible_strokes()) {
                    stroked.push_back(ref.node->id);
                }
            }

            for (const auto& id : stroked) {
                host_.outline_stroke(id);
                ++outlined;
            }
            logger_->debug("[OutlineProcessor] {}: outlined {} primitive(s)", icon_id,
                           stroked.size());
        }
    } catch (const std::exception& e) {
        throw ProcessingError(std::string("Failed to convert outlines: ") + e.what());
    }
    return outlined;
}

} // namespace iconsmith
