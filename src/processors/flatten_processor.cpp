// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "flatten_processor.h"

#include "icon_errors.h"

#include <algorithm>
#include <limits>
#include <vector>

namespace iconsmith {

FlattenProcessor::FlattenProcessor(SceneHost& host, std::shared_ptr<spdlog::logger> logger)
    : host_(host), logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

size_t FlattenProcessor::process(const std::string& target_id) {
    size_t flattened = 0;
    try {
        for (const auto& icon_id : icon_ids_of(require_node(host_, target_id))) {
            const SceneNode* holder = content_holder_of(require_node(host_, icon_id));
            if (!holder || holder->children.empty()) {
                logger_->warn("[FlattenProcessor] Nothing to flatten in {}", icon_id);
                continue;
            }

            const std::string holder_id = holder->id;
            if (holder->children.size() == 1 && is_primitive(holder->children.front()->kind) &&
                holder->children.front()->kind != NodeKind::BOOLEAN_OPERATION) {
                host_.rename_node(holder->children.front()->id, kFlattenedName);
                continue;
            }

            std::vector<std::string> ids;
            double min_x = std::numeric_limits<double>::infinity();
            double min_y = std::numeric_limits<double>::infinity();
            for (const auto& child : holder->children) {
                ids.push_back(child->id);
                if (child->has_position()) {
                    min_x = std::min(min_x, *child->x);
                    min_y = std::min(min_y, *child->y);
                }
            }

            std::string vector_id = host_.flatten_nodes(ids, holder_id);
            host_.rename_node(vector_id, kFlattenedName);
            if (min_x != std::numeric_limits<double>::infinity()) {
                host_.move_node(vector_id, min_x, min_y);
            }
            ++flattened;
            logger_->debug("[FlattenProcessor] {}: flattened {} node(s) into {}", icon_id,
                           ids.size(), vector_id);
        }
    } catch (const std::exception& e) {
        throw ProcessingError(std::string("Failed to flatten: ") + e.what());
    }
    return flattened;
}

} // namespace iconsmith
