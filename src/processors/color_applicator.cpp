// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "color_applicator.h"

#include "config.h"
#include "geometry_analyzer.h"
#include "icon_errors.h"

#include <utility>
#include <vector>

namespace iconsmith {

ColorVariables ColorVariables::from_config(Config& config) {
    ColorVariables vars;
    vars.base = config.get<std::string>("/variables/base", "");
    vars.pulse = config.get<std::string>("/variables/pulse", "");
    return vars;
}

ColorApplicator::ColorApplicator(SceneHost& host, IconCategory category, ColorVariables variables,
                                 const ColorThresholds& colors,
                                 std::shared_ptr<spdlog::logger> logger)
    : host_(host), category_(category), variables_(std::move(variables)), classifier_(colors),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

size_t ColorApplicator::process(const std::string& target_id) {
    if (variables_.base.empty()) {
        throw ProcessingError("Failed to apply colors: no base color variable configured");
    }
    if (category_ == IconCategory::ILLUSTRATIVE && variables_.pulse.empty()) {
        throw ProcessingError("Failed to apply colors: no pulse color variable configured");
    }

    size_t bound = 0;
    try {
        GeometryAnalyzer geometry(logger_);
        for (const auto& icon_id : icon_ids_of(require_node(host_, target_id))) {
            const SceneNode* holder = content_holder_of(require_node(host_, icon_id));
            if (!holder) {
                logger_->warn("[ColorApplicator] No container in {}, skipping", icon_id);
                continue;
            }

            std::vector<std::pair<std::string, std::string>> bindings;
            for (const auto& ref : geometry.find_primitives(*holder)) {
                const SceneNode& node = *ref.node;
                if (!node.has_fills()) {
                    continue;
                }
                if (category_ == IconCategory::FUNCTIONAL) {
                    bindings.emplace_back(node.id, variables_.base);
                    continue;
                }

                ColorMembership colors = classifier_.classify(node);
                if (colors.black && colors.red) {
                    logger_->warn("[ColorApplicator] '{}' shows black and red, left unchanged",
                                  node.name);
                } else if (colors.black) {
                    bindings.emplace_back(node.id, variables_.base);
                } else if (colors.red) {
                    bindings.emplace_back(node.id, variables_.pulse);
                } else {
                    logger_->warn("[ColorApplicator] '{}' is neither black nor red, left "
                                  "unchanged",
                                  node.name);
                }
            }

            for (const auto& [id, key] : bindings) {
                host_.bind_fill_variable(id, key);
                ++bound;
            }
        }
    } catch (const std::exception& e) {
        throw ProcessingError(std::string("Failed to apply colors: ") + e.what());
    }

    logger_->debug("[ColorApplicator] Bound {} primitive(s)", bound);
    return bound;
}

} // namespace iconsmith
