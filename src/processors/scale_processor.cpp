// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scale_processor.h"

#include "icon_errors.h"
#include "icon_policy.h"
#include "icon_set_validator.h"

#include <map>
#include <tuple>

namespace iconsmith {

ScaleProcessor::ScaleProcessor(SceneHost& host, std::shared_ptr<spdlog::logger> logger)
    : host_(host), logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

std::optional<int> ScaleProcessor::nearest_larger(const std::vector<int>& existing, int target) {
    std::optional<int> best;
    for (int size : existing) {
        if (size > target && (!best || size < *best)) {
            best = size;
        }
    }
    return best;
}

size_t ScaleProcessor::process(const std::string& icon_set_id) {
    size_t created = 0;
    try {
        const SceneNode& icon_set = require_node(host_, icon_set_id);
        if (icon_set.kind != NodeKind::COMPONENT_SET) {
            throw ProcessingError("'" + icon_set.name + "' is not a component set");
        }

        // variant type -> size -> variant id, for the variants drawn by hand
        std::map<std::string, std::map<int, std::string>> by_type;
        for (const auto& child : icon_set.children) {
            VariantName parsed = parse_variant_name(child->name);
            if (parsed.size && parsed.variant) {
                by_type[*parsed.variant].emplace(*parsed.size, child->id);
            }
        }

        for (const char* type : {kOutlinedVariant, kFilledVariant}) {
            auto it = by_type.find(type);
            if (it == by_type.end()) {
                continue;
            }
            const auto& existing = it->second;
            std::vector<int> sizes;
            for (const auto& entry : existing) {
                sizes.push_back(entry.first);
            }

            for (int target : kFunctionalAllSizes) {
                if (existing.count(target) != 0) {
                    continue;
                }
                auto source = nearest_larger(sizes, target);
                if (!source) {
                    logger_->warn("[ScaleProcessor] No source variant for {} {}px", type, target);
                    continue;
                }
                create_scaled(existing.at(*source), *source, target, type);
                ++created;
            }
        }
    } catch (const std::exception& e) {
        throw ProcessingError(std::string("Failed to scale variants: ") + e.what());
    }

    logger_->info("[ScaleProcessor] Created {} variant(s)", created);
    return created;
}

void ScaleProcessor::create_scaled(const std::string& source_id, int source_size, int target_size,
                                   const std::string& variant_type) {
    const double factor = static_cast<double>(target_size) / static_cast<double>(source_size);
    logger_->debug("[ScaleProcessor] {}px -> {}px ({}), factor {:.4f}", source_size, target_size,
                   variant_type, factor);

    std::string clone_id = host_.clone_node(source_id);
    host_.resize_node(clone_id, target_size, target_size);

    const SceneNode* holder = content_holder_of(require_node(host_, clone_id));
    if (holder) {
        const std::string holder_id = holder->id;

        // Snapshot ids and offsets first; rescaling mutates the host tree
        std::vector<std::tuple<std::string, double, double>> content;
        for (const auto& child : holder->children) {
            content.emplace_back(child->id, child->x.value_or(0.0), child->y.value_or(0.0));
        }

        host_.resize_node(holder_id, target_size, target_size);
        for (const auto& [id, x, y] : content) {
            host_.rescale_node(id, factor);
            host_.move_node(id, x * factor, y * factor);
        }
    }

    host_.rename_node(clone_id, make_variant_name(target_size, variant_type));
}

} // namespace iconsmith
