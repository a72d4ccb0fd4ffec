// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "icon_policy.h"

#include "config.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace iconsmith {

const std::vector<int> kFunctionalBaseSizes = {32, 24, 20};
const std::vector<int> kFunctionalAllSizes = {32, 28, 24, 20, 16, 14, 12};

namespace {

const std::vector<int> kIllustrativeSizes = {kIllustrativeSize};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

std::optional<IconCategory> parse_icon_category(const std::string& str) {
    std::string lower = to_lower(str);
    if (lower == "functional" || lower == "a") {
        return IconCategory::FUNCTIONAL;
    }
    if (lower == "illustrative" || lower == "b") {
        return IconCategory::ILLUSTRATIVE;
    }
    return std::nullopt;
}

std::optional<IconCategory> detect_category_from_frame(double width) {
    int size = static_cast<int>(std::lround(width));
    if (size == kIllustrativeSize) {
        return IconCategory::ILLUSTRATIVE;
    }
    if (std::find(kFunctionalAllSizes.begin(), kFunctionalAllSizes.end(), size) !=
        kFunctionalAllSizes.end()) {
        return IconCategory::FUNCTIONAL;
    }
    return std::nullopt;
}

IconCategory detect_category_from_name(const std::string& name, IconCategory fallback) {
    std::string lower = to_lower(name);
    if (contains(lower, "illustrative") || contains(lower, "illu") || contains(lower, "ii-")) {
        return IconCategory::ILLUSTRATIVE;
    }
    if (contains(lower, "functional") || contains(lower, "ic-")) {
        return IconCategory::FUNCTIONAL;
    }
    return fallback;
}

const std::vector<int>& ValidationPolicy::sizes_for(IconCategory category) {
    return category == IconCategory::ILLUSTRATIVE ? kIllustrativeSizes : kFunctionalAllSizes;
}

std::optional<double> ValidationPolicy::content_cap(IconCategory category,
                                                    double frame_size) const {
    if (category != IconCategory::ILLUSTRATIVE) {
        return std::nullopt;
    }
    return frame_size - 2.0 * illustrative_inset;
}

ValidationPolicy ValidationPolicy::from_config(Config& config) {
    ValidationPolicy policy;
    policy.colors.black_max = config.get<double>("/color/black_max", policy.colors.black_max);
    policy.colors.red_min = config.get<double>("/color/red_min", policy.colors.red_min);
    policy.colors.red_other_max =
        config.get<double>("/color/red_other_max", policy.colors.red_other_max);
    policy.safety.fill_min = config.get<double>("/safety/fill_min", policy.safety.fill_min);
    policy.safety.stroke_min = config.get<double>("/safety/stroke_min", policy.safety.stroke_min);
    policy.illustrative_inset =
        config.get<double>("/safety/illustrative_inset", policy.illustrative_inset);
    return policy;
}

} // namespace iconsmith
