// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file icon_policy.h
 * @brief Icon categories and the numeric rules each one is held to
 *
 * Functional icons (category A) are single-color line icons shipped in
 * several sizes. Illustrative icons (category B) are 64px two-color
 * (base + pulse) artwork.
 */

#include <optional>
#include <string>
#include <vector>

namespace iconsmith {

class Config;

enum class IconCategory {
    FUNCTIONAL,  ///< kebab-case, 32/24/20 masters + scaled sizes
    ILLUSTRATIVE ///< snake_case, single 64px size, black + red
};

inline const char* icon_category_to_string(IconCategory category) {
    switch (category) {
    case IconCategory::FUNCTIONAL:
        return "functional";
    case IconCategory::ILLUSTRATIVE:
        return "illustrative";
    }
    return "functional";
}

/**
 * @brief Parse "functional" / "illustrative" (also accepts "a" / "b")
 * @return Category, or nullopt for anything else
 */
std::optional<IconCategory> parse_icon_category(const std::string& str);

/**
 * @brief Detect category from the outer frame size
 *
 * 64 → illustrative; any functional master or scaled size → functional.
 */
std::optional<IconCategory> detect_category_from_frame(double width);

/**
 * @brief Detect category from naming hints ("illu", "ii-", "ic-", ...)
 * @param fallback Returned when the name carries no hint
 */
IconCategory detect_category_from_name(const std::string& name, IconCategory fallback);

/// Master sizes designers draw by hand
extern const std::vector<int> kFunctionalBaseSizes;
/// Every size a finished functional icon set ships in, largest first
extern const std::vector<int> kFunctionalAllSizes;
constexpr int kIllustrativeSize = 64;
constexpr double kRequiredStrokeWidth = 2.0;

/**
 * @brief Color classification thresholds
 *
 * Black: every channel strictly below black_max.
 * Red: r strictly above red_min, g and b strictly below red_other_max.
 */
struct ColorThresholds {
    double black_max = 0.2;
    double red_min = 0.5;
    double red_other_max = 0.3;
};

/// Minimum clearance between geometry and the artboard edge
struct SafetyZone {
    double fill_min = 2.0;
    double stroke_min = 3.0;
};

/**
 * @brief Tunable numbers used by every validator
 *
 * Defaults are the design-system values; from_config() lets a deployment
 * override them without recompiling.
 */
struct ValidationPolicy {
    ColorThresholds colors;
    SafetyZone safety;
    /// Illustrative content must fit inside size - 2 * inset
    double illustrative_inset = 4.0;

    /// Valid outer frame sizes for the category
    [[nodiscard]] static const std::vector<int>& sizes_for(IconCategory category);

    /// Maximum content extent for the category, or nullopt when uncapped
    [[nodiscard]] std::optional<double> content_cap(IconCategory category, double frame_size) const;

    static ValidationPolicy from_config(Config& config);
};

} // namespace iconsmith
