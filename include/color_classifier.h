// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "icon_policy.h"
#include "scene_node.h"

namespace iconsmith {

/**
 * @brief Which canonical colors a node shows
 *
 * A node may be in both groups (a flattened shape with black and red
 * regions, or a boolean operation over differently colored operands).
 */
struct ColorMembership {
    bool black = false;
    bool red = false;

    [[nodiscard]] bool any() const {
        return black || red;
    }
};

/**
 * @brief Classifies paint colors as black/dark-gray, red, or other
 *
 * Only visible solid paints are inspected. A node whose fills are the host's
 * "mixed" marker satisfies every predicate, since its regions cannot be read.
 *
 * @code
 * ColorClassifier classifier(policy.colors);
 * if (classifier.classify(node).red) { ... }
 * @endcode
 */
class ColorClassifier {
  public:
    explicit ColorClassifier(const ColorThresholds& thresholds = {}) : thresholds_(thresholds) {}

    /// Every channel below black_max
    [[nodiscard]] bool is_black_or_dark_gray(const RGB& color) const;

    /// r above red_min, g and b below red_other_max
    [[nodiscard]] bool is_red(const RGB& color) const;

    /**
     * @brief Color groups of a node's fills and strokes
     *
     * Boolean operations also contribute the colors of their operands.
     */
    [[nodiscard]] ColorMembership classify(const SceneNode& node) const;

    [[nodiscard]] const ColorThresholds& thresholds() const {
        return thresholds_;
    }

  private:
    void classify_paint(const Paint& paint, ColorMembership& out) const;

    ColorThresholds thresholds_;
};

} // namespace iconsmith
