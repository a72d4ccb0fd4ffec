// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "color_classifier.h"

namespace iconsmith {

bool ColorClassifier::is_black_or_dark_gray(const RGB& color) const {
    return color.r < thresholds_.black_max && color.g < thresholds_.black_max &&
           color.b < thresholds_.black_max;
}

bool ColorClassifier::is_red(const RGB& color) const {
    return color.r > thresholds_.red_min && color.g < thresholds_.red_other_max &&
           color.b < thresholds_.red_other_max;
}

void ColorClassifier::classify_paint(const Paint& paint, ColorMembership& out) const {
    if (paint.type != PaintType::SOLID || !paint.visible) {
        return;
    }
    if (is_black_or_dark_gray(paint.color)) {
        out.black = true;
    }
    if (is_red(paint.color)) {
        out.red = true;
    }
}

ColorMembership ColorClassifier::classify(const SceneNode& node) const {
    ColorMembership result;

    if (node.fills) {
        if (node.fills->mixed) {
            return ColorMembership{true, true};
        }
        for (const auto& paint : node.fills->paints) {
            classify_paint(paint, result);
        }
    }

    if (node.stroke_weight > 0.0) {
        for (const auto& paint : node.strokes) {
            classify_paint(paint, result);
        }
    }

    if (node.kind == NodeKind::BOOLEAN_OPERATION) {
        for (const auto& child : node.children) {
            ColorMembership sub = classify(*child);
            result.black = result.black || sub.black;
            result.red = result.red || sub.red;
        }
    }

    return result;
}

} // namespace iconsmith
