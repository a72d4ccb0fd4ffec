// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "icon_set_validator.h"

#include "readiness_validator.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <regex>
#include <set>

namespace iconsmith {

const char* const kOutlinedVariant = "(Def) Outlined";
const char* const kFilledVariant = "Filled";

namespace {

const std::map<int, SizeConstraint>& size_constraints() {
    static const std::map<int, SizeConstraint> constraints = {
        {32, {26, 28}}, {28, {22, 24}}, {24, {18, 20}}, {20, {14, 16}},
        {16, {10, 12}}, {14, {8, 10}},  {12, {6, 8}},
    };
    return constraints;
}

bool is_allowed_size(int size) {
    return std::find(kFunctionalAllSizes.begin(), kFunctionalAllSizes.end(), size) !=
           kFunctionalAllSizes.end();
}

bool is_allowed_variant(const std::string& variant) {
    return variant == kOutlinedVariant || variant == kFilledVariant;
}

const SceneNode* find_variant(const SceneNode& icon_set, const std::string& name) {
    for (const auto& child : icon_set.children) {
        if (child->name == name) {
            return child.get();
        }
    }
    return nullptr;
}

bool nearly_equal(double a, double b) {
    return std::fabs(a - b) < 1e-6;
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += parts[i];
    }
    return out;
}

std::string display_name(const std::string& variant, int size) {
    return fmt::format("{}, {}px", variant, size);
}

constexpr const char* kPreparationChecklist =
    "<p>Please prepare your icon manually first:</p><ol>"
    "<li><strong>Select all vectors</strong> in the icon</li>"
    "<li><strong>Outline Stroke</strong> (Opt+Cmd+O)</li>"
    "<li><strong>Boolean Groups &gt; Union</strong> (Opt+Shift+U)</li>"
    "<li><strong>Flatten Selection</strong> (Opt+Shift+F)</li>"
    "</ol><p><strong>Note:</strong> Outline BEFORE Flatten to preserve different stroke "
    "widths!</p>";

} // namespace

VariantName parse_variant_name(const std::string& name) {
    static const std::regex size_pattern("Size=(\\d+)");
    static const std::regex variant_pattern("Variant=(.+)$");

    VariantName result;
    std::smatch match;
    if (std::regex_search(name, match, size_pattern)) {
        try {
            result.size = std::stoi(match[1].str());
        } catch (const std::out_of_range&) {
            // Absurdly long digit run; treat as no size
        }
    }
    if (std::regex_search(name, match, variant_pattern)) {
        result.variant = match[1].str();
    }
    return result;
}

std::string make_variant_name(int size, const std::string& variant) {
    return fmt::format("Size={}, Variant={}", size, variant);
}

std::optional<SizeConstraint> size_constraint_for(int size) {
    const auto& constraints = size_constraints();
    auto it = constraints.find(size);
    if (it == constraints.end()) {
        return std::nullopt;
    }
    return it->second;
}

IconSetValidator::IconSetValidator(const ValidationPolicy& policy,
                                   std::shared_ptr<spdlog::logger> logger)
    : policy_(policy), logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

ValidationResult IconSetValidator::validate(const SceneNode& icon_set) const {
    ValidationResult result;
    logger_->debug("[IconSetValidator] Validating '{}' ({} variants)", icon_set.name,
                   icon_set.children.size());

    // Names: invalid sizes / variant types, duplicates, variants per size
    std::set<int, std::greater<int>> invalid_sizes;
    std::vector<std::string> invalid_variants;
    std::map<std::string, int> name_counts;
    std::map<int, int> size_counts;
    bool has_outlined = false;
    bool has_filled = false;

    for (const auto& child : icon_set.children) {
        VariantName parsed = parse_variant_name(child->name);
        if (parsed.size) {
            ++size_counts[*parsed.size];
            if (!is_allowed_size(*parsed.size)) {
                invalid_sizes.insert(*parsed.size);
            }
        }
        if (parsed.variant) {
            if (!is_allowed_variant(*parsed.variant)) {
                if (std::find(invalid_variants.begin(), invalid_variants.end(), *parsed.variant) ==
                    invalid_variants.end()) {
                    invalid_variants.push_back(*parsed.variant);
                }
            } else if (*parsed.variant == kOutlinedVariant) {
                has_outlined = true;
            } else {
                has_filled = true;
            }
        }

        int count = ++name_counts[child->name];
        if (count > 1) {
            std::string shown = parsed.variant && parsed.size
                                     ? display_name(*parsed.variant, *parsed.size)
                                     : child->name;
            result.add_error(IssueKind::STRUCTURAL,
                             fmt::format("Duplicate variant found: {}<br>This variant exists {} "
                                         "times<br>Please remove duplicate variants",
                                         shown, count),
                             icon_set.name);
        }
    }

    if (!invalid_sizes.empty()) {
        std::vector<std::string> parts;
        for (int size : invalid_sizes) {
            parts.push_back(fmt::format("{}px", size));
        }
        result.add_error(IssueKind::GEOMETRY,
                         fmt::format("Invalid size(s): <strong>{}</strong><br>Only sizes 32, 28, "
                                     "24, 20, 16, 14, 12 are allowed",
                                     join(parts)),
                         icon_set.name);
    }

    if (!invalid_variants.empty()) {
        std::vector<std::string> parts;
        for (const auto& v : invalid_variants) {
            parts.push_back(fmt::format("<strong>{}</strong>", v));
        }
        result.add_error(IssueKind::NAME,
                         fmt::format("Invalid variant name(s): {}<br>Only \"<strong>{}</strong>\" "
                                     "and \"<strong>{}</strong>\" are allowed",
                                     join(parts), kOutlinedVariant, kFilledVariant),
                         icon_set.name);
    }

    for (const auto& [size, count] : size_counts) {
        if (count > 2) {
            result.add_error(IssueKind::STRUCTURAL,
                             fmt::format("Too many variants for {}px<br>Found {} variants, "
                                         "expected maximum 2 (Outlined + Filled)<br>Please remove "
                                         "extra variants",
                                         size, count),
                             icon_set.name);
        }
    }

    if (!has_outlined) {
        result.add_error(IssueKind::STRUCTURAL,
                         fmt::format("No <strong>{}</strong> variants found<br>Please add the "
                                     "required sizes (32px, 24px, 20px) for the {} variant",
                                     kOutlinedVariant, kOutlinedVariant),
                         icon_set.name);
        return result;
    }

    // Completeness of the hand-drawn masters
    std::vector<std::string> types = {kOutlinedVariant};
    if (has_filled) {
        types.push_back(kFilledVariant);
    }
    for (const auto& type : types) {
        for (int size : kFunctionalBaseSizes) {
            std::string name = make_variant_name(size, type);
            const SceneNode* variant = find_variant(icon_set, name);
            if (!variant) {
                result.add_error(IssueKind::STRUCTURAL,
                                 fmt::format("Missing variant: <strong>{}</strong><br>Please "
                                             "create this variant and add content",
                                             display_name(type, size)),
                                 icon_set.name);
            }
        }
    }

    // Per-variant size, content and readiness
    for (const auto& child : icon_set.children) {
        VariantName parsed = parse_variant_name(child->name);
        if (!parsed.size) {
            result.add_error(IssueKind::NAME,
                             fmt::format("Variant \"{}\" has no Size property in name",
                                         child->name),
                             child->name);
            continue;
        }
        if (!is_allowed_size(*parsed.size)) {
            continue;
        }
        validate_variant(*child, *parsed.size,
                         display_name(parsed.variant.value_or(child->name), *parsed.size), result);
    }

    if (result.has_errors_of(IssueKind::STRUCTURAL)) {
        result.errors.insert(result.errors.begin(),
                             ValidationIssue{IssueKind::STRUCTURAL, kPreparationChecklist,
                                             icon_set.name});
    }

    logger_->debug("[IconSetValidator] '{}': {} error(s)", icon_set.name, result.errors.size());
    return result;
}

void IconSetValidator::validate_variant(const SceneNode& variant, int size,
                                        const std::string& shown,
                                        ValidationResult& result) const {
    if (variant.children.empty()) {
        result.add_error(IssueKind::STRUCTURAL,
                         fmt::format("Empty variant: <strong>{}</strong><br>Please add vector "
                                     "content to this variant",
                                     shown),
                         variant.name);
        return;
    }

    const SceneNode& container = *variant.children.front();
    if (is_container_like(container.kind) && container.children.empty()) {
        result.add_error(IssueKind::STRUCTURAL,
                         fmt::format("Empty container in variant: <strong>{}</strong><br>Please "
                                     "add vector content to this variant",
                                     shown),
                         variant.name);
        return;
    }

    if (!nearly_equal(variant.width, size) || !nearly_equal(variant.height, size)) {
        result.add_error(IssueKind::GEOMETRY,
                         fmt::format("{} has incorrect size: {}x{}px (expected: {}x{}px)", shown,
                                     variant.width, variant.height, size, size),
                         variant.name);
    }
    if (is_container_like(container.kind) &&
        (!nearly_equal(container.width, size) || !nearly_equal(container.height, size))) {
        result.add_error(IssueKind::GEOMETRY,
                         fmt::format("Container in {} has incorrect size: {}x{}px (expected: "
                                     "{}x{}px)",
                                     shown, container.width, container.height, size, size),
                         variant.name);
    }

    if (auto constraint = size_constraint_for(size)) {
        for (const auto& child : container.children) {
            validate_child_sizes(*child, size, *constraint, shown, result);
        }
    }

    StructuralReadinessValidator readiness(IconCategory::FUNCTIONAL, policy_, logger_);
    ValidationResult ready = readiness.validate(variant);
    for (auto& issue : ready.errors) {
        issue.message = fmt::format("<strong>{}:</strong> {}", shown, issue.message);
        issue.node = variant.name;
        result.errors.push_back(std::move(issue));
    }
}

void IconSetValidator::validate_child_sizes(const SceneNode& node, int size,
                                            const SizeConstraint& constraint,
                                            const std::string& shown,
                                            ValidationResult& result) const {
    if (node.kind == NodeKind::GROUP) {
        for (const auto& child : node.children) {
            validate_child_sizes(*child, size, constraint, shown, result);
        }
        return;
    }
    if (!is_primitive(node.kind)) {
        return;
    }

    const bool fill_only = node.has_fills() && !node.has_visible_strokes();
    const double max = fill_only ? constraint.fill : constraint.stroke;
    const double width = GeometryAnalyzer::round2(node.width);
    const double height = GeometryAnalyzer::round2(node.height);
    if (width > max || height > max) {
        result.add_error(IssueKind::GEOMETRY,
                         fmt::format("Child element in {} is too large: {:.2f}x{:.2f}px (max for "
                                     "{} at {}px: {}x{}px)",
                                     shown, node.width, node.height, fill_only ? "Fill" : "Stroke",
                                     size, max, max),
                         shown);
    }
}

bool is_icon_set_complete(const SceneNode& icon_set) {
    for (int size : kFunctionalAllSizes) {
        if (!find_variant(icon_set, make_variant_name(size, kOutlinedVariant))) {
            return false;
        }
    }
    return true;
}

} // namespace iconsmith
