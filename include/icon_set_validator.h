// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file icon_set_validator.h
 * @brief Validation of a functional icon set (component set of variants)
 *
 * Variants are named `Size=<n>, Variant=<type>` where type is
 * "(Def) Outlined" or "Filled". Designers draw the 32/24/20 masters; the
 * remaining sizes are produced by scaling.
 */

#include "icon_policy.h"
#include "validation_result.h"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

namespace iconsmith {

extern const char* const kOutlinedVariant;
extern const char* const kFilledVariant;

/// Parsed `Size=<n>, Variant=<type>` name; either part may be absent
struct VariantName {
    std::optional<int> size;
    std::optional<std::string> variant;
};

VariantName parse_variant_name(const std::string& name);

/// "Size=24, Variant=Filled"
std::string make_variant_name(int size, const std::string& variant);

/// Maximum primitive extent at a given icon size
struct SizeConstraint {
    double stroke = 0.0; ///< Stroked primitives
    double fill = 0.0;   ///< Fill-only primitives
};

/**
 * @brief Primitive size cap for a functional icon size
 * @return Constraint, or nullopt for sizes outside the icon set
 */
std::optional<SizeConstraint> size_constraint_for(int size);

class IconSetValidator {
  public:
    explicit IconSetValidator(const ValidationPolicy& policy = {},
                              std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * @brief Validate names, completeness, sizes and readiness of every variant
     *
     * When any variant still needs outline/union/flatten work, a preparation
     * checklist is inserted as the first error.
     */
    [[nodiscard]] ValidationResult validate(const SceneNode& icon_set) const;

  private:
    void validate_variant(const SceneNode& variant, int size, const std::string& display_name,
                          ValidationResult& result) const;
    void validate_child_sizes(const SceneNode& node, int size, const SizeConstraint& constraint,
                              const std::string& display_name, ValidationResult& result) const;

    ValidationPolicy policy_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief True when the outlined variant exists in every functional size
 */
bool is_icon_set_complete(const SceneNode& icon_set);

} // namespace iconsmith
