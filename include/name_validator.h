// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "icon_policy.h"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace iconsmith {

struct NameValidationResult {
    std::vector<std::string> errors;
    std::optional<std::string> suggestion; ///< Only set when invalid

    [[nodiscard]] bool is_valid() const {
        return errors.empty();
    }
};

/**
 * @brief Checks icon names against the category's naming convention
 *
 * Functional icons use kebab-case, illustrative icons use snake_case. Length
 * must be 3..50 and only `[a-z0-9_-]` is allowed. Each rule reports its own
 * error, so several may fire for one name.
 */
class NameValidator {
  public:
    static constexpr size_t kMinLength = 3;
    static constexpr size_t kMaxLength = 50;

    explicit NameValidator(IconCategory category,
                           std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    [[nodiscard]] NameValidationResult validate(const std::string& name) const;

    /**
     * @brief Normalize @p name into a valid name for this category
     *
     * Lowercases, replaces disallowed characters with the separator, collapses
     * and trims separators, falls back to "icon" when too short and truncates
     * to kMaxLength. Applying it twice gives the same result as once.
     */
    [[nodiscard]] std::string generate_suggestion(const std::string& name) const;

    [[nodiscard]] char separator() const {
        return category_ == IconCategory::FUNCTIONAL ? '-' : '_';
    }

  private:
    IconCategory category_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace iconsmith
