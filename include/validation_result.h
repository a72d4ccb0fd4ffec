// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "geometry_analyzer.h"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace iconsmith {

/**
 * @brief What kind of rule an issue violates
 *
 * Structural issues are fixed by the repair pipeline, geometry issues need
 * manual correction, name issues come with a suggestion.
 */
enum class IssueKind {
    STRUCTURAL,
    GEOMETRY,
    NAME,
};

const char* issue_kind_to_string(IssueKind kind);

/**
 * @brief One error or warning
 *
 * Messages may carry lightweight markup (`<br>`, `<strong>`) for the UI.
 */
struct ValidationIssue {
    IssueKind kind = IssueKind::GEOMETRY;
    std::string message;
    std::optional<std::string> node; ///< Name of the offending node, if any
};

/**
 * @brief Outcome of one validation pass
 *
 * Valid iff there are no errors; warnings never block.
 */
struct ValidationResult {
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;
    std::vector<VectorPositionInfo> vector_positions;

    [[nodiscard]] bool is_valid() const {
        return errors.empty();
    }

    void add_error(IssueKind kind, std::string message,
                   std::optional<std::string> node = std::nullopt);
    void add_warning(IssueKind kind, std::string message,
                     std::optional<std::string> node = std::nullopt);

    /// Append another result's errors, warnings and positions
    void merge(const ValidationResult& other);

    /// True if any error has the given kind
    [[nodiscard]] bool has_errors_of(IssueKind kind) const;

    /**
     * @brief UI message encoding
     *
     * `{isValid, errors:[{message,node?}], warnings:[{message,node?,canProceed}]}`
     * plus `vectorPositions` when any were collected.
     */
    [[nodiscard]] nlohmann::json to_json() const;
};

nlohmann::json to_json(const VectorPositionInfo& info);

} // namespace iconsmith
