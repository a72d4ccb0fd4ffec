// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file description_editor.h
 * @brief Icon description templates
 *
 * Functional:
 * ```
 * EN:
 * Default: <text>
 * Contextual: <text>
 *
 * DE:
 * Default: <text>
 * Contextual: <text>
 *
 * Keywords: <text>
 * #functionalicon #fi #coreicon
 * ```
 *
 * Illustrative:
 * ```
 * EN: <text>
 * DE: <text>
 *
 * Keywords: <text>
 * #illustrativeicon #ii
 * ```
 */

#include "icon_policy.h"
#include "scene_host.h"

#include <optional>
#include <string>
#include <vector>

namespace iconsmith {

/**
 * @brief Description fields entered by the designer
 *
 * Functional icons use the *_default / *_contextual / keywords fields,
 * illustrative icons use en / de / illustrative_keywords.
 */
struct DescriptionData {
    std::string en_default;
    std::string en_contextual;
    std::string de_default;
    std::string de_contextual;
    std::string keywords;

    std::string en;
    std::string de;
    std::string illustrative_keywords;
};

class DescriptionEditor {
  public:
    explicit DescriptionEditor(IconCategory category) : category_(category) {}

    /**
     * @brief Names of required fields that are blank (empty list when complete)
     */
    [[nodiscard]] std::vector<std::string> missing_fields(const DescriptionData& data) const;

    /**
     * @brief Render @p data into the category template
     * @throws ProcessingError "Invalid description data: ..." when required
     *         fields are blank
     */
    [[nodiscard]] std::string format(const DescriptionData& data) const;

    /**
     * @brief Read a description written by format()
     * @return Data, or nullopt when a required field is missing
     */
    [[nodiscard]] std::optional<DescriptionData> parse(const std::string& description) const;

    /**
     * @brief Format and write the description of node @p id
     */
    void update(SceneHost& host, const std::string& id, const DescriptionData& data) const;

  private:
    IconCategory category_;
};

} // namespace iconsmith
