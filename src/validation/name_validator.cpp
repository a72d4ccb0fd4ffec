// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "name_validator.h"

#include <cctype>
#include <regex>

namespace iconsmith {

namespace {

const std::regex& kebab_case_pattern() {
    static const std::regex pattern("^[a-z0-9]+(-[a-z0-9]+)*$");
    return pattern;
}

const std::regex& snake_case_pattern() {
    static const std::regex pattern("^[a-z0-9]+(_[a-z0-9]+)*$");
    return pattern;
}

const std::regex& allowed_chars_pattern() {
    static const std::regex pattern("^[a-z0-9_-]+$");
    return pattern;
}

bool is_lower_alnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

void trim_separator(std::string& s, char sep) {
    while (!s.empty() && s.front() == sep) {
        s.erase(s.begin());
    }
    while (!s.empty() && s.back() == sep) {
        s.pop_back();
    }
}

} // namespace

NameValidator::NameValidator(IconCategory category, std::shared_ptr<spdlog::logger> logger)
    : category_(category), logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

NameValidationResult NameValidator::validate(const std::string& name) const {
    NameValidationResult result;

    if (category_ == IconCategory::FUNCTIONAL) {
        if (!std::regex_match(name, kebab_case_pattern())) {
            result.errors.push_back("Name must be in kebab-case format (lowercase with hyphens)");
        }
    } else {
        if (!std::regex_match(name, snake_case_pattern())) {
            result.errors.push_back(
                "Name must be in snake_case format (lowercase with underscores)");
        }
    }

    if (name.size() < kMinLength || name.size() > kMaxLength) {
        result.errors.push_back("Name must be between 3 and 50 characters");
    }

    if (!std::regex_match(name, allowed_chars_pattern())) {
        result.errors.push_back(
            "Name must not contain special characters (only letters, numbers, and separators)");
    }

    if (!result.errors.empty()) {
        result.suggestion = generate_suggestion(name);
        logger_->debug("[NameValidator] '{}' invalid ({} error(s)), suggesting '{}'", name,
                       result.errors.size(), *result.suggestion);
    }
    return result;
}

std::string NameValidator::generate_suggestion(const std::string& name) const {
    const char sep = separator();

    std::string suggestion;
    suggestion.reserve(name.size());
    for (unsigned char raw : name) {
        char c = static_cast<char>(std::tolower(raw));
        char out = (is_lower_alnum(c) || c == sep) ? c : sep;
        // Collapse runs of separators as we go
        if (out == sep && !suggestion.empty() && suggestion.back() == sep) {
            continue;
        }
        suggestion.push_back(out);
    }
    trim_separator(suggestion, sep);

    if (suggestion.size() < kMinLength) {
        return "icon";
    }

    if (suggestion.size() > kMaxLength) {
        suggestion.resize(kMaxLength);
        // A cut right after a separator would leave it dangling
        trim_separator(suggestion, sep);
    }
    return suggestion;
}

} // namespace iconsmith
