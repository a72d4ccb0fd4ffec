// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "description_editor.h"

#include "icon_errors.h"

#include <spdlog/spdlog.h>

#include <sstream>

namespace iconsmith {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

bool is_blank(const std::string& s) {
    return trim(s).empty();
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

/// Text after @p prefix, trimmed
std::string value_after(const std::string& line, const std::string& prefix) {
    return trim(line.substr(prefix.size()));
}

} // namespace

std::vector<std::string> DescriptionEditor::missing_fields(const DescriptionData& data) const {
    std::vector<std::string> missing;
    if (category_ == IconCategory::FUNCTIONAL) {
        if (is_blank(data.en_default)) {
            missing.push_back("EN Default is required");
        }
        if (is_blank(data.de_default)) {
            missing.push_back("DE Default is required");
        }
    } else {
        if (is_blank(data.en)) {
            missing.push_back("EN is required");
        }
        if (is_blank(data.de)) {
            missing.push_back("DE is required");
        }
    }
    return missing;
}

std::string DescriptionEditor::format(const DescriptionData& data) const {
    auto missing = missing_fields(data);
    if (!missing.empty()) {
        std::string joined;
        for (size_t i = 0; i < missing.size(); ++i) {
            joined += (i > 0 ? ", " : "") + missing[i];
        }
        throw ProcessingError("Invalid description data: " + joined);
    }

    std::ostringstream out;
    if (category_ == IconCategory::FUNCTIONAL) {
        out << "EN:\n"
            << "Default: " << data.en_default << "\n"
            << "Contextual: " << trim(data.en_contextual) << "\n"
            << "\n"
            << "DE:\n"
            << "Default: " << data.de_default << "\n"
            << "Contextual: " << trim(data.de_contextual) << "\n"
            << "\n"
            << "Keywords: " << trim(data.keywords) << "\n"
            << "#functionalicon #fi #coreicon";
    } else {
        out << "EN: " << data.en << "\n"
            << "DE: " << data.de << "\n"
            << "\n"
            << "Keywords: " << trim(data.illustrative_keywords) << "\n"
            << "#illustrativeicon #ii";
    }
    return out.str();
}

std::optional<DescriptionData> DescriptionEditor::parse(const std::string& description) const {
    DescriptionData data;
    std::istringstream in(description);
    std::string raw;

    if (category_ == IconCategory::FUNCTIONAL) {
        enum class Section { NONE, EN, DE } section = Section::NONE;
        while (std::getline(in, raw)) {
            std::string line = trim(raw);
            if (line == "EN:") {
                section = Section::EN;
            } else if (line == "DE:") {
                section = Section::DE;
            } else if (starts_with(line, "Default:")) {
                std::string value = value_after(line, "Default:");
                if (section == Section::EN) {
                    data.en_default = value;
                } else if (section == Section::DE) {
                    data.de_default = value;
                }
            } else if (starts_with(line, "Contextual:")) {
                std::string value = value_after(line, "Contextual:");
                if (section == Section::EN) {
                    data.en_contextual = value;
                } else if (section == Section::DE) {
                    data.de_contextual = value;
                }
            } else if (starts_with(line, "Keywords:")) {
                data.keywords = value_after(line, "Keywords:");
            }
        }
    } else {
        while (std::getline(in, raw)) {
            std::string line = trim(raw);
            if (starts_with(line, "EN:")) {
                data.en = value_after(line, "EN:");
            } else if (starts_with(line, "DE:")) {
                data.de = value_after(line, "DE:");
            } else if (starts_with(line, "Keywords:")) {
                data.illustrative_keywords = value_after(line, "Keywords:");
            }
        }
    }

    if (!missing_fields(data).empty()) {
        return std::nullopt;
    }
    return data;
}

void DescriptionEditor::update(SceneHost& host, const std::string& id,
                               const DescriptionData& data) const {
    std::string text = format(data);
    host.set_description(id, text);
    spdlog::debug("[DescriptionEditor] Updated description of {} ({} chars)", id, text.size());
}

} // namespace iconsmith
