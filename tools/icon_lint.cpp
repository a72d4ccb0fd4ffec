// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file icon_lint.cpp
 * @brief Validates an icon scene snapshot from the command line
 *
 * Loads a scene exported as JSON, runs the readiness, master or icon-set
 * validator plus the name validator and prints the results as JSON.
 * Illustrative icons also report whether they are already handed over.
 *
 * Usage: icon-lint [options] <scene.json>
 *
 * Exit codes:
 *   0 - Icon is valid (warnings allowed)
 *   1 - Validation errors
 *   2 - Usage, config or scene file error
 */

#include "config.h"
#include "error_reporting.h"
#include "icon_errors.h"
#include "icon_policy.h"
#include "icon_set_validator.h"
#include "illustrative_completion.h"
#include "lint_cli_args.h"
#include "logging_init.h"
#include "master_icon_validator.h"
#include "name_validator.h"
#include "readiness_validator.h"
#include "scene_json.h"

#include <iostream>

using namespace iconsmith;

namespace {

constexpr int kExitValid = 0;
constexpr int kExitInvalid = 1;
constexpr int kExitUsage = 2;

IconCategory resolve_category(const LintCliArgs& args, const SceneNode& root) {
    if (args.category) {
        return *args.category;
    }
    if (root.kind == NodeKind::COMPONENT_SET) {
        return IconCategory::FUNCTIONAL;
    }
    if (auto detected = detect_category_from_frame(root.width)) {
        return *detected;
    }
    return detect_category_from_name(root.name, IconCategory::FUNCTIONAL);
}

} // namespace

int main(int argc, char* argv[]) {
    LintCliArgs args;
    if (!parse_lint_cli_args(argc, argv, args)) {
        print_lint_help(argv[0]);
        return kExitUsage;
    }
    if (args.help) {
        print_lint_help(argv[0]);
        return kExitValid;
    }

    // Console-only logger until the config tells us more
    logging::LogConfig bootstrap;
    if (!args.log_level.empty()) {
        logging::parse_log_level(args.log_level, bootstrap.level);
    }
    logging::init(bootstrap);

    Config* config = Config::get_instance();
    if (!config->init(args.config_path)) {
        NOTIFY_ERROR("Could not load config file {}", args.config_path);
        return kExitUsage;
    }
    logging::init(logging::log_config_from(*config, args.log_level));

    std::unique_ptr<SceneNode> root;
    try {
        root = load_scene_file(args.scene_path);
    } catch (const SceneParseError& e) {
        NOTIFY_ERROR("{}", e.what());
        return kExitUsage;
    }

    const ValidationPolicy policy = ValidationPolicy::from_config(*config);
    const IconCategory category = resolve_category(args, *root);
    spdlog::info("[IconLint] Checking '{}' as {} icon", root->name,
                 icon_category_to_string(category));

    json output = {{"file", args.scene_path}, {"category", icon_category_to_string(category)}};
    bool valid = true;

    ValidationResult result;
    switch (args.mode) {
    case LintMode::READINESS:
        result = StructuralReadinessValidator(category, policy).validate(*root);
        output["readiness"] = result.to_json();
        break;
    case LintMode::MASTER:
        result = MasterIconValidator(category, policy).validate(*root);
        output["master"] = result.to_json();
        break;
    case LintMode::ICON_SET:
        if (root->kind != NodeKind::COMPONENT_SET) {
            NOTIFY_ERROR("--set expects a COMPONENT_SET root, got {}",
                         node_kind_to_string(root->kind));
            return kExitUsage;
        }
        result = IconSetValidator(policy).validate(*root);
        output["iconSet"] = result.to_json();
        output["iconSet"]["complete"] = is_icon_set_complete(*root);
        break;
    }
    valid = valid && result.is_valid();

    if (category == IconCategory::ILLUSTRATIVE && args.mode != LintMode::ICON_SET) {
        output["completion"] = check_illustrative_completion(*root).to_json();
    }

    const std::string name = args.name.value_or(root->name);
    NameValidationResult name_result = NameValidator(category).validate(name);
    output["name"] = {{"value", name},
                      {"isValid", name_result.is_valid()},
                      {"errors", name_result.errors}};
    if (name_result.suggestion) {
        output["name"]["suggestion"] = *name_result.suggestion;
    }
    valid = valid && name_result.is_valid();

    std::cout << output.dump(2) << std::endl;
    return valid ? kExitValid : kExitInvalid;
}
