// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "error_reporting.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

using namespace iconsmith;

Config* Config::instance{NULL};

namespace {

constexpr int CURRENT_CONFIG_VERSION = 1;

/// Design-token keys of the shared color library
constexpr const char* kDefaultBaseVariable = "497497bca9694f6004d1667de59f1a903b3cd3ef";
constexpr const char* kDefaultPulseVariable = "998998d67d3ebef6f2692db932bce69431b3d0cc";

/// Default configuration - shared between the constructor, init() and reset_to_defaults()
json get_default_config() {
    return {{"config_version", CURRENT_CONFIG_VERSION},
            {"log_level", "info"},
            {"log_target", "auto"},
            {"log_file", ""},
            {"color", {{"black_max", 0.2}, {"red_min", 0.5}, {"red_other_max", 0.3}}},
            {"safety", {{"fill_min", 2.0}, {"stroke_min", 3.0}, {"illustrative_inset", 4.0}}},
            {"variables", {{"base", kDefaultBaseVariable}, {"pulse", kDefaultPulseVariable}}}};
}

/// Migrate config keys from old paths to new paths
/// @param data JSON config data to migrate (modified in place)
/// @param migrations Vector of {from_path, to_path} pairs (JSON pointer format)
/// @return true if any migration occurred, false if no migration needed
bool migrate_config_keys(json& data,
                         const std::vector<std::pair<std::string, std::string>>& migrations) {
    bool any_migrated = false;

    for (const auto& [from_path, to_path] : migrations) {
        json::json_pointer from_ptr(from_path);
        json::json_pointer to_ptr(to_path);

        if (!data.contains(from_ptr)) {
            continue;
        }

        // Never overwrite a value already at the new location
        if (data.contains(to_ptr)) {
            spdlog::debug("[Config] Migration skipped: {} already exists", to_path);
            data[from_ptr.parent_pointer()].erase(from_ptr.back());
            any_migrated = true;
            continue;
        }

        data[to_ptr] = data[from_ptr];
        data[from_ptr.parent_pointer()].erase(from_ptr.back());
        spdlog::info("[Config] Migrated {} -> {}", from_path, to_path);
        any_migrated = true;
    }

    return any_migrated;
}

/// Migration v0→v1: flat threshold keys moved into /color/ and /safety/ sections
void migrate_v0_to_v1(json& config) {
    migrate_config_keys(config, {{"/black_threshold", "/color/black_max"},
                                 {"/red_threshold", "/color/red_min"},
                                 {"/fill_safety_zone", "/safety/fill_min"},
                                 {"/stroke_safety_zone", "/safety/stroke_min"}});
}

/// Run all versioned migrations in sequence from current version to CURRENT_CONFIG_VERSION
void run_versioned_migrations(json& config) {
    int version = 0;
    if (config.contains("config_version") && config["config_version"].is_number_integer()) {
        version = config["config_version"].get<int>();
    }

    if (version < 1)
        migrate_v0_to_v1(config);

    config["config_version"] = CURRENT_CONFIG_VERSION;
}

/// Fill in every default key missing from @p data (recursively, never overwriting)
/// @return true if anything was added
bool merge_missing_defaults(json& data, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!data.contains(it.key())) {
            data[it.key()] = it.value();
            modified = true;
        } else if (it.value().is_object() && data[it.key()].is_object()) {
            modified = merge_missing_defaults(data[it.key()], it.value()) || modified;
        }
    }
    return modified;
}

} // namespace

Config::Config() : data(get_default_config()) {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

bool Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;
    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            data = get_default_config();
            return false;
        }

        if (!data.is_object()) {
            spdlog::error("[Config] {} does not contain a JSON object", config_path);
            data = get_default_config();
            return false;
        }

        int version_before = data.value("config_version", 0);
        run_versioned_migrations(data);
        if (data["config_version"].get<int>() != version_before) {
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();

        fs::path parent = fs::path(config_path).parent_path();
        std::error_code ec;
        if (!parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                LOG_WARN_INTERNAL("Could not create config directory {}: {}", parent.string(),
                                  ec.message());
            }
        }
        config_modified = true;
    }

    if (merge_missing_defaults(data, get_default_config())) {
        spdlog::debug("[Config] Added missing default keys");
        config_modified = true;
    }

    if (config_modified && !save()) {
        spdlog::warn("[Config] Continuing with in-memory config only");
    }

    spdlog::debug("[Config] initialized: log_level={}, black_max={}, fill_min={}",
                  get<std::string>("/log_level", "info"), get<double>("/color/black_max", 0.2),
                  get<double>("/safety/fill_min", 2.0));
    return true;
}

void Config::reset_to_defaults() {
    spdlog::info("[Config] Resetting configuration to defaults");
    data = get_default_config();
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    if (path.empty()) {
        LOG_ERROR_INTERNAL("Config has no file path; call init() before save()");
        return false;
    }

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            LOG_ERROR_INTERNAL("Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            LOG_ERROR_INTERNAL("Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}
