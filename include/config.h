// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __ICONSMITH_CONFIG_H__
#define __ICONSMITH_CONFIG_H__

#include "spdlog/spdlog.h"

#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace iconsmith {

/**
 * @brief Tool configuration manager (singleton)
 *
 * Loads and manages validation thresholds, design-token keys and logging
 * settings from a JSON file. Uses JSON pointer syntax (RFC 6901) for nested
 * value access.
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and read from the main thread; validators receive a ValidationPolicy copy.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/path/to/iconsmith.json");
 *
 * double fill_min = cfg->get<double>("/safety/fill_min", 2.0);
 *
 * cfg->set<std::string>("/variables/base", "497497bc...");
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    /**
     * @brief Construct configuration manager
     *
     * Use get_instance() to obtain singleton instance. Starts with the
     * built-in defaults so an uninitialized Config is still usable.
     */
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON configuration file and fills in any missing keys with
     * defaults. Creates the file with defaults if it doesn't exist.
     *
     * @param config_path Path to JSON configuration file
     * @return true on success, false if the file exists but cannot be parsed
     */
    bool init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/color/black_max")
     * @return Configuration value of type T
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds a value of
     * the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Wrong type at {}: {}", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Get JSON sub-object at path
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * @return true on success, false if the file could not be written
     */
    bool save();

    /**
     * @brief Restore every key to its built-in default (in memory only)
     */
    void reset_to_defaults();

    /**
     * @brief Get configuration file path
     */
    std::string get_path();

    /**
     * @brief Get singleton instance
     */
    static Config* get_instance();
};

} // namespace iconsmith

#endif // __ICONSMITH_CONFIG_H__
