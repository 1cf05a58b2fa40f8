// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "sync_config.h"

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

namespace chitusync {

using json = nlohmann::json;

/**
 * @brief Daemon configuration file (singleton)
 *
 * Loads sync_config.json and exposes it through JSON pointer syntax
 * (RFC 6901). Missing keys are filled with defaults and written back on
 * init(), so a first run leaves a complete, editable file behind.
 *
 * Thread safety: Not thread-safe. Initialized at startup and on SIGHUP from
 * the main thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init(Config::default_path());
 *
 * std::string ip = cfg->get<std::string>("/printer_ip", "192.168.0.230");
 * cfg->set<int>("/printer_port", 3000);
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
    static constexpr const char* DEFAULT_PRINTER_IP = "192.168.0.230";
    static constexpr const char* METADATA_FILENAME = "file_metadata.json";
    static constexpr const char* UNKNOWN_MESSAGES_FILENAME = "unknown_printer_msgs.log";

    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Load configuration from file
     *
     * Creates the file (and its directory) with defaults if it doesn't exist.
     * A corrupt file is backed up to <path>.corrupt and replaced by defaults.
     *
     * @param config_path Path to the JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            try {
                return data[ptr].template get<T>();
            } catch (const json::exception& e) {
                spdlog::warn("[Config] {} has invalid type, using default: {}", json_ptr,
                             e.what());
            }
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Changes are in-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Save current configuration to file
     *
     * Written via temp file + rename.
     *
     * @return true on success; failures are reported through NOTIFY_ERROR
     */
    bool save();

    /**
     * @brief Build the immutable pipeline configuration
     *
     * The metadata store and unknown-message log live beside the config file.
     * The result is not validated; SyncEngine::start() does that.
     */
    SyncConfig to_sync_config() const;

    /// spdlog level from "log_level", @p fallback if absent or unknown
    spdlog::level::level_enum log_level(spdlog::level::level_enum fallback) const;

    /// Path of the loaded configuration file
    std::string get_path() const;

    /// Directory holding the configuration file
    std::string get_dir() const;

    /**
     * @brief $XDG_CONFIG_HOME/chitu-sync/sync_config.json
     *
     * Falls back to ~/.config when XDG_CONFIG_HOME is unset.
     */
    static std::string default_path();

    /// Replace "~" at the start of @p path with $HOME
    static std::string expand_home(const std::string& path);

    static Config* get_instance();
};

} // namespace chitusync
