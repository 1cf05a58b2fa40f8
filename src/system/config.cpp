// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "error_reporting.h"
#include "logging_init.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace chitusync {

Config* Config::instance{NULL};

namespace {

/// Default configuration - written on first run and merged into older files
json get_default_config() {
    return {{"printer_ip", Config::DEFAULT_PRINTER_IP},
            {"printer_port", DEFAULT_CHITU_PORT},
            {"sync_folder", "~/ChituSync"},
            {"ping_interval_minutes", 1},
            {"send_delay_ms", 5},
            {"remote_deletion", true},
            {"mirror_interval_sec", 120},
            {"status_poll_ms", 5000},
            {"command_timeout_ms", 3000},
            {"debounce_ms", 1000},
            {"log_level", "info"},
            {"log_unknown_messages", false}};
}

template <typename T> T value_at(const json& data, const char* key, const T& default_value) {
    auto it = data.find(key);
    if (it == data.end()) {
        return default_value;
    }
    try {
        return it->template get<T>();
    } catch (const json::exception& e) {
        spdlog::warn("[Config] {} has invalid type, using default: {}", key, e.what());
        return default_value;
    }
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

std::string Config::expand_home(const std::string& p) {
    if (p.empty() || p[0] != '~') {
        return p;
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return p;
    }
    return std::string(home) + p.substr(1);
}

std::string Config::default_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    std::string base;
    if (xdg && *xdg) {
        base = xdg;
    } else {
        base = expand_home("~/.config");
    }
    return base + "/chitu-sync/sync_config.json";
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::string parse_error;
        try {
            data = json::parse(std::fstream(config_path));
            if (!data.is_object()) {
                parse_error = "root is not an object";
            }
        } catch (const json::exception& e) {
            parse_error = e.what();
        }

        if (!parse_error.empty()) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, parse_error);
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;

        std::error_code ec;
        fs::path config_dir = fs::path(config_path).parent_path();
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
            if (ec) {
                LOG_WARN_INTERNAL("[Config] Cannot create {}: {}", config_dir.string(),
                                  ec.message());
            }
        }
    }

    // Fill keys added since the file was written
    for (auto& [key, value] : get_default_config().items()) {
        if (!data.contains(key)) {
            data[key] = value;
            config_modified = true;
        }
    }

    if (config_modified) {
        save();
    }

    spdlog::debug("[Config] initialized: printer={}:{} folder={}",
                  get<std::string>("/printer_ip", ""), get<int>("/printer_port", 0),
                  get<std::string>("/sync_folder", ""));
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    std::string tmp_path = path + ".tmp";
    try {
        {
            std::ofstream o(tmp_path);
            if (!o.is_open()) {
                NOTIFY_ERROR("Could not save configuration file");
                LOG_ERROR_INTERNAL("Failed to open config file for writing: {}", tmp_path);
                return false;
            }

            o << std::setw(2) << data << std::endl;

            if (!o.good()) {
                NOTIFY_ERROR("Error writing configuration file");
                LOG_ERROR_INTERNAL("Error writing to config file: {}", tmp_path);
                return false;
            }
        }

        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            NOTIFY_ERROR("Could not replace configuration file");
            LOG_ERROR_INTERNAL("Failed to rename {} to {}", tmp_path, path);
            return false;
        }
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        NOTIFY_ERROR("Failed to save configuration: {}", e.what());
        LOG_ERROR_INTERNAL("Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

SyncConfig Config::to_sync_config() const {
    SyncConfig cfg;
    cfg.sync_folder = expand_home(value_at<std::string>(data, "sync_folder", "~/ChituSync"));

    cfg.endpoint.host = value_at<std::string>(data, "printer_ip", DEFAULT_PRINTER_IP);
    int port = value_at<int>(data, "printer_port", DEFAULT_CHITU_PORT);
    cfg.endpoint.port = (port > 0 && port <= 65535) ? static_cast<uint16_t>(port) : 0;

    double ping_ms = value_at<double>(data, "ping_interval_minutes", 1.0) * 60.0 * 1000.0;
    // Out-of-range values stay out of range so validate() rejects them
    if (!(ping_ms <= static_cast<double>(MAX_TIMER_INTERVAL.count()))) {
        cfg.endpoint.ping_interval = MAX_TIMER_INTERVAL + std::chrono::milliseconds(1);
    } else if (ping_ms < 0) {
        cfg.endpoint.ping_interval = std::chrono::milliseconds(0);
    } else {
        cfg.endpoint.ping_interval = std::chrono::milliseconds(static_cast<int64_t>(ping_ms));
    }
    cfg.endpoint.chunk_delay =
        std::chrono::milliseconds(value_at<int64_t>(data, "send_delay_ms", 5));
    cfg.endpoint.command_timeout =
        std::chrono::milliseconds(value_at<int64_t>(data, "command_timeout_ms", 3000));

    cfg.remote_deletion = value_at<bool>(data, "remote_deletion", true);
    int64_t mirror_sec = value_at<int64_t>(data, "mirror_interval_sec", 120);
    if (mirror_sec > MAX_TIMER_INTERVAL.count() / 1000) {
        cfg.mirror_interval = MAX_TIMER_INTERVAL + std::chrono::milliseconds(1);
    } else {
        cfg.mirror_interval = std::chrono::milliseconds(std::max<int64_t>(mirror_sec, 0) * 1000);
    }
    cfg.status_poll_interval =
        std::chrono::milliseconds(value_at<int64_t>(data, "status_poll_ms", 5000));
    cfg.debounce = std::chrono::milliseconds(value_at<int64_t>(data, "debounce_ms", 1000));

    std::string dir = get_dir();
    std::string prefix = dir.empty() ? std::string() : dir + "/";
    cfg.metadata_path = prefix + METADATA_FILENAME;
    if (value_at<bool>(data, "log_unknown_messages", false)) {
        cfg.unknown_message_log = prefix + UNKNOWN_MESSAGES_FILENAME;
    }
    return cfg;
}

spdlog::level::level_enum Config::log_level(spdlog::level::level_enum fallback) const {
    return logging::parse_log_level(value_at<std::string>(data, "log_level", ""), fallback);
}

std::string Config::get_path() const {
    return path;
}

std::string Config::get_dir() const {
    return fs::path(path).parent_path().string();
}

} // namespace chitusync
