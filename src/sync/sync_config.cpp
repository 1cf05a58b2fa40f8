// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sync_config.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace chitusync {

ChituError SyncConfig::validate(bool create_folder) const {
    if (sync_folder.empty()) {
        return ChituError::config_error("sync folder is not set");
    }

    std::error_code ec;
    if (!fs::exists(sync_folder, ec)) {
        if (!create_folder) {
            return ChituError::config_error("sync folder " + sync_folder + " does not exist");
        }
        if (!fs::create_directories(sync_folder, ec) && ec) {
            return ChituError::config_error("cannot create sync folder " + sync_folder + ": " +
                                            ec.message());
        }
        spdlog::info("[SyncConfig] Created sync folder {}", sync_folder);
    }
    if (!fs::is_directory(sync_folder, ec)) {
        return ChituError::config_error("sync folder " + sync_folder + " is not a directory");
    }

    if (endpoint.host.empty()) {
        return ChituError::config_error("printer address is not set");
    }
    if (endpoint.port == 0) {
        return ChituError::config_error("printer port must be non-zero");
    }
    if (endpoint.ping_interval.count() <= 0) {
        return ChituError::config_error("ping interval must be positive");
    }
    if (endpoint.command_timeout.count() <= 0) {
        return ChituError::config_error("command timeout must be positive");
    }
    if (endpoint.chunk_delay.count() < 0) {
        return ChituError::config_error("send delay must not be negative");
    }
    if (mirror_interval.count() <= 0) {
        return ChituError::config_error("mirror interval must be positive");
    }
    if (status_poll_interval.count() <= 0) {
        return ChituError::config_error("status poll interval must be positive");
    }
    if (endpoint.ping_interval > MAX_TIMER_INTERVAL || mirror_interval > MAX_TIMER_INTERVAL ||
        status_poll_interval > MAX_TIMER_INTERVAL ||
        endpoint.command_timeout > MAX_TIMER_INTERVAL) {
        return ChituError::config_error(
            fmt::format("intervals must not exceed {} ms", MAX_TIMER_INTERVAL.count()));
    }
    if (debounce.count() < 0 || settle_time.count() < 0 || settle_timeout.count() < 0) {
        return ChituError::config_error("debounce and settle times must not be negative");
    }
    return {};
}

} // namespace chitusync
