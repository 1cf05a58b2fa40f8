// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chitu_error.h"

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

namespace chitusync {

/// Chitu mainboards listen for M-code datagrams on this port
constexpr uint16_t DEFAULT_CHITU_PORT = 3000;

/// Longest interval an event-loop timer accepts (int milliseconds, about 24.8 days)
constexpr std::chrono::milliseconds MAX_TIMER_INTERVAL{std::numeric_limits<int>::max()};

/**
 * @brief Where and how to talk to the board
 *
 * Immutable for the lifetime of a session; a changed endpoint means a new
 * pipeline.
 */
struct PrinterEndpoint {
    std::string host;
    uint16_t port = DEFAULT_CHITU_PORT;
    std::chrono::milliseconds ping_interval{60000};
    std::chrono::milliseconds chunk_delay{5};
    std::chrono::milliseconds command_timeout{3000};
};

/**
 * @brief Complete pipeline configuration
 *
 * Built once from the config file (or by tests) and passed by value into the
 * SyncEngine constructor.
 */
struct SyncConfig {
    std::string sync_folder;
    PrinterEndpoint endpoint;
    bool remote_deletion = true;
    std::chrono::milliseconds mirror_interval{120000};
    std::chrono::milliseconds status_poll_interval{5000};
    std::chrono::milliseconds debounce{1000};
    std::chrono::milliseconds settle_time{1000};     ///< File size must hold this long
    std::chrono::milliseconds settle_timeout{60000}; ///< Give up on files still being written
    std::string unknown_message_log; ///< Empty disables the unknown-message log
    std::string metadata_path; ///< Empty disables the sync metadata store

    /**
     * @brief Check every field a pipeline needs before it can start
     *
     * @param create_folder Create the sync folder if it does not exist
     * @return CONFIG_ERROR describing the first problem, or success
     */
    ChituError validate(bool create_folder = true) const;
};

} // namespace chitusync
