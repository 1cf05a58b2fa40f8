// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace chitusync {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    // Journal if available, else syslog (Linux) or console only
    Journal, // systemd journal
    Syslog,  // Traditional syslog
    File,    // Rotating log file
    Console  // Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    std::string file_path; ///< Override for LogTarget::File
    bool enable_console = true;
};

/**
 * @brief Create the default "chitusync" logger with console + system sinks
 *
 * Also enables a 32-message backtrace buffer.
 */
void init(const LogConfig& config);

LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Map -v count to a level: 0=warn, 1=info, 2=debug, 3+=trace
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

/// Parse "info", "debug", ...; returns @p fallback for unknown names
spdlog::level::level_enum parse_log_level(const std::string& name,
                                          spdlog::level::level_enum fallback);

/**
 * @brief File logger for datagrams the command channel could not attribute
 *
 * Each line is an ISO timestamp followed by the datagram in hex.
 *
 * @return nullptr if the file cannot be opened
 */
std::shared_ptr<spdlog::logger> create_unknown_message_logger(const std::string& path);

/// Lower-case hex without separators
std::string hex_encode(const std::string& data);

} // namespace logging
} // namespace chitusync
