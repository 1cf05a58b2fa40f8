// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <vector>

#ifdef __linux__
#ifdef CHITUSYNC_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace chitusync {
namespace logging {

namespace {

constexpr const char* IDENT = "chitu-sync";
constexpr const char* UNKNOWN_LOGGER_NAME = "unknown_msgs";
constexpr size_t LOG_FILE_MAX_BYTES = 2 * 1024 * 1024;
constexpr size_t LOG_FILE_ROTATIONS = 3;

struct TargetName {
    LogTarget target;
    const char* name;
};

const TargetName TARGET_NAMES[] = {
    {LogTarget::Auto, "auto"},       {LogTarget::Journal, "journal"},
    {LogTarget::Syslog, "syslog"},   {LogTarget::File, "file"},
    {LogTarget::Console, "console"},
};

/// $XDG_STATE_HOME/chitu-sync, ~/.local/state/chitu-sync, or /tmp
std::string default_log_dir() {
    const char* xdg = std::getenv("XDG_STATE_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/chitu-sync";
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/state/chitu-sync";
    }
    return "/tmp";
}

std::string resolve_log_file_path(const std::string& override_path) {
    std::filesystem::path path =
        override_path.empty() ? std::filesystem::path(default_log_dir()) / "chitu-sync.log"
                              : std::filesystem::path(override_path);

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    return path.string();
}

bool journal_available() {
#if defined(__linux__) && defined(CHITUSYNC_HAS_SYSTEMD)
    std::error_code ec;
    return std::filesystem::exists("/run/systemd/journal/socket", ec);
#else
    return false;
#endif
}

/// Resolve Auto and downgrade an unavailable journal
LogTarget effective_target(LogTarget requested) {
    if (requested == LogTarget::Auto || requested == LogTarget::Journal) {
        if (journal_available()) {
            return LogTarget::Journal;
        }
#ifdef __linux__
        return LogTarget::Syslog;
#else
        return requested == LogTarget::Auto ? LogTarget::Console : LogTarget::File;
#endif
    }
    return requested;
}

/// @return nullptr for console-only targets
spdlog::sink_ptr make_system_sink(LogTarget target, const std::string& file_path) {
    switch (target) {
#if defined(__linux__) && defined(CHITUSYNC_HAS_SYSTEMD)
    case LogTarget::Journal:
        return std::make_shared<spdlog::sinks::systemd_sink_mt>(IDENT);
#endif
#ifdef __linux__
    case LogTarget::Syslog:
        return std::make_shared<spdlog::sinks::syslog_sink_mt>(IDENT, LOG_PID, LOG_DAEMON, false);
#endif
    case LogTarget::File:
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            resolve_log_file_path(file_path), LOG_FILE_MAX_BYTES, LOG_FILE_ROTATIONS);
    default:
        return nullptr;
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget target = effective_target(config.target);
    try {
        if (auto sink = make_system_sink(target, config.file_path)) {
            sinks.push_back(std::move(sink));
        }
    } catch (const spdlog::spdlog_ex& e) {
        // Console output survives a sink that cannot be opened
        fprintf(stderr, "%s: cannot open %s log: %s\n", IDENT, log_target_name(target), e.what());
        target = LogTarget::Console;
    }

    auto logger = std::make_shared<spdlog::logger>("chitusync", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    // Dumped by the daemon on fatal errors
    spdlog::enable_backtrace(32);

    spdlog::debug("[Logging] target={} (requested {}), console={}", log_target_name(target),
                  log_target_name(config.target), config.enable_console);
}

LogTarget parse_log_target(const std::string& str) {
    for (const auto& entry : TARGET_NAMES) {
        if (str == entry.name) {
            return entry.target;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    for (const auto& entry : TARGET_NAMES) {
        if (entry.target == target) {
            return entry.name;
        }
    }
    return "unknown";
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity <= 0) {
        return spdlog::level::warn;
    }
    if (verbosity >= 3) {
        return spdlog::level::trace;
    }
    return verbosity == 1 ? spdlog::level::info : spdlog::level::debug;
}

spdlog::level::level_enum parse_log_level(const std::string& name,
                                          spdlog::level::level_enum fallback) {
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        return fallback;
    }
    return level;
}

std::shared_ptr<spdlog::logger> create_unknown_message_logger(const std::string& path) {
    spdlog::drop(UNKNOWN_LOGGER_NAME);
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
        auto logger = std::make_shared<spdlog::logger>(UNKNOWN_LOGGER_NAME, sink);
        logger->set_pattern("%Y-%m-%dT%H:%M:%S.%f %v");
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
        spdlog::debug("[Logging] Unknown printer messages logged to {}", path);
        return logger;
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("[Logging] Cannot open unknown-message log {}: {}", path, e.what());
        return nullptr;
    }
}

std::string hex_encode(const std::string& data) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (unsigned char c : data) {
        out.push_back(digits[c >> 4]);
        out.push_back(digits[c & 0x0F]);
    }
    return out;
}

} // namespace logging
} // namespace chitusync
