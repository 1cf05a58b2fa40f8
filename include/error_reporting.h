// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <functional>
#include <string>

/**
 * @file error_reporting.h
 * @brief Convenience macros for error reporting with user notifications
 *
 * These macros combine spdlog logging with a process-wide notification hook.
 * The daemon leaves the hook unset (log only); the command-line front end
 * installs one that prints to stderr.
 *
 * Usage Examples:
 * ```cpp
 * // Internal error (logged but not shown to user)
 * LOG_ERROR_INTERNAL("Failed to parse metadata: {}", path);
 *
 * // User-facing error (logged + notification)
 * NOTIFY_ERROR("Failed to save configuration");
 * ```
 */

namespace chitusync {

enum class NotificationLevel { INFO, WARNING, ERROR };

using NotificationHandler = std::function<void(NotificationLevel, const std::string&)>;

/// Install the notification hook (nullptr restores log-only behaviour)
void set_notification_handler(NotificationHandler handler);

/// Deliver a user-facing message to the installed hook, if any
void notify_user(NotificationLevel level, const std::string& message);

} // namespace chitusync

// ============================================================================
// Internal Errors (Log Only)
// ============================================================================

/**
 * @brief Log internal error (not shown to user)
 *
 * Use for callback failures, corrupt state files and other internal issues
 * that don't require user action.
 */
#define LOG_ERROR_INTERNAL(msg, ...) spdlog::error("[INTERNAL] " msg, ##__VA_ARGS__)

/**
 * @brief Log internal warning (not shown to user)
 */
#define LOG_WARN_INTERNAL(msg, ...) spdlog::warn("[INTERNAL] " msg, ##__VA_ARGS__)

// ============================================================================
// User-Facing Errors (Log + Notification)
// ============================================================================

#define NOTIFY_ERROR(msg, ...)                                                                     \
    do {                                                                                           \
        std::string formatted_msg = fmt::format(msg, ##__VA_ARGS__);                               \
        spdlog::error("[USER] {}", formatted_msg);                                                 \
        chitusync::notify_user(chitusync::NotificationLevel::ERROR, formatted_msg);                \
    } while (0)

#define NOTIFY_WARNING(msg, ...)                                                                   \
    do {                                                                                           \
        std::string formatted_msg = fmt::format(msg, ##__VA_ARGS__);                               \
        spdlog::warn("[USER] {}", formatted_msg);                                                  \
        chitusync::notify_user(chitusync::NotificationLevel::WARNING, formatted_msg);              \
    } while (0)

#define NOTIFY_INFO(msg, ...)                                                                      \
    do {                                                                                           \
        std::string formatted_msg = fmt::format(msg, ##__VA_ARGS__);                               \
        spdlog::info("[USER] {}", formatted_msg);                                                  \
        chitusync::notify_user(chitusync::NotificationLevel::INFO, formatted_msg);                 \
    } while (0)
