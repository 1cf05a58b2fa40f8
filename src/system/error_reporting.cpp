// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "error_reporting.h"

#include <mutex>

namespace chitusync {

namespace {

std::mutex g_handler_mutex;
NotificationHandler g_handler;

} // namespace

void set_notification_handler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(g_handler_mutex);
    g_handler = std::move(handler);
}

void notify_user(NotificationLevel level, const std::string& message) {
    NotificationHandler handler_copy;
    {
        std::lock_guard<std::mutex> lock(g_handler_mutex);
        handler_copy = g_handler;
    }
    if (!handler_copy) {
        return;
    }
    try {
        handler_copy(level, message);
    } catch (const std::exception& e) {
        spdlog::error("[INTERNAL] Notification handler threw: {}", e.what());
    }
}

} // namespace chitusync
