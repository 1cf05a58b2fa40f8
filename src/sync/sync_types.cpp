// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sync_types.h"

namespace chitusync {

const char* connection_state_name(ConnectionState state) {
    switch (state) {
    case ConnectionState::DISCONNECTED:
        return "disconnected";
    case ConnectionState::CONNECTING:
        return "connecting";
    case ConnectionState::CONNECTED:
        return "connected";
    }
    return "unknown";
}

const char* plan_operation_kind_name(PlanOperation::Kind kind) {
    switch (kind) {
    case PlanOperation::Kind::UPLOAD:
        return "upload";
    case PlanOperation::Kind::DELETE:
        return "delete";
    }
    return "unknown";
}

const char* print_state_name(PrintJobStatus::State state) {
    switch (state) {
    case PrintJobStatus::State::IDLE:
        return "idle";
    case PrintJobStatus::State::PRINTING:
        return "printing";
    case PrintJobStatus::State::PAUSED:
        return "paused";
    case PrintJobStatus::State::ERROR:
        return "error";
    }
    return "unknown";
}

const char* sync_status_name(SyncStatus status) {
    switch (status) {
    case SyncStatus::OFFLINE:
        return "offline";
    case SyncStatus::SYNCING:
        return "syncing";
    case SyncStatus::SYNCED:
        return "synced";
    case SyncStatus::ERROR:
        return "error";
    }
    return "unknown";
}

} // namespace chitusync
