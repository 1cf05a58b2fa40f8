// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chitu_error.h"
#include "sync_types.h"

#include <memory>

namespace chitusync {

/**
 * @brief Summary published when a reconciliation pass ends
 */
struct PassSummary {
    size_t succeeded = 0;
    size_t failed = 0;
    size_t requeued = 0; ///< Interrupted by connection loss, retried after reconnect
    bool deferred = false; ///< Pass skipped because the board is printing
};

/**
 * @brief Receiver of everything the sync core reports outward
 *
 * Replaces direct UI calls so the core has no dependency on a toolkit.
 * Methods are invoked from the engine's worker, event loop or watcher
 * threads; implementations must be thread-safe and must not block for long.
 * All methods default to no-ops.
 */
class SyncObserver {
  public:
    virtual ~SyncObserver() = default;

    virtual void on_connection_state(ConnectionState /*old_state*/, ConnectionState /*new_state*/) {
    }

    virtual void on_board_info(const BoardInfo& /*info*/) {}

    virtual void on_sync_status(SyncStatus /*status*/) {}

    virtual void on_plan_started(const ReconciliationPlan& /*plan*/) {}

    virtual void on_plan_finished(const PassSummary& /*summary*/) {}

    /// @param error Default-constructed on success
    virtual void on_operation_result(const PlanOperation& /*op*/, const ChituError& /*error*/) {}

    virtual void on_transfer_progress(const TransferProgress& /*progress*/) {}

    virtual void on_print_status(const PrintJobStatus& /*status*/) {}

    /// Non-operation errors: config problems, connect failures, poll failures
    virtual void on_error(const ChituError& /*error*/) {}
};

using SyncObserverPtr = std::shared_ptr<SyncObserver>;

} // namespace chitusync
