// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "board_protocol.h"
#include "command_channel.h"
#include "connection_manager.h"
#include "file_transfer_engine.h"
#include "folder_watcher.h"
#include "local_scanner.h"
#include "print_controller.h"
#include "remote_mirror.h"
#include "sync_config.h"
#include "sync_events.h"
#include "sync_metadata_store.h"

#include "hv/EventLoopThread.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace chitusync {

/**
 * @brief Top-level folder reconciliation pipeline
 *
 * Owns every component for one configuration:
 * - a worker thread that executes plan operations strictly one at a time,
 * - an event-loop thread hosting the reconnect, mirror and status timers,
 * - the folder watcher's inotify thread, which only enqueues.
 *
 * Inputs are debounced per-path folder events and full-pass requests (mirror
 * timer, reconnection, manual sync, print finished). Deletes run before
 * uploads. A failed operation is reported and left for the next full pass;
 * an operation interrupted by connection loss is requeued.
 *
 * Configuration is fixed for the engine's lifetime. Reconfiguring means
 * destroying the engine (cancelling any transfer, tearing down the session,
 * joining all threads) and constructing a new one.
 */
class SyncEngine {
  public:
    /**
     * @param config Validated by start()
     * @param observer Receives all status events (may be nullptr)
     * @param factory Transport factory; defaults to UDP
     * @param protocol Board grammar; defaults to ChituProtocol
     */
    SyncEngine(SyncConfig config, SyncObserverPtr observer,
               ConnectionManager::TransportFactory factory = nullptr,
               std::shared_ptr<const BoardProtocol> protocol = nullptr);
    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    /**
     * @brief Validate the configuration and start all threads
     *
     * @return CONFIG_ERROR (pipeline not started) or FILE_ERROR if the folder
     *         cannot be watched
     */
    ChituError start();

    /// Cancel in-flight work and join every thread; idempotent
    void stop();

    bool is_running() const {
        return running_.load();
    }

    /// Queue a full mirror pass (manual "sync now")
    void request_full_pass(const std::string& reason);

    /// Queue a debounced operation for one local file
    void notify_local_change(const std::string& name);

    /// Block until no work is pending or in flight, or @p timeout passes
    bool wait_idle(std::chrono::milliseconds timeout);

    SyncStatus get_status() const {
        return status_.load();
    }

    ConnectionState get_connection_state() const {
        return manager_.get_connection_state();
    }

    const SyncConfig& config() const {
        return config_;
    }

    ConnectionManager& connection_manager() {
        return manager_;
    }

    PrintController& print_controller() {
        return print_controller_;
    }

    RemoteMirror& remote_mirror() {
        return mirror_;
    }

    /// Completed full passes (for diagnostics and tests)
    uint32_t completed_passes() const {
        return completed_passes_.load();
    }

  private:
    void worker_thread_func();
    void run_full_pass(const std::string& reason);
    void run_pending_paths(const std::set<std::string>& names);
    void execute_plan(const ReconciliationPlan& plan, bool full_pass);
    ChituError execute_operation(const PlanOperation& op);
    ChituError execute_upload(const std::string& name);
    ChituError execute_delete(const std::string& name);

    /// True when the board is printing; the pending work is kept
    bool printer_busy();

    void on_connection_state(ConnectionState old_state, ConnectionState new_state);
    void on_print_status(const PrintJobStatus& status);
    void set_status(SyncStatus status);
    void replace_remote_snapshot(const std::string& name, const RemoteFileRecord* record);

    template <typename Fn> void notify_observer(const char* what, Fn&& fn);

    const SyncConfig config_;
    SyncObserverPtr observer_;
    std::shared_ptr<const BoardProtocol> protocol_;

    ConnectionManager manager_;
    CommandChannel channel_;
    FileTransferEngine transfer_;
    RemoteMirror mirror_;
    LocalScanner scanner_;
    PrintController print_controller_;
    FolderWatcher watcher_;
    std::unique_ptr<SyncMetadataStore> metadata_;

    hv::EventLoopThread loop_thread_;
    hv::TimerID mirror_timer_ = INVALID_TIMER_ID;

    // Work queue, guarded by queue_mutex_
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::map<std::string, std::chrono::steady_clock::time_point> pending_paths_;
    bool full_pass_requested_ = false;
    std::string full_pass_reason_;
    bool busy_ = false;
    bool deferred_ = false;

    // Last remote listing, replaced (never mutated) after each operation
    std::mutex remote_mutex_;
    RemoteSnapshotPtr remote_snapshot_;

    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<SyncStatus> status_{SyncStatus::OFFLINE};
    std::atomic<uint32_t> completed_passes_{0};
};

} // namespace chitusync
