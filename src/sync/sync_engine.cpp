// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sync_engine.h"

#include "chitu_protocol.h"
#include "error_reporting.h"
#include "logging_init.h"
#include "reconciliation_planner.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace chitusync {

namespace {

std::shared_ptr<const BoardProtocol> default_protocol(std::shared_ptr<const BoardProtocol> p) {
    if (p) {
        return p;
    }
    return std::make_shared<ChituProtocol>();
}

} // namespace

SyncEngine::SyncEngine(SyncConfig config, SyncObserverPtr observer,
                       ConnectionManager::TransportFactory factory,
                       std::shared_ptr<const BoardProtocol> protocol)
    : config_(std::move(config)), observer_(std::move(observer)),
      protocol_(default_protocol(std::move(protocol))),
      manager_(config_.endpoint, protocol_, std::move(factory)),
      channel_(manager_, protocol_, config_.endpoint.command_timeout),
      transfer_(channel_, config_.endpoint.chunk_delay), mirror_(channel_),
      scanner_(config_.sync_folder, protocol_),
      print_controller_(channel_, config_.status_poll_interval),
      watcher_(config_.sync_folder, protocol_) {
    manager_.set_state_change_callback(
        [this](ConnectionState old_state, ConnectionState new_state) {
            on_connection_state(old_state, new_state);
        });
    manager_.set_connected_callback([this](const BoardInfo& info) {
        notify_observer("on_board_info", [&](SyncObserver& o) { o.on_board_info(info); });
        request_full_pass("connected");
    });
    print_controller_.set_status_callback(
        [this](const PrintJobStatus& status) { on_print_status(status); });
    print_controller_.set_finished_callback([this]() { request_full_pass("print finished"); });
    watcher_.set_change_callback([this](const std::string& name) { notify_local_change(name); });
    watcher_.set_overflow_callback([this]() { request_full_pass("watcher overflow"); });
}

SyncEngine::~SyncEngine() {
    stop();
}

template <typename Fn> void SyncEngine::notify_observer(const char* what, Fn&& fn) {
    if (!observer_) {
        return;
    }
    try {
        fn(*observer_);
    } catch (const std::exception& e) {
        LOG_ERROR_INTERNAL("[SyncEngine] Observer {} threw: {}", what, e.what());
    }
}

ChituError SyncEngine::start() {
    if (running_) {
        return {};
    }

    ChituError err = config_.validate();
    if (err.has_error()) {
        spdlog::error("[SyncEngine] Invalid configuration: {}", err.message);
        set_status(SyncStatus::ERROR);
        notify_observer("on_error", [&](SyncObserver& o) { o.on_error(err); });
        return err;
    }

    if (!config_.metadata_path.empty()) {
        metadata_ = std::make_unique<SyncMetadataStore>(config_.metadata_path);
        metadata_->load();
    }
    if (!config_.unknown_message_log.empty()) {
        channel_.set_unknown_message_logger(
            logging::create_unknown_message_logger(config_.unknown_message_log));
    }

    err = watcher_.start();
    if (err.has_error()) {
        set_status(SyncStatus::ERROR);
        notify_observer("on_error", [&](SyncObserver& o) { o.on_error(err); });
        return err;
    }

    stop_requested_ = false;
    running_ = true;
    worker_thread_ = std::thread(&SyncEngine::worker_thread_func, this);

    loop_thread_.start(true);
    hv::EventLoopPtr loop = loop_thread_.loop();
    print_controller_.attach_loop(loop);
    mirror_timer_ = loop->setTimerInLoop(
        static_cast<int>(config_.mirror_interval.count()),
        [this](hv::TimerID) {
            if (manager_.get_connection_state() == ConnectionState::CONNECTED) {
                request_full_pass("mirror timer");
            }
        },
        INFINITE);
    manager_.start(loop);

    spdlog::info("[SyncEngine] Started: {} <-> {}:{} (mirror every {}s, deletion {})",
                 config_.sync_folder, config_.endpoint.host, config_.endpoint.port,
                 config_.mirror_interval.count() / 1000,
                 config_.remote_deletion ? "on" : "off");
    return {};
}

void SyncEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    spdlog::info("[SyncEngine] Stopping");

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_requested_ = true;
    }
    queue_cv_.notify_all();

    watcher_.stop();

    // No new sessions from here on; the pending exchange fails promptly
    manager_.stop();
    print_controller_.stop_polling();
    if (mirror_timer_ != INVALID_TIMER_ID && loop_thread_.loop()) {
        loop_thread_.loop()->killTimer(mirror_timer_);
        mirror_timer_ = INVALID_TIMER_ID;
    }
    manager_.drop_session(ChituError::cancelled("Sync pipeline"));

    loop_thread_.stop(true);
    loop_thread_.join();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    if (metadata_) {
        ChituError err = metadata_->save();
        if (err.has_error()) {
            spdlog::warn("[SyncEngine] {}", err.message);
        }
    }

    set_status(SyncStatus::OFFLINE);
    spdlog::info("[SyncEngine] Stopped");
}

void SyncEngine::request_full_pass(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        full_pass_requested_ = true;
        full_pass_reason_ = reason;
    }
    spdlog::debug("[SyncEngine] Full pass requested ({})", reason);
    queue_cv_.notify_all();
}

void SyncEngine::notify_local_change(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pending_paths_[name] = std::chrono::steady_clock::now();
    }
    queue_cv_.notify_all();
}

bool SyncEngine::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return queue_cv_.wait_for(lock, timeout, [this] {
        return !busy_ && !full_pass_requested_ && pending_paths_.empty();
    });
}

void SyncEngine::set_status(SyncStatus status) {
    SyncStatus old_status = status_.exchange(status);
    if (old_status == status) {
        return;
    }
    spdlog::debug("[SyncEngine] Status: {} -> {}", sync_status_name(old_status),
                  sync_status_name(status));
    notify_observer("on_sync_status", [&](SyncObserver& o) { o.on_sync_status(status); });
}

void SyncEngine::on_connection_state(ConnectionState old_state, ConnectionState new_state) {
    notify_observer("on_connection_state",
                    [&](SyncObserver& o) { o.on_connection_state(old_state, new_state); });

    if (new_state == ConnectionState::DISCONNECTED) {
        print_controller_.stop_polling();
        set_status(SyncStatus::OFFLINE);
    } else if (new_state == ConnectionState::CONNECTED) {
        // Busy state is re-checked by the first pass on the new session
        std::lock_guard<std::mutex> lock(queue_mutex_);
        deferred_ = false;
    }
    queue_cv_.notify_all();
}

void SyncEngine::on_print_status(const PrintJobStatus& status) {
    notify_observer("on_print_status", [&](SyncObserver& o) { o.on_print_status(status); });

    if (!status.is_active()) {
        bool resumed = false;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            resumed = deferred_;
            deferred_ = false;
        }
        if (resumed) {
            spdlog::info("[SyncEngine] Printer idle, resuming deferred work");
            queue_cv_.notify_all();
        }
    }
}

void SyncEngine::worker_thread_func() {
    spdlog::debug("[SyncEngine] Worker thread started");
    using clock = std::chrono::steady_clock;

    while (true) {
        bool do_full_pass = false;
        std::string reason;
        std::set<std::string> due;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            while (true) {
                if (stop_requested_) {
                    spdlog::debug("[SyncEngine] Worker thread exiting");
                    return;
                }
                if (!deferred_ && full_pass_requested_) {
                    do_full_pass = true;
                    reason = full_pass_reason_;
                    full_pass_requested_ = false;
                    break;
                }

                auto now = clock::now();
                auto next_due = clock::time_point::max();
                bool connected = manager_.get_connection_state() == ConnectionState::CONNECTED;
                if (connected && !deferred_) {
                    for (auto it = pending_paths_.begin(); it != pending_paths_.end();) {
                        auto ready_at = it->second + config_.debounce;
                        if (ready_at <= now) {
                            due.insert(it->first);
                            it = pending_paths_.erase(it);
                        } else {
                            next_due = std::min(next_due, ready_at);
                            ++it;
                        }
                    }
                    if (!due.empty()) {
                        break;
                    }
                }

                if (next_due == clock::time_point::max()) {
                    queue_cv_.wait(lock);
                } else {
                    queue_cv_.wait_until(lock, next_due);
                }
            }
            busy_ = true;
        }

        if (do_full_pass) {
            run_full_pass(reason);
        } else {
            run_pending_paths(due);
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            busy_ = false;
        }
        queue_cv_.notify_all();
    }
}

bool SyncEngine::printer_busy() {
    PrintJobStatus status;
    ChituError err = print_controller_.poll_status(status);
    if (err.has_error()) {
        // Connection-level errors already dropped the session; the reconnect pass retries
        spdlog::debug("[SyncEngine] Status check failed: {}", err.message);
        return true;
    }
    if (!status.is_active()) {
        return false;
    }

    spdlog::info("[SyncEngine] Printer is {} ({:.1f}%), deferring sync",
                 print_state_name(status.state), status.progress_percent());
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        deferred_ = true;
    }
    PassSummary summary;
    summary.deferred = true;
    notify_observer("on_plan_finished", [&](SyncObserver& o) { o.on_plan_finished(summary); });
    return true;
}

void SyncEngine::run_full_pass(const std::string& reason) {
    spdlog::info("[SyncEngine] Full pass ({})", reason);

    ChituError err;
    if (!manager_.ensure_connected(err)) {
        spdlog::debug("[SyncEngine] Printer offline, pass skipped: {}", err.message);
        set_status(SyncStatus::OFFLINE);
        return;
    }
    {
        // This pass covers the request raised by the connect above
        std::lock_guard<std::mutex> lock(queue_mutex_);
        full_pass_requested_ = false;
    }

    if (printer_busy()) {
        if (manager_.get_connection_state() == ConnectionState::CONNECTED) {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            full_pass_requested_ = true;
            full_pass_reason_ = reason;
        }
        return;
    }

    set_status(SyncStatus::SYNCING);

    LocalSnapshotPtr local;
    err = scanner_.scan(local);
    if (err.has_error()) {
        spdlog::error("[SyncEngine] {}", err.message);
        set_status(SyncStatus::ERROR);
        notify_observer("on_error", [&](SyncObserver& o) { o.on_error(err); });
        return;
    }

    RemoteSnapshotPtr remote;
    err = mirror_.list_remote(remote);
    if (err.has_error()) {
        spdlog::warn("[SyncEngine] Listing failed: {}", err.message);
        notify_observer("on_error", [&](SyncObserver& o) { o.on_error(err); });
        if (!err.is_connection_level()) {
            set_status(SyncStatus::ERROR);
        }
        return;
    }
    {
        std::lock_guard<std::mutex> lock(remote_mutex_);
        remote_snapshot_ = remote;
    }

    ReconciliationPlan plan = ReconciliationPlanner::plan(*local, *remote, config_.remote_deletion);
    if (metadata_) {
        for (const auto& name : metadata_->stale_files(*local, *remote)) {
            PlanOperation op{PlanOperation::Kind::UPLOAD, name};
            if (std::find(plan.begin(), plan.end(), op) == plan.end()) {
                plan.push_back(op);
            }
        }
        ReconciliationPlanner::order(plan);
    }

    spdlog::info("[SyncEngine] {} local, {} remote, {} operations", local->size(), remote->size(),
                 plan.size());
    execute_plan(plan, true);

    if (metadata_) {
        std::set<std::string> keep;
        for (const auto& [name, record] : local->records()) {
            keep.insert(name);
        }
        size_t purged = metadata_->purge(keep);
        if (purged > 0) {
            spdlog::debug("[SyncEngine] Purged {} stale metadata records", purged);
        }
        err = metadata_->save();
        if (err.has_error()) {
            spdlog::warn("[SyncEngine] {}", err.message);
        }
    }
    completed_passes_++;
}

void SyncEngine::run_pending_paths(const std::set<std::string>& names) {
    auto requeue = [this, &names]() {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        auto now = std::chrono::steady_clock::now();
        for (const auto& name : names) {
            pending_paths_.emplace(name, now);
        }
    };

    ChituError err;
    if (!manager_.ensure_connected(err)) {
        requeue();
        return;
    }
    if (printer_busy()) {
        requeue();
        return;
    }

    LocalSnapshotPtr local;
    err = scanner_.scan(local);
    if (err.has_error()) {
        spdlog::error("[SyncEngine] {}", err.message);
        notify_observer("on_error", [&](SyncObserver& o) { o.on_error(err); });
        return;
    }

    RemoteSnapshotPtr remote;
    {
        std::lock_guard<std::mutex> lock(remote_mutex_);
        remote = remote_snapshot_;
    }

    ReconciliationPlan plan = ReconciliationPlanner::plan_for_names(names, *local, remote.get(),
                                                                    config_.remote_deletion);
    if (plan.empty()) {
        return;
    }
    set_status(SyncStatus::SYNCING);
    execute_plan(plan, false);
}

void SyncEngine::execute_plan(const ReconciliationPlan& plan, bool full_pass) {
    notify_observer("on_plan_started", [&](SyncObserver& o) { o.on_plan_started(plan); });

    PassSummary summary;
    for (size_t i = 0; i < plan.size(); i++) {
        const PlanOperation& op = plan[i];
        if (stop_requested_) {
            break;
        }

        ChituError err = execute_operation(op);
        notify_observer("on_operation_result",
                        [&](SyncObserver& o) { o.on_operation_result(op, err); });

        if (err.ok()) {
            summary.succeeded++;
            continue;
        }
        if (err.type == ChituErrorType::CANCELLED) {
            break;
        }
        if (err.is_connection_level()) {
            // Reconnecting triggers a full pass, which replans everything left
            summary.requeued = plan.size() - i;
            spdlog::warn("[SyncEngine] Connection lost during {} {}; {} operations requeued",
                         plan_operation_kind_name(op.kind), op.name, summary.requeued);
            if (!full_pass) {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                auto now = std::chrono::steady_clock::now();
                for (size_t j = i; j < plan.size(); j++) {
                    pending_paths_.emplace(plan[j].name, now);
                }
            }
            break;
        }

        summary.failed++;
        spdlog::error("[SyncEngine] {} {} failed: {}", plan_operation_kind_name(op.kind), op.name,
                      err.message);
    }

    notify_observer("on_plan_finished", [&](SyncObserver& o) { o.on_plan_finished(summary); });

    if (manager_.get_connection_state() != ConnectionState::CONNECTED) {
        set_status(SyncStatus::OFFLINE);
    } else if (summary.failed > 0) {
        set_status(SyncStatus::ERROR);
    } else {
        set_status(SyncStatus::SYNCED);
    }
}

ChituError SyncEngine::execute_operation(const PlanOperation& op) {
    switch (op.kind) {
    case PlanOperation::Kind::UPLOAD:
        return execute_upload(op.name);
    case PlanOperation::Kind::DELETE:
        return execute_delete(op.name);
    }
    return ChituError::invalid_request(op.name, "unknown operation");
}

ChituError SyncEngine::execute_upload(const std::string& name) {
    ChituError err = scanner_.wait_until_stable(name, config_.settle_time, config_.settle_timeout,
                                                &stop_requested_);
    if (err.has_error()) {
        return err;
    }

    LocalFileRecord record;
    if (!scanner_.stat_file(name, record)) {
        return ChituError::file_error(scanner_.path_of(name), "file disappeared");
    }

    err = transfer_.upload(
        scanner_.path_of(name), name,
        [this](const TransferProgress& progress) {
            notify_observer("on_transfer_progress",
                            [&](SyncObserver& o) { o.on_transfer_progress(progress); });
        },
        &stop_requested_);
    if (err.has_error()) {
        return err;
    }

    if (metadata_) {
        metadata_->record(name, record);
        ChituError save_err = metadata_->save();
        if (save_err.has_error()) {
            spdlog::warn("[SyncEngine] {}", save_err.message);
        }
    }
    RemoteFileRecord uploaded{name, record.size};
    replace_remote_snapshot(name, &uploaded);
    return {};
}

ChituError SyncEngine::execute_delete(const std::string& name) {
    ChituError err = mirror_.delete_remote(name);
    if (err.has_error()) {
        return err;
    }
    if (metadata_) {
        metadata_->forget(name);
    }
    replace_remote_snapshot(name, nullptr);
    return {};
}

void SyncEngine::replace_remote_snapshot(const std::string& name, const RemoteFileRecord* record) {
    std::lock_guard<std::mutex> lock(remote_mutex_);
    RemoteSnapshot::Map files;
    if (remote_snapshot_) {
        files = remote_snapshot_->records();
    }
    if (record) {
        files[name] = *record;
    } else {
        files.erase(name);
    }
    remote_snapshot_ = std::make_shared<const RemoteSnapshot>(std::move(files));
}

} // namespace chitusync
