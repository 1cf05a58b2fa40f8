// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "board_protocol.h"
#include "chitu_error.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace chitusync {

/**
 * @brief inotify watcher for the sync folder
 *
 * Reports create, modify, close-write, move and delete of job files by name.
 * The folder is not watched recursively. Callbacks run on the monitor
 * thread and must only enqueue work.
 */
class FolderWatcher {
  public:
    using ChangeCallback = std::function<void(const std::string& name)>;
    /// The kernel dropped events; individual changes are unknown
    using OverflowCallback = std::function<void()>;

    FolderWatcher(std::string folder, std::shared_ptr<const BoardProtocol> protocol);
    ~FolderWatcher();

    FolderWatcher(const FolderWatcher&) = delete;
    FolderWatcher& operator=(const FolderWatcher&) = delete;

    /// FILE_ERROR if inotify is unavailable or the folder cannot be watched
    ChituError start();

    void stop();

    bool is_running() const;

    void set_change_callback(ChangeCallback callback);
    void set_overflow_callback(OverflowCallback callback);

    /**
     * @brief Dispatch one buffer of raw inotify events (public for tests)
     *
     * Job-file events collapse to one change callback per name. IN_Q_OVERFLOW
     * invokes the overflow callback once per buffer.
     */
    void process_events(const char* buf, size_t len);

  private:
    void monitor_thread_func();

    std::string folder_;
    std::shared_ptr<const BoardProtocol> protocol_;

    mutable std::mutex mutex_;
    ChangeCallback change_callback_;
    OverflowCallback overflow_callback_;

    int inotify_fd_ = -1;
    int watch_fd_ = -1;
    std::thread monitor_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace chitusync
