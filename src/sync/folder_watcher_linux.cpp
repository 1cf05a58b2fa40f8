// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "folder_watcher.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <set>
#include <sys/inotify.h>
#include <unistd.h>

namespace chitusync {

namespace {

constexpr uint32_t WATCH_MASK = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_FROM |
                                IN_MOVED_TO | IN_DELETE;

} // namespace

FolderWatcher::FolderWatcher(std::string folder, std::shared_ptr<const BoardProtocol> protocol)
    : folder_(std::move(folder)), protocol_(std::move(protocol)) {}

FolderWatcher::~FolderWatcher() {
    stop();
}

ChituError FolderWatcher::start() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (running_) {
        return {};
    }

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        spdlog::error("[FolderWatcher] Failed to init inotify: {}", strerror(errno));
        return ChituError::file_error(folder_, std::string("inotify_init failed: ") +
                                                   strerror(errno));
    }

    watch_fd_ = inotify_add_watch(inotify_fd_, folder_.c_str(), WATCH_MASK);
    if (watch_fd_ < 0) {
        int saved = errno;
        spdlog::error("[FolderWatcher] Failed to watch {}: {}", folder_, strerror(saved));
        close(inotify_fd_);
        inotify_fd_ = -1;
        return ChituError::file_error(folder_, std::string("inotify_add_watch failed: ") +
                                                   strerror(saved));
    }

    stop_requested_ = false;
    running_ = true;
    monitor_thread_ = std::thread(&FolderWatcher::monitor_thread_func, this);

    spdlog::info("[FolderWatcher] Watching {}", folder_);
    return {};
}

void FolderWatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }

    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }

    if (watch_fd_ >= 0) {
        inotify_rm_watch(inotify_fd_, watch_fd_);
        watch_fd_ = -1;
    }
    if (inotify_fd_ >= 0) {
        close(inotify_fd_);
        inotify_fd_ = -1;
    }

    running_ = false;
    spdlog::info("[FolderWatcher] Stopped");
}

bool FolderWatcher::is_running() const {
    return running_;
}

void FolderWatcher::set_change_callback(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_callback_ = std::move(callback);
}

void FolderWatcher::set_overflow_callback(OverflowCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    overflow_callback_ = std::move(callback);
}

void FolderWatcher::process_events(const char* buf, size_t len) {
    // Collapse the batch: one notification per name
    std::set<std::string> changed;
    bool overflowed = false;
    for (const char* ptr = buf; ptr < buf + len;) {
        const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
        if (event->mask & IN_Q_OVERFLOW) {
            overflowed = true;
        } else if (event->wd == watch_fd_ && event->len > 0 && !(event->mask & IN_ISDIR)) {
            std::string name(event->name);
            if (protocol_->is_job_file(name)) {
                changed.insert(name);
            }
        }
        ptr += sizeof(struct inotify_event) + event->len;
    }

    ChangeCallback change_copy;
    OverflowCallback overflow_copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        change_copy = change_callback_;
        overflow_copy = overflow_callback_;
    }

    if (overflowed) {
        spdlog::warn("[FolderWatcher] inotify queue overflow, events lost");
        if (overflow_copy) {
            try {
                overflow_copy();
            } catch (const std::exception& e) {
                LOG_ERROR_INTERNAL("[FolderWatcher] Overflow callback threw: {}", e.what());
            }
        }
    }

    if (!change_copy) {
        return;
    }
    for (const auto& name : changed) {
        spdlog::trace("[FolderWatcher] Change: {}", name);
        try {
            change_copy(name);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[FolderWatcher] Change callback threw: {}", e.what());
        }
    }
}

void FolderWatcher::monitor_thread_func() {
    spdlog::debug("[FolderWatcher] Monitor thread started");

    constexpr size_t EVENT_BUF_SIZE = 4096;
    alignas(struct inotify_event) char event_buf[EVENT_BUF_SIZE];

    while (!stop_requested_) {
        struct pollfd pfd;
        pfd.fd = inotify_fd_;
        pfd.events = POLLIN;

        int ret = poll(&pfd, 1, 500); // 500ms timeout
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[FolderWatcher] poll() failed: {}", strerror(errno));
            break;
        }

        if (ret == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        ssize_t len = read(inotify_fd_, event_buf, EVENT_BUF_SIZE);
        if (len < 0) {
            if (errno == EAGAIN) {
                continue;
            }
            spdlog::error("[FolderWatcher] read() failed: {}", strerror(errno));
            break;
        }

        process_events(event_buf, static_cast<size_t>(len));
    }

    spdlog::debug("[FolderWatcher] Monitor thread exiting");
}

} // namespace chitusync
