// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "chitu_protocol.h"
#include "folder_watcher.h"

#include "../test_helpers/sync_test_helpers.h"

#include <atomic>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <set>
#include <stdexcept>
#include <sys/inotify.h>

#include <catch2/catch.hpp>

using namespace chitusync;
using namespace std::chrono_literals;
using sync_test::ScopedTempDir;

class FolderWatcherTestFixture {
  public:
    FolderWatcherTestFixture()
        : tmp("chitusync_watcher_test"),
          watcher(tmp.str(), std::make_shared<const ChituProtocol>()) {
        watcher.set_change_callback([this](const std::string& name) {
            std::lock_guard<std::mutex> lock(mutex);
            changed.insert(name);
        });
    }

    ~FolderWatcherTestFixture() {
        watcher.stop();
    }

    bool saw(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        return changed.count(name) != 0;
    }

    ScopedTempDir tmp;
    FolderWatcher watcher;
    std::mutex mutex;
    std::set<std::string> changed;
};

TEST_CASE_METHOD(FolderWatcherTestFixture, "FolderWatcher: reports created job files",
                 "[watcher]") {
    REQUIRE(watcher.start().ok());
    REQUIRE(watcher.is_running());

    sync_test::write_job_file(tmp.file("a.ctb"), 100);

    REQUIRE(sync_test::wait_for([&]() { return saw("a.ctb"); }, 2000ms));
}

TEST_CASE_METHOD(FolderWatcherTestFixture, "FolderWatcher: reports deletes and renames",
                 "[watcher]") {
    sync_test::write_job_file(tmp.file("a.ctb"), 100);
    sync_test::write_job_file(tmp.file("b.ctb"), 100);
    REQUIRE(watcher.start().ok());

    std::remove(tmp.file("a.ctb").c_str());
    std::rename(tmp.file("b.ctb").c_str(), tmp.file("c.goo").c_str());

    REQUIRE(sync_test::wait_for([&]() { return saw("a.ctb") && saw("b.ctb") && saw("c.goo"); },
                                2000ms));
}

TEST_CASE_METHOD(FolderWatcherTestFixture, "FolderWatcher: ignores non-job files",
                 "[watcher]") {
    REQUIRE(watcher.start().ok());

    sync_test::write_job_file(tmp.file("notes.txt"), 10);
    sync_test::write_job_file(tmp.file("marker.ctb"), 10);

    REQUIRE(sync_test::wait_for([&]() { return saw("marker.ctb"); }, 2000ms));
    REQUIRE_FALSE(saw("notes.txt"));
}

TEST_CASE("FolderWatcher: missing folder fails to start", "[watcher]") {
    FolderWatcher watcher("/nonexistent/chitusync/folder", std::make_shared<const ChituProtocol>());

    auto err = watcher.start();

    REQUIRE(err.type == ChituErrorType::FILE_ERROR);
    REQUIRE_FALSE(watcher.is_running());
}

TEST_CASE_METHOD(FolderWatcherTestFixture, "FolderWatcher: stop is idempotent", "[watcher]") {
    REQUIRE(watcher.start().ok());
    watcher.stop();
    watcher.stop();
    REQUIRE_FALSE(watcher.is_running());

    // Restartable
    REQUIRE(watcher.start().ok());
    REQUIRE(watcher.is_running());
}

TEST_CASE_METHOD(FolderWatcherTestFixture, "FolderWatcher: queue overflow requests a rescan",
                 "[watcher][overflow]") {
    std::atomic<int> overflows{0};
    watcher.set_overflow_callback([&overflows]() { overflows++; });

    // Two overflow records in one read still mean one rescan
    alignas(struct inotify_event) char buf[2 * sizeof(struct inotify_event)];
    struct inotify_event event;
    std::memset(&event, 0, sizeof(event));
    event.wd = -1;
    event.mask = IN_Q_OVERFLOW;
    std::memcpy(buf, &event, sizeof(event));
    std::memcpy(buf + sizeof(event), &event, sizeof(event));

    watcher.process_events(buf, sizeof(buf));

    REQUIRE(overflows == 1);
    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(changed.empty());
}

TEST_CASE_METHOD(FolderWatcherTestFixture, "FolderWatcher: throwing overflow callback is contained",
                 "[watcher][overflow]") {
    watcher.set_overflow_callback([]() { throw std::runtime_error("boom"); });

    alignas(struct inotify_event) char buf[sizeof(struct inotify_event)];
    struct inotify_event event;
    std::memset(&event, 0, sizeof(event));
    event.wd = -1;
    event.mask = IN_Q_OVERFLOW;
    std::memcpy(buf, &event, sizeof(event));

    REQUIRE_NOTHROW(watcher.process_events(buf, sizeof(buf)));
}
