// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "chitu_protocol.h"
#include "local_scanner.h"

#include "../test_helpers/sync_test_helpers.h"

#include <atomic>
#include <thread>

#include <catch2/catch.hpp>

using namespace chitusync;
using namespace std::chrono_literals;
using sync_test::ScopedTempDir;
using sync_test::write_job_file;

class LocalScannerTestFixture {
  public:
    LocalScannerTestFixture()
        : tmp("chitusync_scanner_test"), scanner(tmp.str(), std::make_shared<const ChituProtocol>()) {}

    ScopedTempDir tmp;
    LocalScanner scanner;
};

TEST_CASE_METHOD(LocalScannerTestFixture, "LocalScanner: snapshot holds job files only",
                 "[scanner]") {
    write_job_file(tmp.file("a.ctb"), 1234);
    write_job_file(tmp.file("B.GOO"), 10);
    write_job_file(tmp.file("readme.txt"), 10);
    sync_test::fs::create_directories(tmp.path() / "dir.ctb");

    LocalSnapshotPtr snapshot;
    REQUIRE(scanner.scan(snapshot).ok());

    REQUIRE(snapshot->size() == 2);
    REQUIRE(snapshot->find("a.ctb")->size == 1234);
    REQUIRE(snapshot->find("a.ctb")->mtime_ns > 0);
    REQUIRE(snapshot->contains("B.GOO"));
    REQUIRE_FALSE(snapshot->contains("readme.txt"));
    REQUIRE_FALSE(snapshot->contains("dir.ctb"));
}

TEST_CASE_METHOD(LocalScannerTestFixture, "LocalScanner: each scan is a new snapshot",
                 "[scanner]") {
    write_job_file(tmp.file("a.ctb"), 10);
    LocalSnapshotPtr first;
    REQUIRE(scanner.scan(first).ok());

    write_job_file(tmp.file("b.ctb"), 10);
    LocalSnapshotPtr second;
    REQUIRE(scanner.scan(second).ok());

    REQUIRE(first->size() == 1);
    REQUIRE(second->size() == 2);
}

TEST_CASE("LocalScanner: unreadable folder", "[scanner]") {
    LocalScanner scanner("/nonexistent/chitusync", std::make_shared<const ChituProtocol>());
    LocalSnapshotPtr snapshot;

    REQUIRE(scanner.scan(snapshot).type == ChituErrorType::FILE_ERROR);
}

TEST_CASE_METHOD(LocalScannerTestFixture, "LocalScanner: wait_until_stable", "[scanner][stable]") {
    SECTION("settled file returns after the stable period") {
        write_job_file(tmp.file("a.ctb"), 100);
        auto start = std::chrono::steady_clock::now();
        REQUIRE(scanner.wait_until_stable("a.ctb", 150ms, 2000ms).ok());
        REQUIRE(std::chrono::steady_clock::now() - start >= 150ms);
    }

    SECTION("growing file waits for the writer") {
        write_job_file(tmp.file("a.ctb"), 100);
        std::thread writer([this]() {
            for (size_t i = 2; i <= 4; i++) {
                std::this_thread::sleep_for(60ms);
                write_job_file(tmp.file("a.ctb"), 100 * i);
            }
        });
        REQUIRE(scanner.wait_until_stable("a.ctb", 150ms, 3000ms).ok());
        writer.join();

        LocalFileRecord record;
        REQUIRE(scanner.stat_file("a.ctb", record));
        REQUIRE(record.size == 400);
    }

    SECTION("vanished file") {
        REQUIRE(scanner.wait_until_stable("gone.ctb", 100ms, 1000ms).type ==
                ChituErrorType::FILE_ERROR);
    }

    SECTION("cancelled") {
        write_job_file(tmp.file("a.ctb"), 100);
        std::atomic<bool> cancel{true};
        REQUIRE(scanner.wait_until_stable("a.ctb", 500ms, 1000ms, &cancel).type ==
                ChituErrorType::CANCELLED);
    }
}
