// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sync_metadata_store.h"

#include "../test_helpers/sync_test_helpers.h"

#include <fstream>

#include <catch2/catch.hpp>
#include "hv/json.hpp"

using namespace chitusync;
using json = nlohmann::json;
using sync_test::ScopedTempDir;

namespace {

LocalSnapshot local_of(std::initializer_list<LocalFileRecord> records) {
    LocalSnapshot::Map map;
    for (const auto& r : records) {
        map[r.name] = r;
    }
    return LocalSnapshot(std::move(map));
}

RemoteSnapshot remote_of(std::initializer_list<RemoteFileRecord> records) {
    RemoteSnapshot::Map map;
    for (const auto& r : records) {
        map[r.name] = r;
    }
    return RemoteSnapshot(std::move(map));
}

} // namespace

class SyncMetadataTestFixture {
  public:
    SyncMetadataTestFixture() : tmp("chitusync_metadata_test"), path(tmp.file("file_metadata.json")) {}

    ScopedTempDir tmp;
    std::string path;
};

TEST_CASE_METHOD(SyncMetadataTestFixture, "SyncMetadataStore: missing file is empty",
                 "[metadata]") {
    SyncMetadataStore store(path);
    store.load();
    REQUIRE(store.size() == 0);
    REQUIRE_FALSE(store.find("a.ctb").has_value());
}

TEST_CASE_METHOD(SyncMetadataTestFixture, "SyncMetadataStore: save and reload", "[metadata]") {
    {
        SyncMetadataStore store(path);
        store.record("a.ctb", LocalFileRecord{"a.ctb", 100, 1700000000123456789});
        store.record("b.goo", LocalFileRecord{"b.goo", 5, 42});
        REQUIRE(store.save().ok());
    }

    std::ifstream in(path);
    json on_disk = json::parse(in);
    REQUIRE(on_disk["a.ctb"]["size"] == 100);
    REQUIRE(on_disk["a.ctb"]["mtime"] == 1700000000123456789);

    SyncMetadataStore reloaded(path);
    reloaded.load();
    REQUIRE(reloaded.size() == 2);
    REQUIRE(reloaded.find("b.goo")->mtime_ns == 42);
}

TEST_CASE_METHOD(SyncMetadataTestFixture, "SyncMetadataStore: corrupt file is backed up",
                 "[metadata]") {
    {
        std::ofstream out(path);
        out << "{ not json";
    }

    SyncMetadataStore store(path);
    store.load();

    REQUIRE(store.size() == 0);
    REQUIRE(sync_test::fs::exists(path + ".corrupt"));
}

TEST_CASE_METHOD(SyncMetadataTestFixture, "SyncMetadataStore: stale_files", "[metadata]") {
    SyncMetadataStore store(path);
    store.record("edited.ctb", LocalFileRecord{"edited.ctb", 100, 1});
    store.record("same.ctb", LocalFileRecord{"same.ctb", 100, 7});

    auto local = local_of({{"edited.ctb", 100, 2},
                           {"same.ctb", 100, 7},
                           {"adopted.ctb", 50, 3},
                           {"resized.ctb", 60, 4}});
    auto remote = remote_of({{"edited.ctb", 100}, {"same.ctb", 100}, {"adopted.ctb", 50},
                             {"resized.ctb", 10}});

    auto stale = store.stale_files(local, remote);

    // Same size but newer mtime than the recorded upload
    REQUIRE(stale == std::vector<std::string>{"edited.ctb"});
    // Already on the printer with no record: adopted, not re-uploaded
    REQUIRE(store.find("adopted.ctb").has_value());
    // Size differences are left to the planner
    REQUIRE_FALSE(store.find("resized.ctb").has_value());
}

TEST_CASE_METHOD(SyncMetadataTestFixture, "SyncMetadataStore: purge and forget", "[metadata]") {
    SyncMetadataStore store(path);
    store.record("a.ctb", LocalFileRecord{"a.ctb", 1, 1});
    store.record("b.ctb", LocalFileRecord{"b.ctb", 1, 1});
    store.record("c.ctb", LocalFileRecord{"c.ctb", 1, 1});

    store.forget("a.ctb");
    REQUIRE(store.purge({"b.ctb"}) == 1);

    REQUIRE(store.size() == 1);
    REQUIRE(store.find("b.ctb").has_value());
}

TEST_CASE("SyncMetadataStore: save to an unwritable path", "[metadata]") {
    SyncMetadataStore store("/nonexistent/chitusync/file_metadata.json");
    store.record("a.ctb", LocalFileRecord{"a.ctb", 1, 1});

    REQUIRE(store.save().type == ChituErrorType::FILE_ERROR);
}
