// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chitu_error.h"
#include "sync_types.h"

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chitusync {

/// Size and modification time of a file at its last successful upload
struct SyncRecord {
    uint64_t size = 0;
    int64_t mtime_ns = 0;
};

/**
 * @brief Persistent record of what was last uploaded
 *
 * Stored as JSON: { "<name>": { "size": N, "mtime": T }, ... }. Lets a
 * restarted engine notice files that were edited while it was not running
 * without changing size, which the size-only diff cannot see.
 *
 * Thread safety: all methods lock internally.
 */
class SyncMetadataStore {
  public:
    explicit SyncMetadataStore(std::string path);

    /// Load from disk. A missing file is an empty store; a corrupt one is
    /// backed up to "<path>.corrupt" and treated as empty.
    void load();

    /// FILE_ERROR if the file cannot be written
    ChituError save() const;

    std::optional<SyncRecord> find(const std::string& name) const;

    void record(const std::string& name, const LocalFileRecord& local);

    void forget(const std::string& name);

    /// Drop every entry whose name is not in @p keep; returns the number removed
    size_t purge(const std::set<std::string>& keep);

    /**
     * @brief Reconcile records with the current snapshots
     *
     * Files with a record whose mtime differs, but whose remote size already
     * matches, are returned as stale (edited in place). Files without a record
     * that already match the remote by size are adopted.
     *
     * @return Names needing a forced upload
     */
    std::vector<std::string> stale_files(const LocalSnapshot& local, const RemoteSnapshot& remote);

    size_t size() const;

    const std::string& path() const {
        return path_;
    }

  private:
    std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, SyncRecord> records_;
};

} // namespace chitusync
