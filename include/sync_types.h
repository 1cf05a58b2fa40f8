// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file sync_types.h
 * @brief Value types shared by the board protocol, mirror and sync engine
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace chitusync {

/**
 * @brief Connection state of the board session
 */
enum class ConnectionState {
    DISCONNECTED, // No session; reconnect timer active
    CONNECTING,   // Transport open, handshake in progress
    CONNECTED     // Session live and ready for commands
};

const char* connection_state_name(ConnectionState state);

/// Snapshot of one job file in the local sync folder
struct LocalFileRecord {
    std::string name;
    uint64_t size = 0;
    int64_t mtime_ns = 0; ///< Modification time, nanoseconds since epoch
};

/// One entry of the board's directory listing
struct RemoteFileRecord {
    std::string name;
    uint64_t size = 0;
};

/**
 * @brief Immutable name -> record map captured by one scan
 *
 * Snapshots are never mutated after construction; every scan produces a new
 * object, so a plan computed from a pair of snapshots stays valid for the
 * lifetime of those shared pointers.
 */
template <typename Record> class Snapshot {
  public:
    using Map = std::map<std::string, Record>;

    Snapshot() = default;
    explicit Snapshot(Map records) : records_(std::move(records)) {}

    const Map& records() const {
        return records_;
    }

    bool contains(const std::string& name) const {
        return records_.count(name) != 0;
    }

    const Record* find(const std::string& name) const {
        auto it = records_.find(name);
        return it == records_.end() ? nullptr : &it->second;
    }

    size_t size() const {
        return records_.size();
    }

    bool empty() const {
        return records_.empty();
    }

  private:
    const Map records_;
};

using LocalSnapshot = Snapshot<LocalFileRecord>;
using RemoteSnapshot = Snapshot<RemoteFileRecord>;
using LocalSnapshotPtr = std::shared_ptr<const LocalSnapshot>;
using RemoteSnapshotPtr = std::shared_ptr<const RemoteSnapshot>;

/**
 * @brief One reconciliation step against the board
 */
struct PlanOperation {
    enum class Kind { UPLOAD, DELETE };

    Kind kind = Kind::UPLOAD;
    std::string name;

    bool operator==(const PlanOperation& other) const {
        return kind == other.kind && name == other.name;
    }
};

const char* plan_operation_kind_name(PlanOperation::Kind kind);

/// Ordered list of operations; deletes come before uploads
using ReconciliationPlan = std::vector<PlanOperation>;

/**
 * @brief Progress of the upload currently in flight
 */
struct TransferProgress {
    std::string filename;
    uint64_t bytes_sent = 0;
    uint64_t total_bytes = 0;
    uint32_t chunk_index = 0; ///< Index of the last acknowledged chunk

    double percent() const {
        if (total_bytes == 0) {
            return 100.0;
        }
        return 100.0 * static_cast<double>(bytes_sent) / static_cast<double>(total_bytes);
    }
};

/**
 * @brief Print job state as reported by the board status query
 *
 * Progress is the board's byte position in the job file. It is not linear in
 * print time and is reported as-is.
 */
struct PrintJobStatus {
    enum class State { IDLE, PRINTING, PAUSED, ERROR };

    State state = State::IDLE;
    uint64_t bytes_read = 0;
    uint64_t total_bytes = 0;
    std::string filename;

    bool is_active() const {
        return state == State::PRINTING || state == State::PAUSED;
    }

    double progress_percent() const {
        if (total_bytes == 0) {
            return 0.0;
        }
        return 100.0 * static_cast<double>(bytes_read) / static_cast<double>(total_bytes);
    }
};

const char* print_state_name(PrintJobStatus::State state);

/// Identification reported by the board handshake
struct BoardInfo {
    std::string mac;
    std::string ip;
    std::string version;
    std::string id;
    std::string name;
};

/**
 * @brief Aggregate status for tray-style indicators
 */
enum class SyncStatus { OFFLINE, SYNCING, SYNCED, ERROR };

const char* sync_status_name(SyncStatus status);

} // namespace chitusync
