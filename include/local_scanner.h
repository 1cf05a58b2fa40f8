// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "board_protocol.h"
#include "chitu_error.h"
#include "sync_types.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace chitusync {

/**
 * @brief Snapshots the job files in the local sync folder
 *
 * Non-recursive; only regular files whose extension the board protocol
 * recognizes are included.
 */
class LocalScanner {
  public:
    LocalScanner(std::string folder, std::shared_ptr<const BoardProtocol> protocol);

    /// Capture a new immutable snapshot; FILE_ERROR if the folder is unreadable
    ChituError scan(LocalSnapshotPtr& snapshot) const;

    /**
     * @brief Stat a single file in the folder
     *
     * @return false if the file does not exist or is not a job file
     */
    bool stat_file(const std::string& name, LocalFileRecord& record) const;

    /**
     * @brief Wait until a file stops growing
     *
     * Returns once the size has been unchanged for @p stable_for. Used before
     * uploading files that may still be written by the slicer.
     *
     * @return FILE_ERROR if the file vanished or never settled within
     *         @p max_wait, CANCELLED if @p cancel was raised
     */
    ChituError wait_until_stable(const std::string& name, std::chrono::milliseconds stable_for,
                                 std::chrono::milliseconds max_wait,
                                 const std::atomic<bool>* cancel = nullptr) const;

    std::string path_of(const std::string& name) const;

    const std::string& folder() const {
        return folder_;
    }

  private:
    std::string folder_;
    std::shared_ptr<const BoardProtocol> protocol_;
};

} // namespace chitusync
