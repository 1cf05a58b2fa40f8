// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chitu_error.h"
#include "command_channel.h"
#include "sync_types.h"

#include <string>

namespace chitusync {

/**
 * @brief Remote side of the directory mirror: listing and deletion
 */
class RemoteMirror {
  public:
    explicit RemoteMirror(CommandChannel& channel);

    /**
     * @brief Fetch the board's job file listing
     *
     * Entries with size 0 are deleted placeholders and are left out. A
     * malformed listing is escalated as a protocol error (session dropped).
     *
     * @param[out] snapshot New immutable snapshot on success
     */
    ChituError list_remote(RemoteSnapshotPtr& snapshot);

    /// Delete one file from board storage; REMOTE_REJECTED on Error/Failed
    ChituError delete_remote(const std::string& remote_name);

    /**
     * @brief Delete every job file on the board
     *
     * Stops at the first connection-level failure. Per-file rejections are
     * counted in @p failed and the sweep continues.
     */
    ChituError delete_all(size_t& deleted, size_t& failed);

  private:
    CommandChannel& channel_;
};

} // namespace chitusync
