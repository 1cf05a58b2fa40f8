// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chitu_error.h"
#include "command_channel.h"
#include "sync_types.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

namespace chitusync {

/**
 * @brief Chunked upload of one local file to board storage
 *
 * Sequence: open remote file, stream fixed-size chunks each acknowledged by
 * the board, verify the total size, close the remote file. Every upload
 * starts at byte 0; a partial upload is never resumed.
 */
class FileTransferEngine {
  public:
    using ProgressCallback = std::function<void(const TransferProgress&)>;

    FileTransferEngine(CommandChannel& channel, std::chrono::milliseconds chunk_delay);

    /**
     * @brief Upload @p local_path as @p remote_name
     *
     * @param on_progress Called after every acknowledged chunk (may be empty)
     * @param cancel Checked between chunks; may be nullptr
     * @return FILE_ERROR if the local file cannot be read, TRANSFER_ERROR on
     *         rejection or acknowledgement mismatch, CANCELLED when @p cancel
     *         was raised, or a connection-level error from the channel
     */
    ChituError upload(const std::string& local_path, const std::string& remote_name,
                      const ProgressCallback& on_progress = nullptr,
                      const std::atomic<bool>* cancel = nullptr);

  private:
    /// Close the remote file after a failed transfer (best effort)
    void abort_remote_file(const std::string& remote_name);

    CommandChannel& channel_;
    const std::chrono::milliseconds chunk_delay_;
};

} // namespace chitusync
