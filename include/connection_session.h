// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "board_protocol.h"
#include "chitu_transport.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace chitusync {

/**
 * @brief One live link to the board
 *
 * Owns its transport and receive buffer. Created by the ConnectionManager,
 * shared with the CommandChannel, and invalidated (never reused) on the first
 * I/O failure. Not thread-safe: exchanges are serialized by the channel gate.
 */
class ConnectionSession {
  public:
    /// Upper bound on the accepted size of one reply
    static constexpr size_t MAX_REPLY_BYTES = 256 * 1024;

    ConnectionSession(std::unique_ptr<ChituTransport> transport, std::string peer);
    ~ConnectionSession();

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    /**
     * @brief Send a command and collect its reply
     *
     * Waits at most @p timeout in total. Received lines are classified by
     * @p protocol; lines it discards are appended to @p discarded when given.
     *
     * @return TIMEOUT, CONNECTION_LOST or PROTOCOL_ERROR on failure
     */
    ChituError exchange(const BoardCommand& command, const BoardProtocol& protocol,
                        std::chrono::milliseconds timeout, BoardReply& reply,
                        std::vector<std::string>* discarded = nullptr);

    /// Pull every datagram already queued without blocking
    std::vector<std::string> drain();

    /**
     * @brief Mark the session dead
     *
     * Safe from any thread. A pending exchange notices within one receive
     * slice and fails with CONNECTION_LOST.
     */
    void invalidate();

    bool is_valid() const {
        return valid_.load();
    }

    const std::string& peer() const {
        return peer_;
    }

  private:
    std::unique_ptr<ChituTransport> transport_;
    std::string peer_;
    std::string rx_buffer_;
    std::atomic<bool> valid_{true};
};

using ConnectionSessionPtr = std::shared_ptr<ConnectionSession>;

} // namespace chitusync
