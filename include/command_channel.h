// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "board_protocol.h"
#include "chitu_error.h"
#include "connection_manager.h"

#include <spdlog/logger.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace chitusync {

/**
 * @brief Serialized request/response exchanges with the board
 *
 * The Chitu protocol has no request identifiers, so exactly one command may be
 * outstanding at a time. send() holds a single gate for the whole
 * "drain -> send -> await reply" sequence; concurrent callers block until the
 * gate is free.
 *
 * Connection-level failures (timeout, transport error, oversized or malformed
 * reply) tear the session down through the ConnectionManager before send()
 * returns.
 */
class CommandChannel {
  public:
    CommandChannel(ConnectionManager& manager, std::shared_ptr<const BoardProtocol> protocol,
                   std::chrono::milliseconds timeout);

    CommandChannel(const CommandChannel&) = delete;
    CommandChannel& operator=(const CommandChannel&) = delete;

    /**
     * @brief Issue one command and wait for its complete reply
     *
     * @return CONNECTION_LOST when no session is live; TIMEOUT,
     *         CONNECTION_LOST or PROTOCOL_ERROR when the exchange failed
     */
    ChituError send(const BoardCommand& command, BoardReply& reply);

    /**
     * @brief Escalate malformed reply content found by a higher layer
     *
     * Listing, status and identify parsers call this so bad content is
     * handled exactly like a transport-level protocol error.
     */
    void report_protocol_error(const ChituError& err);

    /**
     * @brief Route discarded datagrams to a dedicated logger
     *
     * nullptr logs them at debug level on the default logger instead.
     */
    void set_unknown_message_logger(std::shared_ptr<spdlog::logger> logger);

    const BoardProtocol& protocol() const {
        return *protocol_;
    }

    ConnectionManager& manager() {
        return manager_;
    }

  private:
    void log_unknown(const std::string& data);

    ConnectionManager& manager_;
    std::shared_ptr<const BoardProtocol> protocol_;
    const std::chrono::milliseconds timeout_;

    std::mutex gate_;

    std::mutex logger_mutex_;
    std::shared_ptr<spdlog::logger> unknown_logger_;
};

} // namespace chitusync
