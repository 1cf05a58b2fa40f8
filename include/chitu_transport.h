// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chitu_error.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace chitusync {

/**
 * @brief Datagram link to a printer board
 *
 * One instance backs exactly one ConnectionSession. The session never calls a
 * transport from two threads at once.
 */
class ChituTransport {
  public:
    virtual ~ChituTransport() = default;

    /**
     * @brief Open the link to host:port
     *
     * @return CONNECT_ERROR if the address cannot be resolved or the socket
     *         cannot be created
     */
    virtual ChituError open(const std::string& host, uint16_t port) = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;

    /// Send one datagram; CONNECTION_LOST on socket failure
    virtual ChituError send(const std::string& datagram) = 0;

    /**
     * @brief Wait up to @p timeout for one datagram
     *
     * A zero timeout polls without blocking.
     *
     * @return TIMEOUT when nothing arrived, CONNECTION_LOST on socket failure,
     *         PROTOCOL_ERROR when the datagram was truncated
     */
    virtual ChituError receive(std::string& datagram, std::chrono::milliseconds timeout) = 0;
};

} // namespace chitusync
