// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chitu_transport.h"

#include <string>
#include <vector>

namespace chitusync {

/**
 * @brief Connected UDP socket to a Chitu board
 *
 * The socket is connect()ed to the board so stray datagrams from other hosts
 * are filtered by the kernel and ICMP port-unreachable surfaces as an error
 * on the next receive.
 */
class UdpTransport : public ChituTransport {
  public:
    static constexpr size_t RECV_BUFFER_SIZE = 4096;

    UdpTransport();
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    ChituError open(const std::string& host, uint16_t port) override;
    void close() override;
    bool is_open() const override;
    ChituError send(const std::string& datagram) override;
    ChituError receive(std::string& datagram, std::chrono::milliseconds timeout) override;

  private:
    int fd_ = -1;
    std::string peer_;
    std::vector<char> recv_buffer_;
};

} // namespace chitusync
