// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "udp_transport.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace chitusync {

UdpTransport::UdpTransport() : recv_buffer_(RECV_BUFFER_SIZE) {}

UdpTransport::~UdpTransport() {
    close();
}

ChituError UdpTransport::open(const std::string& host, uint16_t port) {
    close();
    peer_ = host + ":" + std::to_string(port);

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (rc != 0) {
        return ChituError::connect_failed(peer_, gai_strerror(rc));
    }

    int fd = -1;
    int last_errno = 0;
    for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        last_errno = errno;
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(result);

    if (fd < 0) {
        return ChituError::connect_failed(peer_, strerror(last_errno));
    }

    fd_ = fd;
    spdlog::debug("[UdpTransport] Opened socket to {}", peer_);
    return {};
}

void UdpTransport::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
        spdlog::debug("[UdpTransport] Closed socket to {}", peer_);
    }
}

bool UdpTransport::is_open() const {
    return fd_ >= 0;
}

ChituError UdpTransport::send(const std::string& datagram) {
    if (fd_ < 0) {
        return ChituError::connection_lost();
    }
    ssize_t sent = ::send(fd_, datagram.data(), datagram.size(), MSG_NOSIGNAL);
    if (sent < 0) {
        ChituError err = ChituError::connection_lost();
        err.message = "send to " + peer_ + " failed: " + strerror(errno);
        return err;
    }
    if (static_cast<size_t>(sent) != datagram.size()) {
        ChituError err = ChituError::connection_lost();
        err.message = "short send to " + peer_;
        return err;
    }
    return {};
}

ChituError UdpTransport::receive(std::string& datagram, std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        return ChituError::connection_lost();
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ret < 0) {
        if (errno == EINTR) {
            return ChituError::timeout("recv", static_cast<uint32_t>(timeout.count()));
        }
        ChituError err = ChituError::connection_lost();
        err.message = std::string("poll() failed: ") + strerror(errno);
        return err;
    }
    if (ret == 0 || !(pfd.revents & (POLLIN | POLLERR))) {
        return ChituError::timeout("recv", static_cast<uint32_t>(timeout.count()));
    }

    ssize_t len = ::recv(fd_, recv_buffer_.data(), recv_buffer_.size(), MSG_TRUNC);
    if (len < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return ChituError::timeout("recv", static_cast<uint32_t>(timeout.count()));
        }
        ChituError err = ChituError::connection_lost();
        err.message = "recv from " + peer_ + " failed: " + strerror(errno);
        return err;
    }
    if (static_cast<size_t>(len) > recv_buffer_.size()) {
        return ChituError::protocol_error("recv", "datagram of " + std::to_string(len) +
                                                      " bytes exceeds receive buffer");
    }

    datagram.assign(recv_buffer_.data(), static_cast<size_t>(len));
    return {};
}

} // namespace chitusync
