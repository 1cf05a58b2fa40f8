// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connection_session.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace chitusync {

namespace {

// Receive in slices so invalidate() is noticed promptly
constexpr std::chrono::milliseconds RECEIVE_SLICE{100};

} // namespace

ConnectionSession::ConnectionSession(std::unique_ptr<ChituTransport> transport, std::string peer)
    : transport_(std::move(transport)), peer_(std::move(peer)) {}

ConnectionSession::~ConnectionSession() {
    if (transport_) {
        transport_->close();
    }
}

void ConnectionSession::invalidate() {
    valid_ = false;
}

std::vector<std::string> ConnectionSession::drain() {
    std::vector<std::string> stale;
    if (!valid_ || !transport_) {
        return stale;
    }
    std::string datagram;
    while (transport_->receive(datagram, std::chrono::milliseconds(0)).ok()) {
        stale.push_back(datagram);
    }
    return stale;
}

ChituError ConnectionSession::exchange(const BoardCommand& command, const BoardProtocol& protocol,
                                       std::chrono::milliseconds timeout, BoardReply& reply,
                                       std::vector<std::string>* discarded) {
    reply.clear();
    if (!valid_ || !transport_) {
        return ChituError::connection_lost(command.name);
    }

    spdlog::trace("[Session] {} -> {} ({} bytes)", peer_, command.name, command.payload.size());
    ChituError err = transport_->send(command.payload);
    if (err.has_error()) {
        err.command = command.name;
        return err;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string datagram;

    while (true) {
        if (!valid_) {
            return ChituError::connection_lost(command.name);
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return ChituError::timeout(command.name, static_cast<uint32_t>(timeout.count()));
        }

        err = transport_->receive(datagram, std::min(remaining, RECEIVE_SLICE));
        if (err.type == ChituErrorType::TIMEOUT) {
            continue;
        }
        if (err.has_error()) {
            err.command = command.name;
            return err;
        }

        rx_buffer_ = datagram;
        size_t start = 0;
        while (start < rx_buffer_.size()) {
            size_t nl = rx_buffer_.find('\n', start);
            size_t end = (nl == std::string::npos) ? rx_buffer_.size() : nl;
            std::string line = rx_buffer_.substr(start, end - start);
            start = end + 1;

            ReplyProgress progress = protocol.accept_line(command, line, reply);
            if (progress == ReplyProgress::DISCARD) {
                if (discarded) {
                    discarded->push_back(line);
                }
                continue;
            }
            if (reply.bytes > MAX_REPLY_BYTES) {
                return ChituError::protocol_error(command.name, "reply exceeds " +
                                                                    std::to_string(MAX_REPLY_BYTES) +
                                                                    " bytes");
            }
            if (progress == ReplyProgress::COMPLETE) {
                if (start < rx_buffer_.size() && discarded) {
                    discarded->push_back(rx_buffer_.substr(start));
                }
                rx_buffer_.clear();
                spdlog::trace("[Session] {} <- {} ({} lines)", peer_, command.name,
                              reply.lines.size());
                return {};
            }
        }
        rx_buffer_.clear();
    }
}

} // namespace chitusync
