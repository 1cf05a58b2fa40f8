// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "command_channel.h"

#include "logging_init.h"

#include <spdlog/spdlog.h>

namespace chitusync {

CommandChannel::CommandChannel(ConnectionManager& manager,
                               std::shared_ptr<const BoardProtocol> protocol,
                               std::chrono::milliseconds timeout)
    : manager_(manager), protocol_(std::move(protocol)), timeout_(timeout) {}

void CommandChannel::set_unknown_message_logger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(logger_mutex_);
    unknown_logger_ = std::move(logger);
}

void CommandChannel::log_unknown(const std::string& data) {
    std::shared_ptr<spdlog::logger> logger;
    {
        std::lock_guard<std::mutex> lock(logger_mutex_);
        logger = unknown_logger_;
    }
    std::string hex = logging::hex_encode(data);
    if (logger) {
        logger->info("{}", hex);
    } else {
        spdlog::debug("[CommandChannel] Discarded unexpected datagram: {}", hex);
    }
}

ChituError CommandChannel::send(const BoardCommand& command, BoardReply& reply) {
    std::lock_guard<std::mutex> gate(gate_);

    ConnectionSessionPtr session = manager_.session();
    if (!session) {
        return ChituError::connection_lost(command.name);
    }

    for (const auto& stale : session->drain()) {
        log_unknown(stale);
    }

    std::vector<std::string> discarded;
    ChituError err = session->exchange(command, *protocol_, timeout_, reply, &discarded);
    for (const auto& line : discarded) {
        log_unknown(line);
    }

    if (err.has_error()) {
        if (err.is_connection_level()) {
            manager_.drop_session(err);
        }
        return err;
    }
    return {};
}

void CommandChannel::report_protocol_error(const ChituError& err) {
    spdlog::warn("[CommandChannel] {}", err.message);
    manager_.drop_session(err);
}

} // namespace chitusync
