// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connection_manager.h"

#include "error_reporting.h"
#include "udp_transport.h"

#include <spdlog/spdlog.h>

namespace chitusync {

ConnectionManager::ConnectionManager(PrinterEndpoint endpoint,
                                     std::shared_ptr<const BoardProtocol> protocol,
                                     TransportFactory factory)
    : endpoint_(std::move(endpoint)), protocol_(std::move(protocol)), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = []() { return std::make_unique<UdpTransport>(); };
    }
    spdlog::debug("[ConnectionManager] Created for {}:{} (ping every {}ms)", endpoint_.host,
                  endpoint_.port, endpoint_.ping_interval.count());
}

ConnectionManager::~ConnectionManager() {
    stop();
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_) {
        session_->invalidate();
        session_.reset();
    }
}

void ConnectionManager::set_state_change_callback(StateChangeCallback cb) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    state_change_callback_ = std::move(cb);
}

void ConnectionManager::set_connected_callback(ConnectedCallback cb) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    connected_callback_ = std::move(cb);
}

BoardInfo ConnectionManager::get_board_info() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return board_info_;
}

ConnectionSessionPtr ConnectionManager::session() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

void ConnectionManager::set_connection_state(ConnectionState new_state) {
    ConnectionState old_state = connection_state_.exchange(new_state);
    if (old_state == new_state) {
        return;
    }

    spdlog::debug("[ConnectionManager] State change: {} -> {}", connection_state_name(old_state),
                  connection_state_name(new_state));

    StateChangeCallback callback_copy;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        callback_copy = state_change_callback_;
    }
    if (callback_copy) {
        try {
            callback_copy(old_state, new_state);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[ConnectionManager] State change callback threw: {}", e.what());
        }
    }
}

ChituError ConnectionManager::connect() {
    std::lock_guard<std::mutex> lock(connect_mutex_);
    return connect_locked();
}

bool ConnectionManager::attempt_allowed_locked(std::chrono::milliseconds slack) const {
    if (!last_attempt_) {
        return true;
    }
    return std::chrono::steady_clock::now() - *last_attempt_ >= endpoint_.ping_interval - slack;
}

std::chrono::milliseconds ConnectionManager::timer_slack() const {
    return endpoint_.ping_interval / TIMER_SLACK_DIVISOR;
}

ChituError ConnectionManager::connect_locked() {
    if (session()) {
        return {};
    }
    if (stopped_) {
        return ChituError::cancelled("Connect");
    }

    last_attempt_ = std::chrono::steady_clock::now();
    attempt_count_++;
    std::string peer = endpoint_.host + ":" + std::to_string(endpoint_.port);
    spdlog::debug("[ConnectionManager] Connecting to {} (attempt {})", peer, attempt_count_.load());

    set_connection_state(ConnectionState::CONNECTING);

    std::unique_ptr<ChituTransport> transport = factory_();
    if (!transport) {
        set_connection_state(ConnectionState::DISCONNECTED);
        return ChituError::connect_failed(peer, "no transport available");
    }

    ChituError err = transport->open(endpoint_.host, endpoint_.port);
    if (err.has_error()) {
        spdlog::warn("[ConnectionManager] {}", err.message);
        set_connection_state(ConnectionState::DISCONNECTED);
        if (err.type != ChituErrorType::CONNECT_ERROR) {
            return ChituError::connect_failed(peer, err.message);
        }
        return err;
    }

    auto new_session = std::make_shared<ConnectionSession>(std::move(transport), peer);

    // Handshake runs before the session is published, so no channel can race it
    BoardReply reply;
    err = new_session->exchange(protocol_->identify(), *protocol_, endpoint_.command_timeout, reply);
    BoardInfo info;
    if (err.ok()) {
        err = protocol_->parse_board_info(reply, info);
    }
    if (err.has_error()) {
        spdlog::warn("[ConnectionManager] Handshake with {} failed: {}", peer, err.message);
        new_session->invalidate();
        set_connection_state(ConnectionState::DISCONNECTED);
        return ChituError::connect_failed(peer, err.message);
    }

    ConnectedCallback connected_copy;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_ = new_session;
        board_info_ = info;
        connected_copy = connected_callback_;
    }

    spdlog::info("[ConnectionManager] Connected to {} ({} {}, firmware {})", peer, info.name,
                 info.mac, info.version);
    set_connection_state(ConnectionState::CONNECTED);

    if (connected_copy) {
        try {
            connected_copy(info);
        } catch (const std::exception& e) {
            LOG_ERROR_INTERNAL("[ConnectionManager] Connected callback threw: {}", e.what());
        }
    }
    return {};
}

ConnectionSessionPtr ConnectionManager::ensure_connected(ChituError& err) {
    err = ChituError();
    if (auto live = session()) {
        return live;
    }

    std::lock_guard<std::mutex> lock(connect_mutex_);
    // Another thread may have connected while we waited for the lock
    if (auto live = session()) {
        return live;
    }
    if (!attempt_allowed_locked()) {
        spdlog::trace("[ConnectionManager] Reconnect suppressed by rate limit");
        err = ChituError::connection_lost();
        return nullptr;
    }

    err = connect_locked();
    if (err.has_error()) {
        return nullptr;
    }
    return session();
}

void ConnectionManager::drop_session(const ChituError& reason) {
    ConnectionSessionPtr old;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        old = std::move(session_);
        session_.reset();
    }
    if (!old) {
        return;
    }

    old->invalidate();
    spdlog::warn("[ConnectionManager] Session to {} dropped: {}", old->peer(),
                 reason.message.empty() ? reason.get_type_string() : reason.message);
    set_connection_state(ConnectionState::DISCONNECTED);
}

void ConnectionManager::disconnect() {
    stop();
    drop_session(ChituError::cancelled("Session"));
}

void ConnectionManager::start(const hv::EventLoopPtr& loop) {
    if (!loop) {
        return;
    }
    stopped_ = false;
    loop_ = loop;

    int interval_ms = static_cast<int>(endpoint_.ping_interval.count());
    // setTimerInLoop registers from the loop thread; start() runs on the caller's
    reconnect_timer_ = loop_->setTimerInLoop(
        interval_ms, [this](hv::TimerID) { on_reconnect_timer(); }, INFINITE);
    loop_->queueInLoop([this]() { on_reconnect_timer(); });

    spdlog::debug("[ConnectionManager] Reconnect timer started ({}ms)", interval_ms);
}

void ConnectionManager::stop() {
    stopped_ = true;
    if (loop_ && reconnect_timer_ != INVALID_TIMER_ID) {
        loop_->killTimer(reconnect_timer_);
        spdlog::debug("[ConnectionManager] Reconnect timer stopped");
    }
    reconnect_timer_ = INVALID_TIMER_ID;
    loop_.reset();
}

void ConnectionManager::on_reconnect_timer() {
    if (stopped_ || connection_state_.load() != ConnectionState::DISCONNECTED) {
        return;
    }

    std::lock_guard<std::mutex> lock(connect_mutex_);
    // Ticks land slightly short of a full interval after the attempt they pace
    if (!attempt_allowed_locked(timer_slack())) {
        return;
    }
    ChituError err = connect_locked();
    if (err.has_error()) {
        spdlog::debug("[ConnectionManager] Reconnect failed, next attempt in {}ms",
                      endpoint_.ping_interval.count());
    }
}

} // namespace chitusync
