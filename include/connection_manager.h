// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "board_protocol.h"
#include "chitu_error.h"
#include "chitu_transport.h"
#include "connection_session.h"
#include "sync_config.h"
#include "sync_types.h"

#include "hv/EventLoop.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace chitusync {

/**
 * @brief Owns the single board session and its lifecycle
 *
 * State machine:
 *   DISCONNECTED -> CONNECTING -> CONNECTED -> DISCONNECTED (on any I/O failure)
 *
 * While DISCONNECTED a timer on the supplied event loop retries every ping
 * interval. ensure_connected() is rate-limited to one attempt per ping
 * interval; timer ticks get a tenth of the interval as jitter slack so that
 * every tick of an offline board produces an attempt.
 *
 * Thread safety: all public methods may be called from any thread. Callbacks
 * are invoked outside internal locks.
 */
class ConnectionManager {
  public:
    using TransportFactory = std::function<std::unique_ptr<ChituTransport>()>;
    using StateChangeCallback = std::function<void(ConnectionState, ConnectionState)>;
    using ConnectedCallback = std::function<void(const BoardInfo&)>;

    /**
     * @param endpoint Board address and timing; fixed for this manager
     * @param protocol Command grammar used for the identify handshake
     * @param factory Creates a fresh transport per attempt; defaults to UDP
     */
    ConnectionManager(PrinterEndpoint endpoint, std::shared_ptr<const BoardProtocol> protocol,
                      TransportFactory factory = nullptr);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Open a transport and run the identify handshake
     *
     * Ignores the rate limit. A missing or malformed identify reply is a
     * CONNECT_ERROR.
     */
    ChituError connect();

    /**
     * @brief Return the live session, reconnecting if allowed
     *
     * @param[out] err Reason when no session is returned
     * @return Live session, or nullptr when disconnected and either the rate
     *         limit forbids an attempt or the attempt failed
     */
    ConnectionSessionPtr ensure_connected(ChituError& err);

    /// Current session without any reconnect attempt
    ConnectionSessionPtr session() const;

    /**
     * @brief Tear down the live session after a connection-level failure
     *
     * Pending exchanges on the old session fail with CONNECTION_LOST. No-op
     * when already disconnected.
     */
    void drop_session(const ChituError& reason);

    /// Drop the session and stop reconnecting
    void disconnect();

    /**
     * @brief Start the reconnect timer on @p loop
     *
     * The timer only acts while DISCONNECTED. An immediate attempt is queued
     * on the loop.
     */
    void start(const hv::EventLoopPtr& loop);

    /// Kill the reconnect timer
    void stop();

    /// One reconnect-timer tick (public for tests)
    void on_reconnect_timer();

    ConnectionState get_connection_state() const {
        return connection_state_.load();
    }

    BoardInfo get_board_info() const;

    const PrinterEndpoint& endpoint() const {
        return endpoint_;
    }

    /// Number of connect attempts made so far
    uint32_t attempt_count() const {
        return attempt_count_.load();
    }

    void set_state_change_callback(StateChangeCallback cb);
    void set_connected_callback(ConnectedCallback cb);

  private:
    ChituError connect_locked();
    bool attempt_allowed_locked(
        std::chrono::milliseconds slack = std::chrono::milliseconds(0)) const;
    std::chrono::milliseconds timer_slack() const;

    // Timer ticks may attempt up to ping_interval / 10 early
    static constexpr int TIMER_SLACK_DIVISOR = 10;
    void set_connection_state(ConnectionState new_state);

    const PrinterEndpoint endpoint_;
    std::shared_ptr<const BoardProtocol> protocol_;
    TransportFactory factory_;

    // Serializes connect attempts and guards last_attempt_
    mutable std::mutex connect_mutex_;
    std::optional<std::chrono::steady_clock::time_point> last_attempt_;
    std::atomic<uint32_t> attempt_count_{0};

    // Guards session_, board_info_ and callbacks
    mutable std::mutex session_mutex_;
    ConnectionSessionPtr session_;
    BoardInfo board_info_;
    StateChangeCallback state_change_callback_;
    ConnectedCallback connected_callback_;

    std::atomic<ConnectionState> connection_state_{ConnectionState::DISCONNECTED};
    std::atomic<bool> stopped_{false};

    hv::EventLoopPtr loop_;
    hv::TimerID reconnect_timer_ = INVALID_TIMER_ID;
};

} // namespace chitusync
