// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_connection_manager.cpp
 * @brief Session lifecycle, handshake and reconnect pacing
 */

#include "chitu_protocol.h"
#include "connection_manager.h"

#include "../mocks/fake_chitu_board.h"
#include "../test_helpers/sync_test_helpers.h"
#include "hv/EventLoopThread.h"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

using namespace chitusync;
using namespace std::chrono_literals;

// ============================================================================
// Test Fixture
// ============================================================================

class ConnectionManagerTestFixture {
  public:
    ConnectionManagerTestFixture()
        : board(std::make_shared<FakeChituBoard>()),
          protocol(std::make_shared<const ChituProtocol>()) {}

    std::unique_ptr<ConnectionManager> make_manager(std::chrono::milliseconds ping_interval,
                                                    std::chrono::milliseconds timeout = 300ms) {
        PrinterEndpoint ep;
        ep.host = "127.0.0.1";
        ep.ping_interval = ping_interval;
        ep.command_timeout = timeout;
        auto manager = std::make_unique<ConnectionManager>(ep, protocol, board->factory());
        manager->set_state_change_callback([this](ConnectionState old_state,
                                                  ConnectionState new_state) {
            std::lock_guard<std::mutex> lock(transitions_mutex);
            transitions.emplace_back(old_state, new_state);
        });
        return manager;
    }

    std::vector<std::pair<ConnectionState, ConnectionState>> get_transitions() {
        std::lock_guard<std::mutex> lock(transitions_mutex);
        return transitions;
    }

    std::shared_ptr<FakeChituBoard> board;
    std::shared_ptr<const ChituProtocol> protocol;
    std::mutex transitions_mutex;
    std::vector<std::pair<ConnectionState, ConnectionState>> transitions;
};

// ============================================================================
// Connect / handshake
// ============================================================================

TEST_CASE_METHOD(ConnectionManagerTestFixture, "ConnectionManager: connect runs the handshake",
                 "[connection]") {
    auto manager = make_manager(1000ms);
    BoardInfo seen;
    manager->set_connected_callback([&seen](const BoardInfo& info) { seen = info; });

    REQUIRE(manager->connect().ok());

    REQUIRE(manager->get_connection_state() == ConnectionState::CONNECTED);
    REQUIRE(manager->session() != nullptr);
    REQUIRE(manager->get_board_info().mac == FakeChituBoard::MAC);
    REQUIRE(seen.version == FakeChituBoard::FIRMWARE);
    REQUIRE(board->count_commands("M99999") == 1);

    auto t = get_transitions();
    REQUIRE(t.size() == 2);
    REQUIRE(t[0].second == ConnectionState::CONNECTING);
    REQUIRE(t[1].second == ConnectionState::CONNECTED);
}

TEST_CASE_METHOD(ConnectionManagerTestFixture,
                 "ConnectionManager: unreachable board is a connect error", "[connection]") {
    auto manager = make_manager(1000ms);
    board->set_reachable(false);

    auto err = manager->connect();

    REQUIRE(err.type == ChituErrorType::CONNECT_ERROR);
    REQUIRE(manager->get_connection_state() == ConnectionState::DISCONNECTED);
    REQUIRE(manager->session() == nullptr);
}

TEST_CASE_METHOD(ConnectionManagerTestFixture,
                 "ConnectionManager: silent board fails the handshake", "[connection]") {
    auto manager = make_manager(1000ms, 200ms);
    board->set_silent(true);

    auto err = manager->connect();

    REQUIRE(err.type == ChituErrorType::CONNECT_ERROR);
    REQUIRE(manager->get_connection_state() == ConnectionState::DISCONNECTED);
}

TEST_CASE_METHOD(ConnectionManagerTestFixture,
                 "ConnectionManager: drop_session invalidates the old session", "[connection]") {
    auto manager = make_manager(1000ms);
    REQUIRE(manager->connect().ok());
    ConnectionSessionPtr old = manager->session();

    manager->drop_session(ChituError::timeout("M27", 300));

    REQUIRE_FALSE(old->is_valid());
    REQUIRE(manager->session() == nullptr);
    REQUIRE(manager->get_connection_state() == ConnectionState::DISCONNECTED);

    // Reconnect yields a fresh session
    REQUIRE(manager->connect().ok());
    REQUIRE(manager->session() != old);
}

// ============================================================================
// Rate limit
// ============================================================================

TEST_CASE_METHOD(ConnectionManagerTestFixture,
                 "ConnectionManager: ensure_connected attempts at most once per interval",
                 "[connection][backoff]") {
    auto manager = make_manager(300ms);
    board->set_reachable(false);

    ChituError err;
    REQUIRE(manager->ensure_connected(err) == nullptr);
    REQUIRE(err.type == ChituErrorType::CONNECT_ERROR);

    for (int i = 0; i < 10; i++) {
        REQUIRE(manager->ensure_connected(err) == nullptr);
        REQUIRE(err.type == ChituErrorType::CONNECTION_LOST);
    }
    REQUIRE(manager->attempt_count() == 1);

    board->set_reachable(true);
    std::this_thread::sleep_for(320ms);
    REQUIRE(manager->ensure_connected(err) != nullptr);
    REQUIRE(err.ok());
    REQUIRE(manager->attempt_count() == 2);
}

TEST_CASE_METHOD(ConnectionManagerTestFixture,
                 "ConnectionManager: reconnect timer honors the ping interval",
                 "[connection][backoff][slow]") {
    constexpr auto INTERVAL = 150ms;
    auto manager = make_manager(INTERVAL);
    board->set_reachable(false);

    hv::EventLoopThread loop_thread;
    loop_thread.start(true);
    manager->start(loop_thread.loop());

    std::this_thread::sleep_for(1000ms);
    manager->stop();
    loop_thread.stop(true);
    loop_thread.join();

    auto attempts = board->connect_attempts();
    REQUIRE(attempts.size() >= 3);
    // One immediate attempt plus one per interval, never more
    REQUIRE(attempts.size() <= 1000 / 150 + 1);
    for (size_t i = 1; i < attempts.size(); i++) {
        auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(attempts[i] -
                                                                         attempts[i - 1]);
        INFO("gap " << i << " = " << gap.count() << "ms");
        // Scheduler jitter tolerance; no tick may be skipped
        REQUIRE(gap >= INTERVAL - 20ms);
        REQUIRE(gap <= INTERVAL + 50ms);
    }
}

TEST_CASE_METHOD(ConnectionManagerTestFixture,
                 "ConnectionManager: a tick slightly early still attempts",
                 "[connection][backoff]") {
    constexpr auto INTERVAL = 200ms;
    auto manager = make_manager(INTERVAL);
    board->set_reachable(false);

    // Queued immediate attempt, then every tick of an offline board
    manager->on_reconnect_timer();
    for (int tick = 1; tick <= 4; tick++) {
        std::this_thread::sleep_for(INTERVAL - 10ms);
        manager->on_reconnect_timer();
    }
    REQUIRE(manager->attempt_count() == 5);

    // ensure_connected keeps the strict one-per-interval limit
    std::this_thread::sleep_for(INTERVAL - 10ms);
    ChituError err;
    REQUIRE(manager->ensure_connected(err) == nullptr);
    REQUIRE(err.type == ChituErrorType::CONNECTION_LOST);
    REQUIRE(manager->attempt_count() == 5);
}

TEST_CASE_METHOD(ConnectionManagerTestFixture,
                 "ConnectionManager: back-to-back ticks attempt only once",
                 "[connection][backoff]") {
    auto manager = make_manager(300ms);
    board->set_reachable(false);

    manager->on_reconnect_timer();
    manager->on_reconnect_timer();
    std::this_thread::sleep_for(100ms);
    manager->on_reconnect_timer();

    REQUIRE(manager->attempt_count() == 1);
}

TEST_CASE_METHOD(ConnectionManagerTestFixture,
                 "ConnectionManager: timer reconnects once the board returns",
                 "[connection][backoff][slow]") {
    auto manager = make_manager(100ms);
    board->set_reachable(false);

    hv::EventLoopThread loop_thread;
    loop_thread.start(true);
    manager->start(loop_thread.loop());

    REQUIRE(sync_test::wait_for([&]() { return board->connect_attempts().size() >= 2; },
                                2000ms));
    board->set_reachable(true);
    REQUIRE(sync_test::wait_for(
        [&]() { return manager->get_connection_state() == ConnectionState::CONNECTED; }, 2000ms));

    // Timer is idle while connected
    size_t attempts = board->connect_attempts().size();
    std::this_thread::sleep_for(300ms);
    REQUIRE(board->connect_attempts().size() == attempts);

    manager->stop();
    loop_thread.stop(true);
    loop_thread.join();
}

TEST_CASE_METHOD(ConnectionManagerTestFixture, "ConnectionManager: stop cancels connecting",
                 "[connection]") {
    auto manager = make_manager(100ms);
    manager->stop();

    REQUIRE(manager->connect().type == ChituErrorType::CANCELLED);
    REQUIRE(board->connect_attempts().empty());
}
