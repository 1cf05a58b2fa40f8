// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "error_reporting.h"
#include "logging_init.h"

#include "../test_helpers/sync_test_helpers.h"

#include <fstream>
#include <sstream>
#include <vector>

#include <catch2/catch.hpp>

using namespace chitusync;

TEST_CASE("Logging: verbosity maps to levels", "[logging]") {
    REQUIRE(logging::verbosity_to_level(0) == spdlog::level::warn);
    REQUIRE(logging::verbosity_to_level(1) == spdlog::level::info);
    REQUIRE(logging::verbosity_to_level(2) == spdlog::level::debug);
    REQUIRE(logging::verbosity_to_level(5) == spdlog::level::trace);
}

TEST_CASE("Logging: level and target names", "[logging]") {
    REQUIRE(logging::parse_log_level("trace", spdlog::level::warn) == spdlog::level::trace);
    REQUIRE(logging::parse_log_level("off", spdlog::level::warn) == spdlog::level::off);
    REQUIRE(logging::parse_log_level("nonsense", spdlog::level::err) == spdlog::level::err);

    REQUIRE(logging::parse_log_target("journal") == logging::LogTarget::Journal);
    REQUIRE(logging::parse_log_target("file") == logging::LogTarget::File);
    REQUIRE(logging::parse_log_target("bogus") == logging::LogTarget::Auto);
    REQUIRE(std::string(logging::log_target_name(logging::LogTarget::Console)) == "console");
}

TEST_CASE("Logging: hex_encode", "[logging]") {
    REQUIRE(logging::hex_encode("") == "");
    REQUIRE(logging::hex_encode(std::string("ok\r\n")) == "6f6b0d0a");
    REQUIRE(logging::hex_encode(std::string("\x00\xff\x83", 3)) == "00ff83");
}

TEST_CASE("Logging: unknown message logger writes hex lines", "[logging]") {
    sync_test::ScopedTempDir tmp("chitusync_unknown_log_test");
    std::string path = tmp.file("unknown_printer_msgs.log");

    auto logger = logging::create_unknown_message_logger(path);
    REQUIRE(logger != nullptr);
    logger->info("{}", logging::hex_encode("wait"));
    logger->flush();

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    REQUIRE(content.str().find("77616974") != std::string::npos);
}

TEST_CASE("Logging: notification handler receives user-facing errors", "[logging][notify]") {
    std::vector<std::pair<NotificationLevel, std::string>> seen;
    set_notification_handler([&seen](NotificationLevel level, const std::string& message) {
        seen.emplace_back(level, message);
    });

    NOTIFY_ERROR("Upload of {} failed", "a.ctb");
    NOTIFY_WARNING("Printer busy");

    set_notification_handler(nullptr);
    NOTIFY_INFO("not delivered");

    REQUIRE(seen.size() == 2);
    REQUIRE(seen[0].first == NotificationLevel::ERROR);
    REQUIRE(seen[0].second == "Upload of a.ctb failed");
    REQUIRE(seen[1].first == NotificationLevel::WARNING);
}
