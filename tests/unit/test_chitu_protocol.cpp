// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_chitu_protocol.cpp
 * @brief Command encoding and reply decoding for Chitu boards
 */

#include "chitu_protocol.h"

#include <string>
#include <vector>

#include <catch2/catch.hpp>

using namespace chitusync;

namespace {

BoardReply reply_of(std::initializer_list<std::string> lines) {
    BoardReply reply;
    for (const auto& l : lines) {
        reply.lines.push_back(l);
        reply.bytes += l.size();
    }
    return reply;
}

/// Feed lines one at a time, stopping at COMPLETE
ReplyProgress feed(const ChituProtocol& protocol, const BoardCommand& cmd,
                   const std::vector<std::string>& lines, BoardReply& reply,
                   std::vector<std::string>* discarded = nullptr) {
    ReplyProgress last = ReplyProgress::NEED_MORE;
    for (const auto& l : lines) {
        last = protocol.accept_line(cmd, l, reply);
        if (last == ReplyProgress::DISCARD && discarded) {
            discarded->push_back(l);
        }
        if (last == ReplyProgress::COMPLETE) {
            break;
        }
    }
    return last;
}

} // namespace

// ============================================================================
// Command encoding
// ============================================================================

TEST_CASE("ChituProtocol: text commands use the M-code grammar", "[protocol][encode]") {
    ChituProtocol protocol;

    REQUIRE(protocol.identify().payload == "M99999");
    REQUIRE(protocol.list_files().payload == "M20");
    REQUIRE(protocol.list_files().shape == ReplyShape::FILE_LIST);
    REQUIRE(protocol.begin_upload("a.ctb").payload == "M28 a.ctb");
    REQUIRE(protocol.verify_upload(10485760).payload == "M4012 I1 T10485760");
    REQUIRE(protocol.end_upload().payload == "M29");
    REQUIRE(protocol.delete_file("old part.ctb").payload == "M30 old part.ctb");
    REQUIRE(protocol.start_print("a.ctb").payload == "M6030 'a.ctb'");
    REQUIRE(protocol.stop_print().payload == "M33");
    REQUIRE(protocol.query_status().payload == "M27");
    REQUIRE(protocol.home_z().payload == "G28 Z");
    REQUIRE(protocol.query_position().payload == "M114");
    REQUIRE(protocol.move_z(12.5).payload == "G0 Z12.500");
}

TEST_CASE("ChituProtocol: upload chunk carries offset, checksum and terminator",
          "[protocol][encode][chunk]") {
    ChituProtocol protocol;
    const uint8_t data[] = {0x01, 0x02, 0x04, 0x08};
    const uint32_t offset = 0x00010500; // 66816

    BoardCommand cmd = protocol.upload_chunk(data, sizeof(data), offset);
    const std::string& p = cmd.payload;

    REQUIRE(cmd.shape == ReplyShape::CHUNK_ACK);
    REQUIRE(p.size() == sizeof(data) + 6);
    REQUIRE(p.compare(0, 4, std::string(reinterpret_cast<const char*>(data), 4)) == 0);

    // Little-endian offset
    REQUIRE(static_cast<uint8_t>(p[4]) == 0x00);
    REQUIRE(static_cast<uint8_t>(p[5]) == 0x05);
    REQUIRE(static_cast<uint8_t>(p[6]) == 0x01);
    REQUIRE(static_cast<uint8_t>(p[7]) == 0x00);

    // xor of data (0x0F) and offset bytes (0x05 ^ 0x01)
    REQUIRE(static_cast<uint8_t>(p[8]) == (0x0F ^ 0x05 ^ 0x01));
    REQUIRE(static_cast<uint8_t>(p[9]) == ChituProtocol::CHUNK_TERMINATOR);
}

TEST_CASE("ChituProtocol: job file extensions are case-insensitive", "[protocol]") {
    ChituProtocol protocol;

    CHECK(protocol.is_job_file("a.ctb"));
    CHECK(protocol.is_job_file("Benchy.CTB"));
    CHECK(protocol.is_job_file("cube.goo"));
    CHECK_FALSE(protocol.is_job_file("notes.txt"));
    CHECK_FALSE(protocol.is_job_file(".ctb"));
    CHECK_FALSE(protocol.is_job_file("a.ctb.partial"));
}

// ============================================================================
// Reply framing
// ============================================================================

TEST_CASE("ChituProtocol: UNTIL_OK completes on the first ok line", "[protocol][framing]") {
    ChituProtocol protocol;
    BoardReply reply;

    auto progress = feed(protocol, protocol.delete_file("a.ctb"),
                         {"File deleted:a.ctb\r", "ok\r"}, reply);

    REQUIRE(progress == ReplyProgress::COMPLETE);
    REQUIRE(reply.lines.size() == 2);
    REQUIRE(reply.lines[0] == "File deleted:a.ctb");
}

TEST_CASE("ChituProtocol: listing is not complete until ok follows End file list",
          "[protocol][framing]") {
    ChituProtocol protocol;
    BoardCommand cmd = protocol.list_files();
    BoardReply reply;

    REQUIRE(protocol.accept_line(cmd, "Begin file list", reply) == ReplyProgress::NEED_MORE);
    REQUIRE(protocol.accept_line(cmd, "ok 3 files", reply) == ReplyProgress::NEED_MORE);
    REQUIRE(protocol.accept_line(cmd, "a.ctb 100", reply) == ReplyProgress::NEED_MORE);
    REQUIRE(protocol.accept_line(cmd, "End file list", reply) == ReplyProgress::NEED_MORE);
    REQUIRE(protocol.accept_line(cmd, "ok", reply) == ReplyProgress::COMPLETE);
}

TEST_CASE("ChituProtocol: chunk acknowledgement discards unrelated lines",
          "[protocol][framing][chunk]") {
    ChituProtocol protocol;
    const uint8_t data[] = {0xAA};
    BoardCommand cmd = protocol.upload_chunk(data, 1, 0);

    SECTION("ok after noise") {
        BoardReply reply;
        std::vector<std::string> discarded;
        auto progress = feed(protocol, cmd, {"wait", "echo:busy", "ok"}, reply, &discarded);
        REQUIRE(progress == ReplyProgress::COMPLETE);
        REQUIRE(discarded.size() == 2);
        REQUIRE(protocol.is_acknowledged(reply));
        REQUIRE_FALSE(protocol.is_resend(reply));
    }

    SECTION("resend") {
        BoardReply reply;
        auto progress = feed(protocol, cmd, {"resend 1280,offset error:0"}, reply);
        REQUIRE(progress == ReplyProgress::COMPLETE);
        REQUIRE(protocol.is_resend(reply));
    }
}

// ============================================================================
// Reply decoding
// ============================================================================

TEST_CASE("ChituProtocol: parses board identification", "[protocol][decode]") {
    ChituProtocol protocol;
    BoardInfo info;

    auto reply = reply_of(
        {"ok MAC:00:e0:4c:27:00:2e IP:192.168.1.174 VER:V1.4.1 ID:2e,00,27,00 NAME:CBD"});
    REQUIRE(protocol.parse_board_info(reply, info).ok());
    CHECK(info.mac == "00:e0:4c:27:00:2e");
    CHECK(info.ip == "192.168.1.174");
    CHECK(info.version == "V1.4.1");
    CHECK(info.id == "2e,00,27,00");
    CHECK(info.name == "CBD");
}

TEST_CASE("ChituProtocol: identification without fields is a protocol error",
          "[protocol][decode]") {
    ChituProtocol protocol;
    BoardInfo info;

    auto err = protocol.parse_board_info(reply_of({"ok"}), info);
    REQUIRE(err.type == ChituErrorType::PROTOCOL_ERROR);
    REQUIRE(err.is_connection_level());
}

TEST_CASE("ChituProtocol: parses file listing", "[protocol][decode][listing]") {
    ChituProtocol protocol;
    RemoteSnapshot::Map files;

    auto reply = reply_of({"Begin file list", "a.ctb 10485760", "my part v2.goo 2048",
                           "System Volume Information 0", "deleted.ctb 0", "End file list",
                           "ok"});
    REQUIRE(protocol.parse_file_list(reply, files).ok());

    REQUIRE(files.size() == 2);
    REQUIRE(files.at("a.ctb").size == 10485760);
    REQUIRE(files.at("my part v2.goo").size == 2048);
    REQUIRE(files.count("deleted.ctb") == 0);
}

TEST_CASE("ChituProtocol: malformed listings are protocol errors", "[protocol][decode][listing]") {
    ChituProtocol protocol;
    RemoteSnapshot::Map files;
    files["keep.ctb"] = RemoteFileRecord{"keep.ctb", 1};

    SECTION("bad size") {
        auto err = protocol.parse_file_list(
            reply_of({"Begin file list", "a.ctb twelve", "End file list", "ok"}), files);
        REQUIRE(err.type == ChituErrorType::PROTOCOL_ERROR);
    }

    SECTION("not terminated") {
        auto err = protocol.parse_file_list(reply_of({"Begin file list", "a.ctb 12"}), files);
        REQUIRE(err.type == ChituErrorType::PROTOCOL_ERROR);
    }

    // Output untouched on failure
    REQUIRE(files.size() == 1);
}

TEST_CASE("ChituProtocol: split_listing_line keeps spaces in names", "[protocol][listing]") {
    std::string name;
    std::string size;

    REQUIRE(ChituProtocol::split_listing_line("a b c.ctb 42", name, size));
    REQUIRE(name == "a b c.ctb");
    REQUIRE(size == "42");

    REQUIRE_FALSE(ChituProtocol::split_listing_line("readme.txt 42", name, size));
}

TEST_CASE("ChituProtocol: byte progress is reported verbatim", "[protocol][decode][status]") {
    ChituProtocol protocol;
    PrintJobStatus status;

    REQUIRE(protocol.parse_print_status(reply_of({"SD printing byte 950000/1000000", "ok"}),
                                        status)
                .ok());
    REQUIRE(status.state == PrintJobStatus::State::PRINTING);
    REQUIRE(status.bytes_read == 950000);
    REQUIRE(status.total_bytes == 1000000);
    REQUIRE(status.progress_percent() == Catch::Detail::Approx(95.0));
}

TEST_CASE("ChituProtocol: status variants", "[protocol][decode][status]") {
    ChituProtocol protocol;
    PrintJobStatus status;

    SECTION("idle") {
        REQUIRE(protocol.parse_print_status(reply_of({"Not SD printing.", "ok"}), status).ok());
        REQUIRE(status.state == PrintJobStatus::State::IDLE);
        REQUIRE_FALSE(status.is_active());
    }

    SECTION("ok prefix on the same line") {
        REQUIRE(protocol.parse_print_status(reply_of({"ok SD printing byte 1/4"}), status).ok());
        REQUIRE(status.state == PrintJobStatus::State::PRINTING);
        REQUIRE(status.progress_percent() == Catch::Detail::Approx(25.0));
    }

    SECTION("paused") {
        REQUIRE(
            protocol.parse_print_status(reply_of({"SD printing paused byte 5/10", "ok"}), status)
                .ok());
        REQUIRE(status.state == PrintJobStatus::State::PAUSED);
        REQUIRE(status.is_active());
    }

    SECTION("garbage") {
        auto err = protocol.parse_print_status(reply_of({"hello", "ok"}), status);
        REQUIRE(err.type == ChituErrorType::PROTOCOL_ERROR);
    }
}

TEST_CASE("ChituProtocol: parses Z position", "[protocol][decode]") {
    ChituProtocol protocol;
    double z = -1.0;

    REQUIRE(protocol.parse_z_position(reply_of({"ok C: X:0.000000 Y:0.000000 Z:150.000000 "
                                                "E:0.000000"}),
                                      z)
                .ok());
    REQUIRE(z == Catch::Detail::Approx(150.0));

    REQUIRE(protocol.parse_z_position(reply_of({"ok"}), z).type ==
            ChituErrorType::PROTOCOL_ERROR);
}

TEST_CASE("ChituProtocol: rejection detection", "[protocol][decode]") {
    ChituProtocol protocol;

    CHECK(protocol.is_rejection(reply_of({"Failed to delete a.ctb", "ok"})));
    CHECK(protocol.is_rejection(reply_of({"Error:Printing, can not open file", "ok"})));
    CHECK_FALSE(protocol.is_rejection(reply_of({"File deleted:a.ctb", "ok"})));
    CHECK_FALSE(protocol.is_rejection(reply_of({"ok"})));
}
