// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "board_protocol.h"

namespace chitusync {

/**
 * @brief M-code grammar spoken by Chitu-class resin mainboards
 *
 * Wire summary:
 * - Commands are plain ASCII datagrams ("M20", "M28 name.ctb").
 * - Replies are CRLF-terminated lines, normally one per datagram.
 * - Uploads are raw chunks of up to 1280 bytes followed by a 6-byte trailer:
 *   offset (uint32 little-endian), xor of data and offset, then 0x83.
 *
 * Recognized job files: .ctb and .goo, case-insensitive.
 */
class ChituProtocol : public BoardProtocol {
  public:
    static constexpr size_t CHUNK_SIZE = 1280;
    static constexpr uint8_t CHUNK_TERMINATOR = 0x83;

    const char* family() const override {
        return "chitu";
    }

    size_t chunk_size() const override {
        return CHUNK_SIZE;
    }

    bool is_job_file(const std::string& name) const override;

    BoardCommand identify() const override;
    BoardCommand list_files() const override;
    BoardCommand begin_upload(const std::string& remote_name) const override;
    BoardCommand upload_chunk(const uint8_t* data, size_t len, uint32_t offset) const override;
    BoardCommand verify_upload(uint64_t total_bytes) const override;
    BoardCommand end_upload() const override;
    BoardCommand delete_file(const std::string& remote_name) const override;
    BoardCommand start_print(const std::string& remote_name) const override;
    BoardCommand stop_print() const override;
    BoardCommand query_status() const override;
    BoardCommand home_z() const override;
    BoardCommand query_position() const override;
    BoardCommand move_z(double z_mm) const override;

    ReplyProgress accept_line(const BoardCommand& command, const std::string& line,
                              BoardReply& reply) const override;

    ChituError parse_board_info(const BoardReply& reply, BoardInfo& info) const override;
    ChituError parse_file_list(const BoardReply& reply, RemoteSnapshot::Map& files) const override;
    ChituError parse_print_status(const BoardReply& reply, PrintJobStatus& status) const override;
    ChituError parse_z_position(const BoardReply& reply, double& z_mm) const override;

    bool is_rejection(const BoardReply& reply) const override;
    bool is_acknowledged(const BoardReply& reply) const override;
    bool is_resend(const BoardReply& reply) const override;

    /**
     * @brief Split a listing line into name and size text
     *
     * Names may contain spaces, so the split point is the end of the last job
     * extension in the line.
     *
     * @return false if the line carries no job extension
     */
    static bool split_listing_line(const std::string& line, std::string& name,
                                   std::string& size_text);

    /// xor8 over chunk data followed by the encoded offset
    static uint8_t chunk_checksum(const uint8_t* data, size_t len, uint32_t offset);
};

} // namespace chitusync
