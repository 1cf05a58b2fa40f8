// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "chitu_error.h"
#include "sync_types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chitusync {

/**
 * @brief How the reply to a command is delimited
 */
enum class ReplyShape {
    UNTIL_OK,  // Every line up to and including the first "ok" line
    FILE_LIST, // Listing body, "End file list", then "ok"
    CHUNK_ACK  // First "ok" or "resend" line; anything else is stray
};

/**
 * @brief One request ready for the wire
 */
struct BoardCommand {
    std::string name;    ///< Short label for logs and errors ("M28", "CHUNK")
    std::string payload; ///< Exact bytes of the datagram
    ReplyShape shape = ReplyShape::UNTIL_OK;
};

/**
 * @brief Reply lines accepted for one command, line endings stripped
 */
struct BoardReply {
    std::vector<std::string> lines;
    size_t bytes = 0;

    const std::string& first_line() const {
        static const std::string empty;
        return lines.empty() ? empty : lines.front();
    }

    void clear() {
        lines.clear();
        bytes = 0;
    }
};

/**
 * @brief Outcome of feeding one received line into a reply
 */
enum class ReplyProgress {
    NEED_MORE, // Line accepted, reply not complete yet
    COMPLETE,  // Line accepted and it completes the reply
    DISCARD    // Line does not belong to this reply
};

/**
 * @brief Board-family command grammar
 *
 * Everything that depends on the wire format lives behind this interface:
 * building commands, deciding when a reply is complete, and decoding replies
 * into the shared data model. The session and channel only move datagrams.
 *
 * Implementations must be stateless so one instance can be shared between
 * the connection manager, the channel and every higher layer.
 */
class BoardProtocol {
  public:
    virtual ~BoardProtocol() = default;

    /// Human-readable family name for logs
    virtual const char* family() const = 0;

    /// Fixed upload chunk size in bytes
    virtual size_t chunk_size() const = 0;

    /// True when the name has a job extension this board can print
    virtual bool is_job_file(const std::string& name) const = 0;

    // Command builders

    virtual BoardCommand identify() const = 0;
    virtual BoardCommand list_files() const = 0;
    virtual BoardCommand begin_upload(const std::string& remote_name) const = 0;
    virtual BoardCommand upload_chunk(const uint8_t* data, size_t len, uint32_t offset) const = 0;
    virtual BoardCommand verify_upload(uint64_t total_bytes) const = 0;
    virtual BoardCommand end_upload() const = 0;
    virtual BoardCommand delete_file(const std::string& remote_name) const = 0;
    virtual BoardCommand start_print(const std::string& remote_name) const = 0;
    virtual BoardCommand stop_print() const = 0;
    virtual BoardCommand query_status() const = 0;
    virtual BoardCommand home_z() const = 0;
    virtual BoardCommand query_position() const = 0;
    virtual BoardCommand move_z(double z_mm) const = 0;

    /**
     * @brief Feed one received line into the reply for @p command
     *
     * Accepted lines are appended to @p reply. Discarded lines are left for the
     * caller to log.
     */
    virtual ReplyProgress accept_line(const BoardCommand& command, const std::string& line,
                                      BoardReply& reply) const = 0;

    // Reply decoders. Malformed content yields PROTOCOL_ERROR.

    virtual ChituError parse_board_info(const BoardReply& reply, BoardInfo& info) const = 0;
    virtual ChituError parse_file_list(const BoardReply& reply,
                                       RemoteSnapshot::Map& files) const = 0;
    virtual ChituError parse_print_status(const BoardReply& reply,
                                          PrintJobStatus& status) const = 0;
    virtual ChituError parse_z_position(const BoardReply& reply, double& z_mm) const = 0;

    /// Reply carries an Error/Failed line
    virtual bool is_rejection(const BoardReply& reply) const = 0;

    /// Reply starts with a plain acknowledgement
    virtual bool is_acknowledged(const BoardReply& reply) const = 0;

    /// Chunk reply asks for a resend
    virtual bool is_resend(const BoardReply& reply) const = 0;
};

} // namespace chitusync
