// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>

namespace chitusync {

/**
 * @brief Error types for printer and sync operations
 */
enum class ChituErrorType {
    NONE,            // No error
    CONNECT_ERROR,   // Socket refused/unreachable or handshake failed
    TIMEOUT,         // No reply within the command bound
    PROTOCOL_ERROR,  // Malformed, truncated or oversized reply
    CONNECTION_LOST, // Session torn down (or never established) while a command was pending
    TRANSFER_ERROR,  // Chunk acknowledgement or size verification failed
    REMOTE_REJECTED, // Board answered with an Error/Failed line
    PRINTER_BUSY,    // Board is printing and cannot accept the request
    CONFIG_ERROR,    // Invalid folder/address/intervals
    FILE_ERROR,      // Local file unreadable or never settled
    CANCELLED,       // Operation aborted by shutdown or reconfiguration
    INVALID_REQUEST  // Refused locally before anything was sent
};

/**
 * @brief Error information for board and sync operations
 *
 * Value type returned by every fallible operation. A default-constructed
 * ChituError means success.
 */
struct ChituError {
    ChituErrorType type = ChituErrorType::NONE;
    std::string message; // Human-readable technical message
    std::string command; // Command that caused the error (e.g. "M28"), if any
    std::string file;    // File the error relates to, if any

    /**
     * @brief Check if there's an error
     */
    bool has_error() const {
        return type != ChituErrorType::NONE;
    }

    bool ok() const {
        return type == ChituErrorType::NONE;
    }

    /**
     * @brief Errors that invalidate the session
     *
     * These force the Connection Manager back to DISCONNECTED; the operation
     * that hit them is requeued rather than reported as a per-file failure.
     */
    bool is_connection_level() const {
        return type == ChituErrorType::CONNECT_ERROR || type == ChituErrorType::TIMEOUT ||
               type == ChituErrorType::PROTOCOL_ERROR ||
               type == ChituErrorType::CONNECTION_LOST;
    }

    /**
     * @brief Get string representation of error type
     */
    std::string get_type_string() const {
        switch (type) {
        case ChituErrorType::NONE:
            return "NONE";
        case ChituErrorType::CONNECT_ERROR:
            return "CONNECT_ERROR";
        case ChituErrorType::TIMEOUT:
            return "TIMEOUT";
        case ChituErrorType::PROTOCOL_ERROR:
            return "PROTOCOL_ERROR";
        case ChituErrorType::CONNECTION_LOST:
            return "CONNECTION_LOST";
        case ChituErrorType::TRANSFER_ERROR:
            return "TRANSFER_ERROR";
        case ChituErrorType::REMOTE_REJECTED:
            return "REMOTE_REJECTED";
        case ChituErrorType::PRINTER_BUSY:
            return "PRINTER_BUSY";
        case ChituErrorType::CONFIG_ERROR:
            return "CONFIG_ERROR";
        case ChituErrorType::FILE_ERROR:
            return "FILE_ERROR";
        case ChituErrorType::CANCELLED:
            return "CANCELLED";
        case ChituErrorType::INVALID_REQUEST:
            return "INVALID_REQUEST";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Get a user-friendly error message
     */
    std::string user_message() const {
        switch (type) {
        case ChituErrorType::CONNECT_ERROR:
            return "Printer is offline or unreachable.";
        case ChituErrorType::TIMEOUT:
            return "Printer did not answer in time.";
        case ChituErrorType::CONNECTION_LOST:
            return "Connection to printer lost.";
        case ChituErrorType::PROTOCOL_ERROR:
            return "Printer sent an unexpected reply.";
        case ChituErrorType::TRANSFER_ERROR:
            return "File transfer failed. Consider increasing the send delay.";
        case ChituErrorType::PRINTER_BUSY:
            return "Printer is currently printing.";
        case ChituErrorType::CONFIG_ERROR:
            return "Invalid configuration: " + message;
        default:
            break;
        }
        if (!message.empty()) {
            return message;
        }
        return "An unknown error occurred.";
    }

    static ChituError connect_failed(const std::string& host, const std::string& detail) {
        ChituError err;
        err.type = ChituErrorType::CONNECT_ERROR;
        err.message = "Cannot reach " + host + ": " + detail;
        return err;
    }

    static ChituError timeout(const std::string& command_name, uint32_t timeout_ms) {
        ChituError err;
        err.type = ChituErrorType::TIMEOUT;
        err.command = command_name;
        err.message = "No reply to " + command_name + " after " + std::to_string(timeout_ms) + "ms";
        return err;
    }

    static ChituError protocol_error(const std::string& command_name, const std::string& detail) {
        ChituError err;
        err.type = ChituErrorType::PROTOCOL_ERROR;
        err.command = command_name;
        err.message = "Malformed reply to " + command_name + ": " + detail;
        return err;
    }

    static ChituError connection_lost(const std::string& command_name = "") {
        ChituError err;
        err.type = ChituErrorType::CONNECTION_LOST;
        err.command = command_name;
        err.message = "Not connected to printer";
        return err;
    }

    static ChituError transfer_error(const std::string& file_name, const std::string& detail) {
        ChituError err;
        err.type = ChituErrorType::TRANSFER_ERROR;
        err.file = file_name;
        err.message = "Transfer of " + file_name + " failed: " + detail;
        return err;
    }

    static ChituError remote_rejected(const std::string& command_name, const std::string& reply) {
        ChituError err;
        err.type = ChituErrorType::REMOTE_REJECTED;
        err.command = command_name;
        err.message = command_name + " rejected by printer: " + reply;
        return err;
    }

    static ChituError printer_busy(const std::string& command_name) {
        ChituError err;
        err.type = ChituErrorType::PRINTER_BUSY;
        err.command = command_name;
        err.message = "Printer is busy printing";
        return err;
    }

    static ChituError config_error(const std::string& detail) {
        ChituError err;
        err.type = ChituErrorType::CONFIG_ERROR;
        err.message = detail;
        return err;
    }

    static ChituError file_error(const std::string& path, const std::string& detail) {
        ChituError err;
        err.type = ChituErrorType::FILE_ERROR;
        err.file = path;
        err.message = path + ": " + detail;
        return err;
    }

    static ChituError cancelled(const std::string& what) {
        ChituError err;
        err.type = ChituErrorType::CANCELLED;
        err.message = what + " cancelled";
        return err;
    }

    static ChituError invalid_request(const std::string& command_name, const std::string& detail) {
        ChituError err;
        err.type = ChituErrorType::INVALID_REQUEST;
        err.command = command_name;
        err.message = detail;
        return err;
    }
};

} // namespace chitusync
