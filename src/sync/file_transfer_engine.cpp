// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "file_transfer_engine.h"

#include "error_reporting.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

namespace chitusync {

FileTransferEngine::FileTransferEngine(CommandChannel& channel,
                                       std::chrono::milliseconds chunk_delay)
    : channel_(channel), chunk_delay_(chunk_delay) {}

void FileTransferEngine::abort_remote_file(const std::string& remote_name) {
    BoardReply reply;
    ChituError err = channel_.send(channel_.protocol().end_upload(), reply);
    if (err.has_error()) {
        spdlog::warn("[FileTransfer] Could not close {} after failed transfer: {}", remote_name,
                     err.message);
    }
}

ChituError FileTransferEngine::upload(const std::string& local_path,
                                      const std::string& remote_name,
                                      const ProgressCallback& on_progress,
                                      const std::atomic<bool>* cancel) {
    const BoardProtocol& protocol = channel_.protocol();

    std::error_code ec;
    uint64_t total = std::filesystem::file_size(local_path, ec);
    if (ec) {
        return ChituError::file_error(local_path, ec.message());
    }
    std::ifstream in(local_path, std::ios::binary);
    if (!in.is_open()) {
        return ChituError::file_error(local_path, strerror(errno));
    }

    spdlog::info("[FileTransfer] Uploading {} as {} ({} bytes)", local_path, remote_name, total);

    BoardReply reply;
    ChituError err = channel_.send(protocol.begin_upload(remote_name), reply);
    if (err.has_error()) {
        return err;
    }
    if (protocol.is_rejection(reply)) {
        return ChituError::transfer_error(remote_name, "open rejected: " + reply.first_line());
    }

    TransferProgress progress;
    progress.filename = remote_name;
    progress.total_bytes = total;

    std::vector<uint8_t> buffer(protocol.chunk_size());
    uint64_t offset = 0;
    uint32_t chunk_index = 0;

    while (offset < total) {
        if (cancel && cancel->load()) {
            spdlog::info("[FileTransfer] {} cancelled at byte {}", remote_name, offset);
            abort_remote_file(remote_name);
            return ChituError::cancelled("Upload of " + remote_name);
        }

        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        size_t n = static_cast<size_t>(in.gcount());
        if (n == 0) {
            abort_remote_file(remote_name);
            return ChituError::file_error(local_path, "file shrank during upload at byte " +
                                                          std::to_string(offset));
        }

        err = channel_.send(protocol.upload_chunk(buffer.data(), n, static_cast<uint32_t>(offset)),
                            reply);
        if (err.has_error()) {
            return err;
        }
        if (protocol.is_resend(reply)) {
            spdlog::warn("[FileTransfer] {} chunk {} at offset {} not accepted: {}", remote_name,
                         chunk_index, offset, reply.first_line());
            abort_remote_file(remote_name);
            return ChituError::transfer_error(remote_name, "acknowledgement mismatch at offset " +
                                                               std::to_string(offset) + ": " +
                                                               reply.first_line());
        }

        offset += n;
        progress.bytes_sent = offset;
        progress.chunk_index = chunk_index++;
        if (on_progress) {
            try {
                on_progress(progress);
            } catch (const std::exception& e) {
                LOG_ERROR_INTERNAL("[FileTransfer] Progress callback threw: {}", e.what());
            }
        }

        if (chunk_delay_.count() > 0) {
            std::this_thread::sleep_for(chunk_delay_);
        }
    }

    err = channel_.send(protocol.verify_upload(total), reply);
    if (err.has_error()) {
        return err;
    }
    if (!protocol.is_acknowledged(reply)) {
        abort_remote_file(remote_name);
        return ChituError::transfer_error(remote_name,
                                          "size verification failed: " + reply.first_line());
    }

    err = channel_.send(protocol.end_upload(), reply);
    if (err.has_error()) {
        return err;
    }
    if (protocol.is_rejection(reply)) {
        return ChituError::transfer_error(remote_name, "close rejected: " + reply.first_line());
    }

    spdlog::info("[FileTransfer] {} uploaded ({} chunks)", remote_name, chunk_index);
    return {};
}

} // namespace chitusync
