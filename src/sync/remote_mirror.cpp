// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "remote_mirror.h"

#include <spdlog/spdlog.h>

namespace chitusync {

RemoteMirror::RemoteMirror(CommandChannel& channel) : channel_(channel) {}

ChituError RemoteMirror::list_remote(RemoteSnapshotPtr& snapshot) {
    const BoardProtocol& protocol = channel_.protocol();

    BoardReply reply;
    ChituError err = channel_.send(protocol.list_files(), reply);
    if (err.has_error()) {
        return err;
    }

    RemoteSnapshot::Map files;
    err = protocol.parse_file_list(reply, files);
    if (err.has_error()) {
        channel_.report_protocol_error(err);
        return err;
    }

    snapshot = std::make_shared<const RemoteSnapshot>(std::move(files));
    spdlog::debug("[RemoteMirror] Board lists {} job files", snapshot->size());
    return {};
}

ChituError RemoteMirror::delete_remote(const std::string& remote_name) {
    const BoardProtocol& protocol = channel_.protocol();
    BoardCommand cmd = protocol.delete_file(remote_name);

    BoardReply reply;
    ChituError err = channel_.send(cmd, reply);
    if (err.has_error()) {
        return err;
    }
    if (protocol.is_rejection(reply)) {
        err = ChituError::remote_rejected(cmd.name, reply.first_line());
        err.file = remote_name;
        return err;
    }

    spdlog::info("[RemoteMirror] Deleted {} from printer", remote_name);
    return {};
}

ChituError RemoteMirror::delete_all(size_t& deleted, size_t& failed) {
    deleted = 0;
    failed = 0;

    RemoteSnapshotPtr snapshot;
    ChituError err = list_remote(snapshot);
    if (err.has_error()) {
        return err;
    }

    for (const auto& [name, record] : snapshot->records()) {
        err = delete_remote(name);
        if (err.is_connection_level()) {
            return err;
        }
        if (err.has_error()) {
            spdlog::warn("[RemoteMirror] {}", err.message);
            failed++;
        } else {
            deleted++;
        }
    }

    spdlog::info("[RemoteMirror] Storage cleared: {} deleted, {} failed", deleted, failed);
    return {};
}

} // namespace chitusync
