// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "local_scanner.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>
#include <thread>

namespace chitusync {

namespace {

constexpr std::chrono::milliseconds STABLE_POLL{100};

int64_t mtime_ns_of(const struct stat& st) {
    return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
           static_cast<int64_t>(st.st_mtim.tv_nsec);
}

} // namespace

LocalScanner::LocalScanner(std::string folder, std::shared_ptr<const BoardProtocol> protocol)
    : folder_(std::move(folder)), protocol_(std::move(protocol)) {}

std::string LocalScanner::path_of(const std::string& name) const {
    if (!folder_.empty() && folder_.back() == '/') {
        return folder_ + name;
    }
    return folder_ + "/" + name;
}

bool LocalScanner::stat_file(const std::string& name, LocalFileRecord& record) const {
    if (!protocol_->is_job_file(name)) {
        return false;
    }
    struct stat st;
    if (stat(path_of(name).c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return false;
    }
    record.name = name;
    record.size = static_cast<uint64_t>(st.st_size);
    record.mtime_ns = mtime_ns_of(st);
    return true;
}

ChituError LocalScanner::scan(LocalSnapshotPtr& snapshot) const {
    DIR* dir = opendir(folder_.c_str());
    if (!dir) {
        return ChituError::file_error(folder_, strerror(errno));
    }

    LocalSnapshot::Map records;
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") {
            continue;
        }
        LocalFileRecord record;
        if (stat_file(name, record)) {
            records[name] = record;
        }
    }
    closedir(dir);

    snapshot = std::make_shared<const LocalSnapshot>(std::move(records));
    spdlog::trace("[LocalScanner] {} job files in {}", snapshot->size(), folder_);
    return {};
}

ChituError LocalScanner::wait_until_stable(const std::string& name,
                                           std::chrono::milliseconds stable_for,
                                           std::chrono::milliseconds max_wait,
                                           const std::atomic<bool>* cancel) const {
    using clock = std::chrono::steady_clock;
    const std::string path = path_of(name);
    auto deadline = clock::now() + max_wait;

    LocalFileRecord record;
    if (!stat_file(name, record)) {
        return ChituError::file_error(path, "file disappeared");
    }
    uint64_t last_size = record.size;
    auto stable_since = clock::now();

    while (clock::now() - stable_since < stable_for) {
        if (cancel && cancel->load()) {
            return ChituError::cancelled("Waiting for " + name);
        }
        if (clock::now() >= deadline) {
            return ChituError::file_error(path, "still being written after " +
                                                    std::to_string(max_wait.count()) + "ms");
        }
        std::this_thread::sleep_for(std::min(STABLE_POLL, stable_for));

        if (!stat_file(name, record)) {
            return ChituError::file_error(path, "file disappeared");
        }
        if (record.size != last_size) {
            spdlog::trace("[LocalScanner] {} still growing ({} -> {})", name, last_size,
                          record.size);
            last_size = record.size;
            stable_since = clock::now();
        }
    }
    return {};
}

} // namespace chitusync
