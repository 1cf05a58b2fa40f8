// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sync_metadata_store.h"

#include "error_reporting.h"

#include "hv/json.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <iomanip>

using json = nlohmann::json;

namespace chitusync {

SyncMetadataStore::SyncMetadataStore(std::string path) : path_(std::move(path)) {}

void SyncMetadataStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();

    std::ifstream in(path_);
    if (!in.is_open()) {
        spdlog::debug("[SyncMetadata] No metadata at {}, starting empty", path_);
        return;
    }

    try {
        json data = json::parse(in);
        for (auto& [name, entry] : data.items()) {
            SyncRecord rec;
            rec.size = entry.value("size", static_cast<uint64_t>(0));
            rec.mtime_ns = entry.value("mtime", static_cast<int64_t>(0));
            records_[name] = rec;
        }
        spdlog::debug("[SyncMetadata] Loaded {} records from {}", records_.size(), path_);
    } catch (const json::exception& e) {
        LOG_WARN_INTERNAL("[SyncMetadata] Failed to parse {}: {}", path_, e.what());
        records_.clear();
        std::string backup_path = path_ + ".corrupt";
        if (std::rename(path_.c_str(), backup_path.c_str()) == 0) {
            spdlog::info("[SyncMetadata] Corrupt metadata backed up to {}", backup_path);
        }
    }
}

ChituError SyncMetadataStore::save() const {
    json data = json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, rec] : records_) {
            data[name] = {{"size", rec.size}, {"mtime", rec.mtime_ns}};
        }
    }

    // Temp file + rename
    std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            LOG_ERROR_INTERNAL("Failed to open metadata file for writing: {}", tmp_path);
            return ChituError::file_error(tmp_path, "cannot open for writing");
        }
        o << std::setw(2) << data << std::endl;
        if (!o.good()) {
            LOG_ERROR_INTERNAL("Error writing metadata file: {}", tmp_path);
            return ChituError::file_error(tmp_path, "write failed");
        }
    }
    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        LOG_ERROR_INTERNAL("Failed to replace metadata file: {}", path_);
        return ChituError::file_error(path_, "rename failed");
    }
    spdlog::trace("[SyncMetadata] Saved {} records", data.size());
    return {};
}

std::optional<SyncRecord> SyncMetadataStore::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(name);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SyncMetadataStore::record(const std::string& name, const LocalFileRecord& local) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[name] = SyncRecord{local.size, local.mtime_ns};
}

void SyncMetadataStore::forget(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(name);
}

size_t SyncMetadataStore::purge(const std::set<std::string>& keep) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (keep.count(it->first) == 0) {
            it = records_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<std::string> SyncMetadataStore::stale_files(const LocalSnapshot& local,
                                                        const RemoteSnapshot& remote) {
    std::vector<std::string> stale;
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& [name, file] : local.records()) {
        const RemoteFileRecord* remote_record = remote.find(name);
        if (!remote_record || remote_record->size != file.size) {
            continue; // The size diff already uploads it
        }

        auto it = records_.find(name);
        if (it == records_.end()) {
            records_[name] = SyncRecord{file.size, file.mtime_ns};
            spdlog::debug("[SyncMetadata] Adopted {} (already on printer)", name);
        } else if (it->second.mtime_ns != file.mtime_ns) {
            spdlog::info("[SyncMetadata] {} changed since last upload", name);
            stale.push_back(name);
        }
    }
    return stale;
}

size_t SyncMetadataStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace chitusync
