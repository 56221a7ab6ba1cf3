/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/job_store.hpp"
#include "hashbreaker/errors.hpp"
#include "hashbreaker/logger.hpp"
#include <atomic>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace hashbreaker {

namespace {

std::int64_t nowEpochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now().time_since_epoch()).count();
}

constexpr const char* kExpiryKey = "expires_at_ms=";

} // namespace

// --- MemoryJobStore ---------------------------------------------------------

MemoryJobStore::MemoryJobStore(std::chrono::seconds defaultTtl, NowFn now)
    : JobStore(defaultTtl), now_(std::move(now)) {}

std::optional<Job> MemoryJobStore::get(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (now_() >= it->second.expiresAt) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.job;
}

void MemoryJobStore::set(const JobId& id, const Job& job, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[id] = Entry{job, now_() + ttl};
}

bool MemoryJobStore::update(const JobId& id, const JobPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }
    auto now = now_();
    if (now >= it->second.expiresAt) {
        entries_.erase(it);
        return false;
    }
    it->second.job = merge(it->second.job, patch);
    it->second.expiresAt = now + defaultTtl();
    return true;
}

std::size_t MemoryJobStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// --- FileJobStore -----------------------------------------------------------

FileJobStore::FileJobStore(const std::filesystem::path& workspace, std::chrono::seconds defaultTtl)
    : JobStore(defaultTtl), dir_(workspace / "jobs") {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        throw StoreError("Cannot create job directory " + dir_.string() + ": " + ec.message());
    }
}

std::filesystem::path FileJobStore::recordPath(const JobId& id) const {
    return dir_ / (id + ".job");
}

std::optional<FileJobStore::Loaded> FileJobStore::load(const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        if (!std::filesystem::exists(path)) {
            return std::nullopt;
        }
        throw StoreError("Cannot open record " + path.string());
    }

    std::string firstLine;
    std::getline(file, firstLine);
    std::ostringstream rest;
    rest << file.rdbuf();
    if (file.bad()) {
        throw StoreError("Cannot read record " + path.string());
    }

    const std::string prefix = kExpiryKey;
    if (firstLine.compare(0, prefix.size(), prefix) != 0) {
        LOG_WARN("Record without expiry header: " + path.string());
        return std::nullopt;
    }

    Loaded loaded;
    try {
        loaded.expiresAtMs = std::stoll(firstLine.substr(prefix.size()));
    } catch (const std::exception&) {
        LOG_WARN("Corrupt expiry in record: " + path.string());
        return std::nullopt;
    }

    auto job = decodeJob(rest.str());
    if (!job) {
        LOG_WARN("Corrupt record: " + path.string());
        return std::nullopt;
    }
    loaded.job = std::move(*job);
    return loaded;
}

void FileJobStore::write(const JobId& id, const Job& job, std::chrono::seconds ttl) const {
    static std::atomic<unsigned long> counter{0};

    auto finalPath = recordPath(id);
    auto tempPath = dir_ / ("." + id + "." + std::to_string(::getpid()) + "." +
                            std::to_string(counter.fetch_add(1)) + ".tmp");

    std::int64_t expiresAt = nowEpochMs() +
        std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count();
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw StoreError("Cannot write record " + tempPath.string());
        }
        file << kExpiryKey << expiresAt << '\n' << encodeJob(job);
        file.flush();
        if (!file.good()) {
            std::error_code ignored;
            std::filesystem::remove(tempPath, ignored);
            throw StoreError("Short write to record " + tempPath.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        throw StoreError("Cannot publish record " + finalPath.string() + ": " + ec.message());
    }
}

std::optional<Job> FileJobStore::get(const JobId& id) {
    if (!isValidJobId(id)) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto path = recordPath(id);
    auto loaded = load(path);
    if (!loaded) {
        return std::nullopt;
    }
    if (nowEpochMs() >= loaded->expiresAtMs) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        LOG_DEBUG("Expired record removed: " + id);
        return std::nullopt;
    }
    return loaded->job;
}

void FileJobStore::set(const JobId& id, const Job& job, std::chrono::seconds ttl) {
    if (!isValidJobId(id)) {
        throw StoreError("Invalid job id: " + id);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    write(id, job, ttl);
}

bool FileJobStore::update(const JobId& id, const JobPatch& patch) {
    if (!isValidJobId(id)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = load(recordPath(id));
    if (!loaded || nowEpochMs() >= loaded->expiresAtMs) {
        return false;
    }
    write(id, merge(loaded->job, patch), defaultTtl());
    return true;
}

bool FileJobStore::ping() noexcept {
    std::error_code ec;
    bool ok = std::filesystem::is_directory(dir_, ec) && ::access(dir_.c_str(), W_OK) == 0;
    if (!ok) {
        LOG_WARN("Job store not writable: " + dir_.string());
    }
    return ok;
}

std::size_t FileJobStore::purgeExpired() noexcept {
    std::size_t removed = 0;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = nowEpochMs();
        for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".job") {
                continue;
            }
            std::ifstream file(entry.path(), std::ios::binary);
            std::string firstLine;
            if (!file || !std::getline(file, firstLine)) {
                continue;
            }
            const std::string prefix = kExpiryKey;
            if (firstLine.compare(0, prefix.size(), prefix) != 0) {
                continue;
            }
            std::int64_t expiresAt = 0;
            try {
                expiresAt = std::stoll(firstLine.substr(prefix.size()));
            } catch (const std::exception&) {
                continue;
            }
            file.close();
            if (now >= expiresAt) {
                std::error_code ec;
                if (std::filesystem::remove(entry.path(), ec)) {
                    ++removed;
                }
            }
        }
        if (removed > 0) {
            LOG_INFO("Purged " + std::to_string(removed) + " expired job records");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Purge of expired records failed: " + std::string(e.what()));
    }
    return removed;
}

} // namespace hashbreaker
