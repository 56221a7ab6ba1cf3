/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "hashbreaker/job.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace hashbreaker {

// Keyed job records with expiry. I/O failures throw StoreError.
// update() is a read-merge-write and is not atomic with other callers'
// read-merge-write sequences.
class JobStore {
public:
    virtual ~JobStore() = default;

    [[nodiscard]] virtual std::optional<Job> get(const JobId& id) = 0;
    virtual void set(const JobId& id, const Job& job, std::chrono::seconds ttl) = 0;
    // false when no live record exists; refreshes the TTL otherwise
    [[nodiscard]] virtual bool update(const JobId& id, const JobPatch& patch) = 0;
    [[nodiscard]] virtual bool ping() noexcept = 0;

    [[nodiscard]] std::chrono::seconds defaultTtl() const noexcept { return defaultTtl_; }

protected:
    explicit JobStore(std::chrono::seconds defaultTtl) noexcept : defaultTtl_(defaultTtl) {}

private:
    std::chrono::seconds defaultTtl_;
};

class MemoryJobStore final : public JobStore {
public:
    using NowFn = std::function<std::chrono::steady_clock::time_point()>;

    explicit MemoryJobStore(std::chrono::seconds defaultTtl = std::chrono::seconds(86400),
                            NowFn now = &std::chrono::steady_clock::now);

    MemoryJobStore(const MemoryJobStore&) = delete;
    MemoryJobStore& operator=(const MemoryJobStore&) = delete;

    [[nodiscard]] std::optional<Job> get(const JobId& id) override;
    void set(const JobId& id, const Job& job, std::chrono::seconds ttl) override;
    [[nodiscard]] bool update(const JobId& id, const JobPatch& patch) override;
    [[nodiscard]] bool ping() noexcept override { return true; }

    [[nodiscard]] std::size_t size();

private:
    struct Entry {
        Job job;
        std::chrono::steady_clock::time_point expiresAt;
    };

    NowFn now_;
    std::mutex mutex_;
    std::unordered_map<JobId, Entry> entries_;
};

// One record file per job under <workspace>/jobs/<id>.job, written atomically
// through a temp file and rename.
class FileJobStore final : public JobStore {
public:
    explicit FileJobStore(const std::filesystem::path& workspace,
                          std::chrono::seconds defaultTtl = std::chrono::seconds(86400));

    FileJobStore(const FileJobStore&) = delete;
    FileJobStore& operator=(const FileJobStore&) = delete;

    [[nodiscard]] std::optional<Job> get(const JobId& id) override;
    void set(const JobId& id, const Job& job, std::chrono::seconds ttl) override;
    [[nodiscard]] bool update(const JobId& id, const JobPatch& patch) override;
    [[nodiscard]] bool ping() noexcept override;

    // Deletes expired record files, returns how many were removed.
    std::size_t purgeExpired() noexcept;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

private:
    struct Loaded {
        Job job;
        std::int64_t expiresAtMs = 0;
    };

    std::filesystem::path dir_;
    // Serialises read-merge-write within this process only.
    std::mutex mutex_;

    [[nodiscard]] std::filesystem::path recordPath(const JobId& id) const;
    [[nodiscard]] std::optional<Loaded> load(const std::filesystem::path& path) const;
    void write(const JobId& id, const Job& job, std::chrono::seconds ttl) const;
};

} // namespace hashbreaker
