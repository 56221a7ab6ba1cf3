/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "hashbreaker/cancel.hpp"
#include "hashbreaker/job_store.hpp"
#include "hashbreaker/metrics.hpp"
#include "hashbreaker/phases.hpp"
#include "hashbreaker/queue.hpp"
#include "hashbreaker/settings.hpp"
#include <chrono>
#include <cstdint>

namespace hashbreaker {

// Runs one job through the four phases and persists every transition.
class Pipeline final {
public:
    Pipeline(const Settings& settings, JobStore& store, MetricsSink& metrics, PhaseTable phases);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Returns the final stored record. InfrastructureError propagates to the
    // caller; every other exception ends the job FAILED.
    Job execute(const JobMessage& message, const CancelToken* kill = nullptr);

private:
    const Settings& settings_;
    JobStore& store_;
    MetricsSink& metrics_;
    PhaseTable phases_;

    struct Run {
        const JobMessage& message;
        Job base;
        std::chrono::steady_clock::time_point start;
        std::int64_t attempts = 0;
        std::optional<int> lastPhase;
    };

    [[nodiscard]] double elapsed(const Run& run) const;
    [[nodiscard]] bool cancelled(const JobId& id);
    void checkKill(const Run& run, const CancelToken* kill) const;

    // Re-reads, merges and writes with the store's TTL.
    Job persist(Run& run, const JobPatch& patch);
    Job finish(Run& run, JobPatch patch);

    Job finishCancelled(Run& run, const std::string& reason);
    Job finishSuccess(Run& run, int phase, const std::string& password);
    Job finishFailed(Run& run, const std::string& reason);
};

// Minimal PENDING record for a message whose record is missing.
[[nodiscard]] Job jobFromMessage(const JobMessage& message);

} // namespace hashbreaker
