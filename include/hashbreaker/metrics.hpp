/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "hashbreaker/types.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace hashbreaker {

// Receives pipeline and dispatcher telemetry.
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void jobFinished(Status status, double seconds) = 0;
    virtual void phaseFinished(const std::string& phase, double seconds, std::int64_t guesses) = 0;
    virtual void jobsRunningDelta(int delta) = 0;
    virtual void queueDepth(Priority priority, std::size_t depth) = 0;
};

struct Histogram {
    std::vector<double> bounds;           // upper bounds, +Inf implied
    std::vector<std::uint64_t> counts;    // per bound, cumulative on render
    std::uint64_t count = 0;
    double sum = 0.0;

    explicit Histogram(std::vector<double> upperBounds = {});
    void observe(double value);
};

// In-process registry rendering the Prometheus text format.
class Metrics final : public MetricsSink {
public:
    Metrics();

    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    void jobFinished(Status status, double seconds) override;
    void phaseFinished(const std::string& phase, double seconds, std::int64_t guesses) override;
    void jobsRunningDelta(int delta) override;
    void queueDepth(Priority priority, std::size_t depth) override;

    [[nodiscard]] std::uint64_t jobsTotal(Status status) const;
    [[nodiscard]] std::int64_t guessesTotal(const std::string& phase) const;
    [[nodiscard]] std::uint64_t jobDurationCount(Status status) const;
    [[nodiscard]] std::uint64_t phaseDurationCount(const std::string& phase) const;
    [[nodiscard]] int jobsRunning() const;

    [[nodiscard]] std::string renderPrometheus() const;
    // Atomic replace of the file.
    [[nodiscard]] bool writeTo(const std::filesystem::path& path) const noexcept;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> jobsTotal_;
    std::map<std::string, std::int64_t> guessesTotal_;
    std::map<std::string, Histogram> jobDuration_;
    std::map<std::string, Histogram> phaseDuration_;
    std::map<std::string, std::size_t> queueDepth_;
    int jobsRunning_ = 0;
};

} // namespace hashbreaker
