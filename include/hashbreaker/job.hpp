/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "hashbreaker/types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace hashbreaker {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Lifecycle record of one cracking request.
struct Job {
    JobId id;
    Status status = Status::Pending;
    std::uint64_t version = 0;

    TimePoint submittedAt{};
    std::optional<TimePoint> startedAt;

    int hashTypeId = 0;
    int timeoutSeconds = 0;
    Priority priority = Priority::Normal;

    int progress = 0;
    std::optional<std::string> currentPhase;
    std::optional<int> phaseNumber;
    double timeElapsed = 0.0;
    int timeRemaining = 0;
    int delivery = 0;

    // Outcome, set on terminal transitions
    std::optional<std::string> result;
    std::optional<int> crackedInPhase;
    std::optional<std::int64_t> attempts;
    std::optional<std::string> reason;
    std::optional<int> lastPhase;
};

// Partial update. Absent fields leave the record untouched.
struct JobPatch {
    std::optional<Status> status;
    std::optional<TimePoint> startedAt;
    std::optional<int> progress;
    std::optional<std::string> currentPhase;
    std::optional<int> phaseNumber;
    std::optional<double> timeElapsed;
    std::optional<int> timeRemaining;
    std::optional<int> delivery;
    std::optional<std::string> result;
    std::optional<int> crackedInPhase;
    std::optional<std::int64_t> attempts;
    std::optional<std::string> reason;
    std::optional<int> lastPhase;
};

// Applies patch to current and bumps the version.
// started_at is set once. phase_number never decreases while running.
// A terminal record keeps its status, and its outcome fields can only be
// filled in when still absent; time_remaining is forced to 0.
[[nodiscard]] Job merge(const Job& current, const JobPatch& patch);

// Read-time view: recomputes time_elapsed/time_remaining from started_at for
// running jobs; terminal jobs report time_remaining 0.
[[nodiscard]] Job withDerivedTimes(Job job, TimePoint now);

// key=value lines, percent-escaped values, absent optionals omitted.
[[nodiscard]] std::string encodeJob(const Job& job);
[[nodiscard]] std::optional<Job> decodeJob(const std::string& text);

// ISO-8601 UTC with milliseconds, e.g. 2025-01-31T12:00:00.250Z
[[nodiscard]] std::string formatTime(TimePoint time);
[[nodiscard]] std::optional<TimePoint> parseTime(const std::string& text) noexcept;

[[nodiscard]] std::string escapeValue(const std::string& value);
[[nodiscard]] std::optional<std::string> unescapeValue(const std::string& value);

} // namespace hashbreaker
