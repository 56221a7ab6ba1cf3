/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "hashbreaker/types.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace hashbreaker {

// Unit of work carried by a priority lane.
struct JobMessage {
    JobId jobId;
    std::string targetHash;
    int hashTypeId = 0;
    int timeoutSeconds = 0;
    Priority priority = Priority::Normal;
    // Deliveries so far, incremented by the dispatcher on each hand-off.
    int deliveries = 0;
};

[[nodiscard]] std::string encodeMessage(const JobMessage& message);
[[nodiscard]] std::optional<JobMessage> decodeMessage(const std::string& text);

// Lane directory name: "high", "normal" or "low".
[[nodiscard]] const char* laneName(Priority priority) noexcept;

// Durable lanes in the workspace:
//   queue/writing/        staging for half-written messages
//   queue/<lane>/<id>.msg published messages, removed on acknowledgement
class QueueDir final {
public:
    explicit QueueDir(const std::filesystem::path& workspace) noexcept;

    QueueDir(const QueueDir&) = delete;
    QueueDir& operator=(const QueueDir&) = delete;
    QueueDir(QueueDir&&) noexcept = default;
    QueueDir& operator=(QueueDir&&) noexcept = default;

    [[nodiscard]] bool create() const noexcept;
    // Write to staging, then rename into the lane.
    [[nodiscard]] bool publish(const JobMessage& message) const noexcept;
    [[nodiscard]] bool remove(const JobMessage& message) const noexcept;

    [[nodiscard]] std::filesystem::path laneDir(Priority priority) const;
    [[nodiscard]] std::filesystem::path messagePath(const JobMessage& message) const;

private:
    std::filesystem::path root_;
};

} // namespace hashbreaker
