/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <vector>

#include "hashbreaker/queue.hpp"

namespace hashbreaker {

// Lists published messages across the lane directories.
class Scanner {
public:
    explicit Scanner(const std::filesystem::path& workspace) noexcept;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    // Ordered by lane (high first), then by job id.
    [[nodiscard]] std::vector<JobMessage> scan() const noexcept;
    [[nodiscard]] std::size_t readyCount(Priority priority) const noexcept;

private:
    QueueDir queue_;

    [[nodiscard]] std::vector<JobMessage> scanLane(Priority priority) const;
};

}
