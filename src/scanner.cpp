/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/scanner.hpp"
#include "hashbreaker/logger.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace hashbreaker {

Scanner::Scanner(const std::filesystem::path& workspace) noexcept
    : queue_(workspace) {
}

std::vector<JobMessage> Scanner::scanLane(Priority priority) const {
    std::vector<JobMessage> messages;
    const auto dir = queue_.laneDir(priority);
    if (!std::filesystem::exists(dir)) {
        LOG_DEBUG("Lane directory does not exist: " + dir.string());
        return messages;
    }

    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".msg") {
            continue;
        }
        std::ifstream file(entry.path(), std::ios::binary);
        std::ostringstream content;
        content << file.rdbuf();
        auto message = decodeMessage(content.str());
        if (!message) {
            LOG_WARN("Ignoring malformed message: " + entry.path().string());
            continue;
        }
        // The directory decides the lane.
        message->priority = priority;
        messages.push_back(std::move(*message));
        LOG_TRACE("Found message: " + messages.back().jobId);
    }

    // Ids start with a timestamp
    std::sort(messages.begin(), messages.end(),
              [](const JobMessage& a, const JobMessage& b) { return a.jobId < b.jobId; });
    return messages;
}

std::vector<JobMessage> Scanner::scan() const noexcept {
    std::vector<JobMessage> all;
    try {
        for (Priority p : {Priority::High, Priority::Normal, Priority::Low}) {
            auto lane = scanLane(p);
            all.insert(all.end(), std::make_move_iterator(lane.begin()), std::make_move_iterator(lane.end()));
        }
        if (!all.empty()) {
            LOG_DEBUG("Scanner found " + std::to_string(all.size()) + " queued messages");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Scanner error: " + std::string(e.what()));
    }
    return all;
}

std::size_t Scanner::readyCount(Priority priority) const noexcept {
    std::size_t count = 0;
    try {
        const auto dir = queue_.laneDir(priority);
        if (!std::filesystem::exists(dir)) {
            return 0;
        }
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".msg") {
                ++count;
            }
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Lane count interrupted: " + std::string(e.what()));
    }
    return count;
}

}
