/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/queue.hpp"
#include "hashbreaker/job.hpp"
#include "hashbreaker/logger.hpp"
#include <fstream>
#include <sstream>

namespace hashbreaker {

namespace {

bool parseInt(const std::string& text, int& out) noexcept {
    try {
        std::size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

std::string encodeMessage(const JobMessage& message) {
    std::ostringstream out;
    out << "job_id=" << escapeValue(message.jobId) << '\n';
    out << "hash=" << escapeValue(message.targetHash) << '\n';
    out << "hash_type_id=" << message.hashTypeId << '\n';
    out << "timeout_seconds=" << message.timeoutSeconds << '\n';
    out << "priority=" << toString(message.priority) << '\n';
    out << "deliveries=" << message.deliveries << '\n';
    return out.str();
}

std::optional<JobMessage> decodeMessage(const std::string& text) {
    JobMessage message;
    bool haveId = false;
    bool haveHash = false;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const std::string key = line.substr(0, eq);
        auto value = unescapeValue(line.substr(eq + 1));
        if (!value) {
            return std::nullopt;
        }
        if (key == "job_id") {
            message.jobId = *value;
            haveId = true;
        } else if (key == "hash") {
            message.targetHash = *value;
            haveHash = true;
        } else if (key == "hash_type_id") {
            if (!parseInt(*value, message.hashTypeId)) return std::nullopt;
        } else if (key == "timeout_seconds") {
            if (!parseInt(*value, message.timeoutSeconds)) return std::nullopt;
        } else if (key == "priority") {
            auto p = parsePriority(*value);
            if (!p) return std::nullopt;
            message.priority = *p;
        } else if (key == "deliveries") {
            if (!parseInt(*value, message.deliveries)) return std::nullopt;
        }
    }

    if (!haveId || !haveHash || !isValidJobId(message.jobId)) {
        return std::nullopt;
    }
    return message;
}

const char* laneName(Priority priority) noexcept {
    switch (priority) {
        case Priority::High: return "high";
        case Priority::Low: return "low";
        case Priority::Normal:
        default: return "normal";
    }
}

QueueDir::QueueDir(const std::filesystem::path& workspace) noexcept
    : root_(workspace / "queue") {}

bool QueueDir::create() const noexcept {
    try {
        std::filesystem::create_directories(root_ / "writing");
        for (Priority p : {Priority::High, Priority::Normal, Priority::Low}) {
            std::filesystem::create_directories(laneDir(p));
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create queue directories: " + std::string(e.what()));
        return false;
    }
}

std::filesystem::path QueueDir::laneDir(Priority priority) const {
    return root_ / laneName(priority);
}

std::filesystem::path QueueDir::messagePath(const JobMessage& message) const {
    return laneDir(message.priority) / (message.jobId + ".msg");
}

bool QueueDir::publish(const JobMessage& message) const noexcept {
    try {
        if (!isValidJobId(message.jobId)) {
            LOG_ERROR("Refusing to queue invalid job id: " + message.jobId);
            return false;
        }
        auto staging = root_ / "writing" / (message.jobId + ".msg");
        {
            std::ofstream file(staging, std::ios::binary | std::ios::trunc);
            if (!file) {
                LOG_ERROR("Cannot stage message: " + staging.string());
                return false;
            }
            file << encodeMessage(message);
            file.flush();
            if (!file.good()) {
                LOG_ERROR("Short write staging message: " + staging.string());
                return false;
            }
        }
        std::filesystem::rename(staging, messagePath(message));
        LOG_DEBUG("Queued " + message.jobId + " on lane " + laneName(message.priority));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to publish message " + message.jobId + ": " + e.what());
        return false;
    }
}

bool QueueDir::remove(const JobMessage& message) const noexcept {
    try {
        return std::filesystem::remove(messagePath(message));
    } catch (const std::exception& e) {
        LOG_WARN("Failed to remove message " + message.jobId + ": " + e.what());
        return false;
    }
}

} // namespace hashbreaker
