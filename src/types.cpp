/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/types.hpp"
#include <algorithm>
#include <cctype>

namespace hashbreaker {

namespace {
std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}
}

const char* toString(Status status) noexcept {
    switch (status) {
        case Status::Pending: return "PENDING";
        case Status::Running: return "RUNNING";
        case Status::Success: return "SUCCESS";
        case Status::Failed: return "FAILED";
        case Status::Cancelled: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

const char* toString(Priority priority) noexcept {
    switch (priority) {
        case Priority::Low: return "LOW";
        case Priority::Normal: return "NORMAL";
        case Priority::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

std::optional<Status> parseStatus(const std::string& text) {
    const std::string upper = toUpperCopy(text);
    if (upper == "PENDING") return Status::Pending;
    if (upper == "RUNNING") return Status::Running;
    if (upper == "SUCCESS") return Status::Success;
    if (upper == "FAILED") return Status::Failed;
    if (upper == "CANCELLED") return Status::Cancelled;
    return std::nullopt;
}

std::optional<Priority> parsePriority(const std::string& text) {
    const std::string upper = toUpperCopy(text);
    if (upper == "LOW") return Priority::Low;
    if (upper == "NORMAL") return Priority::Normal;
    if (upper == "HIGH") return Priority::High;
    return std::nullopt;
}

bool isValidJobId(const JobId& id) noexcept {
    if (id.empty() || id.size() > 128) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

} // namespace hashbreaker
