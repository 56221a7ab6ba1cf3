/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/job.hpp"
#include "hashbreaker/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <sstream>

namespace hashbreaker {

namespace {

template <typename T>
void fillIfAbsent(std::optional<T>& field, const std::optional<T>& value) {
    if (!field && value) {
        field = value;
    }
}

template <typename T>
void assignIfPresent(std::optional<T>& field, const std::optional<T>& value) {
    if (value) {
        field = value;
    }
}

bool parseInt(const std::string& text, long long& out) noexcept {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtoll(text.c_str(), &end, 10);
    return errno == 0 && end && *end == '\0';
}

bool parseDouble(const std::string& text, double& out) noexcept {
    if (text.empty()) return false;
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end && *end == '\0';
}

} // namespace

Job merge(const Job& current, const JobPatch& patch) {
    Job next = current;
    next.version = current.version + 1;

    if (patch.progress) next.progress = std::clamp(*patch.progress, 0, 100);
    if (patch.timeElapsed) next.timeElapsed = std::max(0.0, *patch.timeElapsed);
    if (patch.delivery) next.delivery = *patch.delivery;
    fillIfAbsent(next.startedAt, patch.startedAt);

    if (isTerminal(current.status)) {
        fillIfAbsent(next.result, patch.result);
        fillIfAbsent(next.crackedInPhase, patch.crackedInPhase);
        fillIfAbsent(next.attempts, patch.attempts);
        fillIfAbsent(next.reason, patch.reason);
        fillIfAbsent(next.lastPhase, patch.lastPhase);
        next.timeRemaining = 0;
        return next;
    }

    if (patch.status) next.status = *patch.status;
    if (patch.timeRemaining) next.timeRemaining = std::max(0, *patch.timeRemaining);
    assignIfPresent(next.currentPhase, patch.currentPhase);
    if (patch.phaseNumber) {
        if (next.phaseNumber && next.status == Status::Running) {
            next.phaseNumber = std::max(*next.phaseNumber, *patch.phaseNumber);
        } else {
            next.phaseNumber = patch.phaseNumber;
        }
    }
    assignIfPresent(next.result, patch.result);
    assignIfPresent(next.crackedInPhase, patch.crackedInPhase);
    assignIfPresent(next.attempts, patch.attempts);
    assignIfPresent(next.reason, patch.reason);
    assignIfPresent(next.lastPhase, patch.lastPhase);

    if (isTerminal(next.status)) {
        next.timeRemaining = 0;
    }
    return next;
}

Job withDerivedTimes(Job job, TimePoint now) {
    if (isTerminal(job.status)) {
        job.timeRemaining = 0;
        return job;
    }
    if (job.status == Status::Running && job.startedAt) {
        double elapsed = std::chrono::duration<double>(now - *job.startedAt).count();
        elapsed = std::max(0.0, elapsed);
        job.timeElapsed = elapsed;
        job.timeRemaining = std::max(0, static_cast<int>(job.timeoutSeconds - elapsed));
    }
    return job;
}

std::string formatTime(TimePoint time) {
    auto sinceEpoch = time.time_since_epoch();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch).count();
    std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    long long millis = ms % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
    return buffer;
}

std::optional<TimePoint> parseTime(const std::string& text) noexcept {
    std::tm utc{};
    int millis = 0;
    int consumed = 0;
    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ%n",
                             &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                             &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &millis, &consumed);
    if (fields != 7 || static_cast<std::size_t>(consumed) != text.size()) {
        return std::nullopt;
    }
    utc.tm_year -= 1900;
    utc.tm_mon -= 1;
    std::time_t seconds = timegm(&utc);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

std::string escapeValue(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '%': out += "%25"; break;
            case '\n': out += "%0A"; break;
            case '\r': out += "%0D"; break;
            case '=': out += "%3D"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::optional<std::string> unescapeValue(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '%') {
            out += value[i];
            continue;
        }
        if (i + 2 >= value.size()) {
            return std::nullopt;
        }
        std::string code = value.substr(i + 1, 2);
        if (code == "25") out += '%';
        else if (code == "0A") out += '\n';
        else if (code == "0D") out += '\r';
        else if (code == "3D") out += '=';
        else return std::nullopt;
        i += 2;
    }
    return out;
}

std::string encodeJob(const Job& job) {
    std::ostringstream out;
    auto field = [&out](const char* key, const std::string& value) {
        out << key << '=' << escapeValue(value) << '\n';
    };

    field("id", job.id);
    field("status", toString(job.status));
    field("version", std::to_string(job.version));
    field("submitted_at", formatTime(job.submittedAt));
    if (job.startedAt) field("started_at", formatTime(*job.startedAt));
    field("hash_type_id", std::to_string(job.hashTypeId));
    field("timeout_seconds", std::to_string(job.timeoutSeconds));
    field("priority", toString(job.priority));
    field("progress", std::to_string(job.progress));
    if (job.currentPhase) field("current_phase", *job.currentPhase);
    if (job.phaseNumber) field("phase_number", std::to_string(*job.phaseNumber));
    {
        std::ostringstream elapsed;
        elapsed.precision(17);
        elapsed << job.timeElapsed;
        field("time_elapsed", elapsed.str());
    }
    field("time_remaining", std::to_string(job.timeRemaining));
    field("delivery", std::to_string(job.delivery));
    if (job.result) field("result", *job.result);
    if (job.crackedInPhase) field("cracked_in_phase", std::to_string(*job.crackedInPhase));
    if (job.attempts) field("attempts", std::to_string(*job.attempts));
    if (job.reason) field("reason", *job.reason);
    if (job.lastPhase) field("last_phase", std::to_string(*job.lastPhase));

    return out.str();
}

std::optional<Job> decodeJob(const std::string& text) {
    Job job;
    bool haveId = false;
    bool haveStatus = false;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            LOG_DEBUG("Skipping malformed record line: " + line);
            continue;
        }
        const std::string key = line.substr(0, eq);
        auto value = unescapeValue(line.substr(eq + 1));
        if (!value) {
            LOG_WARN("Bad escape in record field: " + key);
            return std::nullopt;
        }

        long long n = 0;
        double d = 0.0;
        if (key == "id") {
            job.id = *value;
            haveId = true;
        } else if (key == "status") {
            auto s = parseStatus(*value);
            if (!s) return std::nullopt;
            job.status = *s;
            haveStatus = true;
        } else if (key == "version") {
            if (!parseInt(*value, n) || n < 0) return std::nullopt;
            job.version = static_cast<std::uint64_t>(n);
        } else if (key == "submitted_at") {
            auto t = parseTime(*value);
            if (!t) return std::nullopt;
            job.submittedAt = *t;
        } else if (key == "started_at") {
            auto t = parseTime(*value);
            if (!t) return std::nullopt;
            job.startedAt = *t;
        } else if (key == "hash_type_id") {
            if (!parseInt(*value, n)) return std::nullopt;
            job.hashTypeId = static_cast<int>(n);
        } else if (key == "timeout_seconds") {
            if (!parseInt(*value, n)) return std::nullopt;
            job.timeoutSeconds = static_cast<int>(n);
        } else if (key == "priority") {
            auto p = parsePriority(*value);
            if (!p) return std::nullopt;
            job.priority = *p;
        } else if (key == "progress") {
            if (!parseInt(*value, n)) return std::nullopt;
            job.progress = static_cast<int>(n);
        } else if (key == "current_phase") {
            job.currentPhase = *value;
        } else if (key == "phase_number") {
            if (!parseInt(*value, n)) return std::nullopt;
            job.phaseNumber = static_cast<int>(n);
        } else if (key == "time_elapsed") {
            if (!parseDouble(*value, d)) return std::nullopt;
            job.timeElapsed = d;
        } else if (key == "time_remaining") {
            if (!parseInt(*value, n)) return std::nullopt;
            job.timeRemaining = static_cast<int>(n);
        } else if (key == "delivery") {
            if (!parseInt(*value, n)) return std::nullopt;
            job.delivery = static_cast<int>(n);
        } else if (key == "result") {
            job.result = *value;
        } else if (key == "cracked_in_phase") {
            if (!parseInt(*value, n)) return std::nullopt;
            job.crackedInPhase = static_cast<int>(n);
        } else if (key == "attempts") {
            if (!parseInt(*value, n)) return std::nullopt;
            job.attempts = static_cast<std::int64_t>(n);
        } else if (key == "reason") {
            job.reason = *value;
        } else if (key == "last_phase") {
            if (!parseInt(*value, n)) return std::nullopt;
            job.lastPhase = static_cast<int>(n);
        }
        // Unknown keys belong to the store envelope or newer writers.
    }

    if (!haveId || !haveStatus) {
        return std::nullopt;
    }
    return job;
}

} // namespace hashbreaker
