/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace hashbreaker {

namespace {

struct LogState {
    std::once_flag envOnce;
    std::atomic<uint8_t> threshold{static_cast<uint8_t>(LogLevel::INFO)};
    std::atomic<bool> explicitLevel{false};

    std::mutex mutex;   // guards names and the stderr write
    std::unordered_map<std::thread::id, std::string> names;
};

LogState& state() {
    static LogState s;
    return s;
}

LogLevel levelFromEnv() noexcept {
    const char* value = std::getenv("HASHBREAKER_LOG_LEVEL");
    if (!value) {
        return LogLevel::INFO;
    }
    try {
        return Logger::parseLevel(value).value_or(LogLevel::INFO);
    } catch (const std::exception&) {
        return LogLevel::INFO;
    }
}

// 2025-01-31T12:00:00.123Z
std::string utcStamp() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(ms % 1000));
    return buffer;
}

std::string threadLabel(LogState& s) {
    auto it = s.names.find(std::this_thread::get_id());
    if (it != s.names.end()) {
        return it->second;
    }
    std::ostringstream oss;
    oss << "T" << std::this_thread::get_id();
    return oss.str();
}

} // namespace

void Logger::setLevel(LogLevel level) noexcept {
    LogState& s = state();
    s.explicitLevel = true;
    s.threshold = static_cast<uint8_t>(level);
}

void Logger::initFromEnv() noexcept {
    LogState& s = state();
    s.explicitLevel = true;
    s.threshold = static_cast<uint8_t>(levelFromEnv());
}

LogLevel Logger::level() noexcept {
    LogState& s = state();
    if (!s.explicitLevel.load()) {
        std::call_once(s.envOnce, [&s] {
            if (!s.explicitLevel.load()) {
                s.threshold = static_cast<uint8_t>(levelFromEnv());
            }
        });
    }
    return static_cast<LogLevel>(s.threshold.load());
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

std::optional<LogLevel> Logger::parseLevel(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "trace") return LogLevel::TRACE;
    return std::nullopt;
}

const char* Logger::name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "?";
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (!enabled(level)) {
        return;
    }
    try {
        const std::string stamp = utcStamp();
        LogState& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        // stdout belongs to the CLI tools
        std::fprintf(stderr, "%s %-5s [%s] %s\n", stamp.c_str(), name(level),
                     threadLabel(s).c_str(), message.c_str());
    } catch (const std::exception&) {
        std::fputs("log formatting failed\n", stderr);
    }
}

void setThreadName(const std::string& name) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.names[std::this_thread::get_id()] = name;
}

void clearThreadName() noexcept {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.names.erase(std::this_thread::get_id());
}

std::string getThreadName(int worker_id) {
    return "Worker-" + std::to_string(worker_id);
}

}
