/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace hashbreaker {

// Lower value = more severe. A message is written when its level <= the threshold.
enum class LogLevel : uint8_t { ERROR = 0, WARN, INFO, DEBUG, TRACE };

// Process-wide stderr logger. The threshold defaults to HASHBREAKER_LOG_LEVEL
// (INFO when unset or unrecognised) until setLevel() is called.
class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    // "error", "warn"/"warning", "info", "debug", "trace"; case-insensitive.
    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& text);
    [[nodiscard]] static const char* name(LogLevel level) noexcept;

    // One line: <UTC timestamp> <LEVEL> [<thread>] message
    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }
};

// Label printed for the calling thread; unnamed threads show their id.
void setThreadName(const std::string& name);
void clearThreadName() noexcept;
std::string getThreadName(int worker_id);

}

#define LOG_ERROR(msg) ::hashbreaker::Logger::error(msg)
#define LOG_WARN(msg)  ::hashbreaker::Logger::warn(msg)
#define LOG_INFO(msg)  ::hashbreaker::Logger::info(msg)
#define LOG_DEBUG(msg) ::hashbreaker::Logger::debug(msg)
#define LOG_TRACE(msg) ::hashbreaker::Logger::trace(msg)
