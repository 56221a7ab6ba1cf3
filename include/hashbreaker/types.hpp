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

// Job lifecycle states. Success, Failed and Cancelled are terminal.
enum class Status : std::uint8_t { Pending, Running, Success, Failed, Cancelled };

enum class Priority : std::uint8_t { Low, Normal, High };

// Opaque job identifier (timestamp_pid_counter).
using JobId = std::string;

// Hash modes of the external cracking tool.
namespace hashmode {
constexpr int MD5 = 0;
constexpr int SHA1 = 100;
constexpr int SHA256 = 1400;
constexpr int SHA512 = 1800;
constexpr int NTLM = 1000;
constexpr int BCRYPT = 3200;
}

[[nodiscard]] constexpr bool isTerminal(Status status) noexcept {
    return status == Status::Success || status == Status::Failed || status == Status::Cancelled;
}

[[nodiscard]] const char* toString(Status status) noexcept;
[[nodiscard]] const char* toString(Priority priority) noexcept;

// Case-insensitive; accepts the strings produced by toString().
[[nodiscard]] std::optional<Status> parseStatus(const std::string& text);
[[nodiscard]] std::optional<Priority> parsePriority(const std::string& text);

// Job ids end up in file names; reject anything that could escape a directory.
[[nodiscard]] bool isValidJobId(const JobId& id) noexcept;

} // namespace hashbreaker
