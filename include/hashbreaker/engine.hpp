/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "hashbreaker/cancel.hpp"
#include "hashbreaker/generator.hpp"
#include "hashbreaker/settings.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hashbreaker {

class Process;

enum class ErrorKind : uint8_t {
    None = 0,
    NoDevice,          // tool found no usable compute device
    Timeout,
    ExecutionFailure,
    LaunchFailure,
    Killed             // kill token fired or the job was cancelled mid-stream
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

struct AttackRequest {
    std::string targetHash;
    int hashTypeId = 0;
    int attackMode = 0;
    std::vector<std::string> attackArgs;
    double timeoutSeconds = 0.0;

    // Streaming mode when set: candidates are piped to the tool's stdin.
    CandidateStream* candidates = nullptr;
    // Streaming only: stop feeding once this returns true.
    StopCheck stopFeeding;
    // Kills the tool when fired, in either mode.
    const CancelToken* kill = nullptr;
};

struct EngineResult {
    bool cracked = false;
    std::optional<std::string> password;
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;
    double durationSeconds = 0.0;
    bool timedOut = false;
    ErrorKind errorKind = ErrorKind::None;
    // Candidates written to stdin; streaming mode only.
    std::optional<std::int64_t> attempts;
};

// Runs one attack against the external cracking tool.
class AttackExecutor {
public:
    virtual ~AttackExecutor() = default;
    [[nodiscard]] virtual EngineResult run(const AttackRequest& request) = 0;
};

// Drives a hashcat-compatible binary. Stateless between runs; safe to share
// across workers.
class HashcatEngine final : public AttackExecutor {
public:
    explicit HashcatEngine(const Settings& settings) noexcept : settings_(settings) {}

    HashcatEngine(const HashcatEngine&) = delete;
    HashcatEngine& operator=(const HashcatEngine&) = delete;

    [[nodiscard]] EngineResult run(const AttackRequest& request) override;

    [[nodiscard]] std::vector<std::string> buildCommand(const AttackRequest& request,
                                                        const std::filesystem::path& hashFile,
                                                        const std::filesystem::path& outFile) const;

private:
    const Settings& settings_;

    void runBatch(const AttackRequest& request, Process& process, EngineResult& result) const;
    void runStreaming(const AttackRequest& request, Process& process, EngineResult& result) const;
};

// Maps exit status and stderr to an ErrorKind.
[[nodiscard]] ErrorKind classifyToolError(int exitCode, bool timedOut, const std::string& stderrText);

// Password from the first line of an outfile (format 2) that contains ':'.
[[nodiscard]] std::optional<std::string> parseCrackedOutput(const std::string& outfileText);
[[nodiscard]] std::optional<std::string> readCrackedPassword(const std::filesystem::path& outFile);

[[nodiscard]] std::string normalizeHash(const std::string& hash);

} // namespace hashbreaker
