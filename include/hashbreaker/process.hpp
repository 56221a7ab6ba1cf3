/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

namespace hashbreaker {

enum class WriteStatus : uint8_t { Ok, Broken, TimedOut, Interrupted };

// Child process with captured stdout/stderr and an optional stdin pipe.
// The child leads its own process group so kill() also reaches its children.
class Process final {
public:
    using Deadline = std::chrono::steady_clock::time_point;

    // nullptr and `error` set when fork or exec fails.
    [[nodiscard]] static std::unique_ptr<Process> spawn(const std::vector<std::string>& argv,
                                                        bool pipeStdin, std::string& error);

    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    // Blocks until all of data is written, the pipe breaks or deadline passes.
    // A set `interrupt` abandons the write while the pipe is full.
    [[nodiscard]] WriteStatus write(const std::string& data, Deadline deadline,
                                    const std::atomic<bool>* interrupt = nullptr) noexcept;
    void closeStdin() noexcept;

    // Non-blocking reap.
    [[nodiscard]] bool exited() noexcept;
    // SIGKILL to the process group, then reap.
    void kill() noexcept;

    // Exit status, or -1 when killed by a signal / not yet reaped.
    [[nodiscard]] int exitCode() const noexcept { return exitCode_; }
    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    // Only complete once the process has been reaped.
    [[nodiscard]] std::string output();
    [[nodiscard]] std::string errors();

private:
    Process() = default;

    pid_t pid_ = -1;
    int stdinFd_ = -1;
    int stdoutFd_ = -1;
    int stderrFd_ = -1;
    bool reaped_ = false;
    int exitCode_ = -1;

    std::mutex outputMutex_;
    std::string stdout_;
    std::string stderr_;
    std::thread stdoutReader_;
    std::thread stderrReader_;

    void startReaders();
    void joinReaders() noexcept;
    void recordStatus(int status) noexcept;
};

} // namespace hashbreaker
