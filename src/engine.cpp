/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/engine.hpp"
#include "hashbreaker/channel.hpp"
#include "hashbreaker/logger.hpp"
#include "hashbreaker/process.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace hashbreaker {

namespace {

using SteadyClock = std::chrono::steady_clock;

// Scratch directory for one invocation, removed on scope exit.
class TempDir final {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "hashbreaker_XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (!::mkdtemp(buffer.data())) {
            throw std::runtime_error("Cannot create temp directory from " + pattern);
        }
        path_ = buffer.data();
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            LOG_WARN("Cannot remove temp directory " + path_.string() + ": " + ec.message());
        }
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trimCopy(const std::string& value) {
    const char* ws = " \t\r\n\f\v";
    auto start = value.find_first_not_of(ws);
    if (start == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(ws);
    return value.substr(start, end - start + 1);
}

double secondsSince(SteadyClock::time_point start) {
    return std::chrono::duration<double>(SteadyClock::now() - start).count();
}

SteadyClock::time_point deadlineAfter(SteadyClock::time_point start, double seconds) {
    return start + std::chrono::duration_cast<SteadyClock::duration>(
        std::chrono::duration<double>(std::max(0.0, seconds)));
}

// Hashcat exit codes: 0 cracked, 1 exhausted, 4 aborted by --runtime.
constexpr int kExitCracked = 0;
constexpr int kExitExhausted = 1;
constexpr int kExitRuntimeAbort = 4;

const char* const kNoDeviceTokens[] = {
    "no opencl", "no cuda", "no hip", "no devices found", "no devices available"
};

} // namespace

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::NoDevice: return "no_device";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::ExecutionFailure: return "execution_failure";
        case ErrorKind::LaunchFailure: return "launch_failure";
        case ErrorKind::Killed: return "killed";
        default: return "unknown";
    }
}

ErrorKind classifyToolError(int exitCode, bool timedOut, const std::string& stderrText) {
    const std::string lowered = toLowerCopy(stderrText);
    for (const char* token : kNoDeviceTokens) {
        if (lowered.find(token) != std::string::npos) {
            return ErrorKind::NoDevice;
        }
    }
    if (timedOut || exitCode == kExitRuntimeAbort) {
        return ErrorKind::Timeout;
    }
    if (exitCode == kExitCracked || exitCode == kExitExhausted) {
        return ErrorKind::None;
    }
    return ErrorKind::ExecutionFailure;
}

std::string normalizeHash(const std::string& hash) {
    return trimCopy(hash);
}

std::optional<std::string> parseCrackedOutput(const std::string& outfileText) {
    std::istringstream in(outfileText);
    std::string line;
    while (std::getline(in, line)) {
        if (trimCopy(line).empty()) {
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string password = trimCopy(line.substr(colon + 1));
        if (password.empty()) {
            return std::nullopt;
        }
        return password;
    }
    return std::nullopt;
}

std::optional<std::string> readCrackedPassword(const std::filesystem::path& outFile) {
    std::ifstream file(outFile, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << file.rdbuf();
    return parseCrackedOutput(content.str());
}

std::vector<std::string> HashcatEngine::buildCommand(const AttackRequest& request,
                                                     const std::filesystem::path& hashFile,
                                                     const std::filesystem::path& outFile) const {
    int runtime = std::max(1, static_cast<int>(request.timeoutSeconds));

    std::vector<std::string> cmd = {
        settings_.hashcatPath,
        "-m", std::to_string(request.hashTypeId),
        "-a", std::to_string(request.attackMode),
        hashFile.string(),
    };
    cmd.insert(cmd.end(), request.attackArgs.begin(), request.attackArgs.end());
    cmd.insert(cmd.end(), {
        "--runtime", std::to_string(runtime),
        "--quiet",
        "--outfile", outFile.string(),
        "--outfile-format", "2",
    });
    if (settings_.hashcatForce) {
        cmd.emplace_back("--force");
    }
    if (settings_.hashcatPotfileDisable) {
        cmd.emplace_back("--potfile-disable");
    }
    if (request.candidates) {
        cmd.emplace_back("--stdin");
    }
    return cmd;
}

EngineResult HashcatEngine::run(const AttackRequest& request) {
    EngineResult result;
    const auto start = SteadyClock::now();

    try {
        TempDir scratch;
        const auto hashFile = scratch.path() / "hashes.txt";
        const auto outFile = scratch.path() / "out.txt";
        {
            std::ofstream file(hashFile, std::ios::binary);
            if (!file) {
                throw std::runtime_error("Cannot write " + hashFile.string());
            }
            file << normalizeHash(request.targetHash) << '\n';
        }

        auto cmd = buildCommand(request, hashFile, outFile);
        LOG_DEBUG("Running attack mode " + std::to_string(request.attackMode) +
                  (request.candidates ? " (stdin)" : "") + " budget " +
                  std::to_string(request.timeoutSeconds) + "s");

        std::string spawnError;
        auto process = Process::spawn(cmd, request.candidates != nullptr, spawnError);
        if (!process) {
            LOG_WARN("Cannot launch cracking tool: " + spawnError);
            result.errorKind = ErrorKind::LaunchFailure;
            result.stderrText = spawnError;
            result.durationSeconds = secondsSince(start);
            return result;
        }

        if (request.candidates) {
            runStreaming(request, *process, result);
        } else {
            runBatch(request, *process, result);
        }

        result.stdoutText = process->output();
        result.stderrText = process->errors();
        if (!result.timedOut && result.errorKind != ErrorKind::Killed) {
            result.exitCode = process->exitCode();
        }

        result.password = readCrackedPassword(outFile);
        result.cracked = result.password.has_value();

        if (result.errorKind != ErrorKind::Killed) {
            result.errorKind = classifyToolError(result.exitCode, result.timedOut, result.stderrText);
        }
        if (result.errorKind == ErrorKind::ExecutionFailure && !result.cracked) {
            LOG_WARN("Cracking tool exited with " + std::to_string(result.exitCode) + ": " +
                     trimCopy(result.stderrText.substr(0, 512)));
        }
    } catch (const std::exception& e) {
        LOG_WARN("Attack execution failed: " + std::string(e.what()));
        result.errorKind = ErrorKind::LaunchFailure;
        result.stderrText = e.what();
    }

    result.durationSeconds = secondsSince(start);
    return result;
}

void HashcatEngine::runBatch(const AttackRequest& request, Process& process, EngineResult& result) const {
    const auto start = SteadyClock::now();
    const auto deadline = deadlineAfter(start, request.timeoutSeconds);

    while (!process.exited()) {
        if (request.kill && request.kill->cancelled()) {
            LOG_WARN("Kill token fired, terminating pid " + std::to_string(process.pid()));
            process.kill();
            result.errorKind = ErrorKind::Killed;
            return;
        }
        if (SteadyClock::now() >= deadline) {
            LOG_DEBUG("Attack exceeded " + std::to_string(request.timeoutSeconds) + "s, killing");
            process.kill();
            result.timedOut = true;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void HashcatEngine::runStreaming(const AttackRequest& request, Process& process, EngineResult& result) const {
    const auto start = SteadyClock::now();
    const auto deadline = deadlineAfter(start, request.timeoutSeconds);
    const std::size_t flushEvery = std::max<std::size_t>(1, settings_.streamFlushEvery);
    const auto pollInterval = std::chrono::milliseconds(std::max(1, settings_.cancelPollMillis));

    BoundedChannel<std::string> channel(flushEvery * 4);
    std::atomic<std::int64_t> written{0};
    std::atomic<bool> pipeBroken{false};
    std::atomic<bool> abandon{false};

    // Drains the channel into stdin, one write per flushEvery candidates.
    std::thread writer([&] {
        std::string buffer;
        std::size_t pending = 0;
        auto flush = [&]() {
            if (pending == 0) {
                return true;
            }
            WriteStatus status = process.write(buffer, deadline, &abandon);
            if (status != WriteStatus::Ok) {
                pipeBroken = true;
                channel.close();
                return false;
            }
            written += static_cast<std::int64_t>(pending);
            pending = 0;
            buffer.clear();
            return true;
        };
        while (auto candidate = channel.pop()) {
            buffer += *candidate;
            buffer += '\n';
            if (++pending >= flushEvery && !flush()) {
                return;
            }
        }
        flush();
    });

    std::size_t pulled = 0;
    auto lastPoll = start;
    bool killed = false;
    bool cancelled = false;

    // Stops feeding once the budget, the kill token or the caller says so.
    auto halted = [&](SteadyClock::time_point now) {
        if (now >= deadline) {
            result.timedOut = true;
        } else if (request.kill && request.kill->cancelled()) {
            killed = true;
        } else if (request.stopFeeding && request.stopFeeding()) {
            LOG_INFO("Cancellation observed, stop feeding candidates");
            cancelled = true;
        }
        return result.timedOut || killed || cancelled;
    };

    try {
        while (true) {
            auto now = SteadyClock::now();
            if (now >= deadline) {
                result.timedOut = true;
                break;
            }
            if (pipeBroken) {
                break;
            }
            if (pulled % flushEvery == 0 || now - lastPoll >= pollInterval) {
                lastPoll = now;
                if (halted(now) || process.exited()) {
                    break;
                }
            }

            auto candidate = request.candidates->next();
            if (!candidate) {
                break;
            }
            if (candidate->empty()) {
                continue;
            }

            // A stalled reader keeps the channel full; keep polling while waiting.
            PushResult pushed = channel.push(std::move(*candidate), std::chrono::milliseconds(50));
            while (pushed == PushResult::Full && !halted(SteadyClock::now())) {
                pushed = channel.push(std::move(*candidate), std::chrono::milliseconds(50));
            }
            if (pushed != PushResult::Ok) {
                break;
            }
            ++pulled;
        }
    } catch (const std::exception& e) {
        // The writer thread is still attached; never unwind past it.
        LOG_WARN("Candidate stream failed: " + std::string(e.what()));
    }

    if (killed || cancelled || result.timedOut) {
        abandon = true;
    }
    if (killed) {
        LOG_WARN("Kill token fired, terminating pid " + std::to_string(process.pid()));
        process.kill();
        result.errorKind = ErrorKind::Killed;
    } else if (result.timedOut) {
        process.kill();
    }

    channel.close();
    writer.join();
    process.closeStdin();
    result.attempts = written.load();

    if (!process.exited()) {
        // Let the tool finish checking what it already received.
        while (!process.exited()) {
            if (cancelled) {
                LOG_INFO("Job cancelled, terminating pid " + std::to_string(process.pid()));
                process.kill();
                result.errorKind = ErrorKind::Killed;
                break;
            }
            if (request.kill && request.kill->cancelled()) {
                process.kill();
                result.errorKind = ErrorKind::Killed;
                break;
            }
            if (SteadyClock::now() >= deadline) {
                process.kill();
                result.timedOut = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    LOG_DEBUG("Streamed " + std::to_string(result.attempts.value_or(0)) + " candidates in " +
              std::to_string(secondsSince(start)) + "s");
}

} // namespace hashbreaker
