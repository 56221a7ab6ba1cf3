/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "hashbreaker/cancel.hpp"
#include "hashbreaker/queue.hpp"
#include "hashbreaker/settings.hpp"

namespace hashbreaker {

// Processes one delivery. Throwing requests redelivery.
using JobHandler = std::function<void(const JobMessage&, const CancelToken& kill, int workerId)>;
// Called exactly once per message when it leaves the dispatcher for good.
using AckHandler = std::function<void(const JobMessage&)>;
// Called when the last permitted delivery failed.
using ExhaustedHandler = std::function<void(const JobMessage&, const std::string& error)>;

// Three FIFO lanes served by a fixed worker pool with weighted round robin,
// bounded redelivery and a per-lane hard time limit.
class Dispatcher {
public:
    explicit Dispatcher(const Settings& settings);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) = delete;
    Dispatcher& operator=(Dispatcher&&) = delete;

    void onAcknowledge(AckHandler handler) { ackHandler_ = std::move(handler); }
    void onExhausted(ExhaustedHandler handler) { exhaustedHandler_ = std::move(handler); }

    [[nodiscard]] bool start(JobHandler handler);
    void stop() noexcept;
    // Routes to the lane named by message.priority. Accepted before start().
    bool submit(JobMessage message) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize(Priority priority) const noexcept;
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] std::size_t inFlight() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

    // True once no message is queued or being processed.
    [[nodiscard]] bool waitIdle(std::chrono::milliseconds timeout) const;

private:
    struct Lane {
        std::deque<JobMessage> messages;
    };

    struct Slot {
        bool busy = false;
        JobId jobId;
        std::chrono::steady_clock::time_point deadline;
        std::shared_ptr<CancelToken> kill;
        bool fired = false;
    };

    void workerLoop(int workerId);
    void watchdogLoop();
    [[nodiscard]] bool takeNext(JobMessage& out);
    void deliver(JobMessage message, int workerId);

    static std::size_t laneIndex(Priority priority) noexcept;

    const Settings& settings_;
    int workers_;
    JobHandler handler_;
    AckHandler ackHandler_;
    ExhaustedHandler exhaustedHandler_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    mutable std::condition_variable jobAvailable_;
    mutable std::condition_variable idle_;
    std::array<Lane, 3> lanes_;
    std::vector<Priority> schedule_;
    std::size_t cursor_ = 0;
    std::size_t busyWorkers_ = 0;

    std::mutex slotMutex_;
    std::vector<Slot> slots_;
    std::condition_variable watchdogWake_;

    std::vector<std::thread> workerThreads_;
    std::thread watchdog_;
};

}
