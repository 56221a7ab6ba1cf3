/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/dispatcher.hpp"
#include "hashbreaker/logger.hpp"
#include <algorithm>

namespace hashbreaker {

namespace {
constexpr std::array<Priority, 3> kLanes = {Priority::High, Priority::Normal, Priority::Low};
constexpr auto kWatchdogTick = std::chrono::milliseconds(100);
}

std::size_t Dispatcher::laneIndex(Priority priority) noexcept {
    switch (priority) {
        case Priority::High: return 0;
        case Priority::Low: return 2;
        case Priority::Normal:
        default: return 1;
    }
}

Dispatcher::Dispatcher(const Settings& settings)
    : settings_(settings), workers_(std::max(1, settings.workers)) {
    // Interleaved schedule; weights 6/3/1 give H N L H N H N H H H.
    std::array<int, 3> left = {
        std::max(1, settings.high.weight),
        std::max(1, settings.normal.weight),
        std::max(1, settings.low.weight),
    };
    while (left[0] + left[1] + left[2] > 0) {
        for (std::size_t i = 0; i < kLanes.size(); ++i) {
            if (left[i] > 0) {
                schedule_.push_back(kLanes[i]);
                --left[i];
            }
        }
    }
    LOG_DEBUG("Dispatcher created with " + std::to_string(workers_) + " workers, schedule of " +
              std::to_string(schedule_.size()) + " slots");
}

Dispatcher::~Dispatcher() {
    stop();
}

bool Dispatcher::start(JobHandler handler) {
    if (running_.load()) {
        LOG_WARN("Dispatcher already running");
        return false;
    }
    if (!handler) {
        LOG_ERROR("Invalid job handler provided");
        return false;
    }

    handler_ = std::move(handler);
    shutdown_.store(false);
    running_.store(true);

    try {
        {
            std::lock_guard<std::mutex> lock(slotMutex_);
            slots_.assign(static_cast<std::size_t>(workers_), Slot{});
        }
        watchdog_ = std::thread(&Dispatcher::watchdogLoop, this);
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Dispatcher::workerLoop, this, i);
        }
        LOG_INFO("Dispatcher started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start dispatcher: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Dispatcher::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping dispatcher...");
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    jobAvailable_.notify_all();

    // Workers finish the job in hand; the watchdog keeps guarding it.
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    watchdogWake_.notify_all();
    if (watchdog_.joinable()) {
        watchdog_.join();
    }

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        for (auto& lane : lanes_) {
            dropped += lane.messages.size();
            lane.messages.clear();
        }
    }
    idle_.notify_all();
    if (dropped > 0) {
        LOG_INFO("Dispatcher dropped " + std::to_string(dropped) + " queued messages; they stay on disk");
    }
    LOG_INFO("Dispatcher stopped");
}

bool Dispatcher::submit(JobMessage message) noexcept {
    if (shutdown_.load()) {
        LOG_DEBUG("Cannot submit to stopped dispatcher: " + message.jobId);
        return false;
    }
    const Priority priority = message.priority;
    const JobId id = message.jobId;
    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            lanes_[laneIndex(priority)].messages.push_back(std::move(message));
        }
        jobAvailable_.notify_one();
        LOG_DEBUG("Job queued: " + id + " (" + toString(priority) + ")");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue job " + id + ": " + e.what());
        return false;
    }
}

std::size_t Dispatcher::queueSize(Priority priority) const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return lanes_[laneIndex(priority)].messages.size();
}

std::size_t Dispatcher::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    std::size_t total = 0;
    for (const auto& lane : lanes_) {
        total += lane.messages.size();
    }
    return total;
}

std::size_t Dispatcher::inFlight() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return busyWorkers_;
}

bool Dispatcher::waitIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(queueMutex_);
    return idle_.wait_for(lock, timeout, [this] {
        if (busyWorkers_ > 0) {
            return false;
        }
        return std::all_of(lanes_.begin(), lanes_.end(),
                           [](const Lane& lane) { return lane.messages.empty(); });
    });
}

// Caller holds queueMutex_.
bool Dispatcher::takeNext(JobMessage& out) {
    for (std::size_t k = 0; k < schedule_.size(); ++k) {
        std::size_t pos = (cursor_ + k) % schedule_.size();
        Lane& lane = lanes_[laneIndex(schedule_[pos])];
        if (!lane.messages.empty()) {
            out = std::move(lane.messages.front());
            lane.messages.pop_front();
            cursor_ = (pos + 1) % schedule_.size();
            return true;
        }
    }
    return false;
}

void Dispatcher::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_DEBUG(getThreadName(workerId) + " thread started");

    try {
        while (true) {
            JobMessage message;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                jobAvailable_.wait(lock, [this] {
                    if (shutdown_.load()) return true;
                    return std::any_of(lanes_.begin(), lanes_.end(),
                                       [](const Lane& lane) { return !lane.messages.empty(); });
                });
                if (shutdown_.load()) {
                    break;
                }
                if (!takeNext(message)) {
                    continue;
                }
                ++busyWorkers_;
            }

            deliver(std::move(message), workerId);

            {
                std::lock_guard<std::mutex> lock(queueMutex_);
                --busyWorkers_;
            }
            idle_.notify_all();
        }
    } catch (const std::exception& e) {
        LOG_ERROR(getThreadName(workerId) + " fatal error: " + std::string(e.what()));
    }

    LOG_DEBUG(getThreadName(workerId) + " stopped");
    clearThreadName();
}

void Dispatcher::deliver(JobMessage message, int workerId) {
    ++message.deliveries;
    const auto limit = std::chrono::seconds(settings_.lane(message.priority).timeLimitSeconds);
    auto kill = std::make_shared<CancelToken>();

    {
        std::lock_guard<std::mutex> lock(slotMutex_);
        Slot& slot = slots_[static_cast<std::size_t>(workerId)];
        slot.busy = true;
        slot.jobId = message.jobId;
        slot.deadline = std::chrono::steady_clock::now() + limit;
        slot.kill = kill;
        slot.fired = false;
    }

    LOG_INFO(getThreadName(workerId) + " claimed job: " + message.jobId + " (delivery " +
             std::to_string(message.deliveries) + "/" + std::to_string(settings_.maxDeliveries) + ")");

    std::string failure;
    bool ok = false;
    try {
        handler_(message, *kill, workerId);
        ok = true;
    } catch (const std::exception& e) {
        failure = e.what();
        LOG_ERROR(getThreadName(workerId) + " job processing error: " + failure + " (job: " + message.jobId + ")");
    } catch (...) {
        failure = "unknown error";
        LOG_ERROR(getThreadName(workerId) + " unknown job processing error (job: " + message.jobId + ")");
    }

    {
        std::lock_guard<std::mutex> lock(slotMutex_);
        Slot& slot = slots_[static_cast<std::size_t>(workerId)];
        slot.busy = false;
        slot.kill.reset();
    }

    if (!ok && message.deliveries < settings_.maxDeliveries && !shutdown_.load()) {
        LOG_WARN("Redelivering job " + message.jobId);
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            lanes_[laneIndex(message.priority)].messages.push_back(message);
        }
        jobAvailable_.notify_one();
        return;
    }

    if (!ok) {
        if (shutdown_.load() && message.deliveries < settings_.maxDeliveries) {
            // Left on disk for the next start.
            return;
        }
        LOG_ERROR("Job " + message.jobId + " failed " + std::to_string(message.deliveries) + " deliveries");
        if (exhaustedHandler_) {
            try {
                exhaustedHandler_(message, failure);
            } catch (const std::exception& e) {
                LOG_ERROR("Exhausted handler failed for " + message.jobId + ": " + e.what());
            }
        }
    }

    if (ackHandler_) {
        try {
            ackHandler_(message);
        } catch (const std::exception& e) {
            LOG_ERROR("Acknowledge failed for " + message.jobId + ": " + e.what());
        }
    }
}

void Dispatcher::watchdogLoop() {
    setThreadName("Watchdog");
    std::unique_lock<std::mutex> lock(slotMutex_);
    while (!shutdown_.load() || std::any_of(slots_.begin(), slots_.end(), [](const Slot& s) { return s.busy; })) {
        watchdogWake_.wait_for(lock, kWatchdogTick);
        const auto now = std::chrono::steady_clock::now();
        for (auto& slot : slots_) {
            if (slot.busy && !slot.fired && now >= slot.deadline && slot.kill) {
                LOG_WARN("Job " + slot.jobId + " hit its lane time limit, firing kill token");
                slot.kill->cancel();
                slot.fired = true;
            }
        }
    }
    lock.unlock();
    clearThreadName();
}

}
