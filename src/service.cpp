/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/service.hpp"
#include "hashbreaker/errors.hpp"
#include "hashbreaker/logger.hpp"
#include <atomic>
#include <sstream>
#include <unistd.h>

namespace hashbreaker {

namespace {

std::string trimCopy(const std::string& value) {
    const char* ws = " \t\r\n\f\v";
    auto start = value.find_first_not_of(ws);
    if (start == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(ws);
    return value.substr(start, end - start + 1);
}

ApiResult reply(ApiStatus status, std::string message, std::optional<Job> job = std::nullopt) {
    ApiResult r;
    r.status = status;
    r.message = std::move(message);
    r.job = std::move(job);
    return r;
}

} // namespace

Service::Service(const Settings& settings, JobStore& store, Enqueue enqueue)
    : settings_(settings), store_(store), enqueue_(std::move(enqueue)) {}

JobId Service::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        Clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

ApiResult Service::submit(const SubmitRequest& request) {
    const std::string hash = trimCopy(request.hash);
    if (hash.empty()) {
        return reply(ApiStatus::BadRequest, "Hash must not be empty");
    }
    const int timeout = request.timeoutSeconds.value_or(settings_.defaultTimeout);
    if (timeout < settings_.minTimeout || timeout > settings_.maxTimeout) {
        return reply(ApiStatus::BadRequest, "Timeout must be between " + std::to_string(settings_.minTimeout) +
                                            " and " + std::to_string(settings_.maxTimeout) + " seconds");
    }

    Job job;
    job.id = generateId();
    job.status = Status::Pending;
    job.submittedAt = Clock::now();
    job.hashTypeId = request.hashTypeId;
    job.timeoutSeconds = timeout;
    job.priority = request.priority;
    job.timeRemaining = timeout;

    try {
        store_.set(job.id, job, store_.defaultTtl());
    } catch (const StoreError& e) {
        LOG_ERROR("Failed to store job " + job.id + ": " + e.what());
        return reply(ApiStatus::InternalError, "Failed to store job");
    }

    JobMessage message;
    message.jobId = job.id;
    message.targetHash = hash;
    message.hashTypeId = job.hashTypeId;
    message.timeoutSeconds = timeout;
    message.priority = job.priority;

    if (!enqueue_ || !enqueue_(message)) {
        LOG_ERROR("Failed to enqueue job " + job.id);
        JobPatch patch;
        patch.status = Status::Failed;
        patch.reason = "Failed to enqueue job";
        try {
            if (!store_.update(job.id, patch)) {
                LOG_WARN("Record vanished before enqueue failure was recorded: " + job.id);
            }
        } catch (const StoreError& e) {
            LOG_ERROR("Cannot record enqueue failure for " + job.id + ": " + e.what());
        }
        return reply(ApiStatus::InternalError, "Failed to enqueue job");
    }

    LOG_INFO("Job submitted: " + job.id + " (" + toString(job.priority) + ", timeout " +
             std::to_string(timeout) + "s)");
    return reply(ApiStatus::Accepted, "Job submitted", job);
}

ApiResult Service::status(const JobId& id) {
    try {
        auto job = store_.get(id);
        if (!job) {
            return reply(ApiStatus::NotFound, "Job not found: " + id);
        }
        return reply(ApiStatus::Ok, toString(job->status), withDerivedTimes(*job, Clock::now()));
    } catch (const StoreError& e) {
        LOG_ERROR("Status lookup failed for " + id + ": " + e.what());
        return reply(ApiStatus::InternalError, "Job store unavailable");
    }
}

ApiResult Service::cancel(const JobId& id) {
    try {
        auto job = store_.get(id);
        if (!job) {
            return reply(ApiStatus::NotFound, "Job not found: " + id);
        }
        if (isTerminal(job->status)) {
            return reply(ApiStatus::Conflict,
                         std::string("Cannot cancel job in ") + toString(job->status) + " state", *job);
        }

        JobPatch patch;
        patch.status = Status::Cancelled;
        patch.reason = "User requested cancellation";
        if (!store_.update(id, patch)) {
            return reply(ApiStatus::NotFound, "Job not found: " + id);
        }

        auto updated = store_.get(id);
        LOG_INFO("Job cancelled: " + id);
        return reply(ApiStatus::Ok, "Job cancelled", updated);
    } catch (const StoreError& e) {
        LOG_ERROR("Cancel failed for " + id + ": " + e.what());
        return reply(ApiStatus::InternalError, "Job store unavailable");
    }
}

Health Service::health() {
    Health h;
    h.storeReachable = store_.ping();
    h.workers = workers_;
    if (depthProbe_) {
        h.queueDepth = {depthProbe_(Priority::High), depthProbe_(Priority::Normal), depthProbe_(Priority::Low)};
    }
    return h;
}

} // namespace hashbreaker
