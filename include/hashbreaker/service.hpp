/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "hashbreaker/job_store.hpp"
#include "hashbreaker/queue.hpp"
#include "hashbreaker/settings.hpp"

namespace hashbreaker {

// HTTP-style outcome codes of the service operations.
enum class ApiStatus : uint16_t {
    Ok = 200,
    Accepted = 202,
    BadRequest = 400,
    NotFound = 404,
    Conflict = 409,
    InternalError = 500
};

struct ApiResult {
    ApiStatus status = ApiStatus::InternalError;
    std::optional<Job> job;
    std::string message;
    explicit operator bool() const noexcept {
        return status == ApiStatus::Ok || status == ApiStatus::Accepted;
    }
    [[nodiscard]] int code() const noexcept { return static_cast<int>(status); }
};

struct SubmitRequest {
    std::string hash;
    int hashTypeId = hashmode::MD5;
    std::optional<int> timeoutSeconds;    // Settings::defaultTimeout when absent
    Priority priority = Priority::Normal;
};

struct Health {
    bool storeReachable = false;
    std::array<std::size_t, 3> queueDepth{};   // high, normal, low
    int workers = 0;
};

// Hands a message to a lane; false when the lane refused it.
using Enqueue = std::function<bool(const JobMessage&)>;
using DepthProbe = std::function<std::size_t(Priority)>;

// Submission, status and cancellation on top of a JobStore.
class Service final {
public:
    Service(const Settings& settings, JobStore& store, Enqueue enqueue);

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    [[nodiscard]] ApiResult submit(const SubmitRequest& request);
    [[nodiscard]] ApiResult status(const JobId& id);
    [[nodiscard]] ApiResult cancel(const JobId& id);

    void setHealthProbes(DepthProbe depth, int workers) { depthProbe_ = std::move(depth); workers_ = workers; }
    [[nodiscard]] Health health();

    [[nodiscard]] static JobId generateId();

private:
    const Settings& settings_;
    JobStore& store_;
    Enqueue enqueue_;
    DepthProbe depthProbe_;
    int workers_ = 0;
};

} // namespace hashbreaker
