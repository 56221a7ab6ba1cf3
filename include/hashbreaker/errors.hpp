/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <stdexcept>
#include <string>

namespace hashbreaker {

// Failures of the surrounding infrastructure rather than of a cracking attempt.
// The pipeline lets these reach the dispatcher, which redelivers the job.
class InfrastructureError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Job store I/O failed.
class StoreError : public InfrastructureError {
public:
    using InfrastructureError::InfrastructureError;
};

// The dispatcher's per-lane hard time limit fired.
class TimeLimitExceeded : public InfrastructureError {
public:
    using InfrastructureError::InfrastructureError;
};

} // namespace hashbreaker
