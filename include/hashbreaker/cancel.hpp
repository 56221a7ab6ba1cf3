/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <functional>

namespace hashbreaker {

// One-shot flag fired by the dispatcher watchdog and observed by the engine.
class CancelToken final {
public:
    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

// Polled by the streaming engine; true once the job was cancelled by the user.
using StopCheck = std::function<bool()>;

} // namespace hashbreaker
