/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace hashbreaker {

enum class PushResult : uint8_t { Ok, Full, Closed };

// Bounded single-producer / single-consumer hand-off.
template <typename T>
class BoundedChannel final {
public:
    explicit BoundedChannel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // Waits at most `wait` for room. `value` is only consumed on Ok.
    [[nodiscard]] PushResult push(T&& value, std::chrono::milliseconds wait) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!notFull_.wait_for(lock, wait, [this] { return closed_ || items_.size() < capacity_; })) {
            return PushResult::Full;
        }
        if (closed_) {
            return PushResult::Closed;
        }
        items_.push_back(std::move(value));
        notEmpty_.notify_one();
        return PushResult::Ok;
    }

    // Blocks until an item arrives; nullopt once closed and drained.
    [[nodiscard]] std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        notFull_.notify_one();
        return value;
    }

    void close() noexcept {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    [[nodiscard]] bool closed() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace hashbreaker
