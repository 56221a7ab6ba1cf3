/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace hashbreaker {

// Produces password candidates. Returning fewer than `count` signals exhaustion.
class CandidateGenerator {
public:
    virtual ~CandidateGenerator() = default;
    [[nodiscard]] virtual std::vector<std::string> generate(std::size_t count) = 0;
};

// Pull-based candidate source consumed by the streaming engine.
class CandidateStream {
public:
    virtual ~CandidateStream() = default;
    // nullopt when exhausted
    [[nodiscard]] virtual std::optional<std::string> next() = 0;
};

// Lazily pulls batches from a generator, never more than `total` candidates
// in all and at most one batch ahead of the consumer.
class BatchedCandidateStream final : public CandidateStream {
public:
    BatchedCandidateStream(CandidateGenerator& generator, std::size_t total, std::size_t batchSize);

    [[nodiscard]] std::optional<std::string> next() override;

    [[nodiscard]] std::size_t requested() const noexcept { return requested_; }
    [[nodiscard]] std::size_t batches() const noexcept { return batches_; }

private:
    CandidateGenerator& generator_;
    std::size_t total_;
    std::size_t batchSize_;
    std::size_t requested_ = 0;
    std::size_t received_ = 0;
    std::size_t batches_ = 0;
    bool exhausted_ = false;
    std::deque<std::string> buffer_;

    void refill();
};

// Random human-style patterns (word stems, capitalisation, digits, symbols),
// 4 to 12 characters long. Thread-safe.
class PatternGenerator final : public CandidateGenerator {
public:
    explicit PatternGenerator(std::uint32_t seed = std::random_device{}());

    [[nodiscard]] std::vector<std::string> generate(std::size_t count) override;

    static constexpr std::size_t kMinLength = 4;
    static constexpr std::size_t kMaxLength = 12;

private:
    std::mutex mutex_;
    std::mt19937 rng_;

    std::string makeCandidate();
};

} // namespace hashbreaker
