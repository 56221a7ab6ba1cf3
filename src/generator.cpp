/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/generator.hpp"
#include "hashbreaker/logger.hpp"
#include <algorithm>
#include <unordered_set>

namespace hashbreaker {

BatchedCandidateStream::BatchedCandidateStream(CandidateGenerator& generator,
                                               std::size_t total, std::size_t batchSize)
    : generator_(generator), total_(total), batchSize_(batchSize == 0 ? 1 : batchSize) {}

void BatchedCandidateStream::refill() {
    while (buffer_.empty() && !exhausted_) {
        if (received_ >= total_) {
            exhausted_ = true;
            return;
        }
        std::size_t count = std::min(batchSize_, total_ - received_);
        std::vector<std::string> batch = generator_.generate(count);
        requested_ += count;
        ++batches_;

        if (batch.size() > count) {
            batch.resize(count);
        }
        received_ += batch.size();
        if (batch.size() < count) {
            LOG_DEBUG("Generator returned short batch (" + std::to_string(batch.size()) + "/" +
                      std::to_string(count) + "), stream ends after it");
            exhausted_ = true;
        }
        for (auto& candidate : batch) {
            buffer_.push_back(std::move(candidate));
        }
    }
}

std::optional<std::string> BatchedCandidateStream::next() {
    if (buffer_.empty()) {
        refill();
    }
    if (buffer_.empty()) {
        return std::nullopt;
    }
    std::string candidate = std::move(buffer_.front());
    buffer_.pop_front();
    return candidate;
}

PatternGenerator::PatternGenerator(std::uint32_t seed) : rng_(seed) {}

std::string PatternGenerator::makeCandidate() {
    static const std::string lower = "abcdefghijklmnopqrstuvwxyz";
    static const std::string upper = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    static const std::string digits = "0123456789";
    static const std::string special = "!@#$%";

    auto pick = [this](const std::string& alphabet, std::size_t n) {
        std::uniform_int_distribution<std::size_t> dist(0, alphabet.size() - 1);
        std::string out;
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            out += alphabet[dist(rng_)];
        }
        return out;
    };
    auto between = [this](std::size_t lo, std::size_t hi) {
        return std::uniform_int_distribution<std::size_t>(lo, hi)(rng_);
    };

    switch (std::uniform_int_distribution<int>(0, 6)(rng_)) {
        case 0: return pick(lower, between(6, 10));
        case 1: return pick(lower + digits, between(6, 10));
        case 2: return pick(lower, 1) + pick(digits, 4);
        case 3: return pick(lower, 6) + pick(digits, 2);
        case 4: return pick(upper + lower, between(6, 8)) + pick(digits, 2);
        case 5: return pick(upper, 1) + pick(lower, between(4, 7)) + pick(digits, between(1, 2)) + pick(special, 1);
        default: return pick(lower + upper + digits, between(8, 12));
    }
}

std::vector<std::string> PatternGenerator::generate(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> out;
    out.reserve(count);
    std::unordered_set<std::string> seen;
    const std::size_t maxAttempts = count * 5;

    for (std::size_t attempt = 0; out.size() < count && attempt < maxAttempts; ++attempt) {
        std::string candidate = makeCandidate();
        if (candidate.size() < kMinLength || candidate.size() > kMaxLength) {
            continue;
        }
        if (seen.insert(candidate).second) {
            out.push_back(std::move(candidate));
        }
    }
    return out;
}

} // namespace hashbreaker
