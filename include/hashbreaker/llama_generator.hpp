/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "hashbreaker/generator.hpp"

struct llama_model;
struct llama_context;
struct llama_sampler;

namespace hashbreaker {

// Samples one candidate per line from a password language model (GGUF).
// Falls back to PatternGenerator when sampling fails. Thread-safe.
class LlamaGenerator final : public CandidateGenerator {
public:
    // Throws std::runtime_error if the model cannot be loaded.
    LlamaGenerator(const std::string& modelPath, float temperature, int topK);
    ~LlamaGenerator() override;

    LlamaGenerator(const LlamaGenerator&) = delete;
    LlamaGenerator& operator=(const LlamaGenerator&) = delete;

    [[nodiscard]] std::vector<std::string> generate(std::size_t count) override;

    static constexpr std::size_t kMinLength = 4;
    static constexpr std::size_t kMaxLength = 20;

private:
    std::mutex mutex_;
    std::shared_ptr<llama_model> model_;
    float temperature_;
    int topK_;
    PatternGenerator fallback_;

    [[nodiscard]] llama_sampler* buildSampler() const;
    [[nodiscard]] bool sample(std::size_t count, std::vector<std::string>& out);
};

}
