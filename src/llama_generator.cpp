/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/llama_generator.hpp"
#include "hashbreaker/logger.hpp"
#include "llama.h"
#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

namespace hashbreaker {

namespace {

int env_int(const char* name, int defv) {
    if (const char* v = std::getenv(name)) return std::atoi(v);
    return defv;
}

// llama.cpp is chatty; only errors reach stderr unless LLAMA_LOG_LEVEL says otherwise.
void filtered_llama_log(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text || text[0] == '.' || text[0] == '\n' || text[0] == '\0') {
        return;
    }

    static int filter_level = -1;
    if (filter_level == -1) {
        const char* env = std::getenv("LLAMA_LOG_LEVEL");
        filter_level = env ?
            (std::string(env) == "info" ? GGML_LOG_LEVEL_INFO :
             std::string(env) == "warn" ? GGML_LOG_LEVEL_WARN :
             std::string(env) == "debug" ? GGML_LOG_LEVEL_DEBUG :
             GGML_LOG_LEVEL_ERROR) : GGML_LOG_LEVEL_ERROR;
    }

    if (level >= filter_level) {
        fprintf(stderr, "%s", text);
    }
}

constexpr int kContextTokens = 2048;

bool acceptable(const std::string& candidate) {
    if (candidate.size() < LlamaGenerator::kMinLength || candidate.size() > LlamaGenerator::kMaxLength) {
        return false;
    }
    for (unsigned char c : candidate) {
        if (c < 0x21 || c == 0x7f) return false;
    }
    return true;
}

}

LlamaGenerator::LlamaGenerator(const std::string& modelPath, float temperature, int topK)
    : temperature_(temperature), topK_(topK) {
    llama_log_set(filtered_llama_log, nullptr);
    ggml_backend_load_all();

    LOG_INFO("Loading candidate model: " + modelPath);

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = env_int("HASHBREAKER_GPU_LAYERS", 0);

    llama_model* model = llama_model_load_from_file(modelPath.c_str(), model_params);
    if (!model) {
        LOG_ERROR("Failed to load model: " + modelPath);
        throw std::runtime_error("Failed to load model: " + modelPath);
    }
    model_ = std::shared_ptr<llama_model>(model, llama_model_free);
    LOG_INFO("Candidate model loaded");
}

LlamaGenerator::~LlamaGenerator() = default;

llama_sampler* LlamaGenerator::buildSampler() const {
    auto sparams = llama_sampler_chain_default_params();
    llama_sampler* smpl = llama_sampler_chain_init(sparams);

    llama_sampler_chain_add(smpl, llama_sampler_init_top_k(topK_));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_p(0.95f, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_temp(temperature_));
    llama_sampler_chain_add(smpl, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));

    return smpl;
}

std::vector<std::string> LlamaGenerator::generate(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> out;
    out.reserve(count);
    if (count == 0) {
        return out;
    }

    if (!sample(count, out)) {
        LOG_WARN("Model sampling failed; topping up with pattern candidates");
        for (auto& candidate : fallback_.generate(count - out.size())) {
            out.push_back(std::move(candidate));
        }
    }
    return out;
}

// Decodes a newline separated stream starting at BOS. The context is rebuilt
// whenever it fills up so every window starts fresh.
bool LlamaGenerator::sample(std::size_t count, std::vector<std::string>& out) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    std::unordered_set<std::string> seen;
    const std::size_t maxLines = count * 5;
    std::size_t lines = 0;

    while (out.size() < count && lines < maxLines) {
        llama_context_params ctx_params = llama_context_default_params();
        ctx_params.n_ctx = kContextTokens;
        ctx_params.n_batch = 512;
        llama_context* ctx = llama_init_from_model(model_.get(), ctx_params);
        if (!ctx) {
            LOG_ERROR("Failed to create context");
            return false;
        }
        llama_sampler* smpl = buildSampler();

        llama_token token = llama_vocab_bos(vocab);
        llama_batch batch = llama_batch_get_one(&token, 1);
        std::string line;
        bool failed = false;

        for (int n_pos = 0; n_pos + 1 < kContextTokens && out.size() < count && lines < maxLines; ++n_pos) {
            if (llama_decode(ctx, batch)) {
                LOG_ERROR("Failed to decode");
                failed = true;
                break;
            }

            token = llama_sampler_sample(smpl, ctx, -1);
            llama_sampler_accept(smpl, token);

            std::string piece;
            if (llama_vocab_is_eog(vocab, token)) {
                piece = "\n";
                token = llama_vocab_bos(vocab);
            } else {
                char buf[128];
                int n = llama_token_to_piece(vocab, token, buf, sizeof(buf), 0, false);
                if (n < 0) {
                    LOG_ERROR("Failed to convert token to piece");
                    failed = true;
                    break;
                }
                piece.assign(buf, n);
            }

            for (char c : piece) {
                if (c != '\n') {
                    line.push_back(c);
                    continue;
                }
                ++lines;
                if (acceptable(line) && seen.insert(line).second && out.size() < count) {
                    out.push_back(line);
                }
                line.clear();
            }

            batch = llama_batch_get_one(&token, 1);
        }

        llama_sampler_free(smpl);
        llama_free(ctx);

        if (failed) {
            return false;
        }
    }

    LOG_DEBUG("Sampled " + std::to_string(out.size()) + " candidates from " +
              std::to_string(lines) + " lines");
    return true;
}

}
