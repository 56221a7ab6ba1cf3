/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <deque>
#include <mutex>
#include <vector>

#include "hashbreaker/engine.hpp"

namespace hashbreaker::tests {

// Replays scripted results and records every request it receives.
// Streaming requests are drained so attempts reflect what was offered.
class FakeEngine final : public AttackExecutor {
public:
    struct Call {
        int attackMode = 0;
        std::vector<std::string> attackArgs;
        double timeoutSeconds = 0.0;
        bool streaming = false;
    };

    void push(EngineResult result) { script_.push_back(std::move(result)); }

    static EngineResult cracked(const std::string& password) {
        EngineResult r;
        r.cracked = true;
        r.password = password;
        r.exitCode = 0;
        return r;
    }

    static EngineResult exhausted() {
        EngineResult r;
        r.exitCode = 1;
        return r;
    }

    static EngineResult failure(ErrorKind kind) {
        EngineResult r;
        r.exitCode = 255;
        r.errorKind = kind;
        return r;
    }

    EngineResult run(const AttackRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back({request.attackMode, request.attackArgs, request.timeoutSeconds,
                          request.candidates != nullptr});

        EngineResult r = exhausted();
        if (!script_.empty()) {
            r = script_.front();
            script_.pop_front();
        }
        if (request.candidates) {
            std::int64_t offered = 0;
            while (request.candidates->next()) {
                ++offered;
            }
            r.attempts = offered;
        }
        return r;
    }

    [[nodiscard]] std::vector<Call> calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    std::mutex mutex_;
    std::deque<EngineResult> script_;
    std::vector<Call> calls_;
};

}
