/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/settings.hpp"
#include "hashbreaker/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace hashbreaker {

namespace {

int env_int(const char* name, int defv) {
    if (const char* v = std::getenv(name)) return std::atoi(v);
    return defv;
}

std::size_t env_size(const char* name, std::size_t defv) {
    if (const char* v = std::getenv(name)) {
        long long parsed = std::atoll(v);
        return parsed > 0 ? static_cast<std::size_t>(parsed) : defv;
    }
    return defv;
}

double env_double(const char* name, double defv) {
    if (const char* v = std::getenv(name)) return std::atof(v);
    return defv;
}

std::int64_t env_int64(const char* name, std::int64_t defv) {
    if (const char* v = std::getenv(name)) return std::atoll(v);
    return defv;
}

std::string env_string(const char* name, const std::string& defv) {
    if (const char* v = std::getenv(name)) return v;
    return defv;
}

bool env_bool(const char* name, bool defv) {
    const char* v = std::getenv(name);
    if (!v) return defv;
    std::string s(v);
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    LOG_WARN(std::string("Ignoring unrecognised boolean for ") + name + ": " + v);
    return defv;
}

} // namespace

double PhaseRatios::forPhase(int phase) const noexcept {
    switch (phase) {
        case 1: return quickDictionary;
        case 2: return ruleBased;
        case 3: return aiGeneration;
        case 4: return mask;
        default: return 0.0;
    }
}

double PhaseRatios::sum() const noexcept {
    return quickDictionary + ruleBased + aiGeneration + mask;
}

Settings Settings::fromEnv() {
    Settings s;

    s.workspace = env_string("HASHBREAKER_WORKSPACE", s.workspace.string());
    s.jobTtlSeconds = env_int("HASHBREAKER_JOB_TTL", s.jobTtlSeconds);

    s.defaultTimeout = env_int("HASHBREAKER_DEFAULT_TIMEOUT", s.defaultTimeout);
    s.minTimeout = env_int("HASHBREAKER_MIN_TIMEOUT", s.minTimeout);
    s.maxTimeout = env_int("HASHBREAKER_MAX_TIMEOUT", s.maxTimeout);
    s.ratios.quickDictionary = env_double("HASHBREAKER_PHASE1_RATIO", s.ratios.quickDictionary);
    s.ratios.ruleBased = env_double("HASHBREAKER_PHASE2_RATIO", s.ratios.ruleBased);
    s.ratios.aiGeneration = env_double("HASHBREAKER_PHASE3_RATIO", s.ratios.aiGeneration);
    s.ratios.mask = env_double("HASHBREAKER_PHASE4_RATIO", s.ratios.mask);

    s.workers = env_int("HASHBREAKER_WORKERS", s.workers);
    s.maxDeliveries = env_int("HASHBREAKER_MAX_DELIVERIES", s.maxDeliveries);
    s.high.weight = env_int("HASHBREAKER_HIGH_WEIGHT", s.high.weight);
    s.normal.weight = env_int("HASHBREAKER_NORMAL_WEIGHT", s.normal.weight);
    s.low.weight = env_int("HASHBREAKER_LOW_WEIGHT", s.low.weight);
    int workerTimeout = env_int("HASHBREAKER_WORKER_TIMEOUT", 600);
    s.high.timeLimitSeconds = env_int("HASHBREAKER_HIGH_TIME_LIMIT", workerTimeout);
    s.normal.timeLimitSeconds = env_int("HASHBREAKER_NORMAL_TIME_LIMIT", workerTimeout);
    s.low.timeLimitSeconds = env_int("HASHBREAKER_LOW_TIME_LIMIT", workerTimeout);

    s.hashcatPath = env_string("HASHBREAKER_HASHCAT_PATH", s.hashcatPath);
    s.hashcatForce = env_bool("HASHBREAKER_HASHCAT_FORCE", s.hashcatForce);
    s.hashcatPotfileDisable = env_bool("HASHBREAKER_HASHCAT_POTFILE_DISABLE", s.hashcatPotfileDisable);
    s.streamFlushEvery = env_size("HASHBREAKER_STREAM_FLUSH_EVERY", s.streamFlushEvery);
    s.cancelPollMillis = env_int("HASHBREAKER_CANCEL_POLL_MS", s.cancelPollMillis);

    s.wordlistsDir = env_string("HASHBREAKER_WORDLISTS_DIR", s.wordlistsDir.string());
    s.rulesDir = env_string("HASHBREAKER_RULES_DIR", s.rulesDir.string());
    s.quickWordlist = env_string("HASHBREAKER_QUICK_WORDLIST", s.quickWordlist);
    s.bigWordlist = env_string("HASHBREAKER_BIG_WORDLIST", s.bigWordlist);
    s.rulesFile = env_string("HASHBREAKER_RULES_FILE", s.rulesFile);

    s.generatorBatch = env_size("HASHBREAKER_GENERATOR_BATCH", s.generatorBatch);
    s.generatorTotal = env_size("HASHBREAKER_GENERATOR_TOTAL", s.generatorTotal);
    s.modelPath = env_string("HASHBREAKER_MODEL", s.modelPath);
    s.generatorTemperature = static_cast<float>(env_double("HASHBREAKER_TEMP", s.generatorTemperature));
    s.generatorTopK = env_int("HASHBREAKER_TOP_K", s.generatorTopK);

    s.quickDictionaryEstimate = env_int64("HASHBREAKER_PHASE1_ESTIMATE", s.quickDictionaryEstimate);
    s.ruleBasedEstimate = env_int64("HASHBREAKER_PHASE2_ESTIMATE", s.ruleBasedEstimate);
    s.maskEstimate = env_int64("HASHBREAKER_PHASE4_ESTIMATE", s.maskEstimate);

    return s;
}

std::vector<std::string> Settings::validate() const {
    std::vector<std::string> problems;

    if (jobTtlSeconds <= 0) {
        problems.push_back("job TTL must be positive");
    }
    if (minTimeout <= 0) {
        problems.push_back("minimum timeout must be positive");
    }
    if (minTimeout > maxTimeout) {
        problems.push_back("minimum timeout exceeds maximum timeout");
    }
    if (defaultTimeout < minTimeout || defaultTimeout > maxTimeout) {
        problems.push_back("default timeout outside [" + std::to_string(minTimeout) + ", " +
                           std::to_string(maxTimeout) + "]");
    }

    for (int phase = 1; phase <= 4; ++phase) {
        double r = ratios.forPhase(phase);
        if (!(r > 0.0 && r < 1.0)) {
            problems.push_back("phase " + std::to_string(phase) + " ratio must lie in (0, 1)");
        }
    }
    if (std::fabs(ratios.sum() - 1.0) > 1e-9) {
        problems.push_back("phase ratios must sum to 1.0 (got " + std::to_string(ratios.sum()) + ")");
    }

    if (workers < 1) {
        problems.push_back("worker count must be at least 1");
    }
    if (maxDeliveries < 1) {
        problems.push_back("max deliveries must be at least 1");
    }
    for (Priority p : {Priority::High, Priority::Normal, Priority::Low}) {
        const LaneSettings& l = lane(p);
        if (l.weight < 1) {
            problems.push_back(std::string("lane ") + toString(p) + " weight must be at least 1");
        }
        if (l.timeLimitSeconds < 1) {
            problems.push_back(std::string("lane ") + toString(p) + " time limit must be positive");
        }
    }

    if (hashcatPath.empty()) {
        problems.push_back("hashcat path is empty");
    }
    if (streamFlushEvery == 0) {
        problems.push_back("stream flush interval must be positive");
    }
    if (cancelPollMillis <= 0) {
        problems.push_back("cancel poll interval must be positive");
    }
    if (generatorBatch == 0) {
        problems.push_back("generator batch size must be positive");
    }
    if (quickDictionaryEstimate < 0 || ruleBasedEstimate < 0 || maskEstimate < 0) {
        problems.push_back("attempt estimates must not be negative");
    }

    return problems;
}

const LaneSettings& Settings::lane(Priority priority) const noexcept {
    switch (priority) {
        case Priority::High: return high;
        case Priority::Low: return low;
        case Priority::Normal:
        default: return normal;
    }
}

double phaseBudget(double fraction, double totalSeconds, double elapsedSeconds) noexcept {
    double budget = std::min(fraction * totalSeconds, totalSeconds - elapsedSeconds);
    return std::max(0.0, budget);
}

} // namespace hashbreaker
