/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "hashbreaker/types.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace hashbreaker {

// Share of the job timeout given to each phase.
struct PhaseRatios {
    double quickDictionary = 0.10;
    double ruleBased = 0.25;
    double aiGeneration = 0.35;
    double mask = 0.30;

    // phase is 1..4; anything else yields 0
    [[nodiscard]] double forPhase(int phase) const noexcept;
    [[nodiscard]] double sum() const noexcept;
};

struct LaneSettings {
    int weight = 1;
    int timeLimitSeconds = 600;
};

// Runtime configuration. Built once and passed by reference.
struct Settings {
    std::filesystem::path workspace = "./workspace";

    // Job store
    int jobTtlSeconds = 86400;

    // Job limits
    int defaultTimeout = 60;
    int minTimeout = 10;
    int maxTimeout = 3600;
    PhaseRatios ratios;

    // Dispatcher
    int workers = 4;
    int maxDeliveries = 3;
    LaneSettings high{6, 600};
    LaneSettings normal{3, 600};
    LaneSettings low{1, 600};

    // External cracking tool
    std::string hashcatPath = "/usr/bin/hashcat";
    bool hashcatForce = true;
    bool hashcatPotfileDisable = true;
    std::size_t streamFlushEvery = 1000;
    int cancelPollMillis = 250;

    // Attack inputs
    std::filesystem::path wordlistsDir = "./wordlists";
    std::filesystem::path rulesDir = "./data/rules";
    std::string quickWordlist = "top100k.txt";
    std::string bigWordlist = "rockyou.txt";
    std::string rulesFile = "best64.rule";

    // Candidate generation
    std::size_t generatorBatch = 10000;
    std::size_t generatorTotal = 5000000;
    std::string modelPath;
    float generatorTemperature = 0.8f;
    int generatorTopK = 40;

    // Attempt estimates reported for tool-driven phases
    std::int64_t quickDictionaryEstimate = 100000;
    std::int64_t ruleBasedEstimate = 5000000;
    std::int64_t maskEstimate = 10000000;

    // Reads HASHBREAKER_* environment variables over the defaults.
    [[nodiscard]] static Settings fromEnv();

    // Empty when the configuration is usable.
    [[nodiscard]] std::vector<std::string> validate() const;

    [[nodiscard]] const LaneSettings& lane(Priority priority) const noexcept;

    [[nodiscard]] std::filesystem::path quickWordlistPath() const { return wordlistsDir / quickWordlist; }
    [[nodiscard]] std::filesystem::path bigWordlistPath() const { return wordlistsDir / bigWordlist; }
    [[nodiscard]] std::filesystem::path rulesPath() const { return rulesDir / rulesFile; }
};

// min(fraction * total, total - elapsed), never negative.
[[nodiscard]] double phaseBudget(double fraction, double totalSeconds, double elapsedSeconds) noexcept;

} // namespace hashbreaker
