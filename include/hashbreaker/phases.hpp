/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "hashbreaker/cancel.hpp"
#include "hashbreaker/engine.hpp"
#include "hashbreaker/generator.hpp"
#include "hashbreaker/settings.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace hashbreaker {

// Outcome of one phase. Phases never throw; failures land in `error`.
struct PhaseResult {
    bool cracked = false;
    std::optional<std::string> password;
    std::int64_t attempts = 0;
    int phase = 0;
    std::string method;
    bool timeout = false;
    std::optional<std::string> error;
};

// Collaborators for one job's phases. Must outlive the phase table built from it.
struct PhaseContext {
    const Settings& settings;
    AttackExecutor& engine;
    CandidateGenerator* generator = nullptr;
    StopCheck stopFeeding;
    const CancelToken* kill = nullptr;
};

using PhaseFn = std::function<PhaseResult(const std::string& targetHash, int hashTypeId,
                                          double timeoutSeconds)>;
// Index 0 holds phase 1.
using PhaseTable = std::array<PhaseFn, 4>;

inline constexpr int kPhaseCount = 4;

// Display names, 1-based: "Quick Dictionary", "Rule-Based", ...
[[nodiscard]] const char* phaseName(int phase) noexcept;
// Progress text stored in current_phase.
[[nodiscard]] const char* phaseLabel(int phase) noexcept;
// Progress milestone reported when the phase starts: 15, 35, 60, 80.
[[nodiscard]] int phaseMilestone(int phase) noexcept;

[[nodiscard]] const std::vector<std::string>& commonMasks();

// Phase 1: top wordlist through the tool; CPU fallback when it has no device.
[[nodiscard]] PhaseResult quickDictionaryAttack(const PhaseContext& ctx, const std::string& targetHash,
                                                int hashTypeId, double timeoutSeconds) noexcept;

// Digests each wordlist line on the CPU until match, deadline or end of file.
[[nodiscard]] PhaseResult cpuDictionaryAttack(const std::filesystem::path& wordlist,
                                              const std::string& targetHash, int hashTypeId,
                                              double timeoutSeconds) noexcept;

// Phase 2: best64 rules over the large wordlist.
[[nodiscard]] PhaseResult ruleBasedAttack(const PhaseContext& ctx, const std::string& targetHash,
                                          int hashTypeId, double timeoutSeconds) noexcept;

// Phase 3: generated candidates streamed to the tool.
[[nodiscard]] PhaseResult aiGenerationAttack(const PhaseContext& ctx, CandidateGenerator& generator,
                                             const std::string& targetHash, int hashTypeId,
                                             double timeoutSeconds) noexcept;

// Phase 4: common masks, remaining budget shared among untried masks.
[[nodiscard]] PhaseResult maskAttack(const PhaseContext& ctx, const std::string& targetHash,
                                     int hashTypeId, double timeoutSeconds) noexcept;

// Binds the four strategies to ctx.
[[nodiscard]] PhaseTable makePhaseTable(const PhaseContext& ctx);

} // namespace hashbreaker
