/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/phases.hpp"
#include "hashbreaker/digest.hpp"
#include "hashbreaker/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>

namespace hashbreaker {

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr int kQuickDictionaryPhase = 1;
constexpr int kRuleBasedPhase = 2;
constexpr int kAiGenerationPhase = 3;
constexpr int kMaskPhase = 4;

constexpr int kDictionaryAttackMode = 0;
constexpr int kMaskAttackMode = 3;

std::string trimCopy(const std::string& value) {
    const char* ws = " \t\r\n\f\v";
    auto start = value.find_first_not_of(ws);
    if (start == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(ws);
    return value.substr(start, end - start + 1);
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

double secondsSince(SteadyClock::time_point start) {
    return std::chrono::duration<double>(SteadyClock::now() - start).count();
}

PhaseResult failed(int phase, const std::string& error, std::int64_t attempts = 0) {
    PhaseResult r;
    r.phase = phase;
    r.attempts = attempts;
    r.error = error;
    return r;
}

} // namespace

const char* phaseName(int phase) noexcept {
    switch (phase) {
        case kQuickDictionaryPhase: return "Quick Dictionary";
        case kRuleBasedPhase: return "Rule-Based";
        case kAiGenerationPhase: return "AI Generation";
        case kMaskPhase: return "Mask Attack";
        default: return "Unknown";
    }
}

const char* phaseLabel(int phase) noexcept {
    switch (phase) {
        case kQuickDictionaryPhase: return "Phase 1: Quick Dictionary Attack";
        case kRuleBasedPhase: return "Phase 2: Rule-Based Attack";
        case kAiGenerationPhase: return "Phase 3: AI Generation";
        case kMaskPhase: return "Phase 4: Mask Attack";
        default: return "Unknown Phase";
    }
}

int phaseMilestone(int phase) noexcept {
    switch (phase) {
        case kQuickDictionaryPhase: return 15;
        case kRuleBasedPhase: return 35;
        case kAiGenerationPhase: return 60;
        case kMaskPhase: return 80;
        default: return 0;
    }
}

const std::vector<std::string>& commonMasks() {
    static const std::vector<std::string> masks = {
        "?l?l?l?l?l?l?l?l",   // 8 lowercase
        "?u?l?l?l?l?l?l",     // capitalised word
        "?l?l?l?l?l?l?d",     // word + digit
        "?l?l?l?l?l?l?l?d",
        "?a?a?a?a?a?a?a",     // any printable
    };
    return masks;
}

PhaseResult quickDictionaryAttack(const PhaseContext& ctx, const std::string& targetHash,
                                  int hashTypeId, double timeoutSeconds) noexcept {
    try {
        const auto wordlist = ctx.settings.quickWordlistPath();
        LOG_INFO("Phase 1: Quick Dictionary Attack (budget " + std::to_string(timeoutSeconds) + "s)");

        AttackRequest request;
        request.targetHash = targetHash;
        request.hashTypeId = hashTypeId;
        request.attackMode = kDictionaryAttackMode;
        request.attackArgs = {wordlist.string()};
        request.timeoutSeconds = timeoutSeconds;
        request.kill = ctx.kill;

        EngineResult tool = ctx.engine.run(request);

        PhaseResult r;
        r.phase = kQuickDictionaryPhase;
        r.attempts = ctx.settings.quickDictionaryEstimate;

        if (tool.cracked) {
            r.cracked = true;
            r.password = tool.password;
            r.method = "quick_dictionary";
            LOG_INFO("Phase 1: Password recovered");
            return r;
        }

        switch (tool.errorKind) {
            case ErrorKind::NoDevice:
                LOG_WARN("Phase 1: cracking tool has no usable device, using CPU fallback");
                return cpuDictionaryAttack(wordlist, targetHash, hashTypeId, timeoutSeconds);
            case ErrorKind::Timeout:
                LOG_WARN("Phase 1: Timeout after " + std::to_string(timeoutSeconds) + "s");
                r.timeout = true;
                return r;
            case ErrorKind::Killed:
                r.error = "Killed";
                return r;
            case ErrorKind::LaunchFailure:
            case ErrorKind::ExecutionFailure:
                LOG_WARN(std::string("Phase 1: tool failure (") + toString(tool.errorKind) + ")");
                return r;
            case ErrorKind::None:
            default:
                LOG_INFO("Phase 1: No matches found (exit code " + std::to_string(tool.exitCode) + ")");
                return r;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Phase 1 error: " + std::string(e.what()));
        return failed(kQuickDictionaryPhase, e.what());
    }
}

PhaseResult cpuDictionaryAttack(const std::filesystem::path& wordlist, const std::string& targetHash,
                                int hashTypeId, double timeoutSeconds) noexcept {
    std::int64_t attempts = 0;
    try {
        LOG_INFO("Phase 1: CPU dictionary over " + wordlist.string() +
                 " (budget " + std::to_string(timeoutSeconds) + "s)");
        const auto start = SteadyClock::now();

        Digester digester(hashTypeId);
        if (!digester.valid()) {
            LOG_WARN("Phase 1: CPU fallback unsupported for hash type " + std::to_string(hashTypeId));
            return failed(kQuickDictionaryPhase,
                          "Unsupported hash type for CPU fallback: " + std::to_string(hashTypeId));
        }

        std::ifstream in(wordlist, std::ios::binary);
        if (!in) {
            LOG_ERROR("Phase 1: cannot open wordlist " + wordlist.string());
            return failed(kQuickDictionaryPhase, "Cannot open wordlist: " + wordlist.string());
        }

        const std::string target = toLowerCopy(trimCopy(targetHash));
        PhaseResult r;
        r.phase = kQuickDictionaryPhase;

        std::string line;
        while (std::getline(in, line)) {
            if (secondsSince(start) >= timeoutSeconds) {
                LOG_WARN("Phase 1: CPU fallback timeout after " + std::to_string(attempts) + " attempts");
                r.attempts = attempts;
                r.timeout = true;
                return r;
            }
            std::string candidate = trimCopy(line);
            if (candidate.empty()) {
                continue;
            }
            ++attempts;
            if (digester.hex(candidate) == target) {
                LOG_INFO("Phase 1: Password recovered on CPU after " + std::to_string(attempts) + " attempts");
                r.cracked = true;
                r.password = candidate;
                r.attempts = attempts;
                r.method = "cpu_dictionary";
                return r;
            }
        }
        if (in.bad()) {
            return failed(kQuickDictionaryPhase, "Read error on wordlist: " + wordlist.string(), attempts);
        }

        LOG_INFO("Phase 1: CPU fallback checked " + std::to_string(attempts) + " candidates, no match");
        r.attempts = attempts;
        return r;
    } catch (const std::exception& e) {
        LOG_ERROR("Phase 1 CPU fallback error: " + std::string(e.what()));
        return failed(kQuickDictionaryPhase, e.what(), attempts);
    }
}

PhaseResult ruleBasedAttack(const PhaseContext& ctx, const std::string& targetHash,
                            int hashTypeId, double timeoutSeconds) noexcept {
    try {
        LOG_INFO("Phase 2: Rule-Based Attack (budget " + std::to_string(timeoutSeconds) + "s)");

        AttackRequest request;
        request.targetHash = targetHash;
        request.hashTypeId = hashTypeId;
        request.attackMode = kDictionaryAttackMode;
        request.attackArgs = {"-r", ctx.settings.rulesPath().string(), ctx.settings.bigWordlistPath().string()};
        request.timeoutSeconds = timeoutSeconds;
        request.kill = ctx.kill;

        EngineResult tool = ctx.engine.run(request);

        PhaseResult r;
        r.phase = kRuleBasedPhase;
        r.attempts = ctx.settings.ruleBasedEstimate;
        r.method = "rule_based";
        if (tool.cracked) {
            r.cracked = true;
            r.password = tool.password;
            LOG_INFO("Phase 2: Password recovered");
        } else if (tool.errorKind == ErrorKind::Timeout) {
            LOG_WARN("Phase 2: Timeout after " + std::to_string(timeoutSeconds) + "s");
            r.timeout = true;
        } else {
            LOG_INFO(std::string("Phase 2: No matches found (") + toString(tool.errorKind) + ")");
        }
        return r;
    } catch (const std::exception& e) {
        LOG_ERROR("Phase 2 error: " + std::string(e.what()));
        return failed(kRuleBasedPhase, e.what());
    }
}

PhaseResult aiGenerationAttack(const PhaseContext& ctx, CandidateGenerator& generator,
                               const std::string& targetHash, int hashTypeId,
                               double timeoutSeconds) noexcept {
    try {
        const std::size_t total = ctx.settings.generatorTotal;
        LOG_INFO("Phase 3: AI Generation (budget " + std::to_string(timeoutSeconds) +
                 "s, count " + std::to_string(total) + ")");

        BatchedCandidateStream stream(generator, total, ctx.settings.generatorBatch);

        AttackRequest request;
        request.targetHash = targetHash;
        request.hashTypeId = hashTypeId;
        request.attackMode = kDictionaryAttackMode;
        request.timeoutSeconds = timeoutSeconds;
        request.candidates = &stream;
        request.stopFeeding = ctx.stopFeeding;
        request.kill = ctx.kill;

        EngineResult tool = ctx.engine.run(request);

        PhaseResult r;
        r.phase = kAiGenerationPhase;
        r.method = "ai_generation";
        r.attempts = tool.attempts ? *tool.attempts : static_cast<std::int64_t>(total);
        if (tool.cracked) {
            r.cracked = true;
            r.password = tool.password;
            LOG_INFO("Phase 3: Password recovered after " + std::to_string(r.attempts) + " candidates");
        } else if (tool.timedOut || tool.errorKind == ErrorKind::Timeout) {
            LOG_WARN("Phase 3: Timeout after " + std::to_string(timeoutSeconds) + "s");
            r.timeout = true;
        } else {
            LOG_INFO("Phase 3: No matches found");
        }
        return r;
    } catch (const std::exception& e) {
        LOG_ERROR("Phase 3 error: " + std::string(e.what()));
        return failed(kAiGenerationPhase, e.what());
    }
}

PhaseResult maskAttack(const PhaseContext& ctx, const std::string& targetHash,
                       int hashTypeId, double timeoutSeconds) noexcept {
    try {
        PhaseResult r;
        r.phase = kMaskPhase;
        if (timeoutSeconds <= 0.0) {
            LOG_WARN("Phase 4: no time budget left, skipping");
            r.timeout = true;
            return r;
        }

        LOG_INFO("Phase 4: Mask Attack (budget " + std::to_string(timeoutSeconds) + "s)");
        const auto start = SteadyClock::now();
        const auto& masks = commonMasks();

        for (std::size_t i = 0; i < masks.size(); ++i) {
            const double remaining = timeoutSeconds - secondsSince(start);
            const double share = remaining / static_cast<double>(masks.size() - i);
            if (share <= 0.0) {
                LOG_DEBUG("Phase 4: no time left for mask " + masks[i]);
                continue;
            }

            LOG_DEBUG("Phase 4: mask " + std::to_string(i + 1) + "/" + std::to_string(masks.size()) +
                      ": " + masks[i]);

            AttackRequest request;
            request.targetHash = targetHash;
            request.hashTypeId = hashTypeId;
            request.attackMode = kMaskAttackMode;
            request.attackArgs = {masks[i], "--increment", "--increment-min", "1", "--increment-max", "8"};
            request.timeoutSeconds = share;
            request.kill = ctx.kill;

            EngineResult tool = ctx.engine.run(request);
            if (tool.cracked) {
                LOG_INFO("Phase 4: Password recovered with mask " + masks[i]);
                r.cracked = true;
                r.password = tool.password;
                r.method = "mask_attack";
                r.attempts = ctx.settings.maskEstimate;
                return r;
            }
            if (tool.errorKind == ErrorKind::Killed) {
                break;
            }
        }

        r.attempts = ctx.settings.maskEstimate;
        LOG_INFO("Phase 4: masks exhausted");
        return r;
    } catch (const std::exception& e) {
        LOG_ERROR("Phase 4 error: " + std::string(e.what()));
        return failed(kMaskPhase, e.what());
    }
}

PhaseTable makePhaseTable(const PhaseContext& ctx) {
    const PhaseContext* c = &ctx;
    return PhaseTable{
        [c](const std::string& hash, int type, double budget) {
            return quickDictionaryAttack(*c, hash, type, budget);
        },
        [c](const std::string& hash, int type, double budget) {
            return ruleBasedAttack(*c, hash, type, budget);
        },
        [c](const std::string& hash, int type, double budget) {
            if (!c->generator) {
                LOG_WARN("Phase 3: no candidate generator configured");
                return failed(kAiGenerationPhase, "No candidate generator configured");
            }
            return aiGenerationAttack(*c, *c->generator, hash, type, budget);
        },
        [c](const std::string& hash, int type, double budget) {
            return maskAttack(*c, hash, type, budget);
        },
    };
}

} // namespace hashbreaker
