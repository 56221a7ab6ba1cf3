/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <algorithm>

#include "fake_engine.hpp"
#include "hashbreaker/phases.hpp"
#include "test_support.hpp"

namespace hashbreaker::tests {

namespace {
constexpr const char* kHelloMd5 = "5d41402abc4b2a76b9719d911017c592";

class FixedGenerator final : public CandidateGenerator {
public:
    std::vector<std::string> generate(std::size_t count) override {
        return std::vector<std::string>(count, "candidate");
    }
};

// Hands out `left` candidates in total, then nothing.
class FiniteGenerator final : public CandidateGenerator {
public:
    explicit FiniteGenerator(std::size_t left) : left_(left) {}
    std::vector<std::string> generate(std::size_t count) override {
        std::size_t n = std::min(count, left_);
        left_ -= n;
        return std::vector<std::string>(n, "guess");
    }
private:
    std::size_t left_;
};
}

class PhasesTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.wordlistsDir = dir_.path();
        writeFile(settings_.quickWordlistPath(), "123456\npassword\n\nqwerty\nletmein\nhello\nworld\n");
    }

    PhaseContext context(CandidateGenerator* generator = nullptr) {
        return PhaseContext{settings_, engine_, generator, nullptr, nullptr};
    }

    TempDir dir_;
    Settings settings_;
    FakeEngine engine_;
};

TEST_F(PhasesTest, QuickDictionaryCrack) {
    engine_.push(FakeEngine::cracked("hello"));
    auto ctx = context();

    PhaseResult r = quickDictionaryAttack(ctx, kHelloMd5, hashmode::MD5, 6.0);
    EXPECT_TRUE(r.cracked);
    EXPECT_EQ(r.password.value(), "hello");
    EXPECT_EQ(r.method, "quick_dictionary");
    EXPECT_EQ(r.attempts, settings_.quickDictionaryEstimate);
    EXPECT_EQ(r.phase, 1);

    auto calls = engine_.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].attackMode, 0);
    EXPECT_EQ(calls[0].attackArgs.front(), settings_.quickWordlistPath().string());
}

TEST_F(PhasesTest, QuickDictionaryFallsBackToCpu) {
    engine_.push(FakeEngine::failure(ErrorKind::NoDevice));
    auto ctx = context();

    PhaseResult r = quickDictionaryAttack(ctx, kHelloMd5, hashmode::MD5, 6.0);
    EXPECT_TRUE(r.cracked);
    EXPECT_EQ(r.password.value(), "hello");
    EXPECT_EQ(r.method, "cpu_dictionary");
    // Blank lines are not attempts.
    EXPECT_EQ(r.attempts, 5);
}

TEST_F(PhasesTest, CpuFallbackMiss) {
    PhaseResult r = cpuDictionaryAttack(settings_.quickWordlistPath(),
                                        "00000000000000000000000000000000", hashmode::MD5, 6.0);
    EXPECT_FALSE(r.cracked);
    EXPECT_FALSE(r.timeout);
    EXPECT_EQ(r.attempts, 6);
}

TEST_F(PhasesTest, CpuFallbackWithoutBudget) {
    PhaseResult r = cpuDictionaryAttack(settings_.quickWordlistPath(), kHelloMd5, hashmode::MD5, 0.0);
    EXPECT_FALSE(r.cracked);
    EXPECT_TRUE(r.timeout);
    EXPECT_EQ(r.attempts, 0);
}

TEST_F(PhasesTest, CpuFallbackUnsupportedType) {
    PhaseResult r = cpuDictionaryAttack(settings_.quickWordlistPath(), "$2b$12$abc", hashmode::BCRYPT, 6.0);
    EXPECT_FALSE(r.cracked);
    ASSERT_TRUE(r.error.has_value());
}

TEST_F(PhasesTest, CpuFallbackMissingWordlist) {
    PhaseResult r = cpuDictionaryAttack(dir_.path() / "absent.txt", kHelloMd5, hashmode::MD5, 6.0);
    ASSERT_TRUE(r.error.has_value());
}

TEST_F(PhasesTest, QuickDictionaryTimeout) {
    engine_.push(FakeEngine::failure(ErrorKind::Timeout));
    auto ctx = context();
    PhaseResult r = quickDictionaryAttack(ctx, kHelloMd5, hashmode::MD5, 6.0);
    EXPECT_FALSE(r.cracked);
    EXPECT_TRUE(r.timeout);
}

TEST_F(PhasesTest, RuleBasedUsesRulesAndBigWordlist) {
    auto ctx = context();
    PhaseResult r = ruleBasedAttack(ctx, kHelloMd5, hashmode::MD5, 15.0);
    EXPECT_FALSE(r.cracked);
    EXPECT_EQ(r.attempts, settings_.ruleBasedEstimate);

    auto calls = engine_.calls();
    ASSERT_EQ(calls.size(), 1u);
    std::vector<std::string> expected = {"-r", settings_.rulesPath().string(),
                                         settings_.bigWordlistPath().string()};
    EXPECT_EQ(calls[0].attackArgs, expected);
    EXPECT_DOUBLE_EQ(calls[0].timeoutSeconds, 15.0);
}

TEST_F(PhasesTest, AiGenerationCountsStreamedCandidates) {
    settings_.generatorTotal = 2500;
    settings_.generatorBatch = 1000;
    FixedGenerator generator;
    auto ctx = context(&generator);

    PhaseResult r = aiGenerationAttack(ctx, generator, kHelloMd5, hashmode::MD5, 21.0);
    EXPECT_FALSE(r.cracked);
    EXPECT_EQ(r.attempts, 2500);
    EXPECT_EQ(r.method, "ai_generation");

    auto calls = engine_.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_TRUE(calls[0].streaming);
}

TEST_F(PhasesTest, AiGenerationStopsWhenGeneratorRunsDry) {
    FiniteGenerator generator(1234);
    auto ctx = context(&generator);

    PhaseResult r = aiGenerationAttack(ctx, generator, kHelloMd5, hashmode::MD5, 21.0);
    EXPECT_EQ(r.attempts, 1234);
    EXPECT_FALSE(r.cracked);
}

TEST_F(PhasesTest, PhaseTableWithoutGenerator) {
    auto ctx = context();
    PhaseTable table = makePhaseTable(ctx);
    PhaseResult r = table[2](kHelloMd5, hashmode::MD5, 21.0);
    EXPECT_EQ(r.phase, 3);
    EXPECT_TRUE(r.error.has_value());
    EXPECT_TRUE(engine_.calls().empty());
}

TEST_F(PhasesTest, MaskStopsAtFirstCrack) {
    engine_.push(FakeEngine::cracked("abcdefgh"));
    auto ctx = context();

    PhaseResult r = maskAttack(ctx, kHelloMd5, hashmode::MD5, 18.0);
    EXPECT_TRUE(r.cracked);
    EXPECT_EQ(r.method, "mask_attack");

    auto calls = engine_.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].attackMode, 3);
    EXPECT_EQ(calls[0].attackArgs.front(), commonMasks().front());
    // First mask gets an equal share of the budget.
    EXPECT_NEAR(calls[0].timeoutSeconds, 18.0 / 5.0, 0.1);
}

TEST_F(PhasesTest, MaskTriesEveryMask) {
    auto ctx = context();
    PhaseResult r = maskAttack(ctx, kHelloMd5, hashmode::MD5, 18.0);
    EXPECT_FALSE(r.cracked);
    EXPECT_EQ(r.attempts, settings_.maskEstimate);
    EXPECT_EQ(engine_.calls().size(), commonMasks().size());
}

TEST_F(PhasesTest, MaskWithoutBudget) {
    auto ctx = context();
    PhaseResult r = maskAttack(ctx, kHelloMd5, hashmode::MD5, 0.0);
    EXPECT_TRUE(r.timeout);
    EXPECT_TRUE(engine_.calls().empty());
}

TEST(PhaseNamesTest, NamesAndMilestones) {
    EXPECT_STREQ(phaseName(1), "Quick Dictionary");
    EXPECT_STREQ(phaseName(4), "Mask Attack");
    EXPECT_STREQ(phaseLabel(1), "Phase 1: Quick Dictionary Attack");
    EXPECT_STREQ(phaseLabel(2), "Phase 2: Rule-Based Attack");
    EXPECT_STREQ(phaseLabel(3), "Phase 3: AI Generation");
    EXPECT_STREQ(phaseLabel(4), "Phase 4: Mask Attack");
    EXPECT_EQ(phaseMilestone(1), 15);
    EXPECT_EQ(phaseMilestone(2), 35);
    EXPECT_EQ(phaseMilestone(3), 60);
    EXPECT_EQ(phaseMilestone(4), 80);
    EXPECT_EQ(commonMasks().size(), 5u);
}

}
