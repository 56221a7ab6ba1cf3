/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <cstdlib>

#include "hashbreaker/settings.hpp"

namespace hashbreaker::tests {

class SettingsTest : public ::testing::Test {
protected:
    void TearDown() override {
        ::unsetenv("HASHBREAKER_WORKERS");
        ::unsetenv("HASHBREAKER_PHASE1_RATIO");
        ::unsetenv("HASHBREAKER_HASHCAT_FORCE");
        ::unsetenv("HASHBREAKER_WORKER_TIMEOUT");
        ::unsetenv("HASHBREAKER_HIGH_TIME_LIMIT");
    }
};

TEST_F(SettingsTest, DefaultsAreValid) {
    Settings s;
    EXPECT_TRUE(s.validate().empty());
    EXPECT_DOUBLE_EQ(s.ratios.sum(), 1.0);
    EXPECT_EQ(s.lane(Priority::High).weight, 6);
    EXPECT_EQ(s.lane(Priority::Normal).weight, 3);
    EXPECT_EQ(s.lane(Priority::Low).weight, 1);
}

TEST_F(SettingsTest, PhaseRatiosByNumber) {
    PhaseRatios r;
    EXPECT_DOUBLE_EQ(r.forPhase(1), 0.10);
    EXPECT_DOUBLE_EQ(r.forPhase(2), 0.25);
    EXPECT_DOUBLE_EQ(r.forPhase(3), 0.35);
    EXPECT_DOUBLE_EQ(r.forPhase(4), 0.30);
    EXPECT_DOUBLE_EQ(r.forPhase(5), 0.0);
}

TEST_F(SettingsTest, RatiosMustSumToOne) {
    Settings s;
    s.ratios.mask = 0.5;
    auto problems = s.validate();
    ASSERT_FALSE(problems.empty());
}

TEST_F(SettingsTest, TimeoutBoundsChecked) {
    Settings s;
    s.defaultTimeout = 5;
    EXPECT_FALSE(s.validate().empty());
}

TEST_F(SettingsTest, EnvironmentOverridesDefaults) {
    ::setenv("HASHBREAKER_WORKERS", "8", 1);
    ::setenv("HASHBREAKER_HASHCAT_FORCE", "false", 1);
    ::setenv("HASHBREAKER_WORKER_TIMEOUT", "120", 1);
    ::setenv("HASHBREAKER_HIGH_TIME_LIMIT", "30", 1);

    Settings s = Settings::fromEnv();
    EXPECT_EQ(s.workers, 8);
    EXPECT_FALSE(s.hashcatForce);
    EXPECT_EQ(s.lane(Priority::High).timeLimitSeconds, 30);
    EXPECT_EQ(s.lane(Priority::Low).timeLimitSeconds, 120);
}

TEST_F(SettingsTest, PhaseBudget) {
    EXPECT_DOUBLE_EQ(phaseBudget(0.10, 60.0, 0.0), 6.0);
    EXPECT_DOUBLE_EQ(phaseBudget(0.35, 60.0, 50.0), 10.0);
    EXPECT_DOUBLE_EQ(phaseBudget(0.30, 60.0, 70.0), 0.0);
}

}
