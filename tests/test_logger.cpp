/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "hashbreaker/logger.hpp"

namespace hashbreaker::tests {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = Logger::level(); }
    void TearDown() override { Logger::setLevel(saved_); }

    LogLevel saved_ = LogLevel::INFO;
};

TEST_F(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::parseLevel("error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("WARNING"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("Warn"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("trace"), LogLevel::TRACE);
    EXPECT_FALSE(Logger::parseLevel("verbose").has_value());
    EXPECT_FALSE(Logger::parseLevel("").has_value());
}

TEST_F(LoggerTest, ThresholdFiltersLessSevereLevels) {
    Logger::setLevel(LogLevel::WARN);
    EXPECT_EQ(Logger::level(), LogLevel::WARN);
    EXPECT_TRUE(Logger::enabled(LogLevel::ERROR));
    EXPECT_TRUE(Logger::enabled(LogLevel::WARN));
    EXPECT_FALSE(Logger::enabled(LogLevel::INFO));
    EXPECT_FALSE(Logger::enabled(LogLevel::TRACE));
}

TEST_F(LoggerTest, NamesAndWorkerLabels) {
    EXPECT_STREQ(Logger::name(LogLevel::INFO), "INFO");
    EXPECT_STREQ(Logger::name(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(getThreadName(3), "Worker-3");

    setThreadName("Worker-3");
    LOG_ERROR("named thread writes without throwing");
    clearThreadName();
}

}
