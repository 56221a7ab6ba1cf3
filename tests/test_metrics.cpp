/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "hashbreaker/metrics.hpp"
#include "test_support.hpp"

namespace hashbreaker::tests {

class MetricsTest : public ::testing::Test {
protected:
    static bool contains(const std::string& text, const std::string& needle) {
        return text.find(needle) != std::string::npos;
    }

    Metrics metrics_;
};

TEST_F(MetricsTest, CountersAndGauges) {
    metrics_.jobFinished(Status::Success, 12.0);
    metrics_.jobFinished(Status::Success, 3.0);
    metrics_.jobFinished(Status::Failed, 60.0);
    metrics_.phaseFinished("Quick Dictionary", 2.0, 100000);
    metrics_.phaseFinished("Quick Dictionary", 1.0, 5);
    metrics_.jobsRunningDelta(1);
    metrics_.jobsRunningDelta(1);
    metrics_.jobsRunningDelta(-1);

    EXPECT_EQ(metrics_.jobsTotal(Status::Success), 2u);
    EXPECT_EQ(metrics_.jobsTotal(Status::Cancelled), 0u);
    EXPECT_EQ(metrics_.guessesTotal("Quick Dictionary"), 100005);
    EXPECT_EQ(metrics_.phaseDurationCount("Quick Dictionary"), 2u);
    EXPECT_EQ(metrics_.jobDurationCount(Status::Failed), 1u);
    EXPECT_EQ(metrics_.jobsRunning(), 1);
}

TEST_F(MetricsTest, PrometheusText) {
    metrics_.jobFinished(Status::Success, 12.0);
    metrics_.phaseFinished("Mask Attack", 7.0, 10000000);
    metrics_.queueDepth(Priority::High, 3);

    const std::string text = metrics_.renderPrometheus();
    EXPECT_TRUE(contains(text, "# TYPE hash_breaker_jobs_total counter"));
    EXPECT_TRUE(contains(text, "hash_breaker_jobs_total{status=\"SUCCESS\"} 1"));
    EXPECT_TRUE(contains(text, "hash_breaker_guesses_total{phase=\"Mask Attack\"} 10000000"));
    EXPECT_TRUE(contains(text, "hash_breaker_queue_depth{priority=\"HIGH\"} 3"));
    EXPECT_TRUE(contains(text, "hash_breaker_queue_depth{priority=\"LOW\"} 0"));
    EXPECT_TRUE(contains(text, "hash_breaker_jobs_running 0"));

    // 12s lands in the 30s bucket and above, not in 10s.
    EXPECT_TRUE(contains(text, "hash_breaker_job_duration_seconds_bucket{status=\"SUCCESS\",le=\"10\"} 0"));
    EXPECT_TRUE(contains(text, "hash_breaker_job_duration_seconds_bucket{status=\"SUCCESS\",le=\"30\"} 1"));
    EXPECT_TRUE(contains(text, "hash_breaker_job_duration_seconds_bucket{status=\"SUCCESS\",le=\"+Inf\"} 1"));
    EXPECT_TRUE(contains(text, "hash_breaker_job_duration_seconds_count{status=\"SUCCESS\"} 1"));
    EXPECT_TRUE(contains(text, "hash_breaker_phase_duration_seconds_bucket{phase=\"Mask Attack\",le=\"10\"} 1"));
}

TEST_F(MetricsTest, WritesFile) {
    TempDir dir;
    metrics_.jobFinished(Status::Cancelled, 0.0);
    ASSERT_TRUE(metrics_.writeTo(dir.path() / "metrics.prom"));
    EXPECT_EQ(readFile(dir.path() / "metrics.prom"), metrics_.renderPrometheus());
}

}
