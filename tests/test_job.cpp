/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "hashbreaker/job.hpp"

namespace hashbreaker::tests {

class JobTest : public ::testing::Test {
protected:
    void SetUp() override {
        job_.id = "1700000000000000_42_0";
        job_.status = Status::Pending;
        job_.submittedAt = Clock::now();
        job_.hashTypeId = hashmode::MD5;
        job_.timeoutSeconds = 60;
        job_.priority = Priority::High;
        job_.timeRemaining = 60;
    }

    Job job_;
};

TEST_F(JobTest, MergeAppliesFieldsAndBumpsVersion) {
    JobPatch patch;
    patch.status = Status::Running;
    patch.progress = 15;
    patch.currentPhase = "Phase 1: Quick Dictionary Attack";
    patch.phaseNumber = 1;

    Job next = merge(job_, patch);
    EXPECT_EQ(next.status, Status::Running);
    EXPECT_EQ(next.progress, 15);
    EXPECT_EQ(next.currentPhase.value(), "Phase 1: Quick Dictionary Attack");
    EXPECT_EQ(next.phaseNumber.value(), 1);
    EXPECT_EQ(next.version, job_.version + 1);
    EXPECT_EQ(next.id, job_.id);
}

TEST_F(JobTest, ProgressIsClamped) {
    JobPatch patch;
    patch.progress = 150;
    EXPECT_EQ(merge(job_, patch).progress, 100);
    patch.progress = -5;
    EXPECT_EQ(merge(job_, patch).progress, 0);
}

TEST_F(JobTest, StartedAtIsSetOnce) {
    TimePoint first = Clock::now();
    JobPatch patch;
    patch.startedAt = first;
    Job running = merge(job_, patch);

    patch.startedAt = first + std::chrono::seconds(30);
    Job again = merge(running, patch);
    EXPECT_EQ(again.startedAt.value(), first);
}

TEST_F(JobTest, PhaseNumberNeverDecreasesWhileRunning) {
    job_.status = Status::Running;
    job_.phaseNumber = 3;
    JobPatch patch;
    patch.phaseNumber = 2;
    EXPECT_EQ(merge(job_, patch).phaseNumber.value(), 3);
}

TEST_F(JobTest, TerminalRecordKeepsStatusAndOutcome) {
    job_.status = Status::Cancelled;
    job_.reason = "User requested cancellation";

    JobPatch patch;
    patch.status = Status::Success;
    patch.result = "hello";
    patch.reason = "Cancelled before processing";
    patch.attempts = 0;
    patch.timeRemaining = 12;

    Job next = merge(job_, patch);
    EXPECT_EQ(next.status, Status::Cancelled);
    EXPECT_EQ(next.reason.value(), "User requested cancellation");
    // Absent outcome fields may still be filled in.
    EXPECT_EQ(next.result.value(), "hello");
    EXPECT_EQ(next.attempts.value(), 0);
    EXPECT_EQ(next.timeRemaining, 0);
}

TEST_F(JobTest, TerminalTransitionZeroesRemainingTime) {
    JobPatch patch;
    patch.status = Status::Failed;
    patch.timeRemaining = 25;
    EXPECT_EQ(merge(job_, patch).timeRemaining, 0);
}

TEST_F(JobTest, DerivedTimesForRunningJob) {
    TimePoint now = Clock::now();
    job_.status = Status::Running;
    job_.startedAt = now - std::chrono::seconds(20);

    Job view = withDerivedTimes(job_, now);
    EXPECT_NEAR(view.timeElapsed, 20.0, 0.01);
    EXPECT_EQ(view.timeRemaining, 40);
}

TEST_F(JobTest, DerivedTimesNeverNegative) {
    TimePoint now = Clock::now();
    job_.status = Status::Running;
    job_.startedAt = now - std::chrono::seconds(90);
    EXPECT_EQ(withDerivedTimes(job_, now).timeRemaining, 0);
}

TEST_F(JobTest, CodecPreservesRecord) {
    job_.status = Status::Success;
    job_.startedAt = job_.submittedAt + std::chrono::milliseconds(1500);
    job_.progress = 100;
    job_.currentPhase = "Phase 2: Rule-Based Attack";
    job_.result = "p=ss%word\nwith=newline";
    job_.crackedInPhase = 2;
    job_.attempts = 5000000;
    job_.timeElapsed = 3.25;

    auto decoded = decodeJob(encodeJob(job_));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->id, job_.id);
    EXPECT_EQ(decoded->status, Status::Success);
    EXPECT_EQ(decoded->priority, Priority::High);
    EXPECT_EQ(decoded->result.value(), job_.result.value());
    EXPECT_EQ(decoded->crackedInPhase.value(), 2);
    EXPECT_EQ(decoded->attempts.value(), 5000000);
    EXPECT_FALSE(decoded->reason.has_value());
    EXPECT_EQ(formatTime(decoded->startedAt.value()), formatTime(job_.startedAt.value()));
}

TEST_F(JobTest, DecodeRejectsGarbage) {
    EXPECT_FALSE(decodeJob("this is not a record").has_value());
}

TEST(TimeFormatTest, RoundTripsMilliseconds) {
    auto parsed = parseTime("2025-01-31T12:00:00.250Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(formatTime(*parsed), "2025-01-31T12:00:00.250Z");
    EXPECT_FALSE(parseTime("yesterday").has_value());
}

TEST(TypesTest, StatusAndPriorityNames) {
    EXPECT_STREQ(toString(Status::Cancelled), "CANCELLED");
    EXPECT_EQ(parseStatus("running").value(), Status::Running);
    EXPECT_EQ(parsePriority("High").value(), Priority::High);
    EXPECT_FALSE(parsePriority("urgent").has_value());
    EXPECT_TRUE(isTerminal(Status::Failed));
    EXPECT_FALSE(isTerminal(Status::Running));
}

TEST(TypesTest, JobIdValidation) {
    EXPECT_TRUE(isValidJobId("1700000000000000_42_0"));
    EXPECT_FALSE(isValidJobId(""));
    EXPECT_FALSE(isValidJobId("../etc/passwd"));
    EXPECT_FALSE(isValidJobId(std::string(129, 'a')));
}

}
