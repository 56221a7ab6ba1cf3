/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "hashbreaker/errors.hpp"
#include "hashbreaker/job_store.hpp"
#include "test_support.hpp"

namespace hashbreaker::tests {

namespace {
Job makeJob(const JobId& id) {
    Job job;
    job.id = id;
    job.status = Status::Pending;
    job.submittedAt = Clock::now();
    job.timeoutSeconds = 60;
    job.timeRemaining = 60;
    return job;
}
}

class MemoryJobStoreTest : public ::testing::Test {
protected:
    std::chrono::steady_clock::time_point now_ = std::chrono::steady_clock::now();
    MemoryJobStore store_{std::chrono::seconds(100), [this] { return now_; }};
};

TEST_F(MemoryJobStoreTest, SetThenGet) {
    store_.set("job1", makeJob("job1"), std::chrono::seconds(100));
    auto job = store_.get("job1");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->id, "job1");
    EXPECT_FALSE(store_.get("other").has_value());
}

TEST_F(MemoryJobStoreTest, RecordExpiresAfterTtl) {
    store_.set("job1", makeJob("job1"), std::chrono::seconds(10));
    now_ += std::chrono::seconds(9);
    EXPECT_TRUE(store_.get("job1").has_value());
    now_ += std::chrono::seconds(1);
    EXPECT_FALSE(store_.get("job1").has_value());
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(MemoryJobStoreTest, UpdateMergesAndRefreshesTtl) {
    store_.set("job1", makeJob("job1"), std::chrono::seconds(10));
    now_ += std::chrono::seconds(5);

    JobPatch patch;
    patch.status = Status::Running;
    patch.progress = 35;
    EXPECT_TRUE(store_.update("job1", patch));

    // The update re-armed the default TTL of 100 seconds.
    now_ += std::chrono::seconds(50);
    auto job = store_.get("job1");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, Status::Running);
    EXPECT_EQ(job->progress, 35);
    EXPECT_EQ(job->version, 1u);
}

TEST_F(MemoryJobStoreTest, UpdateOfMissingRecordFails) {
    JobPatch patch;
    patch.progress = 10;
    EXPECT_FALSE(store_.update("ghost", patch));
}

class FileJobStoreTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(FileJobStoreTest, PersistsAcrossInstances) {
    {
        FileJobStore store(dir_.path());
        store.set("job1", makeJob("job1"), store.defaultTtl());
    }
    FileJobStore reopened(dir_.path());
    auto job = reopened.get("job1");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, Status::Pending);
    EXPECT_TRUE(std::filesystem::exists(dir_.path() / "jobs" / "job1.job"));
}

TEST_F(FileJobStoreTest, UpdateWritesMergedRecord) {
    FileJobStore store(dir_.path());
    store.set("job1", makeJob("job1"), store.defaultTtl());

    JobPatch patch;
    patch.status = Status::Cancelled;
    patch.reason = "User requested cancellation";
    EXPECT_TRUE(store.update("job1", patch));

    auto job = store.get("job1");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, Status::Cancelled);
    EXPECT_EQ(job->reason.value(), "User requested cancellation");
    EXPECT_FALSE(store.update("missing", patch));
}

TEST_F(FileJobStoreTest, ExpiredRecordsDisappear) {
    FileJobStore store(dir_.path());
    store.set("old", makeJob("old"), std::chrono::seconds(0));
    store.set("fresh", makeJob("fresh"), std::chrono::seconds(3600));

    EXPECT_EQ(store.purgeExpired(), 1u);
    EXPECT_FALSE(store.get("old").has_value());
    EXPECT_TRUE(store.get("fresh").has_value());
}

TEST_F(FileJobStoreTest, RejectsUnsafeIds) {
    FileJobStore store(dir_.path());
    EXPECT_FALSE(store.get("../escape").has_value());
    EXPECT_THROW(store.set("../escape", makeJob("../escape"), store.defaultTtl()), StoreError);
}

TEST_F(FileJobStoreTest, PingReportsWritableDirectory) {
    FileJobStore store(dir_.path());
    EXPECT_TRUE(store.ping());
}

}
