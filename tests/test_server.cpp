/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <thread>

#include "fake_engine.hpp"
#include "hashbreaker/generator.hpp"
#include "hashbreaker/job_store.hpp"
#include "hashbreaker/metrics.hpp"
#include "hashbreaker/queue.hpp"
#include "hashbreaker/server.hpp"
#include "hashbreaker/service.hpp"
#include "test_support.hpp"

namespace hashbreaker::tests {

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.workspace = dir_.path() / "ws";
        settings_.wordlistsDir = dir_.path() / "wordlists";
        settings_.workers = 2;
    }

    std::optional<Job> waitTerminal(Service& service, const JobId& id) {
        auto giveUp = std::chrono::steady_clock::now() + std::chrono::seconds(15);
        while (std::chrono::steady_clock::now() < giveUp) {
            ApiResult r = service.status(id);
            if (r && isTerminal(r.job->status)) {
                return r.job;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return std::nullopt;
    }

    TempDir dir_;
    Settings settings_;
};

TEST_F(ServerTest, SubmittedJobIsCrackedAndAcknowledged) {
    auto engine = std::make_unique<FakeEngine>();
    engine->push(FakeEngine::cracked("hello"));

    Server server(settings_, std::make_unique<PatternGenerator>(7), std::move(engine));
    ASSERT_TRUE(server.start());
    EXPECT_TRUE(server.isRunning());

    SubmitRequest request;
    request.hash = "5d41402abc4b2a76b9719d911017c592";
    ApiResult submitted = server.service().submit(request);
    ASSERT_TRUE(submitted);

    auto final = waitTerminal(server.service(), submitted.job->id);
    ASSERT_TRUE(final.has_value());
    EXPECT_EQ(final->status, Status::Success);
    EXPECT_EQ(final->result.value(), "hello");
    EXPECT_EQ(final->crackedInPhase.value(), 1);

    // The acknowledged message leaves the lane directory.
    auto lane = settings_.workspace / "queue" / "normal";
    auto giveUp = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!std::filesystem::is_empty(lane) && std::chrono::steady_clock::now() < giveUp) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    EXPECT_TRUE(std::filesystem::is_empty(lane));
    EXPECT_EQ(server.metrics().jobsTotal(Status::Success), 1u);

    server.shutdown();
    EXPECT_FALSE(server.isRunning());
    EXPECT_TRUE(std::filesystem::exists(settings_.workspace / "metrics.prom"));
}

TEST_F(ServerTest, AllPhasesMissFails) {
    settings_.generatorTotal = 100;
    settings_.generatorBatch = 50;
    Server server(settings_, std::make_unique<PatternGenerator>(7), std::make_unique<FakeEngine>());
    ASSERT_TRUE(server.start());

    SubmitRequest request;
    request.hash = "00000000000000000000000000000000";
    request.priority = Priority::Low;
    ApiResult submitted = server.service().submit(request);
    ASSERT_TRUE(submitted);

    auto final = waitTerminal(server.service(), submitted.job->id);
    ASSERT_TRUE(final.has_value());
    EXPECT_EQ(final->status, Status::Failed);
    EXPECT_EQ(final->lastPhase.value(), 4);
    EXPECT_EQ(final->attempts.value(),
              settings_.quickDictionaryEstimate + settings_.ruleBasedEstimate + 100 + settings_.maskEstimate);
}

TEST_F(ServerTest, InvalidSettingsRefuseToStart) {
    settings_.ratios.mask = 0.9;
    Server server(settings_, nullptr, std::make_unique<FakeEngine>());
    EXPECT_FALSE(server.start());
    EXPECT_FALSE(server.isRunning());
}

TEST_F(ServerTest, QueuedMessagesSurviveRestart) {
    JobId id;
    {
        // Published while no daemon is running.
        QueueDir queue(settings_.workspace);
        ASSERT_TRUE(queue.create());
        FileJobStore store(settings_.workspace);
        Service service(settings_, store, [&queue](const JobMessage& m) { return queue.publish(m); });
        SubmitRequest request;
        request.hash = "5d41402abc4b2a76b9719d911017c592";
        ApiResult submitted = service.submit(request);
        ASSERT_TRUE(submitted);
        id = submitted.job->id;
    }
    ASSERT_TRUE(std::filesystem::exists(settings_.workspace / "queue" / "normal" / (id + ".msg")));

    auto engine = std::make_unique<FakeEngine>();
    engine->push(FakeEngine::cracked("hello"));
    Server server(settings_, std::make_unique<PatternGenerator>(7), std::move(engine));
    ASSERT_TRUE(server.start());

    auto final = waitTerminal(server.service(), id);
    ASSERT_TRUE(final.has_value());
    EXPECT_EQ(final->status, Status::Success);
}

}
