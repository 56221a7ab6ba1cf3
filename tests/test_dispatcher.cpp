/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <stdexcept>
#include <thread>

#include "hashbreaker/dispatcher.hpp"

namespace hashbreaker::tests {

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.workers = 1;
        settings_.maxDeliveries = 3;
    }

    static JobMessage message(const std::string& id, Priority priority) {
        JobMessage m;
        m.jobId = id;
        m.targetHash = "5d41402abc4b2a76b9719d911017c592";
        m.timeoutSeconds = 60;
        m.priority = priority;
        return m;
    }

    void recordAcks(Dispatcher& dispatcher) {
        dispatcher.onAcknowledge([this](const JobMessage& m) {
            std::lock_guard<std::mutex> lock(mutex_);
            acked_.push_back(m.jobId);
        });
        dispatcher.onExhausted([this](const JobMessage& m, const std::string& error) {
            std::lock_guard<std::mutex> lock(mutex_);
            exhausted_.push_back(m.jobId + ":" + error);
        });
    }

    std::vector<std::string> processed() {
        std::lock_guard<std::mutex> lock(mutex_);
        return processed_;
    }

    Settings settings_;
    std::mutex mutex_;
    std::vector<std::string> processed_;
    std::vector<std::string> acked_;
    std::vector<std::string> exhausted_;
};

TEST_F(DispatcherTest, HighPriorityServedFirst) {
    Dispatcher dispatcher(settings_);
    recordAcks(dispatcher);
    ASSERT_TRUE(dispatcher.submit(message("low1", Priority::Low)));
    ASSERT_TRUE(dispatcher.submit(message("normal1", Priority::Normal)));
    ASSERT_TRUE(dispatcher.submit(message("high1", Priority::High)));
    ASSERT_TRUE(dispatcher.submit(message("high2", Priority::High)));
    EXPECT_EQ(dispatcher.queueSize(), 4u);
    EXPECT_EQ(dispatcher.queueSize(Priority::High), 2u);

    ASSERT_TRUE(dispatcher.start([this](const JobMessage& m, const CancelToken&, int) {
        std::lock_guard<std::mutex> lock(mutex_);
        processed_.push_back(m.jobId);
    }));
    ASSERT_TRUE(dispatcher.waitIdle(std::chrono::seconds(5)));
    dispatcher.stop();

    EXPECT_EQ(processed(), std::vector<std::string>({"high1", "normal1", "low1", "high2"}));
    EXPECT_EQ(acked_.size(), 4u);
    EXPECT_TRUE(exhausted_.empty());
}

TEST_F(DispatcherTest, WeightedRoundRobin) {
    Dispatcher dispatcher(settings_);
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(dispatcher.submit(message("h" + std::to_string(i), Priority::High)));
        ASSERT_TRUE(dispatcher.submit(message("n" + std::to_string(i), Priority::Normal)));
        ASSERT_TRUE(dispatcher.submit(message("l" + std::to_string(i), Priority::Low)));
    }
    ASSERT_TRUE(dispatcher.start([this](const JobMessage& m, const CancelToken&, int) {
        std::lock_guard<std::mutex> lock(mutex_);
        processed_.push_back(m.jobId);
    }));
    ASSERT_TRUE(dispatcher.waitIdle(std::chrono::seconds(5)));
    dispatcher.stop();

    auto order = processed();
    ASSERT_EQ(order.size(), 30u);
    int high = 0, normal = 0, low = 0;
    for (std::size_t i = 0; i < 10; ++i) {
        switch (order[i][0]) {
            case 'h': ++high; break;
            case 'n': ++normal; break;
            default: ++low; break;
        }
    }
    EXPECT_EQ(high, 6);
    EXPECT_EQ(normal, 3);
    EXPECT_EQ(low, 1);
}

TEST_F(DispatcherTest, FailingJobIsRetriedThenExhausted) {
    Dispatcher dispatcher(settings_);
    recordAcks(dispatcher);
    std::atomic<int> attempts{0};
    ASSERT_TRUE(dispatcher.submit(message("bad", Priority::Normal)));
    ASSERT_TRUE(dispatcher.start([&attempts](const JobMessage& m, const CancelToken&, int) {
        EXPECT_EQ(m.deliveries, attempts.load() + 1);
        ++attempts;
        throw std::runtime_error("store unavailable");
    }));
    ASSERT_TRUE(dispatcher.waitIdle(std::chrono::seconds(5)));
    dispatcher.stop();

    EXPECT_EQ(attempts.load(), 3);
    ASSERT_EQ(exhausted_.size(), 1u);
    EXPECT_EQ(exhausted_[0], "bad:store unavailable");
    EXPECT_EQ(acked_, std::vector<std::string>({"bad"}));
}

TEST_F(DispatcherTest, TransientFailureRecovers) {
    Dispatcher dispatcher(settings_);
    recordAcks(dispatcher);
    std::atomic<int> attempts{0};
    ASSERT_TRUE(dispatcher.submit(message("flaky", Priority::High)));
    ASSERT_TRUE(dispatcher.start([&attempts](const JobMessage&, const CancelToken&, int) {
        if (++attempts == 1) {
            throw std::runtime_error("transient");
        }
    }));
    ASSERT_TRUE(dispatcher.waitIdle(std::chrono::seconds(5)));
    dispatcher.stop();

    EXPECT_EQ(attempts.load(), 2);
    EXPECT_TRUE(exhausted_.empty());
    EXPECT_EQ(acked_.size(), 1u);
}

TEST_F(DispatcherTest, TimeLimitFiresKillToken) {
    settings_.high.timeLimitSeconds = 1;
    settings_.maxDeliveries = 1;
    Dispatcher dispatcher(settings_);
    recordAcks(dispatcher);
    std::atomic<bool> sawKill{false};

    ASSERT_TRUE(dispatcher.submit(message("slow", Priority::High)));
    ASSERT_TRUE(dispatcher.start([&sawKill](const JobMessage&, const CancelToken& kill, int) {
        auto giveUp = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!kill.cancelled() && std::chrono::steady_clock::now() < giveUp) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        sawKill = kill.cancelled();
        throw std::runtime_error("time limit exceeded");
    }));
    ASSERT_TRUE(dispatcher.waitIdle(std::chrono::seconds(8)));
    dispatcher.stop();

    EXPECT_TRUE(sawKill.load());
    EXPECT_EQ(exhausted_.size(), 1u);
}

TEST_F(DispatcherTest, SubmitAfterStopIsRejected) {
    Dispatcher dispatcher(settings_);
    ASSERT_TRUE(dispatcher.start([](const JobMessage&, const CancelToken&, int) {}));
    EXPECT_TRUE(dispatcher.isRunning());
    dispatcher.stop();
    EXPECT_FALSE(dispatcher.isRunning());
    EXPECT_FALSE(dispatcher.submit(message("late", Priority::Low)));
}

TEST_F(DispatcherTest, WorkersShareTheLoad) {
    settings_.workers = 4;
    Dispatcher dispatcher(settings_);
    std::mutex seenMutex;
    std::set<int> workers;
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(dispatcher.submit(message("job" + std::to_string(i), Priority::Normal)));
    }
    ASSERT_TRUE(dispatcher.start([&](const JobMessage&, const CancelToken&, int workerId) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        std::lock_guard<std::mutex> lock(seenMutex);
        workers.insert(workerId);
    }));
    ASSERT_TRUE(dispatcher.waitIdle(std::chrono::seconds(5)));
    dispatcher.stop();
    EXPECT_EQ(dispatcher.workerCount(), 4);
    EXPECT_GT(workers.size(), 1u);
}

}
