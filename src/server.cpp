/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/server.hpp"
#include "hashbreaker/dispatcher.hpp"
#include "hashbreaker/engine.hpp"
#include "hashbreaker/errors.hpp"
#include "hashbreaker/generator.hpp"
#include "hashbreaker/job_store.hpp"
#include "hashbreaker/logger.hpp"
#include "hashbreaker/metrics.hpp"
#include "hashbreaker/phases.hpp"
#include "hashbreaker/pipeline.hpp"
#include "hashbreaker/queue.hpp"
#include "hashbreaker/scanner.hpp"
#include "hashbreaker/service.hpp"
#include <chrono>
#include <cstdlib>
#include <iterator>
#include <thread>
#include <unordered_set>

namespace hashbreaker {

namespace {
constexpr auto kScanInterval = std::chrono::seconds(1);
constexpr int kPurgeEveryScans = 300;
}

Server::Server(Settings settings, std::unique_ptr<CandidateGenerator> generator)
    : Server(std::move(settings), std::move(generator), nullptr) {}

Server::Server(Settings settings, std::unique_ptr<CandidateGenerator> generator,
               std::unique_ptr<AttackExecutor> engine)
    : settings_(std::move(settings)), generator_(std::move(generator)), engine_(std::move(engine)) {
    if (!engine_) {
        engine_ = std::make_unique<HashcatEngine>(settings_);
    }
    LOG_DEBUG("Server created - workspace: " + settings_.workspace.string() +
              ", workers: " + std::to_string(settings_.workers));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting hashbreaker server...");

    auto problems = settings_.validate();
    if (!problems.empty()) {
        for (const auto& p : problems) {
            LOG_ERROR("Invalid configuration: " + p);
        }
        return false;
    }

    if (!createWorkspace()) {
        LOG_ERROR("Failed to create workspace");
        return false;
    }

    setThreadName("Main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("Workspace: " + settings_.workspace.string());
    LOG_DEBUG("Workers: " + std::to_string(settings_.workers));
    LOG_DEBUG("Cracking tool: " + settings_.hashcatPath);
    LOG_DEBUG("Wordlists: " + settings_.wordlistsDir.string());
    LOG_DEBUG("Log Level: " + std::string(std::getenv("HASHBREAKER_LOG_LEVEL") ? std::getenv("HASHBREAKER_LOG_LEVEL") : "INFO"));
    LOG_DEBUG("========================================");

    if (!std::filesystem::exists(settings_.quickWordlistPath())) {
        LOG_WARN("Quick wordlist missing: " + settings_.quickWordlistPath().string());
    }
    if (!generator_) {
        LOG_WARN("No candidate generator configured; phase 3 will be skipped");
    }

    try {
        store_ = std::make_unique<FileJobStore>(settings_.workspace,
                                                std::chrono::seconds(settings_.jobTtlSeconds));
        metrics_ = std::make_unique<Metrics>();
        queue_ = std::make_unique<QueueDir>(settings_.workspace);
        scanner_ = std::make_unique<Scanner>(settings_.workspace);
        dispatcher_ = std::make_unique<Dispatcher>(settings_);

        // In-process submissions go through the durable queue like the CLI's.
        service_ = std::make_unique<Service>(settings_, *store_, [this](const JobMessage& m) {
            return queue_->publish(m);
        });
        service_->setHealthProbes([this](Priority p) { return dispatcher_->queueSize(p); },
                                  dispatcher_->workerCount());

        dispatcher_->onAcknowledge([this](const JobMessage& m) {
            if (!queue_->remove(m)) {
                LOG_WARN("Acknowledged message already gone: " + m.jobId);
            }
        });
        dispatcher_->onExhausted([this](const JobMessage& m, const std::string& error) {
            recordExhausted(m, error);
        });

        if (!dispatcher_->start([this](const JobMessage& m, const CancelToken& kill, int workerId) {
            processJob(m, kill, workerId);
        })) {
            LOG_ERROR("Failed to start dispatcher");
            return false;
        }

        running_.store(true);
        shutdown_.store(false);

        // The first scan redelivers whatever a previous run left queued.
        scannerThread_ = std::thread(&Server::scanLoop, this);

        LOG_INFO("Server started");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        if (dispatcher_) {
            dispatcher_->stop();
        }
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down server...");

    shutdown_.store(true);
    running_.store(false);

    if (scannerThread_.joinable()) {
        scannerThread_.join();
    }
    if (dispatcher_) {
        dispatcher_->stop();
    }
    publishMetrics();

    service_.reset();
    dispatcher_.reset();
    scanner_.reset();
    queue_.reset();
    store_.reset();

    LOG_INFO("Server shutdown complete");
}

bool Server::createWorkspace() noexcept {
    try {
        std::filesystem::create_directories(settings_.workspace / "jobs");
        QueueDir queue(settings_.workspace);
        if (!queue.create()) {
            return false;
        }
        LOG_DEBUG("Workspace created: " + settings_.workspace.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

void Server::processJob(const JobMessage& message, const CancelToken& kill, int workerId) {
    const JobId id = message.jobId;
    PhaseContext ctx{
        settings_,
        *engine_,
        generator_.get(),
        [this, id]() {
            try {
                auto job = store_->get(id);
                return job && job->status == Status::Cancelled;
            } catch (const StoreError& e) {
                LOG_WARN("Cancellation check failed for " + id + ": " + e.what());
                return false;
            }
        },
        &kill,
    };

    Pipeline pipeline(settings_, *store_, *metrics_, makePhaseTable(ctx));
    Job final = pipeline.execute(message, &kill);

    LOG_INFO(getThreadName(workerId) + " finished job " + id + ": " + toString(final.status));
}

void Server::recordExhausted(const JobMessage& message, const std::string& error) noexcept {
    try {
        JobPatch patch;
        patch.status = Status::Failed;
        patch.reason = "Delivery attempts exhausted: " + error;
        patch.progress = 100;
        patch.timeRemaining = 0;
        if (!store_->update(message.jobId, patch)) {
            Job job = merge(jobFromMessage(message), patch);
            store_->set(message.jobId, job, store_->defaultTtl());
        }
        metrics_->jobFinished(Status::Failed, 0.0);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot record exhausted job " + message.jobId + ": " + e.what());
    }
}

void Server::publishMetrics() noexcept {
    if (!metrics_ || !dispatcher_) {
        return;
    }
    for (Priority p : {Priority::High, Priority::Normal, Priority::Low}) {
        metrics_->queueDepth(p, dispatcher_->queueSize(p));
    }
    if (!metrics_->writeTo(settings_.workspace / "metrics.prom")) {
        LOG_DEBUG("Metrics file not written");
    }
}

void Server::scanLoop() {
    setThreadName("Scanner");
    LOG_DEBUG("Scanner loop started");

    std::unordered_set<JobId> submittedJobs;
    int scans = 0;

    while (!shutdown_.load()) {
        try {
            auto messages = scanner_->scan();
            int newCount = 0;

            for (const auto& message : messages) {
                if (shutdown_.load()) break;
                if (submittedJobs.count(message.jobId) == 0) {
                    if (dispatcher_->submit(message)) {
                        submittedJobs.insert(message.jobId);
                        ++newCount;
                    }
                }
            }
            if (newCount > 0) {
                LOG_DEBUG("Dispatched " + std::to_string(newCount) + " new messages");
            }

            // Forget messages that were acknowledged and removed.
            std::unordered_set<JobId> present;
            for (const auto& message : messages) {
                present.insert(message.jobId);
            }
            for (auto it = submittedJobs.begin(); it != submittedJobs.end();) {
                it = present.count(*it) ? std::next(it) : submittedJobs.erase(it);
            }

            publishMetrics();
            if (++scans % kPurgeEveryScans == 0) {
                (void)store_->purgeExpired();
            }

            auto sleepEnd = std::chrono::steady_clock::now() + kScanInterval;
            while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Scanner loop error: " + std::string(e.what()));
            std::this_thread::sleep_for(kScanInterval);
        }
    }

    LOG_DEBUG("Scanner loop stopped");
    clearThreadName();
}

}
