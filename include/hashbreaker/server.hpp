/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>

#include "hashbreaker/cancel.hpp"
#include "hashbreaker/settings.hpp"

namespace hashbreaker {

class AttackExecutor;
class CandidateGenerator;
class Dispatcher;
class FileJobStore;
class Metrics;
class QueueDir;
class Scanner;
class Service;
struct JobMessage;

// Daemon: workspace queue intake, dispatcher, pipeline workers and metrics file.
class Server final {
public:
    Server(Settings settings, std::unique_ptr<CandidateGenerator> generator);
    // Injected engine, used by tests.
    Server(Settings settings, std::unique_ptr<CandidateGenerator> generator,
           std::unique_ptr<AttackExecutor> engine);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return settings_.workspace; }
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // Valid after start().
    [[nodiscard]] Service& service() noexcept { return *service_; }
    [[nodiscard]] Metrics& metrics() noexcept { return *metrics_; }

private:
    [[nodiscard]] bool createWorkspace() noexcept;
    void scanLoop();
    void processJob(const JobMessage& message, const CancelToken& kill, int workerId);
    void recordExhausted(const JobMessage& message, const std::string& error) noexcept;
    void publishMetrics() noexcept;

    Settings settings_;
    std::unique_ptr<CandidateGenerator> generator_;
    std::unique_ptr<AttackExecutor> engine_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    std::unique_ptr<FileJobStore> store_;
    std::unique_ptr<Metrics> metrics_;
    std::unique_ptr<QueueDir> queue_;
    std::unique_ptr<Scanner> scanner_;
    std::unique_ptr<Dispatcher> dispatcher_;
    std::unique_ptr<Service> service_;

    std::thread scannerThread_;
};

}
