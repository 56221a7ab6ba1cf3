/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/job_store.hpp"
#include "hashbreaker/logger.hpp"
#include "hashbreaker/queue.hpp"
#include "hashbreaker/service.hpp"
#include "hashbreaker/settings.hpp"
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace hashbreaker;

void printUsage(const char* progName) {
    std::cout << "hashbreaker query tool\n\n";
    std::cout << "Usage: " << progName << " <workspace> <job_id> [--wait] [--cancel]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Daemon workspace directory\n";
    std::cout << "  job_id        Id printed by hbsub (read from stdin when omitted)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait    Block until the job reaches a terminal state\n";
    std::cout << "  -c, --cancel  Request cancellation\n\n";
    std::cout << "Exit codes: 0 success, 1 error or failed, 2 not finished, 3 cancelled\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace 1731808123456789_12345_0\n";
    std::cout << "  hbsub ./workspace <hash> | " << progName << " ./workspace --wait\n";
}

void printJob(const Job& job) {
    std::cout << "id:          " << job.id << "\n";
    std::cout << "status:      " << toString(job.status) << "\n";
    std::cout << "priority:    " << toString(job.priority) << "\n";
    std::cout << "progress:    " << job.progress << "%\n";
    if (job.currentPhase) std::cout << "phase:       " << *job.currentPhase << "\n";
    std::cout << "elapsed:     " << job.timeElapsed << "s\n";
    std::cout << "remaining:   " << job.timeRemaining << "s\n";
    if (job.result) std::cout << "result:      " << *job.result << "\n";
    if (job.crackedInPhase) std::cout << "cracked in:  phase " << *job.crackedInPhase << "\n";
    if (job.attempts) std::cout << "attempts:    " << *job.attempts << "\n";
    if (job.reason) std::cout << "reason:      " << *job.reason << "\n";
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    Logger::setLevel(LogLevel::WARN);

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }
    std::string first = argv[1];
    if (first == "-h" || first == "--help") {
        printUsage(argv[0]);
        return 0;
    }

    Settings settings = Settings::fromEnv();
    settings.workspace = argv[1];
    std::string jobId;
    bool wait = false;
    bool cancel = false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else if (arg == "-c" || arg == "--cancel") {
            cancel = true;
        } else {
            jobId = arg;
        }
    }

    // Piped id from hbsub
    if (jobId.empty() && !isatty(fileno(stdin))) {
        std::cin >> jobId;
    }
    if (jobId.empty()) {
        std::cerr << "Error: No job id given\n";
        return 1;
    }

    try {
        FileJobStore store(settings.workspace, std::chrono::seconds(settings.jobTtlSeconds));
        QueueDir queue(settings.workspace);
        Service service(settings, store, [&queue](const JobMessage& m) { return queue.publish(m); });

        if (cancel) {
            ApiResult result = service.cancel(jobId);
            if (!result) {
                std::cerr << "Cannot cancel " << jobId << " (" << result.code() << "): " << result.message << std::endl;
                return 1;
            }
        }

        ApiResult result = service.status(jobId);
        while (wait && result && !isTerminal(result.job->status)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            result = service.status(jobId);
        }

        if (!result) {
            std::cerr << "Job not found: " << jobId << std::endl;
            return 1;
        }

        printJob(*result.job);
        switch (result.job->status) {
            case Status::Success: return 0;
            case Status::Failed: return 1;
            case Status::Cancelled: return 3;
            default: return 2;  // Different exit code for "not ready"
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
