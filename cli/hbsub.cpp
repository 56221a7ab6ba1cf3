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
#include <cstdlib>
#include <iostream>
#include <string>

using namespace hashbreaker;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "hashbreaker submission tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> <hash> [-m <mode>] [-t <seconds>] [-p <priority>]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Daemon workspace directory\n";
    std::cout << "  hash          Hex digest to audit\n\n";
    std::cout << "Options:\n";
    std::cout << "  -m, --mode      Hash mode (0 MD5, 100 SHA1, 1400 SHA256, 1800 SHA512, 1000 NTLM)\n";
    std::cout << "  -t, --timeout   Total time budget in seconds\n";
    std::cout << "  -p, --priority  low | normal | high\n";
    std::cout << "  -h, --help      Show this help message\n";
    std::cout << "  -v, --version   Show version\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace 5d41402abc4b2a76b9719d911017c592\n";
    std::cout << "  " << progName << " ./workspace <sha256> -m 1400 -t 300 -p high\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; HASHBREAKER_LOG_LEVEL overrides
    if (!std::getenv("HASHBREAKER_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    Settings settings = Settings::fromEnv();
    settings.workspace = argv[1];

    SubmitRequest request;
    request.hash = argv[2];

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value\n";
            return 1;
        }
        std::string value = argv[++i];
        try {
            if (arg == "-m" || arg == "--mode") {
                request.hashTypeId = std::stoi(value);
            } else if (arg == "-t" || arg == "--timeout") {
                request.timeoutSeconds = std::stoi(value);
            } else if (arg == "-p" || arg == "--priority") {
                auto priority = parsePriority(value);
                if (!priority) {
                    std::cerr << "Error: Unknown priority: " << value << "\n";
                    return 1;
                }
                request.priority = *priority;
            } else {
                std::cerr << "Error: Unknown argument: " << arg << "\n";
                return 1;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid number for " << arg << ": " << value << "\n";
            return 1;
        }
    }

    try {
        QueueDir queue(settings.workspace);
        if (!queue.create()) {
            std::cerr << "Error: Cannot prepare workspace " << settings.workspace.string() << "\n";
            return 1;
        }
        FileJobStore store(settings.workspace, std::chrono::seconds(settings.jobTtlSeconds));
        Service service(settings, store, [&queue](const JobMessage& m) { return queue.publish(m); });

        ApiResult result = service.submit(request);
        if (result) {
            // Just the job ID - clean for piping
            std::cout << result.job->id << std::endl;
            return 0;
        }
        std::cerr << "Error (" << result.code() << "): " << result.message << std::endl;
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
