/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/generator.hpp"
#include "hashbreaker/llama_generator.hpp"
#include "hashbreaker/logger.hpp"
#include "hashbreaker/server.hpp"
#include "hashbreaker/settings.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <thread>
#include <signal.h>
#include <unistd.h>

using namespace hashbreaker;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

std::optional<pid_t> readPidFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

void printUsage(const char* progName) {
    std::cout << "hashbreaker daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> [--model <gguf>] [-w <workers>]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory holding the queue, job records and metrics\n\n";
    std::cout << "Options:\n";
    std::cout << "  --model <path>  Candidate model for phase 3 (pattern generator otherwise)\n";
    std::cout << "  -w, --workers   Number of worker threads\n";
    std::cout << "  -h, --help      Show this help message\n";
    std::cout << "  -v, --version   Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  HASHBREAKER_LOG_LEVEL      Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  HASHBREAKER_HASHCAT_PATH   Cracking tool binary\n";
    std::cout << "  HASHBREAKER_WORDLISTS_DIR  Wordlist directory\n";
    std::cout << "  HASHBREAKER_MODEL          Candidate model (same as --model)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace\n";
    std::cout << "  " << progName << " ./workspace --model models/passgpt.gguf -w 8\n";
}

int main(int argc, char* argv[]) {
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

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    Logger::initFromEnv();

    Settings settings = Settings::fromEnv();
    settings.workspace = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-w" || arg == "--workers") && i + 1 < argc) {
            try {
                settings.workers = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid worker count\n";
                return 1;
            }
        } else if (arg == "--model" && i + 1 < argc) {
            settings.modelPath = argv[++i];
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    std::filesystem::path pidPath = settings.workspace / ".hbd.pid";
    if (auto pid = readPidFile(pidPath); pid && isProcessAlive(*pid)) {
        std::cerr << "Error: Daemon already running on " << settings.workspace.string()
                  << " (pid " << *pid << ")\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::unique_ptr<CandidateGenerator> generator;
    if (!settings.modelPath.empty()) {
        try {
            generator = std::make_unique<LlamaGenerator>(settings.modelPath,
                                                         settings.generatorTemperature,
                                                         settings.generatorTopK);
        } catch (const std::exception& e) {
            LOG_WARN(std::string(e.what()) + " - using pattern candidates");
        }
    }
    if (!generator) {
        generator = std::make_unique<PatternGenerator>();
    }

    try {
        Server server(settings, std::move(generator));

        if (!server.start()) {
            std::cerr << "Failed to start\n";
            return 1;
        }

        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        std::cout << "hbd " << VERSION << " running\n";
        std::cout << "  Workspace  " << settings.workspace.string() << "\n";
        std::cout << "  Workers    " << settings.workers << "\n";
        std::cout << "  Submit:    hbsub " << settings.workspace.string() << " <hash>\n";
        std::cout << std::flush;

        while (!g_shutdown_requested && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Shutdown requested, stopping server...");
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        server.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("hashbreaker daemon stopped");
    return 0;
}
