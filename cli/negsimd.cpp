/*
 * negsim - Simulation queue daemon (negsimd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/config.hpp"
#include "negsim/engine.hpp"
#include "negsim/events.hpp"
#include "negsim/executor.hpp"
#include "negsim/hooks.hpp"
#include "negsim/journal.hpp"
#include "negsim/logger.hpp"
#include "negsim/pool.hpp"
#include "negsim/reaper.hpp"
#include "negsim/recovery.hpp"
#include "negsim/scheduler.hpp"
#include "negsim/store.hpp"
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

using namespace negsim;

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
    std::cout << "negsim Simulation Queue Daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Options:\n";
    std::cout << "  --engine <cmd>    Negotiation engine command (overrides NEGSIM_ENGINE_CMD)\n";
    std::cout << "  --eval <cmd>      Evaluation hook command (overrides NEGSIM_EVAL_CMD)\n";
    std::cout << "  --complete <cmd>  Queue completion hook command (overrides NEGSIM_COMPLETE_CMD)\n";
    std::cout << "  -h, --help        Show this help message\n";
    std::cout << "  -v, --version     Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  NEGSIM_LOG_LEVEL         Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  NEGSIM_TICK_MS           Scheduler tick interval (2000)\n";
    std::cout << "  NEGSIM_RUN_DELAY_MS      Delay between runs of one queue (1000)\n";
    std::cout << "  NEGSIM_STALE_SECONDS     Reaper timeout for running runs (600)\n";
    std::cout << "  NEGSIM_RECOVERY_SECONDS  Orphan threshold for recovery (300)\n";
    std::cout << "  NEGSIM_MAX_ROUNDS        Rounds passed to the engine (6)\n";
    std::cout << "  NEGSIM_MAX_RETRIES       Engine faults tolerated per run (3)\n";
    std::cout << "  NEGSIM_HOOK_WORKERS      Hook pool threads (2)\n";
    std::cout << "  NEGSIM_AUTO_RECOVER      Recover orphans at startup (1)\n";
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
    setThreadName("Main");

    std::filesystem::path workspace = argv[1];
    Config config = Config::fromEnv();

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--engine" && i + 1 < argc) {
            config.engineCommand = argv[++i];
        } else if (arg == "--eval" && i + 1 < argc) {
            config.evaluateCommand = argv[++i];
        } else if (arg == "--complete" && i + 1 < argc) {
            config.completeCommand = argv[++i];
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return 1;
        }
    }

    if (config.engineCommand.empty()) {
        std::cerr << "Error: No engine command (use --engine or NEGSIM_ENGINE_CMD)\n";
        return 1;
    }

    std::filesystem::path pidPath = workspace / ".negsimd.pid";
    if (auto pid = readPidFile(pidPath); pid && isProcessAlive(*pid)) {
        std::cerr << "Error: negsimd already running for " << workspace.string() << " (pid " << *pid << ")\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        Store store(workspace);
        store.initialize();

        Journal journal(workspace / "events.log");
        Broadcaster events;
        (void)journal.attach(events);

        Pool pool(static_cast<int>(config.hookWorkers));
        if (!pool.start()) {
            LOG_ERROR("Failed to start hook pool");
            return 1;
        }

        CommandEngine engine(config.engineCommand);
        Executor executor(store, engine, &events, &pool, config,
                          commandHooks(config.evaluateCommand, config.completeCommand));
        Reaper reaper(store, &events, config.staleThreshold, config.averageRunDuration);

        if (config.autoRecover) {
            Recovery recovery(store, config.recoveryThreshold);
            (void)recovery.recoverOnStartup(Clock::now());
        }

        Scheduler scheduler(store, executor, &reaper, &engine, config.tickInterval, config.runDelay);
        if (!scheduler.start()) {
            LOG_ERROR("Failed to start scheduler");
            pool.stop();
            return 1;
        }

        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        LOG_INFO("negsimd " + std::string(VERSION) + " running");
        LOG_INFO("Workspace: " + workspace.string());
        LOG_INFO("Engine: " + config.engineCommand);
        LOG_DEBUG("Tick: " + std::to_string(config.tickInterval.count()) + "ms, stale after " +
                  std::to_string(config.staleThreshold.count()) + "s, recovery after " +
                  std::to_string(config.recoveryThreshold.count()) + "s");

        while (!g_shutdown_requested && scheduler.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Shutdown requested, stopping scheduler...");
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        scheduler.shutdown();
        pool.stop();

    } catch (const std::exception& e) {
        LOG_ERROR("Daemon error: " + std::string(e.what()));
        std::error_code ec;
        std::filesystem::remove(pidPath, ec);
        return 1;
    }

    LOG_INFO("negsimd stopped");
    return 0;
}
