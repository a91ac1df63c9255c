/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "negsim/types.hpp"

namespace negsim {

class Engine;
class Executor;
class Reaper;
class Store;

struct SchedulerStatus {
    bool tickerRunning = false;
    std::size_t activeQueues = 0;
    std::vector<QueueId> processing;
};

// Single ticker that reaps stale runs and gives every pending or running
// queue exactly one drain thread. Note: signal handling is left to negsimd.
class Scheduler final {
public:
    Scheduler(Store& store, Executor& executor, Reaper* reaper, Engine* engine,
              std::chrono::milliseconds tickInterval, std::chrono::milliseconds runDelay);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    [[nodiscard]] bool start();

    // Stops the ticker, cancels in-flight engine runs and joins every drain thread.
    void shutdown() noexcept;

    // One discovery pass: reap, cancel engine calls whose run was stopped
    // elsewhere, then launch drains for active queues.
    void tick();

    // Launches a drain loop now. Returns false when one is already active.
    bool kick(const QueueId& queueId);

    [[nodiscard]] std::vector<QueueId> processing() const;
    [[nodiscard]] SchedulerStatus systemStatus() const;
    [[nodiscard]] bool isProcessing(const QueueId& queueId) const;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // Debug aid: forgets every queue in the processing set. Threads already
    // running keep running.
    void resetProcessing();

    // Blocks until no drain loop is active or the timeout elapses.
    bool waitIdle(std::chrono::milliseconds timeout) const;

private:
    struct Drain {
        QueueId queueId;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void tickLoop();
    void drainLoop(const QueueId& queueId, std::shared_ptr<std::atomic<bool>> done);
    void joinFinished();
    void cancelAbandoned();
    void sleepFor(std::chrono::milliseconds duration) const;

    Store& store_;
    Executor& executor_;
    Reaper* reaper_;
    Engine* engine_;
    std::chrono::milliseconds tickInterval_;
    std::chrono::milliseconds runDelay_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex mutex_;
    std::unordered_set<QueueId> processing_;
    std::vector<Drain> drains_;

    std::thread tickerThread_;
};

}
