/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/scheduler.hpp"
#include "negsim/engine.hpp"
#include "negsim/executor.hpp"
#include "negsim/logger.hpp"
#include "negsim/reaper.hpp"
#include "negsim/store.hpp"
#include <algorithm>
#include <iterator>

namespace negsim {

Scheduler::Scheduler(Store& store, Executor& executor, Reaper* reaper, Engine* engine,
                     std::chrono::milliseconds tickInterval, std::chrono::milliseconds runDelay)
    : store_(store), executor_(executor), reaper_(reaper), engine_(engine),
      tickInterval_(tickInterval), runDelay_(runDelay) {
    LOG_DEBUG("Scheduler created - tick: " + std::to_string(tickInterval.count()) + "ms, delay: " +
              std::to_string(runDelay.count()) + "ms");
}

Scheduler::~Scheduler() {
    shutdown();
}

bool Scheduler::start() {
    if (running_.load()) {
        LOG_WARN("Scheduler already running");
        return false;
    }

    shutdown_.store(false);
    running_.store(true);
    try {
        tickerThread_ = std::thread(&Scheduler::tickLoop, this);
    } catch (const std::exception& e) {
        running_.store(false);
        LOG_ERROR("Failed to start scheduler: " + std::string(e.what()));
        return false;
    }
    LOG_INFO("Scheduler started");
    return true;
}

void Scheduler::shutdown() noexcept {
    shutdown_.store(true);
    const bool wasRunning = running_.exchange(false);

    if (tickerThread_.joinable()) {
        tickerThread_.join();
    }

    std::vector<Drain> drains;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drains.swap(drains_);
    }
    if (!drains.empty()) {
        LOG_INFO("Waiting for " + std::to_string(drains.size()) + " drain loop(s)...");
        if (engine_) engine_->cancelAll();
    }
    for (auto& drain : drains) {
        if (drain.thread.joinable()) drain.thread.join();
    }

    if (wasRunning) {
        LOG_INFO("Scheduler shutdown complete");
    }
}

void Scheduler::tickLoop() {
    setThreadName("Scheduler");
    LOG_DEBUG("Ticker started");

    while (!shutdown_.load()) {
        try {
            tick();
        } catch (const std::exception& e) {
            LOG_ERROR("Scheduler tick error: " + std::string(e.what()));
        }
        sleepFor(tickInterval_);
    }

    LOG_DEBUG("Ticker stopped");
    clearThreadName();
}

void Scheduler::tick() {
    joinFinished();

    if (reaper_) {
        try {
            (void)reaper_->sweep(Clock::now());
        } catch (const std::exception& e) {
            LOG_ERROR("Reaper sweep failed: " + std::string(e.what()));
        }
    }

    cancelAbandoned();

    int launched = 0;
    for (const auto& queue : store_.queuesWithStatus({QueueStatus::Pending, QueueStatus::Running})) {
        if (shutdown_.load()) break;
        if (kick(queue.id)) ++launched;
    }

    if (launched > 0) {
        LOG_DEBUG("Launched " + std::to_string(launched) + " drain loop(s)");
    }
}

bool Scheduler::kick(const QueueId& queueId) {
    if (shutdown_.load()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!processing_.insert(queueId).second) {
        return false;
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    try {
        drains_.push_back(Drain{queueId, std::thread(&Scheduler::drainLoop, this, queueId, done), done});
    } catch (const std::exception& e) {
        processing_.erase(queueId);
        LOG_ERROR("Failed to launch drain loop for queue " + shortId(queueId) + ": " + e.what());
        return false;
    }
    LOG_INFO("Drain loop started for queue " + shortId(queueId));
    return true;
}

void Scheduler::drainLoop(const QueueId& queueId, std::shared_ptr<std::atomic<bool>> done) {
    setThreadName("Drain-" + shortId(queueId));

    int executed = 0;
    try {
        while (!shutdown_.load()) {
            if (!executor_.executeNext(queueId)) break;
            ++executed;
            sleepFor(runDelay_);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Drain loop for queue " + shortId(queueId) + " failed: " + e.what());
        try {
            (void)store_.setQueueStatus(queueId, QueueStatus::Failed, Clock::now());
            LOG_AUDIT("queue_failed", "queue=" + queueId + " error=" + std::string(e.what()));
        } catch (const std::exception& inner) {
            LOG_ERROR("Could not mark queue " + shortId(queueId) + " failed: " + inner.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        processing_.erase(queueId);
    }
    LOG_DEBUG("Drain loop for queue " + shortId(queueId) + " finished after " +
              std::to_string(executed) + " step(s)");
    clearThreadName();
    done->store(true);
}

void Scheduler::cancelAbandoned() {
    if (!engine_) {
        return;
    }
    for (const auto& active : engine_->active()) {
        try {
            auto run = store_.loadRun(active.queueId, active.runId);
            if (run && run->status == RunStatus::Running) continue;
            LOG_INFO("Run " + shortId(active.runId) + " is " + (run ? toString(run->status) : "gone") +
                     ", cancelling its engine call");
            LOG_AUDIT("run_cancelled", "run=" + active.runId + " queue=" + active.queueId);
            engine_->cancel(active.runId);
        } catch (const StoreError& e) {
            LOG_WARN("Cannot check in-flight run " + shortId(active.runId) + ": " + e.what());
        }
    }
}

void Scheduler::joinFinished() {
    std::vector<Drain> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto split = std::stable_partition(drains_.begin(), drains_.end(),
                                           [](const Drain& drain) { return !drain.done->load(); });
        std::move(split, drains_.end(), std::back_inserter(finished));
        drains_.erase(split, drains_.end());
    }
    for (auto& drain : finished) {
        if (drain.thread.joinable()) drain.thread.join();
    }
}

std::vector<QueueId> Scheduler::processing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<QueueId> ids(processing_.begin(), processing_.end());
    std::sort(ids.begin(), ids.end());
    return ids;
}

SchedulerStatus Scheduler::systemStatus() const {
    SchedulerStatus status;
    status.tickerRunning = running_.load();
    status.processing = processing();
    status.activeQueues = status.processing.size();
    return status;
}

bool Scheduler::isProcessing(const QueueId& queueId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processing_.count(queueId) > 0;
}

void Scheduler::resetProcessing() {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_WARN("Clearing processing set (" + std::to_string(processing_.size()) + " queue(s))");
    processing_.clear();
}

bool Scheduler::waitIdle(std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (processing_.empty()) return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return processing_.empty();
}

void Scheduler::sleepFor(std::chrono::milliseconds duration) const {
    const auto sleepEnd = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(sleepEnd - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(100)));
    }
}

}
