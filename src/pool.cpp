/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/pool.hpp"
#include "negsim/logger.hpp"

namespace negsim {

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start() {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        LOG_DEBUG("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    taskAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();
    LOG_DEBUG("Pool stopped");
}

bool Pool::submit(const std::string& name, Task task) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_WARN("Cannot submit task to stopped pool: " + name);
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            taskQueue_.push({name, std::move(task)});
        }
        taskAvailable_.notify_one();
        LOG_TRACE("Task queued: " + name);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue task " + name + ": " + e.what());
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return taskQueue_.size();
}

void Pool::workerLoop(int workerId) {
    setThreadName("Hook-" + std::to_string(workerId));

    while (true) {
        Named next;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            taskAvailable_.wait(lock, [this] {
                return !taskQueue_.empty() || shutdown_.load();
            });

            // Drain what was accepted before shutdown
            if (taskQueue_.empty()) {
                break;
            }
            next = std::move(taskQueue_.front());
            taskQueue_.pop();
        }

        try {
            if (next.task) next.task();
        } catch (const std::exception& e) {
            LOG_ERROR("Task " + next.name + " failed: " + e.what());
        } catch (...) {
            LOG_ERROR("Task " + next.name + " failed with unknown error");
        }
    }

    LOG_DEBUG("Hook-" + std::to_string(workerId) + " stopped");
    clearThreadName();
}

}
