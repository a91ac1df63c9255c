/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "negsim/config.hpp"
#include "negsim/engine.hpp"
#include "negsim/hooks.hpp"
#include "negsim/progress.hpp"
#include "negsim/types.hpp"

namespace negsim {

class Broadcaster;
class Pool;
class Store;

// Owns the lifecycle of one run at a time for a queue: claim, dispatch,
// classify, persist, broadcast.
class Executor {
public:
    Executor(Store& store, Engine& engine, Broadcaster* events, Pool* pool,
             const Config& config, Hooks hooks = {});

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;
    Executor(Executor&&) = delete;
    Executor& operator=(Executor&&) = delete;

    // Runs the next pending run of the queue to completion.
    // Returns false once the drain loop should stop: the queue is missing,
    // not pending/running, or has nothing left (it is then marked completed).
    // Returns true after a commit, a fault, a discarded late result, or when
    // another run of the queue is still running.
    [[nodiscard]] bool executeNext(const QueueId& queueId);

    [[nodiscard]] Progress& progress() noexcept { return progress_; }

private:
    bool commit(const Queue& queue, const Run& run, const EngineResult& result);
    bool handleFault(const Queue& queue, const Run& run, const std::string& reason);
    // A cancelled call is not an engine fault: a still-running row goes back
    // to pending without spending a retry.
    bool release(const Queue& queue, const Run& run);
    void onRound(const Run& run, const RoundUpdate& update) noexcept;

    void fireEvaluation(const Run& run, Outcome outcome);
    void fireQueueCompleted(const QueueId& queueId);
    void dispatch(const std::string& name, std::function<void()> task);

    Store& store_;
    Engine& engine_;
    Broadcaster* events_;
    Pool* pool_;
    Config config_;
    Hooks hooks_;
    Progress progress_;
};

}
