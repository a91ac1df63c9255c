/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/executor.hpp"
#include "negsim/events.hpp"
#include "negsim/logger.hpp"
#include "negsim/pool.hpp"
#include "negsim/results.hpp"
#include "negsim/store.hpp"

namespace negsim {

namespace {
std::string runFields(const Run& run) {
    return "run=" + run.id + " queue=" + run.queueId + " order=" + std::to_string(run.executionOrder);
}

std::string joinKeys(const std::vector<std::string>& keys) {
    std::string out;
    for (const auto& key : keys) {
        if (!out.empty()) out += ", ";
        out += key;
    }
    return out;
}
}

Executor::Executor(Store& store, Engine& engine, Broadcaster* events, Pool* pool,
                   const Config& config, Hooks hooks)
    : store_(store), engine_(engine), events_(events), pool_(pool), config_(config),
      hooks_(std::move(hooks)), progress_(store, events, config.averageRunDuration) {}

bool Executor::executeNext(const QueueId& queueId) {
    auto queue = store_.loadQueue(queueId);
    if (!queue) {
        LOG_WARN("Queue not found: " + queueId);
        return false;
    }
    if (queue->status != QueueStatus::Pending && queue->status != QueueStatus::Running) {
        LOG_DEBUG("Queue " + shortId(queueId) + " is " + toString(queue->status) + ", nothing to execute");
        return false;
    }

    Claim claim = store_.claimNext(queueId, Clock::now());
    switch (claim.status) {
        case ClaimStatus::Inactive:
            return false;
        case ClaimStatus::Busy:
            LOG_DEBUG("Queue " + shortId(queueId) + " still running run " +
                      (claim.run ? shortId(claim.run->id) : std::string("?")));
            return true;
        case ClaimStatus::Exhausted:
            store_.setQueueStatus(queueId, QueueStatus::Completed, Clock::now());
            (void)store_.refreshRollups(queueId);
            LOG_INFO("Queue " + shortId(queueId) + " has no pending runs, marked completed");
            return false;
        case ClaimStatus::Claimed:
            break;
    }

    const Run run = *claim.run;
    LOG_INFO("Starting run " + std::to_string(run.executionOrder) + "/" +
             std::to_string(queue->totalSimulations) + " of queue " + shortId(queueId) + ": " +
             run.techniqueId + " / " + run.tacticId + " / " + run.personalityId + " / " + run.distance);
    LOG_AUDIT("run_claimed", runFields(run));

    if (events_) {
        Record payload;
        payload.set("run", run.id);
        payload.set("order", static_cast<std::int64_t>(run.executionOrder));
        payload.set("technique", run.techniqueId);
        payload.set("tactic", run.tacticId);
        payload.set("personality", run.personalityId);
        payload.set("distance", run.distance);
        events_->publish(EventType::SimulationStarted, queueId, run.negotiationId, payload);
    }

    EngineRequest request;
    request.negotiationId = run.negotiationId;
    request.runId = run.id;
    request.techniqueId = run.techniqueId;
    request.tacticId = run.tacticId;
    request.personalityId = run.personalityId;
    request.distance = run.distance;
    request.maxRounds = config_.maxRounds;
    request.queueId = queueId;

    EngineResult result;
    std::string fault;
    try {
        result = engine_.run(request, [this, &run](const RoundUpdate& update) { onRound(run, update); });
        if (result.cancelled) {
            return release(*queue, run);
        }
        if (!result.ok) {
            fault = result.error.empty() ? "engine reported failure" : result.error;
        }
    } catch (const std::exception& e) {
        fault = e.what();
        if (fault.empty()) fault = "engine raised an exception";
    }

    if (!fault.empty()) {
        return handleFault(*queue, run, fault);
    }
    return commit(*queue, run, result);
}

void Executor::onRound(const Run& run, const RoundUpdate& update) noexcept {
    try {
        if (events_) {
            Record payload;
            payload.set("run", run.id);
            payload.set("round", static_cast<std::int64_t>(update.round));
            payload.set("agent", update.agent);
            payload.set("message", update.message);
            for (const auto& entry : update.offer) {
                payload.set("offer." + entry.first, entry.second);
            }
            events_->publish(EventType::NegotiationRound, run.queueId, run.negotiationId, payload);
        }
        (void)store_.updateRun(run.queueId, run.id, [&update](Run& current) {
            if (current.status != RunStatus::Running || !current.checkpoint) return false;
            current.checkpoint->round = update.round;
            return true;
        });
    } catch (const std::exception& e) {
        LOG_WARN("Failed to record round " + std::to_string(update.round) + " of run " +
                 shortId(run.id) + ": " + e.what());
    }
}

bool Executor::commit(const Queue& queue, const Run& run, const EngineResult& result) {
    const RunStatus status = classifyOutcome(result.outcome);
    if (result.outcome == Outcome::Unrecognized) {
        LOG_WARN("Run " + shortId(run.id) + " returned unrecognized outcome '" + result.rawOutcome + "'");
    }

    ResultArtifacts artifacts;
    std::optional<std::string> analyticsError;
    try {
        auto negotiation = store_.loadNegotiation(run.negotiationId);
        Negotiation empty;
        const Negotiation& source = negotiation ? *negotiation : empty;
        artifacts = processResults({result.finalOffer, result.conversationLog, source.products,
                                    source.dimensions, source.role});
        if (!artifacts.dealValue && !source.products.empty()) {
            std::vector<std::string> names;
            for (const auto& product : source.products) names.push_back(product.name);
            LOG_WARN("No products matched for run " + shortId(run.id) + ". Expected: " +
                     joinKeys(names) + ". Offer keys: " + joinKeys(artifacts.entryKeys));
        }
    } catch (const std::exception& e) {
        analyticsError = e.what();
        LOG_ERROR("Result processing failed for run " + shortId(run.id) + ": " + e.what());
    }

    const auto now = Clock::now();
    const double cost = result.totalRounds * config_.roundCost;
    bool discarded = false;
    RunStatus current = RunStatus::Running;

    auto stored = store_.updateRun(queue.id, run.id, [&](Run& row) {
        if (row.status != RunStatus::Running) {
            discarded = true;
            current = row.status;
            return false;
        }
        row.status = status;
        row.completedAt = now;
        row.outcome = result.rawOutcome;
        row.totalRounds = result.totalRounds;
        row.finalOffer = result.finalOffer;
        row.dealValue = artifacts.dealValue;
        row.actualCost = cost;
        row.checkpoint.reset();
        row.analyticsError = analyticsError;
        if (status == RunStatus::Failed) {
            row.lastError = "outcome " + (result.rawOutcome.empty() ? std::string("<empty>") : result.rawOutcome);
        }
        return true;
    });

    if (!stored) {
        LOG_WARN("Run " + shortId(run.id) + " disappeared before commit");
        return true;
    }
    if (discarded) {
        LOG_WARN("Discarding late result for run " + shortId(run.id) + ": run is now " + toString(current));
        LOG_AUDIT("result_discarded", runFields(run) + " status=" + toString(current));
        return true;
    }

    try {
        store_.saveConversation(queue.id, run.id, result.conversationLog);
        store_.saveResults(queue.id, run.id, toRecords(artifacts));
    } catch (const StoreError& e) {
        LOG_ERROR("Failed to persist artifacts of run " + shortId(run.id) + ": " + e.what());
    }

    LOG_INFO("Run " + shortId(run.id) + " finished: " + toString(status) + " (" +
             (result.rawOutcome.empty() ? std::string("no outcome") : result.rawOutcome) + ", " +
             std::to_string(result.totalRounds) + " rounds" +
             (artifacts.dealValue ? ", deal " + *artifacts.dealValue : std::string()) + ")");
    LOG_AUDIT("run_completed", runFields(run) + " status=" + toString(status) +
              " outcome=" + result.rawOutcome + " rounds=" + std::to_string(result.totalRounds));

    if (events_) {
        Record payload;
        payload.set("run", run.id);
        payload.set("status", toString(status));
        payload.set("outcome", result.rawOutcome);
        payload.set("rounds", static_cast<std::int64_t>(result.totalRounds));
        payload.setOptional("deal_value", artifacts.dealValue);
        payload.setDouble("cost", cost);
        events_->publish(EventType::SimulationCompleted, queue.id, run.negotiationId, payload);
    }

    if (progress_.settle(queue.id, now)) {
        fireQueueCompleted(queue.id);
    }

    if (qualifiesForEvaluation(result.outcome)) {
        fireEvaluation(*stored, result.outcome);
    }
    return true;
}

bool Executor::release(const Queue& queue, const Run& run) {
    bool released = false;
    auto stored = store_.updateRun(queue.id, run.id, [&released](Run& row) {
        if (row.status != RunStatus::Running) return false;
        row.status = RunStatus::Pending;
        row.startedAt.reset();
        row.checkpoint.reset();
        released = true;
        return true;
    });

    if (!released) {
        LOG_INFO("Cancelled run " + shortId(run.id) + " left as " +
                 (stored ? toString(stored->status) : "missing"));
        return true;
    }
    LOG_INFO("Run " + shortId(run.id) + " cancelled in flight, back to pending");
    LOG_AUDIT("run_released", runFields(run));
    return true;
}

bool Executor::handleFault(const Queue& queue, const Run& run, const std::string& reason) {
    const auto now = Clock::now();
    bool discarded = false;
    bool exhausted = false;

    auto stored = store_.updateRun(queue.id, run.id, [&](Run& row) {
        if (row.status != RunStatus::Running) {
            discarded = true;
            return false;
        }
        row.retryCount += 1;
        row.lastError = reason;
        row.checkpoint.reset();
        if (row.retryCount >= row.maxRetries) {
            row.status = RunStatus::Failed;
            row.completedAt = now;
            exhausted = true;
        } else {
            row.status = RunStatus::Pending;
            row.startedAt.reset();
        }
        return true;
    });

    if (!stored) {
        LOG_WARN("Run " + shortId(run.id) + " disappeared before fault handling");
        return true;
    }
    if (discarded) {
        LOG_WARN("Discarding fault of run " + shortId(run.id) + " (" + reason + "): run is now " +
                 toString(stored->status));
        LOG_AUDIT("fault_discarded", runFields(run) + " status=" + toString(stored->status));
        return true;
    }

    if (!exhausted) {
        LOG_WARN("Run " + shortId(run.id) + " failed (attempt " + std::to_string(stored->retryCount) +
                 "/" + std::to_string(stored->maxRetries) + "), will retry: " + reason);
        LOG_AUDIT("run_retry", runFields(run) + " attempt=" + std::to_string(stored->retryCount));
        return true;
    }

    LOG_ERROR("Run " + shortId(run.id) + " failed after " + std::to_string(stored->retryCount) +
              " attempts: " + reason);
    LOG_AUDIT("run_failed", runFields(run) + " attempts=" + std::to_string(stored->retryCount));

    if (events_) {
        Record payload;
        payload.set("run", run.id);
        payload.set("error", reason);
        payload.set("retries", static_cast<std::int64_t>(stored->retryCount));
        events_->publish(EventType::SimulationFailed, queue.id, run.negotiationId, payload);
    }

    if (progress_.settle(queue.id, now)) {
        fireQueueCompleted(queue.id);
    }
    return true;
}

void Executor::fireEvaluation(const Run& run, Outcome outcome) {
    if (!hooks_.evaluate) return;
    LOG_AUDIT("evaluation_triggered", runFields(run) + " outcome=" + toString(outcome));
    auto hook = hooks_.evaluate;
    dispatch("evaluate-" + shortId(run.id), [hook, run, outcome] { hook(run, outcome); });
}

void Executor::fireQueueCompleted(const QueueId& queueId) {
    if (!hooks_.queueCompleted) return;
    auto queue = store_.loadQueue(queueId);
    if (!queue) return;
    auto hook = hooks_.queueCompleted;
    dispatch("complete-" + shortId(queueId), [hook, q = *queue] { hook(q); });
}

void Executor::dispatch(const std::string& name, std::function<void()> task) {
    if (pool_) {
        if (!pool_->submit(name, std::move(task))) {
            LOG_WARN("Hook " + name + " dropped: pool not running");
        }
        return;
    }
    try {
        task();
    } catch (const std::exception& e) {
        LOG_ERROR("Hook " + name + " failed: " + e.what());
    }
}

}
