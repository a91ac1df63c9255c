/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/control.hpp"
#include "negsim/catalog.hpp"
#include "negsim/engine.hpp"
#include "negsim/events.hpp"
#include "negsim/logger.hpp"
#include "negsim/record.hpp"
#include "negsim/scheduler.hpp"
#include "negsim/store.hpp"

namespace negsim {

namespace {
OpResult fail(const std::string& message) {
    OpResult result;
    result.message = message;
    return result;
}

OpResult done(int count, const std::string& message = {}) {
    OpResult result;
    result.ok = true;
    result.count = count;
    result.message = message;
    return result;
}

CreateResult reject(CreateError error, const std::string& message) {
    CreateResult result;
    result.error = error;
    result.message = message;
    return result;
}

bool restartable(RunStatus status) noexcept {
    return status == RunStatus::Failed || status == RunStatus::Timeout || status == RunStatus::Aborted;
}
}

Control::Control(Store& store, const Catalog& catalog, Broadcaster* events, Engine* engine,
                 const Config& config)
    : store_(store), events_(events), engine_(engine),
      builder_(catalog, config.runCost, config.maxRetries),
      progress_(store, events, config.averageRunDuration),
      recovery_(store, config.recoveryThreshold) {}

CreateResult Control::createQueue(const QueueRequest& request) {
    try {
        auto negotiation = store_.loadNegotiation(request.negotiationId);
        if (!negotiation) {
            return reject(CreateError::Validation, "negotiation not found: " + request.negotiationId);
        }

        for (const auto& queue : store_.queuesForNegotiation(negotiation->id)) {
            if (queue.status == QueueStatus::Pending || queue.status == QueueStatus::Running) {
                LOG_INFO("Negotiation " + shortId(negotiation->id) + " already has active queue " +
                         shortId(queue.id));
                CreateResult result;
                result.ok = true;
                result.id = queue.id;
                result.existing = true;
                return result;
            }
        }

        QueueRequest resolved = request;
        if (resolved.techniques.empty()) resolved.techniques = negotiation->techniques;
        if (resolved.tactics.empty()) resolved.tactics = negotiation->tactics;
        if (resolved.personalities.empty() && !negotiation->personalities.empty()) {
            resolved.personalities = splitList(negotiation->personalities);
        }
        if (resolved.distances.empty() && !negotiation->distances.empty()) {
            resolved.distances = splitList(negotiation->distances);
        }

        if (resolved.techniques.empty()) {
            return reject(CreateError::Validation, "at least one technique is required");
        }
        if (resolved.tactics.empty()) {
            return reject(CreateError::Validation, "at least one tactic is required");
        }

        CreateResult result;
        result.id = builder_.build(store_, resolved, Clock::now());
        result.ok = true;
        return result;
    } catch (const StoreError& e) {
        LOG_ERROR("Queue creation failed: " + std::string(e.what()));
        return reject(CreateError::Store, e.what());
    }
}

OpResult Control::startQueue(const QueueId& queueId) {
    auto queue = store_.loadQueue(queueId);
    if (!queue) {
        return fail("queue not found: " + queueId);
    }
    int pending = 0;
    for (const auto& run : store_.loadRuns(queueId)) {
        if (run.status == RunStatus::Pending) ++pending;
    }

    const bool active = queue->status == QueueStatus::Pending || queue->status == QueueStatus::Running;
    if (active) {
        LOG_DEBUG("Queue " + shortId(queueId) + " already " + toString(queue->status));
        if (scheduler_) {
            (void)scheduler_->kick(queueId);
        }
        return done(pending, std::string("already ") + toString(queue->status));
    }
    if (pending == 0) {
        return fail("no pending simulations; restart failed simulations first");
    }

    (void)store_.setQueueStatus(queueId, QueueStatus::Pending, Clock::now());
    LOG_INFO("Queue " + shortId(queueId) + " started with " + std::to_string(pending) + " pending run(s)");
    LOG_AUDIT("queue_started", "queue=" + queueId + " pending=" + std::to_string(pending));

    if (scheduler_) {
        (void)scheduler_->kick(queueId);
    }
    return done(pending);
}

OpResult Control::pauseQueue(const QueueId& queueId) {
    auto queue = store_.loadQueue(queueId);
    if (!queue) {
        return fail("queue not found: " + queueId);
    }
    if (queue->status == QueueStatus::Paused) {
        return done(0, "already paused");
    }
    if (queue->status != QueueStatus::Running && queue->status != QueueStatus::Pending) {
        return fail(std::string("cannot pause a ") + toString(queue->status) + " queue");
    }
    (void)store_.setQueueStatus(queueId, QueueStatus::Paused, Clock::now());
    LOG_INFO("Queue " + shortId(queueId) + " paused");
    LOG_AUDIT("queue_paused", "queue=" + queueId);
    return done(0);
}

OpResult Control::resumeQueue(const QueueId& queueId) {
    auto queue = store_.loadQueue(queueId);
    if (!queue) {
        return fail("queue not found: " + queueId);
    }
    if (queue->status != QueueStatus::Paused) {
        return fail(std::string("cannot resume a ") + toString(queue->status) + " queue");
    }
    (void)store_.setQueueStatus(queueId, QueueStatus::Running, Clock::now());
    LOG_INFO("Queue " + shortId(queueId) + " resumed");
    LOG_AUDIT("queue_resumed", "queue=" + queueId);
    if (scheduler_) {
        (void)scheduler_->kick(queueId);
    }
    return done(0);
}

OpResult Control::stopQueue(const QueueId& queueId) {
    auto queue = store_.loadQueue(queueId);
    if (!queue) {
        return fail("queue not found: " + queueId);
    }

    const auto now = Clock::now();
    std::vector<RunId> inFlight;
    auto stopped = store_.updateRuns(queueId, [&](Run& run) {
        if (run.status != RunStatus::Pending && run.status != RunStatus::Running) return false;
        if (run.status == RunStatus::Running) inFlight.push_back(run.id);
        run.status = RunStatus::Aborted;
        run.completedAt = now;
        run.checkpoint.reset();
        return true;
    });

    if (engine_) {
        for (const auto& runId : inFlight) {
            engine_->cancel(runId);
        }
    }

    (void)store_.setQueueStatus(queueId, QueueStatus::Completed, now);

    for (const auto& run : stopped) {
        if (events_) {
            Record payload;
            payload.set("run", run.id);
            payload.set("reason", "manually_stopped");
            events_->publish(EventType::SimulationStopped, queueId, run.negotiationId, payload);
        }
    }
    (void)progress_.settle(queueId, now);

    LOG_INFO("Queue " + shortId(queueId) + " stopped, " + std::to_string(stopped.size()) +
             " run(s) aborted (" + std::to_string(inFlight.size()) + " in flight)");
    LOG_AUDIT("queue_stopped", "queue=" + queueId + " aborted=" + std::to_string(stopped.size()));
    return done(static_cast<int>(stopped.size()));
}

OpResult Control::stopQueuesForNegotiation(const NegotiationId& negotiationId) {
    int stopped = 0;
    int failures = 0;
    for (const auto& queue : store_.queuesForNegotiation(negotiationId)) {
        if (queue.status == QueueStatus::Completed || queue.status == QueueStatus::Failed) continue;
        try {
            auto result = stopQueue(queue.id);
            if (result.ok) {
                ++stopped;
            } else {
                ++failures;
                LOG_WARN("Failed to stop queue " + shortId(queue.id) + ": " + result.message);
            }
        } catch (const std::exception& e) {
            ++failures;
            LOG_ERROR("Failed to stop queue " + shortId(queue.id) + ": " + e.what());
        }
    }
    if (failures > 0) {
        OpResult result = fail(std::to_string(failures) + " queue(s) could not be stopped");
        result.count = stopped;
        return result;
    }
    return done(stopped);
}

void Control::resetRun(Run& run) {
    run.status = RunStatus::Pending;
    run.retryCount = 0;
    run.startedAt.reset();
    run.completedAt.reset();
    run.finalOffer.clear();
    run.dealValue.reset();
    run.actualCost = 0.0;
    run.outcome.reset();
    run.totalRounds = 0;
    run.lastError.reset();
    run.checkpoint.reset();
    run.analyticsError.reset();
}

OpResult Control::restartFailedSimulations(const QueueId& queueId) {
    auto queue = store_.loadQueue(queueId);
    if (!queue) {
        return fail("queue not found: " + queueId);
    }

    auto reset = store_.updateRuns(queueId, [](Run& run) {
        if (!restartable(run.status)) return false;
        resetRun(run);
        return true;
    });
    for (const auto& run : reset) {
        store_.clearArtifacts(queueId, run.id);
    }

    (void)store_.setQueueStatus(queueId, QueueStatus::Pending, Clock::now());
    (void)store_.refreshRollups(queueId);

    LOG_INFO("Queue " + shortId(queueId) + ": " + std::to_string(reset.size()) + " run(s) reset to pending");
    LOG_AUDIT("queue_restarted", "queue=" + queueId + " reset=" + std::to_string(reset.size()));
    return done(static_cast<int>(reset.size()));
}

OpResult Control::restartRun(const RunId& runId) {
    auto run = store_.loadRun(runId);
    if (!run) {
        return fail("run not found: " + runId);
    }

    bool changed = false;
    auto stored = store_.updateRun(run->queueId, runId, [&changed](Run& row) {
        if (!restartable(row.status) && row.status != RunStatus::Completed && row.status != RunStatus::Paused) {
            return false;
        }
        resetRun(row);
        changed = true;
        return true;
    });
    if (!stored) {
        return fail("run not found: " + runId);
    }
    if (!changed) {
        return fail(std::string("cannot restart a ") + toString(stored->status) + " run");
    }

    store_.clearArtifacts(run->queueId, runId);
    (void)store_.setQueueStatus(run->queueId, QueueStatus::Pending, Clock::now());
    (void)store_.refreshRollups(run->queueId);

    LOG_INFO("Run " + shortId(runId) + " (order " + std::to_string(stored->executionOrder) + ") reset to pending");
    LOG_AUDIT("run_restarted", "run=" + runId + " queue=" + run->queueId);
    return done(stored->executionOrder);
}

std::optional<QueueReport> Control::getQueueStatus(const QueueId& queueId) const {
    return progress_.report(queueId);
}

std::vector<Run> Control::runs(const QueueId& queueId) const {
    return store_.loadRuns(queueId);
}

std::optional<QueueId> Control::findQueueByNegotiation(const NegotiationId& negotiationId) const {
    auto queues = store_.queuesForNegotiation(negotiationId);
    if (queues.empty()) {
        return std::nullopt;
    }
    for (auto it = queues.rbegin(); it != queues.rend(); ++it) {
        if (it->status == QueueStatus::Pending || it->status == QueueStatus::Running ||
            it->status == QueueStatus::Paused) {
            return it->id;
        }
    }
    return queues.back().id;
}

std::vector<RunDetail> Control::results(const QueueId& queueId) const {
    return progress_.details(queueId);
}

NegotiationStats Control::stats(const NegotiationId& negotiationId) const {
    return progress_.stats(negotiationId);
}

RecoveryReport Control::findRecoveryOpportunities(const NegotiationId& negotiationId) const {
    return recovery_.findRecoveryOpportunities(negotiationId, Clock::now());
}

OpResult Control::recoverOrphanedSimulations(const std::vector<RunId>& runIds) {
    const int recovered = recovery_.recoverOrphanedSimulations(runIds, Clock::now());
    return done(recovered);
}

}
