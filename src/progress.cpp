/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/progress.hpp"
#include "negsim/events.hpp"
#include "negsim/logger.hpp"
#include "negsim/store.hpp"
#include <cmath>

namespace negsim {

Progress::Progress(Store& store, Broadcaster* events, std::chrono::seconds averageRun) noexcept
    : store_(store), events_(events), averageRun_(averageRun) {}

QueueReport Progress::summarize(const Queue& queue, const std::vector<Run>& runs,
                                std::chrono::seconds averageRun) {
    QueueReport report;
    report.queue = queue;
    report.estimatedCost = queue.estimatedCost;

    for (const auto& run : runs) {
        switch (run.status) {
            case RunStatus::Pending:   ++report.counts.pending; break;
            case RunStatus::Running:
                ++report.counts.running;
                if (!report.current) report.current = run;
                break;
            case RunStatus::Completed: ++report.counts.completed; break;
            case RunStatus::Failed:    ++report.counts.failed; break;
            case RunStatus::Timeout:   ++report.counts.timeout; break;
            case RunStatus::Paused:    ++report.counts.paused; break;
            case RunStatus::Aborted:   ++report.counts.aborted; break;
        }
        report.actualCost += run.actualCost;
    }

    report.completedCount = report.counts.completed;
    report.failedCount = report.counts.failed + report.counts.timeout + report.counts.aborted;
    int done = report.completedCount + report.failedCount;
    report.remaining = queue.totalSimulations > done ? queue.totalSimulations - done : 0;
    report.percentage = queue.totalSimulations > 0
        ? static_cast<double>(done) * 100.0 / queue.totalSimulations
        : 0.0;
    report.eta = averageRun * report.remaining;
    return report;
}

std::optional<QueueReport> Progress::report(const QueueId& queueId) const {
    auto queue = store_.loadQueue(queueId);
    if (!queue) {
        return std::nullopt;
    }
    return summarize(*queue, store_.loadRuns(queueId), averageRun_);
}

std::vector<RunDetail> Progress::details(const QueueId& queueId) const {
    std::vector<RunDetail> out;
    for (auto& run : store_.loadRuns(queueId)) {
        RunDetail detail;
        detail.conversation = store_.loadConversation(queueId, run.id);
        detail.results = store_.loadResults(queueId, run.id);
        detail.run = std::move(run);
        out.push_back(std::move(detail));
    }
    LOG_DEBUG("Loaded " + std::to_string(out.size()) + " run detail(s) for queue " + shortId(queueId));
    return out;
}

NegotiationStats Progress::stats(const NegotiationId& negotiationId) const {
    NegotiationStats stats;
    for (const auto& queue : store_.queuesForNegotiation(negotiationId)) {
        std::vector<Run> runs;
        try {
            runs = store_.loadRuns(queue.id);
        } catch (const StoreError& e) {
            LOG_WARN("Stats skip unreadable queue " + shortId(queue.id) + ": " + e.what());
            continue;
        }
        for (const auto& run : runs) {
            ++stats.totalRuns;
            switch (run.status) {
                case RunStatus::Completed: ++stats.completedRuns; break;
                case RunStatus::Running:   ++stats.runningRuns; break;
                case RunStatus::Pending:   ++stats.pendingRuns; break;
                case RunStatus::Failed:
                case RunStatus::Timeout:
                case RunStatus::Aborted:   ++stats.failedRuns; break;
                case RunStatus::Paused:    break;
            }
        }
    }

    if (stats.totalRuns > 0) {
        stats.successRate = static_cast<int>(
            std::lround(static_cast<double>(stats.completedRuns) * 100.0 / stats.totalRuns));
        return stats;
    }

    if (auto negotiation = store_.loadNegotiation(negotiationId)) {
        const int planned = static_cast<int>(negotiation->techniques.size() * negotiation->tactics.size());
        stats.planned = planned > 0;
        stats.pendingRuns = planned;
    }
    return stats;
}

bool Progress::settle(const QueueId& queueId, TimePoint now) {
    auto queue = store_.refreshRollups(queueId);
    if (!queue) {
        LOG_WARN("Cannot settle missing queue: " + queueId);
        return false;
    }

    Record payload;
    payload.set("completed", static_cast<std::int64_t>(queue->completedCount));
    payload.set("failed", static_cast<std::int64_t>(queue->failedCount));
    payload.set("total", static_cast<std::int64_t>(queue->totalSimulations));

    if (queue->completedCount + queue->failedCount >= queue->totalSimulations) {
        if (queue->status != QueueStatus::Completed) {
            store_.setQueueStatus(queueId, QueueStatus::Completed, now);
        }
        payload.setDouble("actual_cost", queue->actualCost);
        LOG_INFO("Queue " + shortId(queueId) + " completed: " +
                 std::to_string(queue->completedCount) + " completed, " +
                 std::to_string(queue->failedCount) + " failed");
        LOG_AUDIT("queue_completed", "queue=" + queueId + " completed=" +
                  std::to_string(queue->completedCount) + " failed=" + std::to_string(queue->failedCount));
        if (events_) events_->publish(EventType::QueueCompleted, queueId, queue->negotiationId, payload);
        return true;
    }

    int done = queue->completedCount + queue->failedCount;
    payload.set("percentage", static_cast<std::int64_t>(
        queue->totalSimulations > 0 ? done * 100 / queue->totalSimulations : 0));
    if (events_) events_->publish(EventType::QueueProgress, queueId, queue->negotiationId, payload);
    return false;
}

}
