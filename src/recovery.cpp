/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/recovery.hpp"
#include "negsim/logger.hpp"
#include "negsim/store.hpp"

namespace negsim {

Recovery::Recovery(Store& store, std::chrono::seconds threshold) noexcept
    : store_(store), threshold_(threshold) {}

bool Recovery::orphaned(const Run& run, TimePoint now) const noexcept {
    return run.status == RunStatus::Running && run.startedAt && *run.startedAt < now - threshold_;
}

RecoveryReport Recovery::findRecoveryOpportunities(const NegotiationId& negotiationId,
                                                   TimePoint now) const {
    RecoveryReport report;
    auto queues = store_.queuesForNegotiation(negotiationId);
    if (queues.empty()) {
        return report;
    }

    // queuesForNegotiation is ordered by creation time
    const Queue& latest = queues.back();
    report.latestQueueId = latest.id;

    std::vector<Run> runs;
    for (const auto& queue : queues) {
        try {
            auto queueRuns = store_.loadRuns(queue.id);
            for (const auto& run : queueRuns) {
                if (orphaned(run, now)) report.orphanedRunIds.push_back(run.id);
            }
            if (queue.id == latest.id) runs = std::move(queueRuns);
        } catch (const StoreError& e) {
            LOG_WARN("Skipping queue " + shortId(queue.id) + " during recovery scan: " + e.what());
        }
    }

    SessionCheckpoint checkpoint;
    checkpoint.negotiationId = negotiationId;
    checkpoint.queueId = latest.id;
    checkpoint.startedAt = latest.startedAt;
    bool inFlight = false;
    for (const auto& run : runs) {
        switch (run.status) {
            case RunStatus::Running:
                inFlight = true;
                checkpoint.currentRunId = run.id;
                checkpoint.round = run.checkpoint ? run.checkpoint->round : 0;
                break;
            case RunStatus::Completed:
                checkpoint.completedRunIds.push_back(run.id);
                break;
            case RunStatus::Failed:
            case RunStatus::Timeout:
            case RunStatus::Aborted:
                checkpoint.failedRunIds.push_back(run.id);
                break;
            default:
                break;
        }
        checkpoint.totalCost += run.actualCost;
    }
    if (inFlight) {
        report.checkpoint = std::move(checkpoint);
    }

    report.hasRecoverableSession = !report.orphanedRunIds.empty() || report.checkpoint.has_value();
    return report;
}

int Recovery::recoverOrphanedSimulations(const std::vector<RunId>& runIds, TimePoint now) {
    int recovered = 0;
    for (const auto& runId : runIds) {
        std::optional<Run> run;
        bool changed = false;
        try {
            run = store_.loadRun(runId);
            if (!run) {
                LOG_WARN("Cannot recover unknown run " + runId);
                continue;
            }
            (void)store_.updateRun(run->queueId, runId, [&](Run& row) {
                if (row.status != RunStatus::Running) return false;
                row.status = RunStatus::Pending;
                row.startedAt.reset();
                row.checkpoint.reset();
                row.recoveredAt = now;
                changed = true;
                return true;
            });
        } catch (const StoreError& e) {
            LOG_ERROR("Failed to recover run " + shortId(runId) + ": " + e.what());
            continue;
        }
        if (!changed) {
            LOG_DEBUG("Run " + shortId(runId) + " is no longer running, skipped");
            continue;
        }

        LOG_INFO("Recovered orphaned run " + shortId(runId) + " of queue " + shortId(run->queueId));
        LOG_AUDIT("run_recovered", "run=" + runId + " queue=" + run->queueId);
        ++recovered;
    }
    return recovered;
}

int Recovery::recoverOnStartup(TimePoint now) {
    std::vector<RunId> orphans;
    for (const auto& run : store_.runsWithStatus(RunStatus::Running)) {
        if (orphaned(run, now)) {
            LOG_WARN("Found orphaned run " + shortId(run.id) + " of queue " + shortId(run.queueId));
            orphans.push_back(run.id);
        }
    }
    if (orphans.empty()) {
        return 0;
    }

    int recovered = recoverOrphanedSimulations(orphans, now);
    LOG_INFO("Recovered " + std::to_string(recovered) + " orphaned run(s)");
    return recovered;
}

}
