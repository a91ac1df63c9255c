/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/reaper.hpp"
#include "negsim/events.hpp"
#include "negsim/logger.hpp"
#include "negsim/store.hpp"
#include <map>

namespace negsim {

Reaper::Reaper(Store& store, Broadcaster* events, std::chrono::seconds staleThreshold,
               std::chrono::seconds averageRun) noexcept
    : store_(store), events_(events), threshold_(staleThreshold), progress_(store, events, averageRun) {}

int Reaper::sweep(TimePoint now) {
    const TimePoint cutoff = now - threshold_;
    std::map<QueueId, std::vector<Run>> reaped;

    for (const auto& candidate : store_.runsWithStatus(RunStatus::Running)) {
        if (!candidate.startedAt || *candidate.startedAt >= cutoff) continue;

        bool changed = false;
        std::optional<Run> stored;
        try {
            stored = store_.updateRun(candidate.queueId, candidate.id, [&](Run& row) {
                if (row.status != RunStatus::Running || !row.startedAt || *row.startedAt >= cutoff) {
                    return false;
                }
                row.status = RunStatus::Timeout;
                row.completedAt = now;
                row.lastError = "timeout";
                row.checkpoint.reset();
                changed = true;
                return true;
            });
        } catch (const StoreError& e) {
            LOG_ERROR("Failed to time out run " + shortId(candidate.id) + ": " + e.what());
            continue;
        }
        if (!changed || !stored) continue;

        const auto age = std::chrono::duration_cast<std::chrono::seconds>(now - *candidate.startedAt);
        LOG_WARN("Run " + shortId(candidate.id) + " of queue " + shortId(candidate.queueId) +
                 " timed out after " + std::to_string(age.count()) + "s");
        LOG_AUDIT("run_timeout", "run=" + candidate.id + " queue=" + candidate.queueId +
                  " age=" + std::to_string(age.count()));
        reaped[candidate.queueId].push_back(*stored);
    }

    int total = 0;
    for (const auto& entry : reaped) {
        for (const auto& run : entry.second) {
            if (events_) {
                Record payload;
                payload.set("run", run.id);
                payload.set("error", "timeout");
                events_->publish(EventType::SimulationFailed, entry.first, run.negotiationId, payload);
            }
            ++total;
        }
        try {
            (void)progress_.settle(entry.first, now);
        } catch (const StoreError& e) {
            LOG_ERROR("Failed to settle queue " + shortId(entry.first) + ": " + e.what());
        }
    }

    if (total > 0) {
        LOG_INFO("Reaper timed out " + std::to_string(total) + " stale run(s) across " +
                 std::to_string(reaped.size()) + " queue(s)");
    }
    return total;
}

}
