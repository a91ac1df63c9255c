/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "negsim/types.hpp"

namespace negsim {

class Store;

struct SessionCheckpoint {
    NegotiationId negotiationId;
    QueueId queueId;
    RunId currentRunId;
    int round = 0;
    std::vector<RunId> completedRunIds;
    std::vector<RunId> failedRunIds;
    double totalCost = 0.0;
    std::optional<TimePoint> startedAt;
};

struct RecoveryReport {
    bool hasRecoverableSession = false;
    std::optional<QueueId> latestQueueId;
    std::optional<SessionCheckpoint> checkpoint;
    std::vector<RunId> orphanedRunIds;
};

// Orphan detection after a crash. Uses a shorter window than the Reaper so a
// restarted process can resume runs before they are written off as timeouts.
class Recovery final {
public:
    Recovery(Store& store, std::chrono::seconds threshold) noexcept;

    Recovery(const Recovery&) = delete;
    Recovery& operator=(const Recovery&) = delete;

    [[nodiscard]] RecoveryReport findRecoveryOpportunities(const NegotiationId& negotiationId,
                                                           TimePoint now) const;

    // Resets runs that are still running back to pending. Returns how many.
    int recoverOrphanedSimulations(const std::vector<RunId>& runIds, TimePoint now);

    // Recovers every orphan across the workspace.
    int recoverOnStartup(TimePoint now);

private:
    [[nodiscard]] bool orphaned(const Run& run, TimePoint now) const noexcept;

    Store& store_;
    std::chrono::seconds threshold_;
};

}
