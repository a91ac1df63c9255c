/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <optional>
#include <vector>

#include "negsim/record.hpp"
#include "negsim/types.hpp"

namespace negsim {

class Broadcaster;
class Store;

struct RunCounts {
    int pending = 0;
    int running = 0;
    int completed = 0;
    int failed = 0;
    int timeout = 0;
    int paused = 0;
    int aborted = 0;
};

struct QueueReport {
    Queue queue;
    RunCounts counts;
    int completedCount = 0;
    int failedCount = 0;  // failed + timeout + aborted
    int remaining = 0;
    double percentage = 0.0;
    std::chrono::seconds eta{0};
    std::optional<Run> current;
    double estimatedCost = 0.0;
    double actualCost = 0.0;
};

struct RunDetail {
    Run run;
    std::vector<RoundUpdate> conversation;
    std::vector<Record> results;  // kind=product|dimension|other rows
};

// Run counts across every queue of a negotiation. failedRuns includes
// timeout and aborted runs.
struct NegotiationStats {
    int totalRuns = 0;
    int completedRuns = 0;
    int runningRuns = 0;
    int failedRuns = 0;
    int pendingRuns = 0;
    int successRate = 0;  // rounded percentage of completed runs
    bool planned = false;  // no queue yet; pendingRuns holds techniques x tactics
};

// Pure status reads plus the shared settle step.
class Progress {
public:
    Progress(Store& store, Broadcaster* events, std::chrono::seconds averageRun) noexcept;

    Progress(const Progress&) = delete;
    Progress& operator=(const Progress&) = delete;

    // Recomputed from run rows on every call; cached counters are ignored.
    [[nodiscard]] std::optional<QueueReport> report(const QueueId& queueId) const;

    [[nodiscard]] std::vector<RunDetail> details(const QueueId& queueId) const;
    [[nodiscard]] NegotiationStats stats(const NegotiationId& negotiationId) const;

    [[nodiscard]] static QueueReport summarize(const Queue& queue, const std::vector<Run>& runs,
                                               std::chrono::seconds averageRun);

    // Refreshes rollups, then either marks the queue completed and publishes
    // queue_completed (returns true) or publishes queue_progress.
    bool settle(const QueueId& queueId, TimePoint now);

private:
    Store& store_;
    Broadcaster* events_;
    std::chrono::seconds averageRun_;
};

}
