/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "negsim/config.hpp"
#include "negsim/matrix.hpp"
#include "negsim/progress.hpp"
#include "negsim/recovery.hpp"
#include "negsim/types.hpp"

namespace negsim {

class Broadcaster;
class Catalog;
class Engine;
class Scheduler;
class Store;

enum class CreateError : uint8_t {
    None,
    Validation,
    Store
};

struct CreateResult {
    bool ok = false;
    QueueId id;
    bool existing = false;  // an active queue of the negotiation was reused
    CreateError error = CreateError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct OpResult {
    bool ok = false;
    int count = 0;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Queue control surface shared by the negsim tool and embedding callers.
class Control final {
public:
    Control(Store& store, const Catalog& catalog, Broadcaster* events, Engine* engine,
            const Config& config);

    Control(const Control&) = delete;
    Control& operator=(const Control&) = delete;

    void attachScheduler(Scheduler* scheduler) noexcept { scheduler_ = scheduler; }

    // Empty lists fall back to the negotiation's stored selections.
    [[nodiscard]] CreateResult createQueue(const QueueRequest& request);

    [[nodiscard]] OpResult startQueue(const QueueId& queueId);
    [[nodiscard]] OpResult pauseQueue(const QueueId& queueId);
    [[nodiscard]] OpResult resumeQueue(const QueueId& queueId);
    [[nodiscard]] OpResult stopQueue(const QueueId& queueId);
    [[nodiscard]] OpResult stopQueuesForNegotiation(const NegotiationId& negotiationId);

    // Terminal failed, timeout and aborted runs go back to pending.
    [[nodiscard]] OpResult restartFailedSimulations(const QueueId& queueId);
    // count holds the run's execution order.
    [[nodiscard]] OpResult restartRun(const RunId& runId);

    [[nodiscard]] std::optional<QueueReport> getQueueStatus(const QueueId& queueId) const;
    [[nodiscard]] std::vector<Run> runs(const QueueId& queueId) const;
    [[nodiscard]] std::optional<QueueId> findQueueByNegotiation(const NegotiationId& negotiationId) const;

    // Runs in execution order with their conversation and result rows.
    [[nodiscard]] std::vector<RunDetail> results(const QueueId& queueId) const;
    [[nodiscard]] NegotiationStats stats(const NegotiationId& negotiationId) const;

    [[nodiscard]] RecoveryReport findRecoveryOpportunities(const NegotiationId& negotiationId) const;
    [[nodiscard]] OpResult recoverOrphanedSimulations(const std::vector<RunId>& runIds);

private:
    static void resetRun(Run& run);

    Store& store_;
    Broadcaster* events_;
    Engine* engine_;
    Scheduler* scheduler_ = nullptr;
    MatrixBuilder builder_;
    Progress progress_;
    Recovery recovery_;
};

}
