/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "negsim/record.hpp"
#include "negsim/types.hpp"

namespace negsim {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Whole-file read; nullopt when the file does not exist.
[[nodiscard]] std::optional<std::string> readFile(const std::filesystem::path& path);
// Writes to a unique temporary name and renames it into place.
void writeFileAtomic(const std::filesystem::path& path, const std::string& content);

enum class ClaimStatus : uint8_t {
    Claimed,
    Busy,       // another run of the queue is already running
    Exhausted,  // no pending run left
    Inactive    // queue missing or not pending/running
};

struct Claim {
    ClaimStatus status = ClaimStatus::Inactive;
    std::optional<Run> run;
};

// Workspace-directory persistence. Every read-modify-write of a queue or its
// runs holds queues/<id>/.lock, so threads and processes serialize alike.
class Store final {
public:
    explicit Store(const std::filesystem::path& workspace);

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;
    Store(Store&&) = delete;
    Store& operator=(Store&&) = delete;

    void initialize();
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }

    // Negotiations
    void saveNegotiation(const Negotiation& negotiation);
    [[nodiscard]] std::optional<Negotiation> loadNegotiation(const NegotiationId& id) const;
    [[nodiscard]] bool setNegotiationStatus(const NegotiationId& id, NegotiationStatus status) noexcept;

    // Queues
    [[nodiscard]] QueueId createQueue(Queue queue, std::vector<Run> runs);
    [[nodiscard]] std::optional<Queue> loadQueue(const QueueId& id) const;
    // Unreadable queue records are logged and skipped.
    [[nodiscard]] std::vector<Queue> listQueues() const;
    [[nodiscard]] std::vector<Queue> queuesWithStatus(std::initializer_list<QueueStatus> statuses) const;
    [[nodiscard]] std::vector<Queue> queuesForNegotiation(const NegotiationId& id) const;

    // Stamps the matching timestamp and syncs the negotiation status.
    // Returns false when the queue does not exist.
    bool setQueueStatus(const QueueId& id, QueueStatus status, TimePoint now);

    // Recomputes counts and cost from the run rows and caches them on the queue.
    std::optional<Queue> refreshRollups(const QueueId& id);

    // Runs
    [[nodiscard]] std::vector<Run> loadRuns(const QueueId& queueId) const;
    [[nodiscard]] std::optional<Run> loadRun(const RunId& runId) const;
    [[nodiscard]] std::optional<Run> loadRun(const QueueId& queueId, const RunId& runId) const;
    // Across all queues. A queue with an unreadable run record is skipped.
    [[nodiscard]] std::vector<Run> runsWithStatus(RunStatus status) const;

    // Selects the pending run with the smallest execution order and marks it
    // running, all under the queue lock. The queue is set running as well.
    // Only pending or running queues hand out runs.
    [[nodiscard]] Claim claimNext(const QueueId& queueId, TimePoint now);

    // Locked read-modify-write of one run. The mutator returns true to persist.
    // Returns the run as it stands afterwards, or nullopt when missing.
    std::optional<Run> updateRun(const QueueId& queueId, const RunId& runId,
                                 const std::function<bool(Run&)>& mutate);

    // Locked read-modify-write over all runs of a queue. Returns the runs that
    // were persisted.
    std::vector<Run> updateRuns(const QueueId& queueId, const std::function<bool(Run&)>& mutate);

    // Run artifacts
    void saveConversation(const QueueId& queueId, const RunId& runId,
                          const std::vector<RoundUpdate>& rounds);
    [[nodiscard]] std::vector<RoundUpdate> loadConversation(const QueueId& queueId, const RunId& runId) const;
    void saveResults(const QueueId& queueId, const RunId& runId, const std::vector<Record>& rows);
    [[nodiscard]] std::vector<Record> loadResults(const QueueId& queueId, const RunId& runId) const;
    void clearArtifacts(const QueueId& queueId, const RunId& runId) noexcept;

    [[nodiscard]] static std::string generateId();

private:
    std::filesystem::path workspace_;

    [[nodiscard]] std::filesystem::path queueDir(const QueueId& id) const;
    [[nodiscard]] std::filesystem::path runPath(const QueueId& queueId, const RunId& runId,
                                                const char* ext) const;
    [[nodiscard]] std::filesystem::path negotiationDir(const NegotiationId& id) const;

    [[nodiscard]] std::optional<Queue> readQueue(const std::filesystem::path& dir) const;
    void writeQueue(const std::filesystem::path& dir, const Queue& queue) const;
    [[nodiscard]] std::vector<Run> readRuns(const std::filesystem::path& dir) const;
    [[nodiscard]] std::optional<Run> readRun(const std::filesystem::path& path) const;
    void writeRun(const std::filesystem::path& dir, const Run& run) const;
    void syncNegotiation(const NegotiationId& id, QueueStatus status) noexcept;
};

}
