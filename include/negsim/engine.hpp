/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <sys/types.h>

#include "negsim/types.hpp"

namespace negsim {

struct EngineRequest {
    NegotiationId negotiationId;
    RunId runId;
    std::string techniqueId;
    std::string tacticId;
    std::string personalityId;
    std::string distance;
    int maxRounds = 6;
    QueueId queueId;
};

struct EngineResult {
    bool ok = false;
    bool cancelled = false;  // ended by cancel()/cancelAll(), not an engine fault
    std::string error;
    Outcome outcome = Outcome::Unrecognized;
    std::string rawOutcome;
    int totalRounds = 0;
    std::vector<RoundUpdate> conversationLog;
    DimensionValues finalOffer;
};

using RoundCallback = std::function<void(const RoundUpdate&)>;

struct ActiveRun {
    QueueId queueId;
    RunId runId;
};

// The external negotiation collaborator. run() blocks the calling drain
// thread; a fault is either a thrown exception or a result with ok == false.
class Engine {
public:
    virtual ~Engine() = default;

    [[nodiscard]] virtual EngineResult run(const EngineRequest& request, const RoundCallback& onRound) = 0;
    virtual void cancel(const RunId& runId) noexcept = 0;
    virtual void cancelAll() noexcept = 0;
    // Runs currently inside run().
    [[nodiscard]] virtual std::vector<ActiveRun> active() const = 0;
};

// Runs one external program per run and reads its protocol from stdout:
//   ROUND_UPDATE<TAB>round=..<TAB>agent=..<TAB>message=..<TAB>offer.<key>=..
//   RESULT<TAB>outcome=..<TAB>rounds=..<TAB>offer.<key>=..
class CommandEngine final : public Engine {
public:
    explicit CommandEngine(std::string command);

    CommandEngine(const CommandEngine&) = delete;
    CommandEngine& operator=(const CommandEngine&) = delete;

    [[nodiscard]] EngineResult run(const EngineRequest& request, const RoundCallback& onRound) override;
    // SIGTERM to the engine's whole process group.
    void cancel(const RunId& runId) noexcept override;
    void cancelAll() noexcept override;
    [[nodiscard]] std::vector<ActiveRun> active() const override;

    [[nodiscard]] const std::string& command() const noexcept { return command_; }

    // Parses one stdout line into result/round state. Returns false when the
    // line is not part of the protocol.
    static bool parseLine(const std::string& line, EngineResult& result, bool& sawResult,
                          RoundUpdate* round);

private:
    struct Child {
        pid_t pid = -1;
        QueueId queueId;
    };

    std::string command_;
    mutable std::mutex mutex_;
    std::unordered_map<RunId, Child> children_;
    std::unordered_set<RunId> cancelled_;
};

}
