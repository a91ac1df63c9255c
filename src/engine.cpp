/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/engine.hpp"
#include "negsim/logger.hpp"
#include "negsim/record.hpp"
#include "negsim/subprocess.hpp"
#include <csignal>

namespace negsim {

namespace {
constexpr const char* kRoundTag = "ROUND_UPDATE";
constexpr const char* kResultTag = "RESULT";
}

CommandEngine::CommandEngine(std::string command) : command_(std::move(command)) {
    LOG_DEBUG("CommandEngine created: " + command_);
}

bool CommandEngine::parseLine(const std::string& line, EngineResult& result, bool& sawResult,
                              RoundUpdate* round) {
    auto tab = line.find('\t');
    std::string tag = line.substr(0, tab);
    Record record = Record::fromLine(tab == std::string::npos ? std::string() : line.substr(tab + 1));

    if (tag == kRoundTag) {
        if (round == nullptr) return true;
        round->round = static_cast<int>(record.getInt("round").value_or(0));
        round->agent = record.getOr("agent", "");
        round->message = record.getOr("message", "");
        round->offer = record.prefixed("offer.");
        return true;
    }

    if (tag == kResultTag) {
        sawResult = true;
        result.rawOutcome = record.getOr("outcome", "");
        result.outcome = parseOutcome(result.rawOutcome);
        auto rounds = record.getInt("rounds");
        if (!rounds || *rounds < 0) {
            result.ok = false;
            result.error = "malformed RESULT line: rounds missing or negative";
            return true;
        }
        result.totalRounds = static_cast<int>(*rounds);
        result.finalOffer = record.prefixed("offer.");
        result.ok = true;
        return true;
    }
    return false;
}

EngineResult CommandEngine::run(const EngineRequest& request, const RoundCallback& onRound) {
    EngineResult result;
    bool sawResult = false;

    std::vector<std::string> args = {
        "--negotiation-id", request.negotiationId,
        "--simulation-run-id", request.runId,
        "--technique-id", request.techniqueId,
        "--tactic-id", request.tacticId,
        "--personality-id", request.personalityId,
        "--distance", request.distance,
        "--max-rounds", std::to_string(request.maxRounds),
        "--queue-id", request.queueId,
    };

    auto onLine = [&](const std::string& line) {
        RoundUpdate round;
        bool wasRound = line.compare(0, std::char_traits<char>::length(kRoundTag), kRoundTag) == 0;
        if (!parseLine(line, result, sawResult, wasRound ? &round : nullptr)) {
            LOG_DEBUG("[" + shortId(request.runId) + "] engine: " + line);
            return;
        }
        if (wasRound) {
            result.conversationLog.push_back(round);
            if (onRound) onRound(round);
        }
    };

    auto onSpawn = [&](pid_t pid) {
        std::lock_guard<std::mutex> lock(mutex_);
        children_[request.runId] = Child{pid, request.queueId};
    };

    ProcessOutcome process;
    try {
        process = runProcess(command_, args, onLine, onSpawn);
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(mutex_);
        children_.erase(request.runId);
        cancelled_.erase(request.runId);
        throw;
    }

    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        children_.erase(request.runId);
        cancelled = cancelled_.erase(request.runId) > 0;
    }

    if (cancelled) {
        result.ok = false;
        result.cancelled = true;
        result.error = "cancelled";
        return result;
    }
    if (!process.ok()) {
        result.ok = false;
        result.error = "engine " + process.describe();
        return result;
    }
    if (!sawResult) {
        result.ok = false;
        result.error = "engine produced no RESULT line";
        return result;
    }
    return result;
}

void CommandEngine::cancel(const RunId& runId) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = children_.find(runId);
    if (it == children_.end()) return;
    try {
        cancelled_.insert(runId);
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Failed to record cancellation: ") + e.what());
    }
    ::kill(-it->second.pid, SIGTERM);
    LOG_INFO("Sent SIGTERM to engine for run " + shortId(runId));
}

void CommandEngine::cancelAll() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& child : children_) {
        try {
            cancelled_.insert(child.first);
        } catch (const std::exception& e) {
            LOG_WARN(std::string("Failed to record cancellation: ") + e.what());
        }
        ::kill(-child.second.pid, SIGTERM);
    }
    if (!children_.empty()) {
        LOG_INFO("Sent SIGTERM to " + std::to_string(children_.size()) + " engine process(es)");
    }
}

std::vector<ActiveRun> CommandEngine::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ActiveRun> out;
    out.reserve(children_.size());
    for (const auto& child : children_) {
        out.push_back({child.second.queueId, child.first});
    }
    return out;
}

}
