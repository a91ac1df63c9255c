/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/types.hpp"
#include <algorithm>
#include <cctype>

namespace negsim {

namespace {
std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

const char* toString(QueueStatus status) noexcept {
    switch (status) {
        case QueueStatus::Pending:   return "pending";
        case QueueStatus::Running:   return "running";
        case QueueStatus::Paused:    return "paused";
        case QueueStatus::Completed: return "completed";
        case QueueStatus::Failed:    return "failed";
    }
    return "unknown";
}

const char* toString(RunStatus status) noexcept {
    switch (status) {
        case RunStatus::Pending:   return "pending";
        case RunStatus::Running:   return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed:    return "failed";
        case RunStatus::Timeout:   return "timeout";
        case RunStatus::Paused:    return "paused";
        case RunStatus::Aborted:   return "aborted";
    }
    return "unknown";
}

const char* toString(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::DealAccepted:     return "DEAL_ACCEPTED";
        case Outcome::Terminated:       return "TERMINATED";
        case Outcome::WalkAway:         return "WALK_AWAY";
        case Outcome::Paused:           return "PAUSED";
        case Outcome::MaxRoundsReached: return "MAX_ROUNDS_REACHED";
        case Outcome::Error:            return "ERROR";
        case Outcome::Unrecognized:     return "UNRECOGNIZED";
    }
    return "UNRECOGNIZED";
}

const char* toString(Role role) noexcept {
    return role == Role::Buyer ? "buyer" : "seller";
}

const char* toString(NegotiationStatus status) noexcept {
    switch (status) {
        case NegotiationStatus::Planned:   return "planned";
        case NegotiationStatus::Running:   return "running";
        case NegotiationStatus::Completed: return "completed";
        case NegotiationStatus::Aborted:   return "aborted";
    }
    return "planned";
}

std::optional<QueueStatus> parseQueueStatus(const std::string& text) noexcept {
    if (text == "pending") return QueueStatus::Pending;
    if (text == "running") return QueueStatus::Running;
    if (text == "paused") return QueueStatus::Paused;
    if (text == "completed") return QueueStatus::Completed;
    if (text == "failed") return QueueStatus::Failed;
    return std::nullopt;
}

std::optional<RunStatus> parseRunStatus(const std::string& text) noexcept {
    if (text == "pending") return RunStatus::Pending;
    if (text == "running") return RunStatus::Running;
    if (text == "completed") return RunStatus::Completed;
    if (text == "failed") return RunStatus::Failed;
    if (text == "timeout") return RunStatus::Timeout;
    if (text == "paused") return RunStatus::Paused;
    if (text == "aborted") return RunStatus::Aborted;
    return std::nullopt;
}

Outcome parseOutcome(const std::string& text) noexcept {
    if (text == "DEAL_ACCEPTED") return Outcome::DealAccepted;
    if (text == "TERMINATED") return Outcome::Terminated;
    if (text == "WALK_AWAY") return Outcome::WalkAway;
    if (text == "PAUSED") return Outcome::Paused;
    if (text == "MAX_ROUNDS_REACHED") return Outcome::MaxRoundsReached;
    if (text == "ERROR") return Outcome::Error;
    return Outcome::Unrecognized;
}

Role parseRole(const std::string& text) {
    return lower(text) == "buyer" ? Role::Buyer : Role::Seller;
}

std::optional<NegotiationStatus> parseNegotiationStatus(const std::string& text) noexcept {
    if (text == "planned") return NegotiationStatus::Planned;
    if (text == "running") return NegotiationStatus::Running;
    if (text == "completed") return NegotiationStatus::Completed;
    if (text == "aborted") return NegotiationStatus::Aborted;
    return std::nullopt;
}

bool isTerminal(RunStatus status) noexcept {
    return status == RunStatus::Completed || status == RunStatus::Failed ||
           status == RunStatus::Timeout || status == RunStatus::Aborted;
}

RunStatus classifyOutcome(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::DealAccepted:
        case Outcome::Terminated:
        case Outcome::WalkAway:
            return RunStatus::Completed;
        case Outcome::Paused:
            return RunStatus::Paused;
        case Outcome::MaxRoundsReached:
            return RunStatus::Timeout;
        default:
            return RunStatus::Failed;
    }
}

bool qualifiesForEvaluation(Outcome outcome) noexcept {
    return outcome == Outcome::DealAccepted || outcome == Outcome::Terminated ||
           outcome == Outcome::WalkAway || outcome == Outcome::MaxRoundsReached;
}

std::int64_t toMillis(TimePoint tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromMillis(std::int64_t ms) noexcept {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

std::string shortId(const std::string& id) {
    return id.substr(0, 8);
}

}
