/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/events.hpp"
#include "negsim/logger.hpp"
#include <algorithm>

namespace negsim {

const char* toString(EventType type) noexcept {
    switch (type) {
        case EventType::SimulationStarted:   return "simulation_started";
        case EventType::SimulationCompleted: return "simulation_completed";
        case EventType::SimulationFailed:    return "simulation_failed";
        case EventType::SimulationStopped:   return "simulation_stopped";
        case EventType::QueueProgress:       return "queue_progress";
        case EventType::QueueCompleted:      return "queue_completed";
        case EventType::NegotiationRound:    return "negotiation_round";
    }
    return "unknown";
}

Broadcaster::Token Broadcaster::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    Token token = next_++;
    listeners_.emplace_back(token, std::move(listener));
    return token;
}

void Broadcaster::unsubscribe(Token token) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [token](const auto& entry) { return entry.first == token; }),
                     listeners_.end());
}

void Broadcaster::publish(EventType type, const QueueId& queueId, const NegotiationId& negotiationId,
                          const Record& payload) noexcept {
    std::vector<Listener> snapshot;
    Event event;
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot.reserve(listeners_.size());
            for (const auto& entry : listeners_) {
                snapshot.push_back(entry.second);
            }
        }
        event.type = type;
        event.queueId = queueId;
        event.negotiationId = negotiationId;
        event.payload = payload;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to prepare event ") + toString(type) + ": " + e.what());
        return;
    }

    LOG_TRACE(std::string("Event ") + toString(type) + " queue=" + shortId(queueId));

    for (const auto& listener : snapshot) {
        try {
            if (listener) listener(event);
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Event listener failed on ") + toString(type) + ": " + e.what());
        } catch (...) {
            LOG_ERROR(std::string("Event listener failed on ") + toString(type) + ": unknown error");
        }
    }
}

std::size_t Broadcaster::listenerCount() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

}
