/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "negsim/record.hpp"
#include "negsim/types.hpp"

namespace negsim {

enum class EventType : uint8_t {
    SimulationStarted,
    SimulationCompleted,
    SimulationFailed,
    SimulationStopped,
    QueueProgress,
    QueueCompleted,
    NegotiationRound
};

const char* toString(EventType type) noexcept;

struct Event {
    EventType type = EventType::QueueProgress;
    QueueId queueId;
    NegotiationId negotiationId;
    Record payload;
};

using Listener = std::function<void(const Event&)>;

// Fans lifecycle events out to every subscriber on the publishing thread.
class Broadcaster final {
public:
    using Token = std::uint64_t;

    Broadcaster() = default;

    Broadcaster(const Broadcaster&) = delete;
    Broadcaster& operator=(const Broadcaster&) = delete;

    Token subscribe(Listener listener);
    void unsubscribe(Token token) noexcept;

    // A throwing listener is logged and does not affect the others.
    void publish(EventType type, const QueueId& queueId, const NegotiationId& negotiationId,
                 const Record& payload = {}) noexcept;

    [[nodiscard]] std::size_t listenerCount() const noexcept;

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<Token, Listener>> listeners_;
    Token next_ = 1;
};

}
