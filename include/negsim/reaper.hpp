/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>

#include "negsim/progress.hpp"
#include "negsim/types.hpp"

namespace negsim {

class Broadcaster;
class Store;

// Turns runs stuck in running past the stale threshold into timeout.
class Reaper final {
public:
    Reaper(Store& store, Broadcaster* events, std::chrono::seconds staleThreshold,
           std::chrono::seconds averageRun) noexcept;

    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    // Returns the number of runs timed out by this pass.
    int sweep(TimePoint now);

    [[nodiscard]] std::chrono::seconds threshold() const noexcept { return threshold_; }

private:
    Store& store_;
    Broadcaster* events_;
    std::chrono::seconds threshold_;
    Progress progress_;
};

}
