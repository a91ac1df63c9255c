/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace negsim {

struct Config {
    std::chrono::milliseconds tickInterval{2000};
    std::chrono::milliseconds runDelay{1000};
    std::chrono::seconds staleThreshold{600};
    std::chrono::seconds recoveryThreshold{300};
    int maxRounds = 6;
    int maxRetries = 3;
    double runCost = 0.15;
    double roundCost = 0.006;
    std::chrono::seconds averageRunDuration{60};
    std::size_t hookWorkers = 2;
    bool autoRecover = true;

    std::string engineCommand;
    std::string evaluateCommand;
    std::string completeCommand;

    // Reads NEGSIM_* variables; unset, invalid or zero values keep the defaults.
    [[nodiscard]] static Config fromEnv();
};

}
