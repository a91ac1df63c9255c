/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <string>

#include "negsim/types.hpp"

namespace negsim {

// Fire-and-forget side effects. Both run on the Pool; a throw is logged.
struct Hooks {
    std::function<void(const Run& run, Outcome outcome)> evaluate;
    std::function<void(const Queue& queue)> queueCompleted;
};

// Hooks that run external commands:
//   evaluate:       <cmd> <run id> <negotiation id> <outcome> <technique> <tactic> <personality>
//   queueCompleted: <cmd> <negotiation id> <queue id>
// An empty command leaves that hook unset.
[[nodiscard]] Hooks commandHooks(const std::string& evaluateCommand, const std::string& completeCommand);

}
