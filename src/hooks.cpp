/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/hooks.hpp"
#include "negsim/logger.hpp"
#include "negsim/subprocess.hpp"
#include <stdexcept>

namespace negsim {

namespace {
void runHook(const std::string& name, const std::string& command, const std::vector<std::string>& args) {
    auto outcome = runProcess(command, args, [&name](const std::string& line) {
        LOG_DEBUG(name + ": " + line);
    });
    if (!outcome.ok()) {
        throw std::runtime_error(name + " hook " + outcome.describe());
    }
}
}

Hooks commandHooks(const std::string& evaluateCommand, const std::string& completeCommand) {
    Hooks hooks;
    if (!evaluateCommand.empty()) {
        hooks.evaluate = [evaluateCommand](const Run& run, Outcome outcome) {
            runHook("evaluate", evaluateCommand,
                    {run.id, run.negotiationId, toString(outcome), run.techniqueId, run.tacticId,
                     run.personalityId});
        };
    }
    if (!completeCommand.empty()) {
        hooks.queueCompleted = [completeCommand](const Queue& queue) {
            runHook("complete", completeCommand, {queue.negotiationId, queue.id});
        };
    }
    return hooks;
}

}
