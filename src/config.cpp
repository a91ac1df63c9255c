/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/config.hpp"
#include "negsim/logger.hpp"
#include <cstdlib>
#include <stdexcept>

namespace negsim {

namespace {
std::size_t env_size(const char* name, std::size_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::logic_error&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

double env_double(const char* name, double defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        double parsed = std::stod(val);
        return parsed <= 0.0 ? defv : parsed;
    } catch (const std::logic_error&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

std::string env_string(const char* name) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : std::string();
}
}

Config Config::fromEnv() {
    Config config;
    config.tickInterval = std::chrono::milliseconds(
        env_size("NEGSIM_TICK_MS", static_cast<std::size_t>(config.tickInterval.count())));
    config.runDelay = std::chrono::milliseconds(
        env_size("NEGSIM_RUN_DELAY_MS", static_cast<std::size_t>(config.runDelay.count())));
    config.staleThreshold = std::chrono::seconds(
        env_size("NEGSIM_STALE_SECONDS", static_cast<std::size_t>(config.staleThreshold.count())));
    config.recoveryThreshold = std::chrono::seconds(
        env_size("NEGSIM_RECOVERY_SECONDS", static_cast<std::size_t>(config.recoveryThreshold.count())));
    config.maxRounds = static_cast<int>(env_size("NEGSIM_MAX_ROUNDS", static_cast<std::size_t>(config.maxRounds)));
    config.maxRetries = static_cast<int>(env_size("NEGSIM_MAX_RETRIES", static_cast<std::size_t>(config.maxRetries)));
    config.runCost = env_double("NEGSIM_RUN_COST", config.runCost);
    config.roundCost = env_double("NEGSIM_ROUND_COST", config.roundCost);
    config.averageRunDuration = std::chrono::seconds(
        env_size("NEGSIM_AVG_RUN_SECONDS", static_cast<std::size_t>(config.averageRunDuration.count())));
    config.hookWorkers = env_size("NEGSIM_HOOK_WORKERS", config.hookWorkers);

    // "0" disables; anything else that is set keeps it on
    const char* recover = std::getenv("NEGSIM_AUTO_RECOVER");
    if (recover && std::string(recover) == "0") {
        config.autoRecover = false;
    }

    config.engineCommand = env_string("NEGSIM_ENGINE_CMD");
    config.evaluateCommand = env_string("NEGSIM_EVAL_CMD");
    config.completeCommand = env_string("NEGSIM_COMPLETE_CMD");
    return config;
}

}
