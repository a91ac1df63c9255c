/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace negsim {

struct ProcessOutcome {
    bool started = false;
    int exitCode = -1;
    int signal = 0;          // terminating signal, 0 when exited normally
    std::string errorTail;   // last bytes written to stderr
    std::string error;       // spawn failure

    [[nodiscard]] bool ok() const noexcept { return started && signal == 0 && exitCode == 0; }
    [[nodiscard]] std::string describe() const;
};

using LineHandler = std::function<void(const std::string&)>;
using SpawnHandler = std::function<void(pid_t)>;

// Runs `command` through /bin/sh with `args` appended as positional
// parameters. Each stdout line is handed to onLine as it arrives. onSpawn
// sees the child pid before any output is read. The child leads its own
// process group; signal -pid to reach its descendants too.
[[nodiscard]] ProcessOutcome runProcess(const std::string& command, const std::vector<std::string>& args,
                                        const LineHandler& onLine, const SpawnHandler& onSpawn = {});

}
