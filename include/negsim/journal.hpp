/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <mutex>
#include <vector>

#include "negsim/events.hpp"
#include "negsim/record.hpp"

namespace negsim {

// Appends lifecycle events to <workspace>/events.log, one record line each.
// Daemon and CLI both write here so a stop issued from either is visible.
class Journal final {
public:
    explicit Journal(std::filesystem::path path);

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    void operator()(const Event& event);

    // Subscribes this journal; the journal must outlive the broadcaster.
    Broadcaster::Token attach(Broadcaster& events);

    // Lines in append order. A missing journal reads as empty.
    [[nodiscard]] std::vector<Record> load() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

}
