/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

#include "negsim/types.hpp"

namespace negsim {

class Catalog;
class Store;

constexpr const char* kAllSelector = "all";
constexpr const char* kDefaultSelector = "default";

struct QueueRequest {
    NegotiationId negotiationId;
    std::vector<std::string> techniques;
    std::vector<std::string> tactics;
    std::vector<std::string> personalities;  // ids, or a single "all"
    std::vector<std::string> distances;      // categories, or a single "all"
};

struct MatrixPlan {
    Queue queue;
    std::vector<Run> runs;
};

// Expands a request into the ordered technique -> tactic -> personality ->
// distance cross product. Selectors are resolved against the catalog at build
// time, so later catalog edits never change an existing queue.
class MatrixBuilder final {
public:
    MatrixBuilder(const Catalog& catalog, double runCost, int maxRetries) noexcept;

    [[nodiscard]] MatrixPlan plan(const QueueRequest& request, TimePoint now) const;

    // Plans and publishes the queue with all of its runs. Returns the queue id.
    [[nodiscard]] QueueId build(Store& store, const QueueRequest& request, TimePoint now) const;

    [[nodiscard]] std::vector<std::string> resolvePersonalities(const std::vector<std::string>& selector) const;
    [[nodiscard]] static std::vector<std::string> resolveDistances(const std::vector<std::string>& selector);

private:
    const Catalog& catalog_;
    double runCost_;
    int maxRetries_;
};

}
