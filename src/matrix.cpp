/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/matrix.hpp"
#include "negsim/catalog.hpp"
#include "negsim/logger.hpp"
#include "negsim/store.hpp"
#include <algorithm>

namespace negsim {

namespace {
bool selectsAll(const std::vector<std::string>& selector) {
    return std::find(selector.begin(), selector.end(), kAllSelector) != selector.end();
}

std::vector<std::string> orDefault(std::vector<std::string> values) {
    if (values.empty()) {
        values.emplace_back(kDefaultSelector);
    }
    return values;
}
}

MatrixBuilder::MatrixBuilder(const Catalog& catalog, double runCost, int maxRetries) noexcept
    : catalog_(catalog), runCost_(runCost), maxRetries_(maxRetries) {}

std::vector<std::string> MatrixBuilder::resolvePersonalities(const std::vector<std::string>& selector) const {
    if (selectsAll(selector)) {
        return orDefault(catalog_.ids(CatalogKind::Personalities));
    }
    return orDefault(selector);
}

std::vector<std::string> MatrixBuilder::resolveDistances(const std::vector<std::string>& selector) {
    if (selectsAll(selector)) {
        return Catalog::distances();
    }
    return orDefault(selector);
}

MatrixPlan MatrixBuilder::plan(const QueueRequest& request, TimePoint now) const {
    MatrixPlan plan;
    auto personalities = resolvePersonalities(request.personalities);
    auto distances = resolveDistances(request.distances);

    Queue& queue = plan.queue;
    queue.negotiationId = request.negotiationId;
    queue.status = QueueStatus::Pending;
    queue.createdAt = now;
    queue.techniques = request.techniques;
    queue.tactics = request.tactics;
    queue.personalities = personalities;
    queue.distances = distances;

    int order = 1;
    for (const auto& technique : request.techniques) {
        for (const auto& tactic : request.tactics) {
            for (const auto& personality : personalities) {
                for (const auto& distance : distances) {
                    Run run;
                    run.negotiationId = request.negotiationId;
                    run.executionOrder = order++;
                    run.techniqueId = technique;
                    run.tacticId = tactic;
                    run.personalityId = personality;
                    run.distance = distance;
                    run.status = RunStatus::Pending;
                    run.maxRetries = maxRetries_;
                    plan.runs.push_back(std::move(run));
                }
            }
        }
    }

    queue.totalSimulations = static_cast<int>(plan.runs.size());
    queue.estimatedCost = queue.totalSimulations * runCost_;
    return plan;
}

QueueId MatrixBuilder::build(Store& store, const QueueRequest& request, TimePoint now) const {
    MatrixPlan matrix = plan(request, now);
    LOG_INFO("Creating queue for negotiation " + request.negotiationId + ": " +
             std::to_string(request.techniques.size()) + " techniques x " +
             std::to_string(request.tactics.size()) + " tactics x " +
             std::to_string(matrix.queue.personalities.size()) + " personalities x " +
             std::to_string(matrix.queue.distances.size()) + " distances = " +
             std::to_string(matrix.queue.totalSimulations) + " runs");

    QueueId id = store.createQueue(std::move(matrix.queue), std::move(matrix.runs));
    LOG_AUDIT("queue_created", "queue=" + id + " negotiation=" + request.negotiationId);
    return id;
}

}
