/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include "negsim/catalog.hpp"
#include "negsim/matrix.hpp"
#include "negsim/store.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <memory>

using namespace negsim;
using negsim::testing_support::TempWorkspace;

class MatrixBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<Store>(ws_.path());
        store_->initialize();
        catalog_ = std::make_unique<Catalog>(ws_.path());
        builder_ = std::make_unique<MatrixBuilder>(*catalog_, 0.15, 3);
    }

    TempWorkspace ws_;
    std::unique_ptr<Store> store_;
    std::unique_ptr<Catalog> catalog_;
    std::unique_ptr<MatrixBuilder> builder_;
};

TEST_F(MatrixBuilderTest, CrossProductOrderIsNested) {
    QueueRequest request;
    request.negotiationId = "neg-1";
    request.techniques = {"t1", "t2"};
    request.tactics = {"k1", "k2"};
    request.personalities = {"p1"};
    request.distances = {"close"};

    auto plan = builder_->plan(request, Clock::now());
    ASSERT_EQ(plan.runs.size(), 4u);
    EXPECT_EQ(plan.queue.totalSimulations, 4);
    EXPECT_DOUBLE_EQ(plan.queue.estimatedCost, 0.6);

    const std::vector<std::pair<std::string, std::string>> expected = {
        {"t1", "k1"}, {"t1", "k2"}, {"t2", "k1"}, {"t2", "k2"}};
    for (std::size_t i = 0; i < plan.runs.size(); ++i) {
        EXPECT_EQ(plan.runs[i].executionOrder, static_cast<int>(i) + 1);
        EXPECT_EQ(plan.runs[i].techniqueId, expected[i].first);
        EXPECT_EQ(plan.runs[i].tacticId, expected[i].second);
        EXPECT_EQ(plan.runs[i].status, RunStatus::Pending);
        EXPECT_EQ(plan.runs[i].maxRetries, 3);
    }
}

TEST_F(MatrixBuilderTest, AllSelectorsResolveAgainstCatalog) {
    catalog_->put(CatalogKind::Personalities, {"analytical", "Analytical", ""});
    catalog_->put(CatalogKind::Personalities, {"assertive", "Assertive", ""});
    catalog_->put(CatalogKind::Personalities, {"amiable", "Amiable", ""});

    QueueRequest request;
    request.negotiationId = "neg-1";
    request.techniques = {"t1"};
    request.tactics = {"k1", "k2"};
    request.personalities = {"all"};
    request.distances = {"all"};

    auto plan = builder_->plan(request, Clock::now());
    EXPECT_EQ(plan.queue.totalSimulations, 1 * 2 * 3 * 3);
    EXPECT_EQ(plan.queue.personalities.size(), 3u);
    EXPECT_EQ(plan.queue.distances, (std::vector<std::string>{"close", "medium", "far"}));

    // innermost axis is distance
    EXPECT_EQ(plan.runs[0].distance, "close");
    EXPECT_EQ(plan.runs[1].distance, "medium");
    EXPECT_EQ(plan.runs[2].distance, "far");
    EXPECT_EQ(plan.runs[3].personalityId, plan.queue.personalities[1]);
}

TEST_F(MatrixBuilderTest, EmptyResolutionFallsBackToDefault) {
    QueueRequest request;
    request.negotiationId = "neg-1";
    request.techniques = {"t1"};
    request.tactics = {"k1"};
    request.personalities = {"all"};  // empty catalog

    auto plan = builder_->plan(request, Clock::now());
    ASSERT_EQ(plan.runs.size(), 1u);
    EXPECT_EQ(plan.runs[0].personalityId, "default");
    EXPECT_EQ(plan.runs[0].distance, "default");
}

TEST_F(MatrixBuilderTest, OrdersFormExactPermutation) {
    catalog_->put(CatalogKind::Personalities, {"a", "A", ""});
    catalog_->put(CatalogKind::Personalities, {"b", "B", ""});

    QueueRequest request;
    request.negotiationId = "neg-1";
    request.techniques = {"t1", "t2", "t3"};
    request.tactics = {"k1", "k2"};
    request.personalities = {"all"};
    request.distances = {"close", "far"};

    QueueId id = builder_->build(*store_, request, Clock::now());
    auto queue = store_->loadQueue(id);
    ASSERT_TRUE(queue.has_value());
    EXPECT_EQ(queue->totalSimulations, 24);
    EXPECT_EQ(queue->status, QueueStatus::Pending);

    auto runs = store_->loadRuns(id);
    ASSERT_EQ(runs.size(), 24u);
    std::vector<int> orders;
    for (const auto& run : runs) {
        orders.push_back(run.executionOrder);
        EXPECT_EQ(run.queueId, id);
    }
    std::sort(orders.begin(), orders.end());
    for (int i = 0; i < 24; ++i) {
        EXPECT_EQ(orders[i], i + 1);
    }
}

TEST_F(MatrixBuilderTest, CatalogEditsDoNotChangeExistingQueue) {
    catalog_->put(CatalogKind::Personalities, {"a", "A", ""});

    QueueRequest request;
    request.negotiationId = "neg-1";
    request.techniques = {"t1"};
    request.tactics = {"k1"};
    request.personalities = {"all"};
    request.distances = {"close"};

    QueueId id = builder_->build(*store_, request, Clock::now());
    catalog_->put(CatalogKind::Personalities, {"b", "B", ""});

    auto queue = store_->loadQueue(id);
    ASSERT_TRUE(queue.has_value());
    EXPECT_EQ(queue->totalSimulations, 1);
    EXPECT_EQ(queue->personalities, (std::vector<std::string>{"a"}));
    EXPECT_EQ(store_->loadRuns(id).size(), 1u);
}
