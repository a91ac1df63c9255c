/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include "negsim/catalog.hpp"
#include "negsim/matrix.hpp"
#include "negsim/reaper.hpp"
#include "negsim/store.hpp"
#include "test_support.hpp"
#include <memory>

using namespace negsim;
using namespace negsim::testing_support;
using std::chrono::minutes;
using std::chrono::seconds;

class ReaperTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<Store>(ws_.path());
        store_->initialize();
        catalog_ = std::make_unique<Catalog>(ws_.path());
        log_ = std::make_unique<EventLog>(events_);
        reaper_ = std::make_unique<Reaper>(*store_, &events_, seconds(600), seconds(60));
        now_ = Clock::now();
    }

    QueueId createQueue(int runs) {
        MatrixBuilder builder(*catalog_, 0.15, 3);
        QueueRequest request;
        request.negotiationId = "neg-1";
        for (int i = 0; i < runs; ++i) request.techniques.push_back("t" + std::to_string(i));
        request.tactics = {"k1"};
        return builder.build(*store_, request, now_);
    }

    void markRunning(const QueueId& queueId, const RunId& runId, TimePoint startedAt) {
        (void)store_->updateRun(queueId, runId, [startedAt](negsim::Run& run) {
            run.status = RunStatus::Running;
            run.startedAt = startedAt;
            run.checkpoint = Checkpoint{run.id, run.queueId, startedAt, 2};
            return true;
        });
    }

    TempWorkspace ws_;
    Broadcaster events_;
    std::unique_ptr<Store> store_;
    std::unique_ptr<Catalog> catalog_;
    std::unique_ptr<EventLog> log_;
    std::unique_ptr<Reaper> reaper_;
    TimePoint now_;
};

TEST_F(ReaperTest, StaleRunTimesOutExactlyOnce) {
    QueueId id = createQueue(2);
    auto runs = store_->loadRuns(id);
    markRunning(id, runs[0].id, now_ - minutes(11));

    EXPECT_EQ(reaper_->sweep(now_), 1);
    EXPECT_EQ(reaper_->sweep(now_ + seconds(5)), 0);

    auto reaped = store_->loadRun(id, runs[0].id);
    ASSERT_TRUE(reaped.has_value());
    EXPECT_EQ(reaped->status, RunStatus::Timeout);
    EXPECT_EQ(reaped->lastError.value_or(""), "timeout");
    EXPECT_TRUE(reaped->completedAt.has_value());
    EXPECT_FALSE(reaped->checkpoint.has_value());

    auto queue = store_->loadQueue(id);
    EXPECT_EQ(queue->failedCount, 1);
    EXPECT_EQ(queue->completedCount, 0);
    EXPECT_EQ(queue->status, QueueStatus::Pending);

    EXPECT_EQ(log_->count(EventType::SimulationFailed), 1);
    EXPECT_EQ(log_->count(EventType::QueueProgress), 1);
    auto events = log_->all();
    bool sawTimeout = false;
    for (const auto& event : events) {
        if (event.type == EventType::SimulationFailed) {
            sawTimeout = event.payload.getOr("error", "") == "timeout";
        }
    }
    EXPECT_TRUE(sawTimeout);
}

TEST_F(ReaperTest, FreshRunIsLeftAlone) {
    QueueId id = createQueue(1);
    auto runs = store_->loadRuns(id);
    markRunning(id, runs[0].id, now_ - minutes(9));

    EXPECT_EQ(reaper_->sweep(now_), 0);
    EXPECT_EQ(store_->loadRun(id, runs[0].id)->status, RunStatus::Running);
    EXPECT_TRUE(log_->all().empty());
}

TEST_F(ReaperTest, LastStaleRunCompletesQueue) {
    QueueId id = createQueue(1);
    auto runs = store_->loadRuns(id);
    markRunning(id, runs[0].id, now_ - minutes(30));

    EXPECT_EQ(reaper_->sweep(now_), 1);
    auto queue = store_->loadQueue(id);
    EXPECT_EQ(queue->status, QueueStatus::Completed);
    EXPECT_EQ(queue->failedCount, 1);
    EXPECT_EQ(log_->count(EventType::QueueCompleted), 1);
}

TEST_F(ReaperTest, SweepsAcrossQueues) {
    QueueId a = createQueue(1);
    QueueId b = createQueue(2);
    markRunning(a, store_->loadRuns(a)[0].id, now_ - minutes(15));
    markRunning(b, store_->loadRuns(b)[0].id, now_ - minutes(15));

    EXPECT_EQ(reaper_->sweep(now_), 2);
    EXPECT_EQ(store_->loadQueue(a)->status, QueueStatus::Completed);
    EXPECT_EQ(store_->loadQueue(b)->failedCount, 1);
}

TEST_F(ReaperTest, CorruptQueueDoesNotBlockOthers) {
    QueueId broken = createQueue(2);
    QueueId healthy = createQueue(1);
    auto brokenRuns = store_->loadRuns(broken);
    markRunning(broken, brokenRuns[0].id, now_ - minutes(30));
    writeFileAtomic(ws_.path() / "queues" / broken / "runs" / (brokenRuns[1].id + ".txt"), "garbage\n");

    QueueId unreadable = createQueue(1);
    writeFileAtomic(ws_.path() / "queues" / unreadable / "queue.txt", "status=\n");

    RunId stale = store_->loadRuns(healthy)[0].id;
    markRunning(healthy, stale, now_ - minutes(30));

    EXPECT_EQ(reaper_->sweep(now_), 1);
    EXPECT_EQ(store_->loadRun(healthy, stale)->status, RunStatus::Timeout);
    EXPECT_EQ(store_->loadQueue(healthy)->status, QueueStatus::Completed);
    EXPECT_EQ(log_->count(EventType::SimulationFailed), 1);
}
