/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include "negsim/catalog.hpp"
#include "negsim/control.hpp"
#include "negsim/executor.hpp"
#include "negsim/matrix.hpp"
#include "negsim/reaper.hpp"
#include "negsim/scheduler.hpp"
#include "negsim/store.hpp"
#include "test_support.hpp"
#include <memory>
#include <thread>

using namespace negsim;
using namespace negsim::testing_support;
using std::chrono::milliseconds;

class SchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<Store>(ws_.path());
        store_->initialize();
        catalog_ = std::make_unique<Catalog>(ws_.path());
        store_->saveNegotiation(makeNegotiation("neg-1"));
        store_->saveNegotiation(makeNegotiation("neg-2"));

        Reply deal;
        deal.offer = {{"Preis_WidgetA", "12"}};
        engine_.setDefault(deal);

        executor_ = std::make_unique<Executor>(*store_, engine_, &events_, nullptr, config_);
        reaper_ = std::make_unique<Reaper>(*store_, &events_, config_.staleThreshold,
                                           config_.averageRunDuration);
        scheduler_ = std::make_unique<Scheduler>(*store_, *executor_, reaper_.get(), &engine_,
                                                 milliseconds(50), milliseconds(0));
    }

    void TearDown() override {
        engine_.release();
        scheduler_->shutdown();
    }

    QueueId createQueue(const NegotiationId& negotiationId, std::vector<std::string> techniques) {
        MatrixBuilder builder(*catalog_, config_.runCost, config_.maxRetries);
        QueueRequest request;
        request.negotiationId = negotiationId;
        request.techniques = std::move(techniques);
        request.tactics = {"k1", "k2"};
        return builder.build(*store_, request, Clock::now());
    }

    bool waitForStatus(const QueueId& id, QueueStatus status, milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            auto queue = store_->loadQueue(id);
            if (queue && queue->status == status) return true;
            std::this_thread::sleep_for(milliseconds(10));
        }
        return false;
    }

    TempWorkspace ws_;
    Config config_;
    Broadcaster events_;
    FakeEngine engine_;
    std::unique_ptr<Store> store_;
    std::unique_ptr<Catalog> catalog_;
    std::unique_ptr<Executor> executor_;
    std::unique_ptr<Reaper> reaper_;
    std::unique_ptr<Scheduler> scheduler_;
};

TEST_F(SchedulerTest, DrainsQueuesWithoutOverlap) {
    engine_.setDelay(milliseconds(5));
    QueueId a = createQueue("neg-1", {"t1", "t2", "t3"});
    QueueId b = createQueue("neg-2", {"t1", "t2"});

    ASSERT_TRUE(scheduler_->start());
    EXPECT_TRUE(waitForStatus(a, QueueStatus::Completed, milliseconds(10000)));
    EXPECT_TRUE(waitForStatus(b, QueueStatus::Completed, milliseconds(10000)));
    EXPECT_TRUE(scheduler_->waitIdle(milliseconds(5000)));

    EXPECT_FALSE(engine_.overlapped());
    EXPECT_EQ(engine_.calls(), 10);
    EXPECT_EQ(store_->loadQueue(a)->completedCount, 6);
    EXPECT_EQ(store_->loadQueue(b)->completedCount, 4);
}

TEST_F(SchedulerTest, KickIsIdempotentPerQueue) {
    QueueId id = createQueue("neg-1", {"t1"});
    engine_.hold();

    EXPECT_TRUE(scheduler_->kick(id));
    EXPECT_FALSE(scheduler_->kick(id));
    ASSERT_TRUE(engine_.waitEntered(1, milliseconds(5000)));
    EXPECT_TRUE(scheduler_->isProcessing(id));
    EXPECT_EQ(scheduler_->processing(), (std::vector<QueueId>{id}));

    engine_.release();
    EXPECT_TRUE(scheduler_->waitIdle(milliseconds(5000)));
    EXPECT_FALSE(scheduler_->isProcessing(id));
    EXPECT_EQ(engine_.calls(), 2);
    EXPECT_FALSE(engine_.overlapped());
    EXPECT_EQ(store_->loadQueue(id)->status, QueueStatus::Completed);
}

TEST_F(SchedulerTest, PausedQueueIsNotPickedUp) {
    QueueId id = createQueue("neg-1", {"t1"});
    (void)store_->setQueueStatus(id, QueueStatus::Paused, Clock::now());

    scheduler_->tick();
    EXPECT_TRUE(scheduler_->waitIdle(milliseconds(2000)));
    EXPECT_EQ(engine_.calls(), 0);
    EXPECT_EQ(store_->loadQueue(id)->status, QueueStatus::Paused);
}

TEST_F(SchedulerTest, CorruptRunMarksQueueFailed) {
    QueueId id = createQueue("neg-1", {"t1"});
    auto runs = store_->loadRuns(id);
    writeFileAtomic(ws_.path() / "queues" / id / "runs" / (runs[0].id + ".txt"), "garbage\n");

    EXPECT_TRUE(scheduler_->kick(id));
    EXPECT_TRUE(scheduler_->waitIdle(milliseconds(5000)));
    EXPECT_EQ(store_->loadQueue(id)->status, QueueStatus::Failed);
    EXPECT_EQ(engine_.calls(), 0);
}

TEST_F(SchedulerTest, ShutdownReleasesInFlightRun) {
    QueueId id = createQueue("neg-1", {"t1"});
    engine_.hold();

    ASSERT_TRUE(scheduler_->start());
    ASSERT_TRUE(engine_.waitEntered(1, milliseconds(5000)));
    EXPECT_TRUE(scheduler_->systemStatus().tickerRunning);
    EXPECT_EQ(scheduler_->systemStatus().activeQueues, 1u);

    scheduler_->shutdown();
    EXPECT_FALSE(scheduler_->isRunning());
    EXPECT_FALSE(scheduler_->isProcessing(id));
    EXPECT_EQ(engine_.calls(), 1) << "no new run is claimed once shutdown begins";

    auto runs = store_->loadRuns(id);
    ASSERT_EQ(runs.size(), 2u);
    EXPECT_EQ(runs[0].status, RunStatus::Pending);
    EXPECT_EQ(runs[0].retryCount, 0);
    EXPECT_FALSE(runs[0].startedAt.has_value());
    EXPECT_EQ(runs[1].status, RunStatus::Pending);
}

TEST_F(SchedulerTest, StopFromAnotherProcessCancelsEngineCall) {
    QueueId id = createQueue("neg-1", {"t1"});
    engine_.hold();

    EXPECT_TRUE(scheduler_->kick(id));
    ASSERT_TRUE(engine_.waitEntered(1, milliseconds(5000)));
    const RunId inFlight = engine_.requests().front().runId;

    // a control tool without an engine handle only rewrites the rows
    Control remote(*store_, *catalog_, nullptr, nullptr, config_);
    auto stopped = remote.stopQueue(id);
    EXPECT_TRUE(stopped.ok);
    EXPECT_EQ(stopped.count, 2);
    EXPECT_TRUE(engine_.cancelledRuns().empty());

    scheduler_->tick();
    EXPECT_EQ(engine_.cancelledRuns(), (std::vector<RunId>{inFlight}));
    EXPECT_TRUE(scheduler_->waitIdle(milliseconds(5000)));

    EXPECT_EQ(engine_.calls(), 1);
    EXPECT_EQ(store_->loadRun(id, inFlight)->status, RunStatus::Aborted);
    EXPECT_EQ(store_->loadQueue(id)->status, QueueStatus::Completed);
}

TEST_F(SchedulerTest, TickLeavesRunningEngineCallsAlone) {
    QueueId id = createQueue("neg-1", {"t1"});
    engine_.hold();

    EXPECT_TRUE(scheduler_->kick(id));
    ASSERT_TRUE(engine_.waitEntered(1, milliseconds(5000)));
    scheduler_->tick();
    EXPECT_TRUE(engine_.cancelledRuns().empty());
    EXPECT_TRUE(scheduler_->isProcessing(id));

    engine_.release();
    EXPECT_TRUE(waitForStatus(id, QueueStatus::Completed, milliseconds(5000)));
}
