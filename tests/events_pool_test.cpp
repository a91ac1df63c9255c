/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include "negsim/events.hpp"
#include "negsim/journal.hpp"
#include "negsim/pool.hpp"
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace negsim;
using namespace negsim::testing_support;

TEST(BroadcasterTest, ThrowingListenerDoesNotStopOthers) {
    Broadcaster events;
    int delivered = 0;
    events.subscribe([](const Event&) { throw std::runtime_error("listener broke"); });
    events.subscribe([&delivered](const Event& event) {
        EXPECT_EQ(event.queueId, "q1");
        EXPECT_EQ(event.payload.getOr("run", ""), "r1");
        ++delivered;
    });

    Record payload;
    payload.set("run", "r1");
    events.publish(EventType::SimulationStarted, "q1", "neg-1", payload);
    events.publish(EventType::SimulationCompleted, "q1", "neg-1", payload);

    EXPECT_EQ(delivered, 2);
}

TEST(BroadcasterTest, UnsubscribeStopsDelivery) {
    Broadcaster events;
    int delivered = 0;
    auto token = events.subscribe([&delivered](const Event&) { ++delivered; });
    EXPECT_EQ(events.listenerCount(), 1u);

    events.publish(EventType::QueueProgress, "q1", "neg-1");
    events.unsubscribe(token);
    events.publish(EventType::QueueProgress, "q1", "neg-1");

    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(events.listenerCount(), 0u);
}

TEST(BroadcasterTest, EventNames) {
    EXPECT_STREQ(toString(EventType::SimulationStopped), "simulation_stopped");
    EXPECT_STREQ(toString(EventType::NegotiationRound), "negotiation_round");
}

TEST(JournalTest, AppendsOneLinePerEvent) {
    TempWorkspace ws;
    Journal journal(ws.path() / "events.log");
    EXPECT_TRUE(journal.load().empty());

    Broadcaster events;
    (void)journal.attach(events);
    Record payload;
    payload.set("run", "r1");
    payload.set("reason", "manually_stopped");
    events.publish(EventType::SimulationStopped, "q1", "neg-1", payload);
    events.publish(EventType::QueueCompleted, "q1", "neg-1");

    // a second writer on the same file, as the control tool next to the daemon
    Journal other(ws.path() / "events.log");
    other(Event{EventType::QueueProgress, "q2", "neg-2", {}});

    auto lines = journal.load();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].getOr("event", ""), "simulation_stopped");
    EXPECT_EQ(lines[0].getOr("queue", ""), "q1");
    EXPECT_EQ(lines[0].getOr("reason", ""), "manually_stopped");
    EXPECT_TRUE(lines[0].getInt("ts").has_value());
    EXPECT_EQ(lines[1].getOr("event", ""), "queue_completed");
    EXPECT_EQ(lines[2].getOr("negotiation", ""), "neg-2");
}

TEST(PoolTest, RunsTasksAndSurvivesFailures) {
    Pool pool(2);
    ASSERT_TRUE(pool.start());

    std::atomic<int> ran{0};
    EXPECT_TRUE(pool.submit("boom", [] { throw std::runtime_error("hook failed"); }));
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(pool.submit("count-" + std::to_string(i), [&ran] { ++ran; }));
    }
    pool.stop();

    EXPECT_EQ(ran.load(), 10) << "queued tasks are drained before the workers exit";
    EXPECT_FALSE(pool.isRunning());
}

TEST(PoolTest, RejectsWorkWhenStopped) {
    Pool pool(1);
    EXPECT_FALSE(pool.submit("early", [] {}));

    ASSERT_TRUE(pool.start());
    EXPECT_FALSE(pool.start());
    pool.stop();
    EXPECT_FALSE(pool.submit("late", [] {}));
}
