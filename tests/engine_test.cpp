/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include "negsim/engine.hpp"
#include "negsim/store.hpp"
#include "test_support.hpp"
#include <atomic>
#include <memory>
#include <thread>

using namespace negsim;
using namespace negsim::testing_support;

TEST(EngineProtocolTest, ParsesRoundUpdate) {
    EngineResult result;
    bool sawResult = false;
    RoundUpdate round;

    EXPECT_TRUE(CommandEngine::parseLine(
        "ROUND_UPDATE\tround=2\tagent=SELLER\tmessage=counter%3D13\toffer.Preis_WidgetA=13",
        result, sawResult, &round));
    EXPECT_FALSE(sawResult);
    EXPECT_EQ(round.round, 2);
    EXPECT_EQ(round.agent, "SELLER");
    EXPECT_EQ(round.message, "counter=13");
    ASSERT_EQ(round.offer.size(), 1u);
    EXPECT_EQ(round.offer[0].first, "Preis_WidgetA");
}

TEST(EngineProtocolTest, ParsesResult) {
    EngineResult result;
    bool sawResult = false;

    EXPECT_TRUE(CommandEngine::parseLine("RESULT\toutcome=WALK_AWAY\trounds=5\toffer.Lieferzeit=30",
                                         result, sawResult, nullptr));
    EXPECT_TRUE(sawResult);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.outcome, Outcome::WalkAway);
    EXPECT_EQ(result.rawOutcome, "WALK_AWAY");
    EXPECT_EQ(result.totalRounds, 5);
    EXPECT_EQ(result.finalOffer, (DimensionValues{{"Lieferzeit", "30"}}));
}

TEST(EngineProtocolTest, RejectsMalformedResultAndNoise) {
    EngineResult result;
    bool sawResult = false;

    EXPECT_FALSE(CommandEngine::parseLine("loading model...", result, sawResult, nullptr));
    EXPECT_FALSE(sawResult);

    EXPECT_TRUE(CommandEngine::parseLine("RESULT\toutcome=DEAL_ACCEPTED", result, sawResult, nullptr));
    EXPECT_TRUE(sawResult);
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("rounds"), std::string::npos);
}

class CommandEngineTest : public ::testing::Test {
protected:
    std::string script(const std::string& name, const std::string& body) {
        auto path = ws_.path() / name;
        writeFileAtomic(path, body);
        return "exec /bin/sh " + path.string();
    }

    EngineRequest request() const {
        EngineRequest req;
        req.negotiationId = "neg-1";
        req.runId = "run-0001";
        req.techniqueId = "anchoring";
        req.tacticId = "deadline";
        req.personalityId = "default";
        req.distance = "medium";
        req.maxRounds = 6;
        req.queueId = "queue-1";
        return req;
    }

    TempWorkspace ws_;
};

TEST_F(CommandEngineTest, StreamsRoundsAndResult) {
    CommandEngine engine(script("engine.sh",
        "echo 'warming up'\n"
        "printf 'ROUND_UPDATE\\tround=1\\tagent=BUYER\\tmessage=hello\\toffer.Preis_WidgetA=11\\n'\n"
        "printf 'ROUND_UPDATE\\tround=2\\tagent=SELLER\\tmessage=no\\toffer.Preis_WidgetA=13\\n'\n"
        "printf 'RESULT\\toutcome=DEAL_ACCEPTED\\trounds=2\\toffer.run=%s\\toffer.rounds=%s\\n' \"$4\" \"${14}\"\n"));

    std::vector<RoundUpdate> seen;
    auto result = engine.run(request(), [&seen](const RoundUpdate& round) { seen.push_back(round); });

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.outcome, Outcome::DealAccepted);
    EXPECT_EQ(result.totalRounds, 2);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1].agent, "SELLER");
    EXPECT_EQ(result.conversationLog.size(), 2u);
    EXPECT_EQ(result.finalOffer, (DimensionValues{{"run", "run-0001"}, {"rounds", "6"}}));
}

TEST_F(CommandEngineTest, MissingResultIsAFault) {
    CommandEngine engine(script("quiet.sh", "echo 'nothing to say'\n"));

    auto result = engine.run(request(), {});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "engine produced no RESULT line");
}

TEST_F(CommandEngineTest, NonZeroExitIsAFault) {
    CommandEngine engine(script("broken.sh",
        "printf 'RESULT\\toutcome=DEAL_ACCEPTED\\trounds=1\\n'\n"
        "echo 'model crashed' >&2\n"
        "exit 3\n"));

    auto result = engine.run(request(), {});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.rfind("engine ", 0), 0u);
}

TEST_F(CommandEngineTest, CancelTerminatesChild) {
    CommandEngine engine(script("slow.sh",
        "printf 'ROUND_UPDATE\\tround=1\\tagent=BUYER\\tmessage=hi\\n'\n"
        "exec sleep 30\n"));

    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    EngineResult result;
    std::thread worker([&] {
        result = engine.run(request(), [&started](const RoundUpdate&) { started = true; });
        finished = true;
    });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!started && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(started.load());
    engine.cancel("run-0001");
    worker.join();

    EXPECT_TRUE(finished.load());
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.error, "cancelled");
}

TEST_F(CommandEngineTest, CancelReachesGrandchildren) {
    // the shell stays in between: sleep is its child, not the spawned process
    CommandEngine engine(script("nested.sh",
        "printf 'ROUND_UPDATE\\tround=1\\tagent=BUYER\\tmessage=hi\\n'\n"
        "sleep 30\n"
        "printf 'RESULT\\toutcome=DEAL_ACCEPTED\\trounds=1\\n'\n"));

    std::atomic<bool> started{false};
    EngineResult result;
    std::thread worker([&] {
        result = engine.run(request(), [&started](const RoundUpdate&) { started = true; });
    });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!started && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(started.load());
    EXPECT_EQ(engine.active().size(), 1u);

    const auto cancelledAt = std::chrono::steady_clock::now();
    engine.cancelAll();
    worker.join();

    EXPECT_LT(std::chrono::steady_clock::now() - cancelledAt, std::chrono::seconds(10))
        << "the whole process group is terminated";
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(engine.active().empty());
}
