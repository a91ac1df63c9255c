/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "negsim/catalog.hpp"
#include "negsim/engine.hpp"
#include "negsim/events.hpp"
#include "negsim/store.hpp"

namespace negsim {
namespace testing_support {

// Unique scratch workspace removed on destruction.
class TempWorkspace {
public:
    TempWorkspace() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("negsim_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// One scripted engine reply. Replies are consumed in call order; once the
// script is empty every call returns the default reply.
struct Reply {
    enum class Kind { Result, Fault, Throw } kind = Kind::Result;
    std::string outcome = "DEAL_ACCEPTED";
    int rounds = 3;
    DimensionValues offer;
    std::string error = "engine unavailable";
    bool emitRounds = false;
};

// In-process engine with overlap detection per queue and an optional gate
// that holds every call until released or cancelled. A call cancelled while
// held returns a cancelled result, as a terminated child process would.
class FakeEngine : public Engine {
public:
    EngineResult run(const EngineRequest& request, const RoundCallback& onRound) override {
        Reply reply;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (++active_[request.queueId] > 1) overlapped_ = true;
            inFlight_[request.runId] = request.queueId;
            requests_.push_back(request);
            if (!script_.empty()) {
                reply = script_.front();
                script_.pop_front();
            } else {
                reply = defaultReply_;
            }
            ++entered_;
            entered_cv_.notify_all();
            gate_cv_.wait(lock, [&] { return !gated_ || cancelled_.count(request.runId) > 0; });
        }

        struct Leave {
            FakeEngine& self;
            const EngineRequest& request;
            ~Leave() {
                std::lock_guard<std::mutex> lock(self.mutex_);
                --self.active_[request.queueId];
                self.inFlight_.erase(request.runId);
                self.cancelled_.erase(request.runId);
            }
        } leave{*this, request};

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_.count(request.runId) > 0) {
                EngineResult result;
                result.cancelled = true;
                result.error = "cancelled";
                return result;
            }
        }

        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);

        if (reply.kind == Reply::Kind::Throw) {
            throw std::runtime_error(reply.error);
        }
        EngineResult result;
        if (reply.kind == Reply::Kind::Fault) {
            result.ok = false;
            result.error = reply.error;
            return result;
        }

        result.ok = true;
        result.rawOutcome = reply.outcome;
        result.outcome = parseOutcome(reply.outcome);
        result.totalRounds = reply.rounds;
        result.finalOffer = reply.offer;
        for (int round = 1; round <= reply.rounds && reply.emitRounds; ++round) {
            RoundUpdate update;
            update.round = round;
            update.agent = round % 2 ? "BUYER" : "SELLER";
            update.message = "round " + std::to_string(round);
            update.offer = reply.offer;
            result.conversationLog.push_back(update);
            if (onRound) onRound(update);
        }
        return result;
    }

    void cancel(const RunId& runId) noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inFlight_.count(runId) == 0) return;
        cancelled_.insert(runId);
        cancelHistory_.push_back(runId);
        gate_cv_.notify_all();
    }

    void cancelAll() noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : inFlight_) {
            cancelled_.insert(entry.first);
            cancelHistory_.push_back(entry.first);
        }
        gate_cv_.notify_all();
    }

    std::vector<ActiveRun> active() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ActiveRun> runs;
        for (const auto& entry : inFlight_) {
            runs.push_back(ActiveRun{entry.second, entry.first});
        }
        return runs;
    }

    void script(Reply reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(reply));
    }
    void setDefault(Reply reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        defaultReply_ = std::move(reply);
    }
    void setDelay(std::chrono::milliseconds delay) { delay_ = delay; }

    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        gated_ = true;
    }
    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        gated_ = false;
        gate_cv_.notify_all();
    }
    bool waitEntered(int count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return entered_cv_.wait_for(lock, timeout, [&] { return entered_ >= count; });
    }

    bool overlapped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return overlapped_;
    }
    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(requests_.size());
    }
    std::vector<EngineRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }
    std::vector<RunId> cancelledRuns() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelHistory_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable gate_cv_;
    std::condition_variable entered_cv_;
    std::deque<Reply> script_;
    Reply defaultReply_;
    std::map<QueueId, int> active_;
    std::set<RunId> cancelled_;
    std::map<RunId, QueueId> inFlight_;
    std::vector<RunId> cancelHistory_;
    std::vector<EngineRequest> requests_;
    std::chrono::milliseconds delay_{0};
    bool gated_ = false;
    bool overlapped_ = false;
    int entered_ = 0;
};

// Records every published event.
class EventLog {
public:
    explicit EventLog(Broadcaster& events) {
        events.subscribe([this](const Event& event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        });
    }

    std::vector<Event> all() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }
    int count(EventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& event : events_) {
            if (event.type == type) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

inline Negotiation makeNegotiation(const std::string& id) {
    Negotiation negotiation;
    negotiation.id = id;
    negotiation.title = "Supplier contract";
    negotiation.role = Role::Buyer;
    negotiation.techniques = {"anchoring", "reciprocity"};
    negotiation.tactics = {"deadline", "bundling"};
    negotiation.personalities = "default";
    negotiation.distances = "medium";

    Product widget;
    widget.id = id + "-p1";
    widget.name = "WidgetA";
    widget.targetPrice = 12.0;
    widget.minPrice = 10.0;
    widget.maxPrice = 15.0;
    widget.volume = 100;
    negotiation.products.push_back(widget);
    return negotiation;
}

}
}
