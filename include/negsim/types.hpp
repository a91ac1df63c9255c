#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace negsim {

using QueueId = std::string;
using RunId = std::string;
using NegotiationId = std::string;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Queue lifecycle states.
enum class QueueStatus : std::uint8_t { Pending, Running, Paused, Completed, Failed };

// Run lifecycle states.
enum class RunStatus : std::uint8_t { Pending, Running, Completed, Failed, Timeout, Paused, Aborted };

// Outcome reported by the negotiation engine. Unknown strings parse to Unrecognized.
enum class Outcome : std::uint8_t {
    DealAccepted,
    Terminated,
    WalkAway,
    Paused,
    MaxRoundsReached,
    Error,
    Unrecognized
};

enum class Role : std::uint8_t { Buyer, Seller };

enum class NegotiationStatus : std::uint8_t { Planned, Running, Completed, Aborted };

// Ordered key/value pairs as reported by the engine (values may be locale text).
using DimensionValues = std::vector<std::pair<std::string, std::string>>;

const char* toString(QueueStatus status) noexcept;
const char* toString(RunStatus status) noexcept;
const char* toString(Outcome outcome) noexcept;
const char* toString(Role role) noexcept;
const char* toString(NegotiationStatus status) noexcept;

std::optional<QueueStatus> parseQueueStatus(const std::string& text) noexcept;
std::optional<RunStatus> parseRunStatus(const std::string& text) noexcept;
Outcome parseOutcome(const std::string& text) noexcept;
Role parseRole(const std::string& text);
std::optional<NegotiationStatus> parseNegotiationStatus(const std::string& text) noexcept;

[[nodiscard]] bool isTerminal(RunStatus status) noexcept;

// Outcome -> terminal run status used when committing an engine result.
[[nodiscard]] RunStatus classifyOutcome(Outcome outcome) noexcept;

// Outcomes that trigger the post-run evaluation hook.
[[nodiscard]] bool qualifiesForEvaluation(Outcome outcome) noexcept;

std::int64_t toMillis(TimePoint tp) noexcept;
TimePoint fromMillis(std::int64_t ms) noexcept;

// First eight characters, for log lines.
std::string shortId(const std::string& id);

struct Product {
    std::string id;
    std::string name;
    std::optional<std::string> key;
    std::optional<double> targetPrice;
    std::optional<double> minPrice;
    std::optional<double> maxPrice;
    double volume = 0.0;  // fixed, never negotiated
};

struct Dimension {
    std::string name;
    std::optional<double> minValue;
    std::optional<double> maxValue;
    std::optional<double> targetValue;
    int priority = 3;
    std::string unit;
};

struct Negotiation {
    NegotiationId id;
    std::string title;
    Role role = Role::Buyer;
    NegotiationStatus status = NegotiationStatus::Planned;
    std::vector<std::string> techniques;
    std::vector<std::string> tactics;
    std::string personalities;  // "all" or comma list
    std::string distances;      // "all" or comma list
    std::vector<Product> products;
    std::vector<Dimension> dimensions;
};

// One incremental exchange streamed by the engine while a run is in flight.
struct RoundUpdate {
    int round = 0;
    std::string agent;
    std::string message;
    DimensionValues offer;
};

// Crash-recovery snapshot, diagnostics only.
struct Checkpoint {
    RunId runId;
    QueueId queueId;
    TimePoint startedAt;
    int round = 0;
};

struct Run {
    RunId id;
    QueueId queueId;
    NegotiationId negotiationId;
    int executionOrder = 0;
    std::string techniqueId;
    std::string tacticId;
    std::string personalityId;
    std::string distance;
    RunStatus status = RunStatus::Pending;
    int retryCount = 0;
    int maxRetries = 3;
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;
    DimensionValues finalOffer;
    std::optional<std::string> dealValue;
    double actualCost = 0.0;
    std::optional<std::string> outcome;  // raw engine text
    int totalRounds = 0;
    std::optional<std::string> lastError;
    std::optional<Checkpoint> checkpoint;
    std::optional<TimePoint> recoveredAt;
    std::optional<std::string> analyticsError;
};

struct Queue {
    QueueId id;
    NegotiationId negotiationId;
    int totalSimulations = 0;
    QueueStatus status = QueueStatus::Pending;
    double estimatedCost = 0.0;
    double actualCost = 0.0;
    TimePoint createdAt;
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> pausedAt;
    std::optional<TimePoint> completedAt;
    std::vector<std::string> techniques;
    std::vector<std::string> tactics;
    std::vector<std::string> personalities;
    std::vector<std::string> distances;
    // Cached for external readers; never trusted for decisions.
    int completedCount = 0;
    int failedCount = 0;
};

} // namespace negsim
