/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/store.hpp"
#include "negsim/logger.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace negsim {

namespace fs = std::filesystem;

namespace {

// Exclusive flock held for the lifetime of the object.
class DirLock {
public:
    explicit DirLock(const fs::path& lockPath) {
        fd_ = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw StoreError("Failed to open lock " + lockPath.string() + ": " + std::strerror(errno));
        }
        while (::flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd_);
            throw StoreError("Failed to lock " + lockPath.string() + ": " + std::strerror(err));
        }
    }
    ~DirLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    DirLock(const DirLock&) = delete;
    DirLock& operator=(const DirLock&) = delete;

private:
    int fd_ = -1;
};

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

void setTime(Record& record, const std::string& key, const std::optional<TimePoint>& tp) {
    if (tp) {
        record.set(key, toMillis(*tp));
    } else {
        record.erase(key);
    }
}

std::optional<TimePoint> getTime(const Record& record, const std::string& key) {
    auto ms = record.getInt(key);
    if (!ms) return std::nullopt;
    return fromMillis(*ms);
}

void setNumber(Record& record, const std::string& key, const std::optional<double>& value) {
    if (value) {
        record.setDouble(key, *value);
    } else {
        record.erase(key);
    }
}

Record queueToRecord(const Queue& queue) {
    Record record;
    record.set("id", queue.id);
    record.set("negotiation", queue.negotiationId);
    record.set("total", static_cast<std::int64_t>(queue.totalSimulations));
    record.set("status", toString(queue.status));
    record.setDouble("estimated_cost", queue.estimatedCost);
    record.setDouble("actual_cost", queue.actualCost);
    record.set("created_at", toMillis(queue.createdAt));
    setTime(record, "started_at", queue.startedAt);
    setTime(record, "paused_at", queue.pausedAt);
    setTime(record, "completed_at", queue.completedAt);
    record.set("techniques", joinList(queue.techniques));
    record.set("tactics", joinList(queue.tactics));
    record.set("personalities", joinList(queue.personalities));
    record.set("distances", joinList(queue.distances));
    record.set("completed_count", static_cast<std::int64_t>(queue.completedCount));
    record.set("failed_count", static_cast<std::int64_t>(queue.failedCount));
    return record;
}

Queue queueFromRecord(const Record& record, const fs::path& source) {
    Queue queue;
    queue.id = record.getOr("id", "");
    auto status = parseQueueStatus(record.getOr("status", ""));
    if (queue.id.empty() || !status) {
        throw StoreError("Corrupt queue record: " + source.string());
    }
    queue.status = *status;
    queue.negotiationId = record.getOr("negotiation", "");
    queue.totalSimulations = static_cast<int>(record.getInt("total").value_or(0));
    queue.estimatedCost = record.getDouble("estimated_cost").value_or(0.0);
    queue.actualCost = record.getDouble("actual_cost").value_or(0.0);
    queue.createdAt = getTime(record, "created_at").value_or(TimePoint{});
    queue.startedAt = getTime(record, "started_at");
    queue.pausedAt = getTime(record, "paused_at");
    queue.completedAt = getTime(record, "completed_at");
    queue.techniques = splitList(record.getOr("techniques", ""));
    queue.tactics = splitList(record.getOr("tactics", ""));
    queue.personalities = splitList(record.getOr("personalities", ""));
    queue.distances = splitList(record.getOr("distances", ""));
    queue.completedCount = static_cast<int>(record.getInt("completed_count").value_or(0));
    queue.failedCount = static_cast<int>(record.getInt("failed_count").value_or(0));
    return queue;
}

Record runToRecord(const Run& run) {
    Record record;
    record.set("id", run.id);
    record.set("queue", run.queueId);
    record.set("negotiation", run.negotiationId);
    record.set("order", static_cast<std::int64_t>(run.executionOrder));
    record.set("technique", run.techniqueId);
    record.set("tactic", run.tacticId);
    record.set("personality", run.personalityId);
    record.set("distance", run.distance);
    record.set("status", toString(run.status));
    record.set("retries", static_cast<std::int64_t>(run.retryCount));
    record.set("max_retries", static_cast<std::int64_t>(run.maxRetries));
    setTime(record, "started_at", run.startedAt);
    setTime(record, "completed_at", run.completedAt);
    record.setOptional("deal_value", run.dealValue);
    record.setDouble("cost", run.actualCost);
    record.setOptional("outcome", run.outcome);
    record.set("rounds", static_cast<std::int64_t>(run.totalRounds));
    record.setOptional("error", run.lastError);
    if (run.checkpoint) {
        record.set("checkpoint.run", run.checkpoint->runId);
        record.set("checkpoint.queue", run.checkpoint->queueId);
        record.set("checkpoint.started_at", toMillis(run.checkpoint->startedAt));
        record.set("checkpoint.round", static_cast<std::int64_t>(run.checkpoint->round));
    }
    setTime(record, "recovered_at", run.recoveredAt);
    record.setOptional("analytics_error", run.analyticsError);
    for (const auto& entry : run.finalOffer) {
        record.set("offer." + entry.first, entry.second);
    }
    return record;
}

Run runFromRecord(const Record& record, const fs::path& source) {
    Run run;
    run.id = record.getOr("id", "");
    auto status = parseRunStatus(record.getOr("status", ""));
    if (run.id.empty() || !status) {
        throw StoreError("Corrupt run record: " + source.string());
    }
    run.status = *status;
    run.queueId = record.getOr("queue", "");
    run.negotiationId = record.getOr("negotiation", "");
    run.executionOrder = static_cast<int>(record.getInt("order").value_or(0));
    run.techniqueId = record.getOr("technique", "");
    run.tacticId = record.getOr("tactic", "");
    run.personalityId = record.getOr("personality", "");
    run.distance = record.getOr("distance", "");
    run.retryCount = static_cast<int>(record.getInt("retries").value_or(0));
    run.maxRetries = static_cast<int>(record.getInt("max_retries").value_or(3));
    run.startedAt = getTime(record, "started_at");
    run.completedAt = getTime(record, "completed_at");
    run.dealValue = record.get("deal_value");
    run.actualCost = record.getDouble("cost").value_or(0.0);
    run.outcome = record.get("outcome");
    run.totalRounds = static_cast<int>(record.getInt("rounds").value_or(0));
    run.lastError = record.get("error");
    if (record.has("checkpoint.run")) {
        Checkpoint checkpoint;
        checkpoint.runId = record.getOr("checkpoint.run", "");
        checkpoint.queueId = record.getOr("checkpoint.queue", "");
        checkpoint.startedAt = getTime(record, "checkpoint.started_at").value_or(TimePoint{});
        checkpoint.round = static_cast<int>(record.getInt("checkpoint.round").value_or(0));
        run.checkpoint = checkpoint;
    }
    run.recoveredAt = getTime(record, "recovered_at");
    run.analyticsError = record.get("analytics_error");
    for (auto& entry : record.prefixed("offer.")) {
        run.finalOffer.push_back(std::move(entry));
    }
    return run;
}

Record productToRecord(const Product& product) {
    Record record;
    record.set("id", product.id);
    record.set("name", product.name);
    record.setOptional("key", product.key);
    setNumber(record, "target", product.targetPrice);
    setNumber(record, "min", product.minPrice);
    setNumber(record, "max", product.maxPrice);
    record.setDouble("volume", product.volume);
    return record;
}

Product productFromRecord(const Record& record) {
    Product product;
    product.id = record.getOr("id", "");
    product.name = record.getOr("name", "");
    product.key = record.get("key");
    product.targetPrice = record.getDouble("target");
    product.minPrice = record.getDouble("min");
    product.maxPrice = record.getDouble("max");
    product.volume = record.getDouble("volume").value_or(0.0);
    return product;
}

Record dimensionToRecord(const Dimension& dimension) {
    Record record;
    record.set("name", dimension.name);
    setNumber(record, "min", dimension.minValue);
    setNumber(record, "max", dimension.maxValue);
    setNumber(record, "target", dimension.targetValue);
    record.set("priority", static_cast<std::int64_t>(dimension.priority));
    record.set("unit", dimension.unit);
    return record;
}

Dimension dimensionFromRecord(const Record& record) {
    Dimension dimension;
    dimension.name = record.getOr("name", "");
    dimension.minValue = record.getDouble("min");
    dimension.maxValue = record.getDouble("max");
    dimension.targetValue = record.getDouble("target");
    dimension.priority = static_cast<int>(record.getInt("priority").value_or(3));
    dimension.unit = record.getOr("unit", "");
    return dimension;
}

Record roundToRecord(const RoundUpdate& round) {
    Record record;
    record.set("round", static_cast<std::int64_t>(round.round));
    record.set("agent", round.agent);
    record.set("message", round.message);
    for (const auto& entry : round.offer) {
        record.set("offer." + entry.first, entry.second);
    }
    return record;
}

RoundUpdate roundFromRecord(const Record& record) {
    RoundUpdate round;
    round.round = static_cast<int>(record.getInt("round").value_or(0));
    round.agent = record.getOr("agent", "");
    round.message = record.getOr("message", "");
    round.offer = record.prefixed("offer.");
    return round;
}

NegotiationStatus negotiationStatusFor(QueueStatus status) noexcept {
    switch (status) {
        case QueueStatus::Running:
        case QueueStatus::Paused:
            return NegotiationStatus::Running;
        case QueueStatus::Completed:
            return NegotiationStatus::Completed;
        case QueueStatus::Failed:
            return NegotiationStatus::Aborted;
        case QueueStatus::Pending:
            break;
    }
    return NegotiationStatus::Planned;
}

}

std::optional<std::string> readFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw StoreError("Failed to open " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw StoreError("Failed to read " + path.string());
    }
    return content;
}

void writeFileAtomic(const fs::path& path, const std::string& content) {
    static std::atomic<uint64_t> counter{0};
    fs::path tempPath = path.string() + ".tmp." + std::to_string(::getpid()) + "." +
                        std::to_string(counter.fetch_add(1));
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw StoreError("Failed to create " + tempPath.string());
        }
        file << content;
        file.flush();
        if (!file.good()) {
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw StoreError("Failed to write " + tempPath.string());
        }
    }
    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw StoreError("Failed to publish " + path.string() + ": " + ec.message());
    }
}

Store::Store(const fs::path& workspace) : workspace_(workspace) {
    LOG_DEBUG("Store created for workspace: " + workspace_.string());
}

void Store::initialize() {
    try {
        fs::create_directories(workspace_ / "catalog");
        fs::create_directories(workspace_ / "negotiations");
        fs::create_directories(workspace_ / "queues" / "writing");
    } catch (const fs::filesystem_error& e) {
        throw StoreError("Failed to create workspace: " + std::string(e.what()));
    }
}

fs::path Store::queueDir(const QueueId& id) const {
    return workspace_ / "queues" / id;
}

fs::path Store::runPath(const QueueId& queueId, const RunId& runId, const char* ext) const {
    return queueDir(queueId) / "runs" / (runId + ext);
}

fs::path Store::negotiationDir(const NegotiationId& id) const {
    return workspace_ / "negotiations" / id;
}

// -- negotiations ----------------------------------------------------------

void Store::saveNegotiation(const Negotiation& negotiation) {
    if (negotiation.id.empty()) {
        throw StoreError("Negotiation id is empty");
    }
    auto dir = negotiationDir(negotiation.id);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw StoreError("Failed to create " + dir.string() + ": " + ec.message());
    }

    DirLock lock(dir / ".lock");

    Record record;
    record.set("id", negotiation.id);
    record.set("title", negotiation.title);
    record.set("role", toString(negotiation.role));
    record.set("status", toString(negotiation.status));
    record.set("techniques", joinList(negotiation.techniques));
    record.set("tactics", joinList(negotiation.tactics));
    record.set("personalities", negotiation.personalities);
    record.set("distances", negotiation.distances);
    writeFileAtomic(dir / "negotiation.txt", record.toText());

    std::string products;
    for (const auto& product : negotiation.products) {
        products += productToRecord(product).toLine() + "\n";
    }
    writeFileAtomic(dir / "products.txt", products);

    std::string dimensions;
    for (const auto& dimension : negotiation.dimensions) {
        dimensions += dimensionToRecord(dimension).toLine() + "\n";
    }
    writeFileAtomic(dir / "dimensions.txt", dimensions);
}

std::optional<Negotiation> Store::loadNegotiation(const NegotiationId& id) const {
    if (id.empty()) return std::nullopt;
    auto dir = negotiationDir(id);
    auto text = readFile(dir / "negotiation.txt");
    if (!text) return std::nullopt;

    Record record = Record::fromText(*text);
    Negotiation negotiation;
    negotiation.id = record.getOr("id", id);
    negotiation.title = record.getOr("title", "");
    negotiation.role = parseRole(record.getOr("role", "buyer"));
    negotiation.status = parseNegotiationStatus(record.getOr("status", "")).value_or(NegotiationStatus::Planned);
    negotiation.techniques = splitList(record.getOr("techniques", ""));
    negotiation.tactics = splitList(record.getOr("tactics", ""));
    negotiation.personalities = record.getOr("personalities", "");
    negotiation.distances = record.getOr("distances", "");

    if (auto products = readFile(dir / "products.txt")) {
        for (const auto& line : splitLines(*products)) {
            negotiation.products.push_back(productFromRecord(Record::fromLine(line)));
        }
    }
    if (auto dimensions = readFile(dir / "dimensions.txt")) {
        for (const auto& line : splitLines(*dimensions)) {
            negotiation.dimensions.push_back(dimensionFromRecord(Record::fromLine(line)));
        }
    }
    return negotiation;
}

bool Store::setNegotiationStatus(const NegotiationId& id, NegotiationStatus status) noexcept {
    try {
        auto dir = negotiationDir(id);
        if (id.empty() || !fs::exists(dir / "negotiation.txt")) {
            LOG_DEBUG("No negotiation record to update: " + id);
            return false;
        }
        DirLock lock(dir / ".lock");
        auto text = readFile(dir / "negotiation.txt");
        if (!text) return false;
        Record record = Record::fromText(*text);
        record.set("status", toString(status));
        writeFileAtomic(dir / "negotiation.txt", record.toText());
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("Failed to update negotiation status " + id + ": " + e.what());
        return false;
    }
}

void Store::syncNegotiation(const NegotiationId& id, QueueStatus status) noexcept {
    if (id.empty()) return;
    (void)setNegotiationStatus(id, negotiationStatusFor(status));
}

// -- queues ----------------------------------------------------------------

QueueId Store::createQueue(Queue queue, std::vector<Run> runs) {
    queue.id = generateId();
    for (auto& run : runs) {
        run.id = generateId();
        run.queueId = queue.id;
        run.negotiationId = queue.negotiationId;
    }

    auto staging = workspace_ / "queues" / "writing" / queue.id;
    try {
        fs::create_directories(staging / "runs");
        writeQueue(staging, queue);
        for (const auto& run : runs) {
            writeRun(staging, run);
        }
        // Single rename publishes the fully materialized queue
        fs::rename(staging, queueDir(queue.id));
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove_all(staging, ec);
        throw StoreError("Failed to create queue: " + std::string(e.what()));
    } catch (const StoreError&) {
        std::error_code ec;
        fs::remove_all(staging, ec);
        throw;
    }

    LOG_DEBUG("Queue published: " + queue.id + " (" + std::to_string(runs.size()) + " runs)");
    return queue.id;
}

std::optional<Queue> Store::readQueue(const fs::path& dir) const {
    auto text = readFile(dir / "queue.txt");
    if (!text) return std::nullopt;
    return queueFromRecord(Record::fromText(*text), dir / "queue.txt");
}

void Store::writeQueue(const fs::path& dir, const Queue& queue) const {
    writeFileAtomic(dir / "queue.txt", queueToRecord(queue).toText());
}

std::optional<Queue> Store::loadQueue(const QueueId& id) const {
    if (id.empty() || id == "writing") return std::nullopt;
    return readQueue(queueDir(id));
}

std::vector<Queue> Store::listQueues() const {
    std::vector<Queue> queues;
    auto root = workspace_ / "queues";
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return queues;
    }
    try {
        for (const auto& entry : fs::directory_iterator(root)) {
            if (!entry.is_directory()) continue;
            if (entry.path().filename() == "writing") continue;
            try {
                if (auto queue = readQueue(entry.path())) {
                    queues.push_back(std::move(*queue));
                }
            } catch (const StoreError& e) {
                LOG_WARN("Skipping unreadable queue " + entry.path().filename().string() + ": " + e.what());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw StoreError("Failed to list queues: " + std::string(e.what()));
    }
    std::sort(queues.begin(), queues.end(), [](const Queue& a, const Queue& b) {
        if (a.createdAt != b.createdAt) return a.createdAt < b.createdAt;
        return a.id < b.id;
    });
    return queues;
}

std::vector<Queue> Store::queuesWithStatus(std::initializer_list<QueueStatus> statuses) const {
    std::vector<Queue> out;
    for (auto& queue : listQueues()) {
        if (std::find(statuses.begin(), statuses.end(), queue.status) != statuses.end()) {
            out.push_back(std::move(queue));
        }
    }
    return out;
}

std::vector<Queue> Store::queuesForNegotiation(const NegotiationId& id) const {
    std::vector<Queue> out;
    for (auto& queue : listQueues()) {
        if (queue.negotiationId == id) {
            out.push_back(std::move(queue));
        }
    }
    return out;
}

bool Store::setQueueStatus(const QueueId& id, QueueStatus status, TimePoint now) {
    auto dir = queueDir(id);
    if (id.empty() || !fs::exists(dir / "queue.txt")) {
        return false;
    }

    NegotiationId negotiationId;
    {
        DirLock lock(dir / ".lock");
        auto queue = readQueue(dir);
        if (!queue) return false;

        queue->status = status;
        switch (status) {
            case QueueStatus::Running:
                if (!queue->startedAt) queue->startedAt = now;
                queue->pausedAt.reset();
                break;
            case QueueStatus::Paused:
                queue->pausedAt = now;
                break;
            case QueueStatus::Completed:
            case QueueStatus::Failed:
                queue->completedAt = now;
                break;
            case QueueStatus::Pending:
                queue->pausedAt.reset();
                queue->completedAt.reset();
                break;
        }
        writeQueue(dir, *queue);
        negotiationId = queue->negotiationId;
    }

    syncNegotiation(negotiationId, status);
    return true;
}

std::optional<Queue> Store::refreshRollups(const QueueId& id) {
    auto dir = queueDir(id);
    if (id.empty() || !fs::exists(dir / "queue.txt")) {
        return std::nullopt;
    }

    DirLock lock(dir / ".lock");
    auto queue = readQueue(dir);
    if (!queue) return std::nullopt;

    int completed = 0;
    int failed = 0;
    double cost = 0.0;
    for (const auto& run : readRuns(dir)) {
        if (run.status == RunStatus::Completed) {
            ++completed;
        } else if (run.status == RunStatus::Failed || run.status == RunStatus::Timeout ||
                   run.status == RunStatus::Aborted) {
            ++failed;
        }
        cost += run.actualCost;
    }
    queue->completedCount = completed;
    queue->failedCount = failed;
    queue->actualCost = cost;
    writeQueue(dir, *queue);
    return queue;
}

// -- runs ------------------------------------------------------------------

std::optional<Run> Store::readRun(const fs::path& path) const {
    auto text = readFile(path);
    if (!text) return std::nullopt;
    return runFromRecord(Record::fromText(*text), path);
}

void Store::writeRun(const fs::path& dir, const Run& run) const {
    writeFileAtomic(dir / "runs" / (run.id + ".txt"), runToRecord(run).toText());
}

std::vector<Run> Store::readRuns(const fs::path& dir) const {
    std::vector<Run> runs;
    auto runsDir = dir / "runs";
    std::error_code ec;
    if (!fs::exists(runsDir, ec)) {
        return runs;
    }
    try {
        for (const auto& entry : fs::directory_iterator(runsDir)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".txt") continue;
            if (auto run = readRun(entry.path())) {
                runs.push_back(std::move(*run));
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw StoreError("Failed to list runs in " + dir.string() + ": " + e.what());
    }
    std::sort(runs.begin(), runs.end(), [](const Run& a, const Run& b) {
        return a.executionOrder < b.executionOrder;
    });
    return runs;
}

std::vector<Run> Store::loadRuns(const QueueId& queueId) const {
    if (queueId.empty()) return {};
    return readRuns(queueDir(queueId));
}

std::optional<Run> Store::loadRun(const QueueId& queueId, const RunId& runId) const {
    if (queueId.empty() || runId.empty()) return std::nullopt;
    return readRun(runPath(queueId, runId, ".txt"));
}

std::optional<Run> Store::loadRun(const RunId& runId) const {
    if (runId.empty()) return std::nullopt;
    for (const auto& queue : listQueues()) {
        if (auto run = readRun(runPath(queue.id, runId, ".txt"))) {
            return run;
        }
    }
    return std::nullopt;
}

std::vector<Run> Store::runsWithStatus(RunStatus status) const {
    std::vector<Run> out;
    for (const auto& queue : listQueues()) {
        std::vector<Run> runs;
        try {
            runs = readRuns(queueDir(queue.id));
        } catch (const StoreError& e) {
            LOG_WARN("Skipping runs of queue " + shortId(queue.id) + ": " + e.what());
            continue;
        }
        for (auto& run : runs) {
            if (run.status == status) {
                out.push_back(std::move(run));
            }
        }
    }
    return out;
}

Claim Store::claimNext(const QueueId& queueId, TimePoint now) {
    auto dir = queueDir(queueId);
    if (queueId.empty() || !fs::exists(dir / "queue.txt")) {
        return {};
    }

    Claim claim;
    NegotiationId negotiationId;
    bool queueChanged = false;
    {
        DirLock lock(dir / ".lock");
        auto queue = readQueue(dir);
        if (!queue) return {};
        if (queue->status != QueueStatus::Pending && queue->status != QueueStatus::Running) {
            return {};
        }

        auto runs = readRuns(dir);
        Run* next = nullptr;
        for (auto& run : runs) {
            if (run.status == RunStatus::Running) {
                claim.status = ClaimStatus::Busy;
                claim.run = run;
                return claim;
            }
            if (run.status == RunStatus::Pending &&
                (next == nullptr || run.executionOrder < next->executionOrder)) {
                next = &run;
            }
        }
        if (next == nullptr) {
            claim.status = ClaimStatus::Exhausted;
            return claim;
        }

        next->status = RunStatus::Running;
        next->startedAt = now;
        next->checkpoint = Checkpoint{next->id, queueId, now, 0};
        writeRun(dir, *next);

        if (queue->status != QueueStatus::Running) {
            queue->status = QueueStatus::Running;
            if (!queue->startedAt) queue->startedAt = now;
            queue->pausedAt.reset();
            writeQueue(dir, *queue);
            queueChanged = true;
        }
        negotiationId = queue->negotiationId;

        claim.status = ClaimStatus::Claimed;
        claim.run = *next;
    }

    if (queueChanged) {
        syncNegotiation(negotiationId, QueueStatus::Running);
    }
    return claim;
}

std::optional<Run> Store::updateRun(const QueueId& queueId, const RunId& runId,
                                    const std::function<bool(Run&)>& mutate) {
    auto dir = queueDir(queueId);
    if (queueId.empty() || runId.empty() || !fs::exists(dir / "queue.txt")) {
        return std::nullopt;
    }

    DirLock lock(dir / ".lock");
    auto run = readRun(runPath(queueId, runId, ".txt"));
    if (!run) return std::nullopt;
    if (mutate(*run)) {
        writeRun(dir, *run);
    }
    return run;
}

std::vector<Run> Store::updateRuns(const QueueId& queueId, const std::function<bool(Run&)>& mutate) {
    std::vector<Run> changed;
    auto dir = queueDir(queueId);
    if (queueId.empty() || !fs::exists(dir / "queue.txt")) {
        return changed;
    }

    DirLock lock(dir / ".lock");
    for (auto& run : readRuns(dir)) {
        if (mutate(run)) {
            writeRun(dir, run);
            changed.push_back(std::move(run));
        }
    }
    return changed;
}

// -- artifacts -------------------------------------------------------------

void Store::saveConversation(const QueueId& queueId, const RunId& runId,
                             const std::vector<RoundUpdate>& rounds) {
    std::string content;
    for (const auto& round : rounds) {
        content += roundToRecord(round).toLine() + "\n";
    }
    writeFileAtomic(runPath(queueId, runId, ".log"), content);
}

std::vector<RoundUpdate> Store::loadConversation(const QueueId& queueId, const RunId& runId) const {
    std::vector<RoundUpdate> rounds;
    if (auto text = readFile(runPath(queueId, runId, ".log"))) {
        for (const auto& line : splitLines(*text)) {
            rounds.push_back(roundFromRecord(Record::fromLine(line)));
        }
    }
    return rounds;
}

void Store::saveResults(const QueueId& queueId, const RunId& runId, const std::vector<Record>& rows) {
    std::string content;
    for (const auto& row : rows) {
        content += row.toLine() + "\n";
    }
    writeFileAtomic(runPath(queueId, runId, ".results"), content);
}

std::vector<Record> Store::loadResults(const QueueId& queueId, const RunId& runId) const {
    std::vector<Record> rows;
    if (auto text = readFile(runPath(queueId, runId, ".results"))) {
        for (const auto& line : splitLines(*text)) {
            rows.push_back(Record::fromLine(line));
        }
    }
    return rows;
}

void Store::clearArtifacts(const QueueId& queueId, const RunId& runId) noexcept {
    std::error_code ec;
    fs::remove(runPath(queueId, runId, ".log"), ec);
    fs::remove(runPath(queueId, runId, ".results"), ec);
}

std::string Store::generateId() {
    static std::atomic<uint64_t> counter{0};

    std::random_device device;
    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << std::hex << std::setw(8) << std::setfill('0') << static_cast<uint32_t>(device())
       << std::dec << "_" << now << "_" << unique_counter;
    return ss.str();
}

}
