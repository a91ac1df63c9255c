/*
 * negsim - Queue control tool (negsim)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/catalog.hpp"
#include "negsim/config.hpp"
#include "negsim/control.hpp"
#include "negsim/events.hpp"
#include "negsim/journal.hpp"
#include "negsim/logger.hpp"
#include "negsim/record.hpp"
#include "negsim/store.hpp"
#include <cstdlib>
#include <filesystem>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace negsim;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "negsim Queue Control Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> <command> [args...]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  create <negotiation> [--techniques a,b] [--tactics a,b]\n";
    std::cout << "         [--personalities all|a,b] [--distances all|close,far]\n";
    std::cout << "  start <queue>              Queue pending runs for the daemon\n";
    std::cout << "  pause <queue>\n";
    std::cout << "  resume <queue>\n";
    std::cout << "  stop <queue>               Abort pending and running runs\n";
    std::cout << "  stop-negotiation <negotiation>\n";
    std::cout << "  restart <queue>            Reset failed, timeout and aborted runs\n";
    std::cout << "  restart-run <run>\n";
    std::cout << "  status <queue|negotiation>\n";
    std::cout << "  runs <queue>\n";
    std::cout << "  results <queue>            Conversation and result rows per run\n";
    std::cout << "  stats <negotiation>        Run counts across all queues\n";
    std::cout << "  recover <negotiation> [--apply]\n";
    std::cout << "  catalog list <techniques|tactics|personalities>\n";
    std::cout << "  catalog add <techniques|tactics|personalities> <id> <name> [description]\n";
    std::cout << "  negotiation setup <id> [--title t] [--role buyer|seller]\n";
    std::cout << "         [--techniques a,b] [--tactics a,b] [--personalities s] [--distances s]\n";
    std::cout << "         [--product name:volume[:target[:min[:max[:key]]]]]...\n";
    std::cout << "         [--dimension name[:min[:max[:target[:priority[:unit]]]]]]...\n";
    std::cout << "  negotiation show <id>\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  NEGSIM_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
}

std::vector<std::string> splitOn(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream in(text);
    while (std::getline(in, part, sep)) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == sep) {
        parts.emplace_back();
    }
    return parts;
}

std::optional<double> optionalNumber(const std::vector<std::string>& parts, std::size_t index) {
    if (index >= parts.size() || parts[index].empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double value = std::strtod(parts[index].c_str(), &end);
    if (end == parts[index].c_str() || *end != '\0') {
        throw std::invalid_argument("not a number: " + parts[index]);
    }
    return value;
}

std::optional<CatalogKind> parseKind(const std::string& text) {
    if (text == "techniques") return CatalogKind::Techniques;
    if (text == "tactics") return CatalogKind::Tactics;
    if (text == "personalities") return CatalogKind::Personalities;
    return std::nullopt;
}

std::string timeText(const std::optional<TimePoint>& tp) {
    if (!tp) return "-";
    std::time_t t = Clock::to_time_t(*tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

void printReport(const QueueReport& report) {
    const Queue& q = report.queue;
    std::cout << "Queue        " << q.id << "\n";
    std::cout << "Negotiation  " << q.negotiationId << "\n";
    std::cout << "Status       " << toString(q.status) << "\n";
    std::cout << "Progress     " << report.completedCount << " completed, " << report.failedCount
              << " failed, " << report.remaining << " remaining of " << q.totalSimulations << " ("
              << std::fixed << std::setprecision(1) << report.percentage << "%)\n";
    std::cout << "Runs         pending " << report.counts.pending << ", running " << report.counts.running
              << ", completed " << report.counts.completed << ", failed " << report.counts.failed
              << ", timeout " << report.counts.timeout << ", paused " << report.counts.paused
              << ", aborted " << report.counts.aborted << "\n";
    std::cout << "ETA          " << report.eta.count() << "s\n";
    std::cout << "Cost         " << std::setprecision(3) << report.actualCost << " of estimated "
              << std::setprecision(2) << report.estimatedCost << "\n";
    std::cout << "Created      " << timeText(q.createdAt) << "\n";
    std::cout << "Started      " << timeText(q.startedAt) << "\n";
    std::cout << "Completed    " << timeText(q.completedAt) << "\n";
    if (report.current) {
        const Run& run = *report.current;
        std::cout << "Current      #" << run.executionOrder << " " << run.id << " (" << run.techniqueId
                  << " / " << run.tacticId << " / " << run.personalityId << " / " << run.distance << ")\n";
    }
}

int report(const OpResult& result, const std::string& what) {
    if (!result.ok) {
        std::cerr << "Error: " << result.message << std::endl;
        return 1;
    }
    std::cout << what;
    if (!result.message.empty()) std::cout << " (" << result.message << ")";
    std::cout << std::endl;
    return 0;
}

int cmdCreate(Control& control, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Error: create requires a negotiation id\n";
        return 1;
    }
    QueueRequest request;
    request.negotiationId = args[0];
    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (i + 1 >= args.size()) {
            std::cerr << "Error: " << arg << " requires a value\n";
            return 1;
        }
        if (arg == "--techniques") {
            request.techniques = splitList(args[++i]);
        } else if (arg == "--tactics") {
            request.tactics = splitList(args[++i]);
        } else if (arg == "--personalities") {
            request.personalities = splitList(args[++i]);
        } else if (arg == "--distances") {
            request.distances = splitList(args[++i]);
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return 1;
        }
    }

    auto result = control.createQueue(request);
    if (!result.ok) {
        std::cerr << "Error: " << result.message << std::endl;
        return result.error == CreateError::Validation ? 2 : 1;
    }
    std::cout << result.id << std::endl;
    return 0;
}

int cmdRuns(Control& control, const QueueId& queueId) {
    auto runs = control.runs(queueId);
    if (runs.empty()) {
        std::cerr << "No runs for queue " << queueId << std::endl;
        return 1;
    }
    for (const auto& run : runs) {
        std::cout << std::setw(4) << run.executionOrder << "  " << std::left << std::setw(10)
                  << toString(run.status) << std::right << "  " << run.id << "  " << run.techniqueId
                  << " / " << run.tacticId << " / " << run.personalityId << " / " << run.distance;
        if (run.outcome) std::cout << "  " << *run.outcome;
        if (run.dealValue) std::cout << "  deal " << *run.dealValue;
        if (run.lastError) std::cout << "  error: " << *run.lastError;
        std::cout << "\n";
    }
    return 0;
}

int cmdResults(Control& control, const QueueId& queueId) {
    auto details = control.results(queueId);
    if (details.empty()) {
        std::cerr << "No runs for queue " << queueId << std::endl;
        return 1;
    }
    for (const auto& detail : details) {
        const Run& run = detail.run;
        std::cout << "#" << run.executionOrder << " " << run.id << "  " << toString(run.status) << "  "
                  << run.techniqueId << " / " << run.tacticId << " / " << run.personalityId << " / "
                  << run.distance << "\n";
        if (run.outcome) {
            std::cout << "  outcome " << *run.outcome << " after " << run.totalRounds << " round(s)";
            if (run.dealValue) std::cout << ", deal " << *run.dealValue;
            std::cout << "\n";
        }
        for (const auto& round : detail.conversation) {
            std::cout << "  [" << round.round << "] " << round.agent << ": " << round.message << "\n";
        }
        for (const auto& row : detail.results) {
            std::cout << "  " << row.toLine() << "\n";
        }
    }
    return 0;
}

int cmdStats(Control& control, const NegotiationId& negotiationId) {
    auto stats = control.stats(negotiationId);
    if (stats.planned) {
        std::cout << "No queue yet, " << stats.pendingRuns << " run(s) planned\n";
        return 0;
    }
    std::cout << "Total        " << stats.totalRuns << "\n";
    std::cout << "Completed    " << stats.completedRuns << "\n";
    std::cout << "Running      " << stats.runningRuns << "\n";
    std::cout << "Failed       " << stats.failedRuns << "\n";
    std::cout << "Pending      " << stats.pendingRuns << "\n";
    std::cout << "Success      " << stats.successRate << "%\n";
    return 0;
}

int cmdRecover(Control& control, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Error: recover requires a negotiation id\n";
        return 1;
    }
    bool apply = args.size() > 1 && args[1] == "--apply";
    auto found = control.findRecoveryOpportunities(args[0]);
    if (!found.hasRecoverableSession) {
        std::cout << "Nothing to recover" << std::endl;
        return 0;
    }
    if (found.latestQueueId) std::cout << "Latest queue   " << *found.latestQueueId << "\n";
    if (found.checkpoint) {
        std::cout << "Current run    " << found.checkpoint->currentRunId << " (round "
                  << found.checkpoint->round << ")\n";
        std::cout << "Completed      " << found.checkpoint->completedRunIds.size() << "\n";
        std::cout << "Failed         " << found.checkpoint->failedRunIds.size() << "\n";
        std::cout << "Cost           " << std::fixed << std::setprecision(3) << found.checkpoint->totalCost << "\n";
    }
    std::cout << "Orphaned runs  " << found.orphanedRunIds.size() << "\n";
    for (const auto& id : found.orphanedRunIds) {
        std::cout << "  " << id << "\n";
    }
    if (!apply || found.orphanedRunIds.empty()) {
        return 0;
    }
    return report(control.recoverOrphanedSimulations(found.orphanedRunIds), "Recovered orphaned runs");
}

int cmdCatalog(Catalog& catalog, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Error: catalog requires list|add and a kind\n";
        return 1;
    }
    auto kind = parseKind(args[1]);
    if (!kind) {
        std::cerr << "Error: Unknown catalog " << args[1] << "\n";
        return 1;
    }
    if (args[0] == "list") {
        for (const auto& entry : catalog.list(*kind)) {
            std::cout << entry.id << "\t" << entry.name;
            if (!entry.description.empty()) std::cout << "\t" << entry.description;
            std::cout << "\n";
        }
        return 0;
    }
    if (args[0] == "add") {
        if (args.size() < 4) {
            std::cerr << "Error: catalog add requires <id> <name>\n";
            return 1;
        }
        catalog.put(*kind, {args[2], args[3], args.size() > 4 ? args[4] : std::string()});
        std::cout << args[2] << std::endl;
        return 0;
    }
    std::cerr << "Error: Unknown catalog command " << args[0] << "\n";
    return 1;
}

int cmdNegotiation(Store& store, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Error: negotiation requires setup|show and an id\n";
        return 1;
    }

    if (args[0] == "show") {
        auto negotiation = store.loadNegotiation(args[1]);
        if (!negotiation) {
            std::cerr << "Negotiation not found: " << args[1] << std::endl;
            return 1;
        }
        std::cout << "Negotiation  " << negotiation->id << "\n";
        std::cout << "Title        " << negotiation->title << "\n";
        std::cout << "Role         " << toString(negotiation->role) << "\n";
        std::cout << "Status       " << toString(negotiation->status) << "\n";
        std::cout << "Techniques   " << joinList(negotiation->techniques) << "\n";
        std::cout << "Tactics      " << joinList(negotiation->tactics) << "\n";
        std::cout << "Products     " << negotiation->products.size() << "\n";
        for (const auto& product : negotiation->products) {
            std::cout << "  " << product.name << " x" << product.volume << "\n";
        }
        std::cout << "Dimensions   " << negotiation->dimensions.size() << "\n";
        for (const auto& dimension : negotiation->dimensions) {
            std::cout << "  " << dimension.name << " (priority " << dimension.priority << ")\n";
        }
        return 0;
    }

    if (args[0] != "setup") {
        std::cerr << "Error: Unknown negotiation command " << args[0] << "\n";
        return 1;
    }

    Negotiation negotiation;
    if (auto existing = store.loadNegotiation(args[1])) {
        negotiation = *existing;
    }
    negotiation.id = args[1];
    bool productsGiven = false;
    bool dimensionsGiven = false;

    for (std::size_t i = 2; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (i + 1 >= args.size()) {
            std::cerr << "Error: " << arg << " requires a value\n";
            return 1;
        }
        const std::string& value = args[++i];
        if (arg == "--title") {
            negotiation.title = value;
        } else if (arg == "--role") {
            negotiation.role = parseRole(value);
        } else if (arg == "--techniques") {
            negotiation.techniques = splitList(value);
        } else if (arg == "--tactics") {
            negotiation.tactics = splitList(value);
        } else if (arg == "--personalities") {
            negotiation.personalities = value;
        } else if (arg == "--distances") {
            negotiation.distances = value;
        } else if (arg == "--product") {
            if (!productsGiven) negotiation.products.clear();
            productsGiven = true;
            auto parts = splitOn(value, ':');
            if (parts.size() < 2 || parts[0].empty()) {
                std::cerr << "Error: --product expects name:volume[:target[:min[:max[:key]]]]\n";
                return 1;
            }
            Product product;
            product.id = negotiation.id + "-p" + std::to_string(negotiation.products.size() + 1);
            product.name = parts[0];
            product.volume = optionalNumber(parts, 1).value_or(0.0);
            product.targetPrice = optionalNumber(parts, 2);
            product.minPrice = optionalNumber(parts, 3);
            product.maxPrice = optionalNumber(parts, 4);
            if (parts.size() > 5 && !parts[5].empty()) product.key = parts[5];
            negotiation.products.push_back(std::move(product));
        } else if (arg == "--dimension") {
            if (!dimensionsGiven) negotiation.dimensions.clear();
            dimensionsGiven = true;
            auto parts = splitOn(value, ':');
            if (parts.empty() || parts[0].empty()) {
                std::cerr << "Error: --dimension expects name[:min[:max[:target[:priority[:unit]]]]]\n";
                return 1;
            }
            Dimension dimension;
            dimension.name = parts[0];
            dimension.minValue = optionalNumber(parts, 1);
            dimension.maxValue = optionalNumber(parts, 2);
            dimension.targetValue = optionalNumber(parts, 3);
            if (auto priority = optionalNumber(parts, 4)) dimension.priority = static_cast<int>(*priority);
            if (parts.size() > 5) dimension.unit = parts[5];
            negotiation.dimensions.push_back(std::move(dimension));
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return 1;
        }
    }

    store.saveNegotiation(negotiation);
    std::cout << negotiation.id << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; NEGSIM_LOG_LEVEL overrides
    if (!std::getenv("NEGSIM_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    std::string command = argv[2];
    std::vector<std::string> args(argv + 3, argv + argc);
    auto need = [&](const char* what) {
        if (args.empty()) {
            std::cerr << "Error: " << command << " requires " << what << "\n";
            return false;
        }
        return true;
    };

    try {
        Store store(workspace);
        store.initialize();
        Catalog catalog(workspace);
        Config config = Config::fromEnv();
        // Events land in the shared journal. With no engine handle here, the
        // daemon's next tick cancels engine calls whose run this process stopped.
        Journal journal(std::filesystem::path(workspace) / "events.log");
        Broadcaster events;
        (void)journal.attach(events);
        Control control(store, catalog, &events, nullptr, config);

        if (command == "create") return cmdCreate(control, args);
        if (command == "start") return need("a queue id") ? report(control.startQueue(args[0]), "Started") : 1;
        if (command == "pause") return need("a queue id") ? report(control.pauseQueue(args[0]), "Paused") : 1;
        if (command == "resume") return need("a queue id") ? report(control.resumeQueue(args[0]), "Resumed") : 1;
        if (command == "stop") {
            if (!need("a queue id")) return 1;
            auto result = control.stopQueue(args[0]);
            return report(result, "Stopped, " + std::to_string(result.count) + " run(s) aborted");
        }
        if (command == "stop-negotiation") {
            if (!need("a negotiation id")) return 1;
            auto result = control.stopQueuesForNegotiation(args[0]);
            return report(result, "Stopped " + std::to_string(result.count) + " queue(s)");
        }
        if (command == "restart") {
            if (!need("a queue id")) return 1;
            auto result = control.restartFailedSimulations(args[0]);
            return report(result, "Reset " + std::to_string(result.count) + " run(s) to pending");
        }
        if (command == "restart-run") {
            if (!need("a run id")) return 1;
            auto result = control.restartRun(args[0]);
            return report(result, "Reset run #" + std::to_string(result.count) + " to pending");
        }
        if (command == "status") {
            if (!need("a queue or negotiation id")) return 1;
            QueueId queueId = args[0];
            if (!store.loadQueue(queueId)) {
                auto found = control.findQueueByNegotiation(args[0]);
                if (!found) {
                    std::cerr << "Queue not found: " << args[0] << std::endl;
                    return 1;
                }
                queueId = *found;
            }
            auto status = control.getQueueStatus(queueId);
            if (!status) {
                std::cerr << "Queue not found: " << queueId << std::endl;
                return 1;
            }
            printReport(*status);
            return 0;
        }
        if (command == "runs") return need("a queue id") ? cmdRuns(control, args[0]) : 1;
        if (command == "results") return need("a queue id") ? cmdResults(control, args[0]) : 1;
        if (command == "stats") return need("a negotiation id") ? cmdStats(control, args[0]) : 1;
        if (command == "recover") return cmdRecover(control, args);
        if (command == "catalog") return cmdCatalog(catalog, args);
        if (command == "negotiation") return cmdNegotiation(store, args);

        std::cerr << "Error: Unknown command " << command << "\n";
        printUsage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
