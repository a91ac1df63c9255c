/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/journal.hpp"
#include "negsim/logger.hpp"
#include <fstream>
#include <utility>

namespace negsim {

Journal::Journal(std::filesystem::path path) : path_(std::move(path)) {}

void Journal::operator()(const Event& event) {
    Record line;
    line.set("ts", toMillis(Clock::now()));
    line.set("event", toString(event.type));
    line.set("queue", event.queueId);
    line.set("negotiation", event.negotiationId);
    for (const auto& field : event.payload.fields()) {
        line.set(field.first, field.second);
    }
    const std::string text = line.toLine() + "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        LOG_WARN("Cannot append to event journal: " + path_.string());
        return;
    }
    out << text;
    out.flush();
    if (!out) {
        LOG_WARN("Short write to event journal: " + path_.string());
    }
}

Broadcaster::Token Journal::attach(Broadcaster& events) {
    return events.subscribe([this](const Event& event) { (*this)(event); });
}

std::vector<Record> Journal::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Record> lines;
    std::ifstream in(path_);
    if (!in) {
        return lines;
    }
    std::string text;
    while (std::getline(in, text)) {
        if (text.empty()) continue;
        lines.push_back(Record::fromLine(text));
    }
    return lines;
}

}
