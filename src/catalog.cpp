/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/catalog.hpp"
#include "negsim/logger.hpp"
#include "negsim/record.hpp"
#include "negsim/store.hpp"
#include <sstream>

namespace negsim {

const char* toString(CatalogKind kind) noexcept {
    switch (kind) {
        case CatalogKind::Techniques:    return "techniques";
        case CatalogKind::Tactics:       return "tactics";
        case CatalogKind::Personalities: return "personalities";
    }
    return "techniques";
}

Catalog::Catalog(const std::filesystem::path& workspace) noexcept
    : dir_(workspace / "catalog") {}

std::filesystem::path Catalog::fileFor(CatalogKind kind) const {
    return dir_ / (std::string(toString(kind)) + ".txt");
}

std::vector<CatalogEntry> Catalog::list(CatalogKind kind) const {
    std::vector<CatalogEntry> entries;
    auto text = readFile(fileFor(kind));
    if (!text) {
        LOG_DEBUG(std::string("Catalog has no ") + toString(kind));
        return entries;
    }

    std::istringstream in(*text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        Record record = Record::fromLine(line);
        auto id = record.get("id");
        if (!id || id->empty()) {
            LOG_WARN(std::string("Skipping catalog line without id in ") + toString(kind));
            continue;
        }
        entries.push_back({*id, record.getOr("name", *id), record.getOr("description", "")});
    }
    return entries;
}

std::vector<std::string> Catalog::ids(CatalogKind kind) const {
    std::vector<std::string> out;
    for (const auto& entry : list(kind)) {
        out.push_back(entry.id);
    }
    return out;
}

void Catalog::put(CatalogKind kind, const CatalogEntry& entry) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        throw StoreError("Failed to create catalog: " + ec.message());
    }

    auto entries = list(kind);
    bool replaced = false;
    for (auto& existing : entries) {
        if (existing.id == entry.id) {
            existing = entry;
            replaced = true;
        }
    }
    if (!replaced) {
        entries.push_back(entry);
    }

    std::string content;
    for (const auto& item : entries) {
        Record record;
        record.set("id", item.id);
        record.set("name", item.name);
        record.set("description", item.description);
        content += record.toLine() + "\n";
    }
    writeFileAtomic(fileFor(kind), content);
}

const std::vector<std::string>& Catalog::distances() noexcept {
    static const std::vector<std::string> categories = {"close", "medium", "far"};
    return categories;
}

}
