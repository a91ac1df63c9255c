/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace negsim {

struct CatalogEntry {
    std::string id;
    std::string name;
    std::string description;
};

enum class CatalogKind : uint8_t {
    Techniques,
    Tactics,
    Personalities
};

// Read-only reference data under <workspace>/catalog, one record per line.
class Catalog {
public:
    explicit Catalog(const std::filesystem::path& workspace) noexcept;

    [[nodiscard]] std::vector<CatalogEntry> list(CatalogKind kind) const;
    [[nodiscard]] std::vector<std::string> ids(CatalogKind kind) const;

    // Inserts or replaces an entry by id.
    void put(CatalogKind kind, const CatalogEntry& entry);

    // Fixed distance-to-agreement categories.
    [[nodiscard]] static const std::vector<std::string>& distances() noexcept;

private:
    std::filesystem::path dir_;

    [[nodiscard]] std::filesystem::path fileFor(CatalogKind kind) const;
};

const char* toString(CatalogKind kind) noexcept;

}
