/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/results.hpp"
#include "negsim/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <regex>
#include <unordered_map>

namespace negsim {

namespace {

struct Entry {
    std::string key;
    std::string normalized;
    std::string raw;
    std::optional<double> numeric;
};

const std::vector<std::string> kPriceKeywords = {"preis", "price", "prize"};
const std::vector<std::string> kTotalKeywords = {"gesamt", "total", "summe"};

bool hasKeyword(const std::string& value, const std::vector<std::string>& keywords) {
    for (const auto& keyword : keywords) {
        if (value.find(keyword) != std::string::npos) return true;
    }
    return false;
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Latin-1 supplement (second byte after 0xC3) folded to ASCII. Letters with
// no canonical decomposition (AE, O-slash, eth, thorn) fold to nothing.
const char* foldLatin1(unsigned char second) {
    switch (second) {
        case 0x84: case 0xA4: return "ae";
        case 0x96: case 0xB6: return "oe";
        case 0x9C: case 0xBC: return "ue";
        case 0x9F:            return "ss";
        case 0x80: case 0x81: case 0x82: case 0x83: case 0x85:
        case 0xA0: case 0xA1: case 0xA2: case 0xA3: case 0xA5:
            return "a";
        case 0x87: case 0xA7: return "c";
        case 0x88: case 0x89: case 0x8A: case 0x8B:
        case 0xA8: case 0xA9: case 0xAA: case 0xAB:
            return "e";
        case 0x8C: case 0x8D: case 0x8E: case 0x8F:
        case 0xAC: case 0xAD: case 0xAE: case 0xAF:
            return "i";
        case 0x91: case 0xB1: return "n";
        case 0x92: case 0x93: case 0x94: case 0x95:
        case 0xB2: case 0xB3: case 0xB4: case 0xB5:
            return "o";
        case 0x99: case 0x9A: case 0x9B:
        case 0xB9: case 0xBA: case 0xBB:
            return "u";
        case 0x9D: case 0xBD: case 0xBF: return "y";
        default: return "";
    }
}

std::vector<Entry> collectEntries(const DimensionValues& finalOffer,
                                  const std::vector<RoundUpdate>& conversation) {
    std::vector<Entry> entries;
    std::unordered_map<std::string, std::size_t> index;

    auto add = [&](const std::string& key, const std::string& raw, bool overwrite) {
        std::string normalized = normalizeKey(key);
        auto it = index.find(normalized);
        if (it != index.end()) {
            if (overwrite) {
                entries[it->second] = {key, normalized, raw, coerceNumber(raw)};
            }
            return;
        }
        index.emplace(normalized, entries.size());
        entries.push_back({key, normalized, raw, coerceNumber(raw)});
    };

    for (const auto& value : finalOffer) {
        add(value.first, value.second, true);
    }
    // Latest round wins for keys the final offer does not carry
    for (auto round = conversation.rbegin(); round != conversation.rend(); ++round) {
        for (const auto& value : round->offer) {
            add(value.first, value.second, false);
        }
    }
    return entries;
}

const Entry* findPriceEntry(const Product& product, const std::vector<Entry>& entries) {
    const std::string name = normalizeKey(product.name);
    const std::string key = product.key ? normalizeKey(*product.key) : std::string();

    for (const auto& entry : entries) {
        if ((!name.empty() && entry.normalized == name) || (!key.empty() && entry.normalized == key)) {
            return &entry;
        }
    }

    for (const auto& entry : entries) {
        bool nameHit = name.empty() || contains(entry.normalized, name);
        if (nameHit && hasKeyword(entry.normalized, kPriceKeywords)) {
            return &entry;
        }
    }

    if (name.empty() && key.empty()) {
        return nullptr;
    }

    // Fuzzy fallback for truncated keys
    for (const auto& entry : entries) {
        if (hasKeyword(entry.normalized, kTotalKeywords)) continue;
        if (name.size() > 5 && startsWith(entry.normalized, name.substr(0, 6))) return &entry;
        if (key.size() > 5 && startsWith(entry.normalized, key.substr(0, 6))) return &entry;
        if (name.size() > 4 && entry.normalized.size() > 4 &&
            (contains(name, entry.normalized) || contains(entry.normalized, name))) {
            return &entry;
        }
    }
    return nullptr;
}

const Entry* findDimensionEntry(const std::string& dimensionName, const std::vector<Entry>& entries) {
    const std::string name = normalizeKey(dimensionName);
    for (const auto& entry : entries) {
        if (entry.normalized == name) return &entry;
    }
    for (const auto& entry : entries) {
        if (contains(entry.normalized, name)) return &entry;
    }
    for (const auto& entry : entries) {
        if (contains(name, entry.normalized)) return &entry;
    }
    return nullptr;
}

bool isWithinRange(double value, const std::optional<double>& min, const std::optional<double>& max) {
    if (min && max) {
        return value >= std::min(*min, *max) && value <= std::max(*min, *max);
    }
    if (min && value < *min) return false;
    if (max && value > *max) return false;
    return true;
}

std::optional<double> zopaUtilization(double value, const std::optional<double>& min,
                                      const std::optional<double>& max) {
    if (!min || !max || *max == *min) {
        return std::nullopt;
    }
    return (value - *min) / (*max - *min);
}

double deltaFromBounds(double value, const std::optional<double>& min, const std::optional<double>& max) {
    if (min && value < *min) return value - *min;
    if (max && value > *max) return value - *max;
    return 0.0;
}

double performanceScore(double value, const std::optional<double>& target, bool withinZopa) {
    if (target && *target > 0) {
        double deviation = std::fabs((value - *target) / *target);
        double base = std::max(0.0, 100.0 - deviation * 100.0);
        return withinZopa ? base : std::max(0.0, base - 10.0);
    }
    return withinZopa ? 80.0 : 60.0;
}

}

std::string normalizeKey(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (std::size_t i = 0; i < key.size(); ++i) {
        auto c = static_cast<unsigned char>(key[i]);
        if (c < 0x80) {
            char lower = static_cast<char>(std::tolower(c));
            if ((lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9')) {
                out += lower;
            }
            continue;
        }
        if (c == 0xC3 && i + 1 < key.size()) {
            out += foldLatin1(static_cast<unsigned char>(key[i + 1]));
            ++i;
            continue;
        }
        // Skip the remaining bytes of any other multi-byte sequence
        while (i + 1 < key.size() && (static_cast<unsigned char>(key[i + 1]) & 0xC0) == 0x80) {
            ++i;
        }
    }
    return out;
}

std::optional<double> coerceNumber(const std::string& text) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }
    std::string normalized = text;
    auto comma = normalized.find(',');
    if (comma != std::string::npos) {
        normalized[comma] = '.';
    }

    static const std::regex number(R"(-?\d+(\.\d+)?)");
    std::smatch match;
    if (!std::regex_search(normalized, match, number)) {
        return std::nullopt;
    }
    double parsed = std::strtod(match.str(0).c_str(), nullptr);
    if (!std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

std::string formatDecimal(double value, int places) {
    if (std::isnan(value)) value = 0.0;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", places, value);
    return buf;
}

ResultArtifacts processResults(const ResultInput& input) {
    ResultArtifacts artifacts;
    auto entries = collectEntries(input.finalOffer, input.conversation);
    for (const auto& entry : entries) {
        artifacts.entryKeys.push_back(entry.key);
    }

    for (const auto& dimension : input.dimensions) {
        const Entry* match = findDimensionEntry(dimension.name, entries);
        double fallback = dimension.targetValue ? *dimension.targetValue
                        : dimension.minValue    ? *dimension.minValue
                        : dimension.maxValue    ? *dimension.maxValue
                        : 0.0;
        DimensionResult row;
        row.name = dimension.name;
        row.finalValue = (match && match->numeric) ? *match->numeric : fallback;
        row.targetValue = dimension.targetValue.value_or(fallback);
        row.achievedTarget = isWithinRange(row.finalValue, dimension.minValue, dimension.maxValue);
        row.priority = dimension.priority;
        artifacts.dimensions.push_back(std::move(row));
    }

    std::vector<bool> claimed(entries.size(), false);
    double total = 0.0;
    for (const auto& product : input.products) {
        const Entry* entry = findPriceEntry(product, entries);
        if (entry == nullptr) continue;
        claimed[static_cast<std::size_t>(entry - entries.data())] = true;
        if (!entry->numeric) {
            LOG_DEBUG("Offer key " + entry->key + " matched product " + product.name + " but is not numeric");
            continue;
        }

        // Buyers have no floor and sellers have no ceiling
        std::optional<double> minPrice = input.role == Role::Buyer ? std::nullopt : product.minPrice;
        std::optional<double> maxPrice = input.role == Role::Seller ? std::nullopt : product.maxPrice;

        ProductResult row;
        row.productId = product.id;
        row.productName = product.name;
        row.dimensionKey = entry->key;
        row.agreedPrice = *entry->numeric;
        row.volume = product.volume;
        row.subtotal = row.agreedPrice * row.volume;
        row.targetPrice = product.targetPrice;
        row.targetSubtotal = product.targetPrice.value_or(row.agreedPrice) * row.volume;
        if (product.targetPrice && *product.targetPrice != 0.0) {
            row.priceVsTarget = (row.agreedPrice - *product.targetPrice) / *product.targetPrice * 100.0;
        }
        row.deltaFromTarget = product.targetPrice ? row.agreedPrice - *product.targetPrice : 0.0;
        row.withinZopa = isWithinRange(row.agreedPrice, minPrice, maxPrice);
        row.zopaUtilization = zopaUtilization(row.agreedPrice, minPrice, maxPrice);
        row.deltaFromBounds = deltaFromBounds(row.agreedPrice, minPrice, maxPrice);
        row.performanceScore = performanceScore(row.agreedPrice, product.targetPrice, row.withinZopa);

        total += row.subtotal;
        artifacts.products.push_back(std::move(row));
    }

    if (!artifacts.products.empty()) {
        artifacts.dealValue = formatDecimal(total, 2);
    }

    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (claimed[i]) continue;
        artifacts.otherDimensions.push_back({entries[i].key, entries[i].numeric, entries[i].raw});
    }
    return artifacts;
}

std::vector<Record> toRecords(const ResultArtifacts& artifacts) {
    std::vector<Record> rows;
    for (const auto& product : artifacts.products) {
        Record row;
        row.set("kind", "product");
        row.set("product", product.productId);
        row.set("name", product.productName);
        row.set("key", product.dimensionKey);
        row.set("agreed_price", formatDecimal(product.agreedPrice, 2));
        row.set("volume", formatDecimal(product.volume, 2));
        row.set("subtotal", formatDecimal(product.subtotal, 2));
        row.set("target_subtotal", formatDecimal(product.targetSubtotal, 2));
        if (product.targetPrice) row.set("target_price", formatDecimal(*product.targetPrice, 2));
        if (product.priceVsTarget) row.set("price_vs_target", formatDecimal(*product.priceVsTarget, 2));
        if (product.zopaUtilization) row.set("zopa_utilization", formatDecimal(*product.zopaUtilization, 2));
        row.set("delta_from_target", formatDecimal(product.deltaFromTarget, 4));
        row.set("delta_from_bounds", formatDecimal(product.deltaFromBounds, 4));
        row.set("within_zopa", product.withinZopa ? "true" : "false");
        row.set("performance_score", formatDecimal(product.performanceScore, 2));
        rows.push_back(std::move(row));
    }
    for (const auto& dimension : artifacts.dimensions) {
        Record row;
        row.set("kind", "dimension");
        row.set("name", dimension.name);
        row.set("final_value", formatDecimal(dimension.finalValue, 4));
        row.set("target_value", formatDecimal(dimension.targetValue, 4));
        row.set("achieved", dimension.achievedTarget ? "true" : "false");
        row.set("priority", static_cast<std::int64_t>(dimension.priority));
        rows.push_back(std::move(row));
    }
    for (const auto& other : artifacts.otherDimensions) {
        Record row;
        row.set("kind", "other");
        row.set("key", other.key);
        row.set("value", other.numeric ? formatDecimal(*other.numeric, 4) : other.raw);
        rows.push_back(std::move(row));
    }
    return rows;
}

}
