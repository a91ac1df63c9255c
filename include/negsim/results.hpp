/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "negsim/record.hpp"
#include "negsim/types.hpp"

namespace negsim {

struct ProductResult {
    std::string productId;
    std::string productName;
    std::string dimensionKey;  // offer key the price was read from
    double agreedPrice = 0.0;
    double volume = 0.0;
    double subtotal = 0.0;
    double targetSubtotal = 0.0;
    std::optional<double> targetPrice;
    std::optional<double> priceVsTarget;    // percent
    std::optional<double> zopaUtilization;  // 0..1 inside the zone
    double deltaFromTarget = 0.0;
    double deltaFromBounds = 0.0;
    bool withinZopa = false;
    double performanceScore = 0.0;
};

struct DimensionResult {
    std::string name;
    double finalValue = 0.0;
    double targetValue = 0.0;
    bool achievedTarget = false;
    int priority = 3;
};

// Offer entry that no product claimed.
struct OtherDimension {
    std::string key;
    std::optional<double> numeric;
    std::string raw;
};

struct ResultArtifacts {
    std::optional<std::string> dealValue;
    std::vector<ProductResult> products;
    std::vector<DimensionResult> dimensions;
    std::vector<OtherDimension> otherDimensions;
    std::vector<std::string> entryKeys;  // every offer key considered
};

struct ResultInput {
    const DimensionValues& finalOffer;
    const std::vector<RoundUpdate>& conversation;
    const std::vector<Product>& products;
    const std::vector<Dimension>& dimensions;
    Role role = Role::Buyer;
};

// Reconciles a finished run's offer into a deal value, per-product metrics,
// per-dimension rows and the leftover non-product dimensions.
[[nodiscard]] ResultArtifacts processResults(const ResultInput& input);

// Lowercase, umlauts expanded, Latin-1 accents stripped, [a-z0-9] only.
[[nodiscard]] std::string normalizeKey(const std::string& key);

// Tolerates units and a decimal comma: "12,50 EUR" -> 12.5.
[[nodiscard]] std::optional<double> coerceNumber(const std::string& text);

[[nodiscard]] std::string formatDecimal(double value, int places);

// Rows persisted next to the run (kind=product|dimension|other).
[[nodiscard]] std::vector<Record> toRecords(const ResultArtifacts& artifacts);

}
