/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace negsim {

// Ordered key=value fields. Multi-line form holds one field per line,
// single-line form separates fields with tabs. '%', '=', tab, CR and LF
// are percent-escaped in both keys and values.
class Record {
public:
    using Field = std::pair<std::string, std::string>;

    Record() = default;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, std::int64_t value);
    void setDouble(const std::string& key, double value);
    void setOptional(const std::string& key, const std::optional<std::string>& value);
    void erase(const std::string& key);

    [[nodiscard]] bool has(const std::string& key) const noexcept;
    [[nodiscard]] std::optional<std::string> get(const std::string& key) const;
    [[nodiscard]] std::string getOr(const std::string& key, const std::string& fallback) const;
    [[nodiscard]] std::optional<std::int64_t> getInt(const std::string& key) const noexcept;
    [[nodiscard]] std::optional<double> getDouble(const std::string& key) const noexcept;

    // Fields whose key starts with prefix, with the prefix removed.
    [[nodiscard]] std::vector<Field> prefixed(const std::string& prefix) const;

    [[nodiscard]] const std::vector<Field>& fields() const noexcept { return fields_; }
    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    [[nodiscard]] std::string toLine() const;
    [[nodiscard]] std::string toText() const;
    [[nodiscard]] static Record fromLine(const std::string& line);
    [[nodiscard]] static Record fromText(const std::string& text);

    [[nodiscard]] static std::string escape(const std::string& raw);
    [[nodiscard]] static std::string unescape(const std::string& encoded);

private:
    void parseField(const std::string& token);

    std::vector<Field> fields_;
};

// Comma-separated list helpers for id lists stored in a single field.
[[nodiscard]] std::string joinList(const std::vector<std::string>& items);
[[nodiscard]] std::vector<std::string> splitList(const std::string& text);

}
