/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/record.hpp"
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace negsim {

namespace {
int hexValue(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}
}

void Record::set(const std::string& key, const std::string& value) {
    for (auto& field : fields_) {
        if (field.first == key) {
            field.second = value;
            return;
        }
    }
    fields_.emplace_back(key, value);
}

void Record::set(const std::string& key, std::int64_t value) {
    set(key, std::to_string(value));
}

void Record::setDouble(const std::string& key, double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f", value);
    set(key, std::string(buf));
}

void Record::setOptional(const std::string& key, const std::optional<std::string>& value) {
    if (value) {
        set(key, *value);
    } else {
        erase(key);
    }
}

void Record::erase(const std::string& key) {
    for (auto it = fields_.begin(); it != fields_.end(); ++it) {
        if (it->first == key) {
            fields_.erase(it);
            return;
        }
    }
}

bool Record::has(const std::string& key) const noexcept {
    for (const auto& field : fields_) {
        if (field.first == key) return true;
    }
    return false;
}

std::optional<std::string> Record::get(const std::string& key) const {
    for (const auto& field : fields_) {
        if (field.first == key) return field.second;
    }
    return std::nullopt;
}

std::string Record::getOr(const std::string& key, const std::string& fallback) const {
    auto value = get(key);
    return value ? *value : fallback;
}

std::optional<std::int64_t> Record::getInt(const std::string& key) const noexcept {
    for (const auto& field : fields_) {
        if (field.first != key) continue;
        if (field.second.empty()) return std::nullopt;
        char* end = nullptr;
        long long parsed = std::strtoll(field.second.c_str(), &end, 10);
        if (end == nullptr || *end != '\0') return std::nullopt;
        return static_cast<std::int64_t>(parsed);
    }
    return std::nullopt;
}

std::optional<double> Record::getDouble(const std::string& key) const noexcept {
    for (const auto& field : fields_) {
        if (field.first != key) continue;
        if (field.second.empty()) return std::nullopt;
        char* end = nullptr;
        double parsed = std::strtod(field.second.c_str(), &end);
        if (end == nullptr || *end != '\0') return std::nullopt;
        return parsed;
    }
    return std::nullopt;
}

std::vector<Record::Field> Record::prefixed(const std::string& prefix) const {
    std::vector<Field> out;
    for (const auto& field : fields_) {
        if (field.first.size() > prefix.size() &&
            field.first.compare(0, prefix.size(), prefix) == 0) {
            out.emplace_back(field.first.substr(prefix.size()), field.second);
        }
    }
    return out;
}

std::string Record::toLine() const {
    std::string out;
    bool first = true;
    for (const auto& field : fields_) {
        if (!first) out += '\t';
        out += escape(field.first);
        out += '=';
        out += escape(field.second);
        first = false;
    }
    return out;
}

std::string Record::toText() const {
    std::string out;
    for (const auto& field : fields_) {
        out += escape(field.first);
        out += '=';
        out += escape(field.second);
        out += '\n';
    }
    return out;
}

Record Record::fromLine(const std::string& line) {
    Record record;
    std::size_t start = 0;
    while (start <= line.size()) {
        auto tab = line.find('\t', start);
        std::string token = line.substr(start, tab == std::string::npos ? std::string::npos : tab - start);
        record.parseField(token);
        if (tab == std::string::npos) break;
        start = tab + 1;
    }
    return record;
}

Record Record::fromText(const std::string& text) {
    Record record;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        record.parseField(line);
    }
    return record;
}

void Record::parseField(const std::string& token) {
    if (token.empty()) return;
    auto eq = token.find('=');
    if (eq == std::string::npos || eq == 0) return;
    set(unescape(token.substr(0, eq)), unescape(token.substr(eq + 1)));
}

std::string Record::escape(const std::string& raw) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (c == '%' || c == '=' || c == '\t' || c == '\r' || c == '\n') {
            auto byte = static_cast<unsigned char>(c);
            out += '%';
            out += hex[byte >> 4];
            out += hex[byte & 0x0F];
        } else {
            out += c;
        }
    }
    return out;
}

std::string Record::unescape(const std::string& encoded) {
    std::string out;
    out.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size()) {
            int hi = hexValue(encoded[i + 1]);
            int lo = hexValue(encoded[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += encoded[i];
    }
    return out;
}

std::string joinList(const std::vector<std::string>& items) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ',';
        out += items[i];
    }
    return out;
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start < text.size()) {
        auto comma = text.find(',', start);
        std::string item = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        if (!item.empty()) out.push_back(item);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

}
