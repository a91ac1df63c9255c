/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace negsim {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Searchable audit line: "[AUDIT] <event> key=value ..."
    static void audit(const std::string& event, const std::string& fields) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context. Drain threads clear their name on exit.
void setThreadName(const std::string& name);
void clearThreadName();

}

#define LOG_ERROR(msg) ::negsim::Logger::error(msg)
#define LOG_WARN(msg)  ::negsim::Logger::warn(msg)
#define LOG_INFO(msg)  ::negsim::Logger::info(msg)
#define LOG_DEBUG(msg) ::negsim::Logger::debug(msg)
#define LOG_TRACE(msg) ::negsim::Logger::trace(msg)
#define LOG_AUDIT(event, fields) ::negsim::Logger::audit(event, fields)
