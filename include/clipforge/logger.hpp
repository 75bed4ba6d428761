/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace clipforge {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Process-wide leveled logger writing to stderr. The level is read from
// CLIPFORGE_LOG_LEVEL on first use unless set explicitly.
class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;
    [[nodiscard]] static bool parseLevel(const std::string& text, LogLevel& out) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

private:
    static const char* label(LogLevel level) noexcept;
};

// Per-thread name shown in each log line; unnamed threads show their id.
void setThreadName(const std::string& name);
void clearThreadName() noexcept;
std::string getThreadName(std::uint64_t taskId);

}

// The message expression is only evaluated when the level is enabled
#define CLIPFORGE_LOG(lvl, msg)                                   \
    do {                                                          \
        if (::clipforge::Logger::enabled(lvl))                    \
            ::clipforge::Logger::log((lvl), (msg));               \
    } while (0)

#define LOG_ERROR(msg) CLIPFORGE_LOG(::clipforge::LogLevel::ERROR, msg)
#define LOG_WARN(msg)  CLIPFORGE_LOG(::clipforge::LogLevel::WARN, msg)
#define LOG_INFO(msg)  CLIPFORGE_LOG(::clipforge::LogLevel::INFO, msg)
#define LOG_DEBUG(msg) CLIPFORGE_LOG(::clipforge::LogLevel::DEBUG, msg)
#define LOG_TRACE(msg) CLIPFORGE_LOG(::clipforge::LogLevel::TRACE, msg)
