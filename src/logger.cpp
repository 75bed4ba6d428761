/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "clipforge/logger.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

namespace clipforge {

namespace {

struct LevelName {
    const char* name;
    LogLevel level;
};

constexpr LevelName kLevelNames[] = {
    {"error", LogLevel::ERROR},
    {"warn", LogLevel::WARN},
    {"warning", LogLevel::WARN},
    {"info", LogLevel::INFO},
    {"debug", LogLevel::DEBUG},
    {"trace", LogLevel::TRACE},
};

constexpr LogLevel kDefaultLevel = LogLevel::INFO;

std::atomic<uint8_t> g_level{static_cast<uint8_t>(kDefaultLevel)};
std::once_flag g_env_once;
std::mutex g_write_mutex;

thread_local std::string t_thread_name;

LogLevel levelFromEnv() noexcept {
    const char* value = std::getenv("CLIPFORGE_LOG_LEVEL");
    LogLevel parsed = kDefaultLevel;
    if (value && !Logger::parseLevel(value, parsed)) {
        return kDefaultLevel;
    }
    return parsed;
}

void ensureLevel() noexcept {
    try {
        std::call_once(g_env_once, [] {
            g_level.store(static_cast<uint8_t>(levelFromEnv()));
        });
    } catch (const std::system_error&) {
        // Keep the default level
    }
}

std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);
    char stamp[48];
    std::snprintf(stamp, sizeof(stamp), "%s.%03d", date, static_cast<int>(millis));
    return stamp;
}

std::string currentThreadLabel() {
    if (!t_thread_name.empty()) {
        return t_thread_name;
    }
    std::ostringstream oss;
    oss << "T" << std::this_thread::get_id();
    return oss.str();
}

}

void Logger::setLevel(LogLevel level) noexcept {
    ensureLevel();
    g_level.store(static_cast<uint8_t>(level));
}

void Logger::initFromEnv() noexcept {
    ensureLevel();
    g_level.store(static_cast<uint8_t>(levelFromEnv()));
}

LogLevel Logger::level() noexcept {
    ensureLevel();
    return static_cast<LogLevel>(g_level.load());
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

bool Logger::parseLevel(const std::string& text, LogLevel& out) noexcept {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    for (const auto& entry : kLevelNames) {
        if (lowered == entry.name) {
            out = entry.level;
            return true;
        }
    }
    return false;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    if (!enabled(level)) {
        return;
    }
    try {
        std::string line;
        line.reserve(message.size() + 64);
        line += "[" + timestamp() + "] [";
        line += label(level);
        line += "] [" + currentThreadLabel() + "] ";
        line += message;
        line += '\n';

        // stdout belongs to the CLI
        std::lock_guard<std::mutex> lock(g_write_mutex);
        std::cerr << line << std::flush;
    } catch (...) {
        // Never throw from logging
    }
}

const char* Logger::label(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    t_thread_name = name;
}

void clearThreadName() noexcept {
    t_thread_name.clear();
}

std::string getThreadName(std::uint64_t taskId) {
    return "Job-" + std::to_string(taskId);
}

}
