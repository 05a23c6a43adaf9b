/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "slotwise/logger.hpp"
#include <iostream>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace slotwise {

namespace {
struct LogState {
    LogLevel level = LogLevel::INFO;
    bool levelInitialized = false;
    std::mutex mutex;
    std::unordered_map<std::thread::id, std::string> threadNames;
};

// Never destroyed: detached work threads may still log while statics are torn down at exit.
LogState& state() noexcept {
    static LogState* instance = new LogState();
    return *instance;
}
}

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(state().mutex);
    state().level = level;
    state().levelInitialized = true;
}

void Logger::initFromEnv() noexcept {
    std::lock_guard<std::mutex> lock(state().mutex);
    state().level = parseEnvLevel();
    state().levelInitialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(state().mutex);
    if (!state().levelInitialized) {
        state().level = parseEnvLevel();
        state().levelInitialized = true;
    }
    return state().level;
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&time_t, &local);

        std::string thread_info;
        {
            std::lock_guard<std::mutex> lock(state().mutex);
            auto tid = std::this_thread::get_id();
            auto it = state().threadNames.find(tid);
            if (it != state().threadNames.end()) {
                thread_info = it->second;
            } else {
                std::ostringstream oss;
                oss << "T" << tid;
                thread_info = oss.str();
            }
        }

        std::stringstream ss;
        ss << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << levelToString(level) << "]";
        ss << " [" << thread_info << "]";
        ss << " " << message;

        {
            // stdout is reserved for command output
            std::lock_guard<std::mutex> lock(state().mutex);
            std::cerr << ss.str() << std::endl;
        }
    } catch (...) {
        // Never throw from logging; fall back to an unformatted line
        std::fputs(message.c_str(), stderr);
        std::fputc('\n', stderr);
    }
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv("SLOTWISE_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;

    std::string level_str(env_val);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "trace") return LogLevel::TRACE;

    return LogLevel::INFO;
}

const char* Logger::levelToString(LogLevel level) noexcept {
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
    std::lock_guard<std::mutex> lock(state().mutex);
    state().threadNames[std::this_thread::get_id()] = name;
}

void clearThreadName() {
    std::lock_guard<std::mutex> lock(state().mutex);
    state().threadNames.erase(std::this_thread::get_id());
}

}
