/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>

#ifndef DELVE_APP_NAME
#define DELVE_APP_NAME "delve"
#endif

namespace DelveEngine {
namespace {

// Console prefix shared by stdout (debug) and stderr (release) output
constexpr const char* CONSOLE_PREFIX = "Delve Engine";

struct LogSink {
    std::mutex mutex;
    std::ofstream file;
    std::string path;
    std::array<std::atomic<uint32_t>, LOG_LEVEL_COUNT> counts{};
};

LogSink& sink() {
    static LogSink instance;
    return instance;
}

std::tm localNow(std::chrono::system_clock::time_point now) {
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &time_t_now);
#else
    localtime_r(&time_t_now, &timeinfo);
#endif
    return timeinfo;
}

// YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [System] message
void writeFileLine(std::ofstream& file, LogLevel level, const char* system,
                   const char* message) {
    const auto now = std::chrono::system_clock::now();
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const std::tm timeinfo = localNow(now);

    file << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
         << std::setw(3) << ms.count() << " [" << Logger::GetLevelString(level) << "] ["
         << system << "] " << message << '\n';

    // Errors must survive a crash right after them
    if (level == LogLevel::CRITICAL || level == LogLevel::ERROR_LEVEL) {
        file.flush();
    }
}

} // anonymous namespace

void Logger::Log(LogLevel level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }

    LogSink& s = sink();
    const auto index = static_cast<size_t>(level);
    if (index < LOG_LEVEL_COUNT) {
        s.counts[index].fetch_add(1, std::memory_order_relaxed);
    }

    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file.is_open()) {
        writeFileLine(s.file, level, system, message);
    }

#ifdef DEBUG
    printf("%s - [%s] %s: %s\n", CONSOLE_PREFIX, system, GetLevelString(level), message);
    fflush(stdout);
#else
    if (!s.file.is_open()) {
        fprintf(stderr, "%s - [%s] %s: %s\n", CONSOLE_PREFIX, system, GetLevelString(level),
                message);
    }
#endif
}

bool Logger::SetLogFile(const std::string& path) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);

    if (s.file.is_open()) {
        s.file.flush();
        s.file.close();
    }
    s.path.clear();

    if (path.empty()) {
        return true;
    }

    s.file.open(path, std::ios::out | std::ios::app);
    if (!s.file.is_open()) {
        fprintf(stderr, "%s - [Logger] ERROR: Cannot open log file %s\n", CONSOLE_PREFIX,
                path.c_str());
        return false;
    }

    s.path = path;
    const std::tm timeinfo = localNow(std::chrono::system_clock::now());
    s.file << "=== " << DELVE_APP_NAME << " log started "
           << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << " ===\n";
    s.file.flush();
    return true;
}

std::string Logger::GetLogFile() {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.path;
}

uint32_t Logger::GetCount(LogLevel level) {
    const auto index = static_cast<size_t>(level);
    return index < LOG_LEVEL_COUNT ? sink().counts[index].load(std::memory_order_relaxed) : 0;
}

void Logger::ResetCounts() {
    for (auto& count : sink().counts) {
        count.store(0, std::memory_order_relaxed);
    }
}

const char* Logger::GetLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::CRITICAL:
            return "CRITICAL";
        case LogLevel::ERROR_LEVEL:
            return "ERROR";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::DEBUG_LEVEL:
            return "DEBUG";
        default:
            return "UNKNOWN";
    }
}

} // namespace DelveEngine
