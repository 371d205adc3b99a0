/*
 * UUIDKIT COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the UuidKit Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 */

#include "uuidkit/infra/logger.hpp"

#include "uuidkit/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace uuidkit::infra {

std::mutex Logger::mutex_;
LogLevel Logger::level_ = LogLevel::INFO;
Logger::Sink Logger::sink_;

/**
 * @brief Dispatches a formatted log entry to the sink or the console.
 *
 * Operational Logic:
 * 1. **Filtering**: Entries below the threshold are discarded.
 * 2. **Redirection**: An installed sink receives the raw entry, unformatted. It runs
 *    after the lock is released, so a sink may itself log or change the threshold.
 * 3. **Stream Segregation**: Otherwise routes to `stdout` or `stderr` based on severity.
 * 4. **Stylization**: Injects ANSI escape sequences for visual categorization.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    // Serializes console output and guards the threshold and sink.
    std::unique_lock<std::mutex> lock(mutex_);

    if (level < level_) {
        return;
    }

    if (sink_) {
        Sink sink = sink_;
        lock.unlock();
        sink(level, message);
        return;
    }

    // Capture system time for event sequencing.
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    // Warnings and failures go to stderr so they stay out of the UUIDs printed on
    // stdout and are not held back by its buffering.
    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Formatting: [YYYY-MM-DD HH:MM:SS]
    // Note: Mutex protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    // ANSI escape sequences for severity color-coding.
    switch (level) {
    case LogLevel::TRACE:
        // Gray: clock sequence bumps and similar internals.
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        // Cyan: diagnostic state.
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        // Green: notices such as v2 domain fallbacks.
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        // Yellow: recoverable misuse replaced by a fallback value.
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        // Red: a failed request that did not stop the process.
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        // Bold red: the process is about to exit.
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    // Append payload, reset terminal style, and flush.
    stream << message << "\033[0m" << std::endl;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_sink(Sink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

LogLevel Logger::parse_level(const std::string& name)
{
    std::string key = String::to_lower(String::trim(name));

    if (key == "trace")
        return LogLevel::TRACE;
    if (key == "debug")
        return LogLevel::DEBUG;
    if (key == "info")
        return LogLevel::INFO;
    if (key == "warn" || key == "warning")
        return LogLevel::WARN;
    if (key == "error")
        return LogLevel::ERROR;
    if (key == "fatal")
        return LogLevel::FATAL;

    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace uuidkit::infra
