// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-JAIL-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of Jail (sandboxed JavaScript cells for RPC clients).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE in the project root

#include "backends/DefaultBackend.h"
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>

namespace JAIL {

namespace Colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *TRACE = "\033[37m";
constexpr const char *DEBUG = "\033[36m";
constexpr const char *INFO = "\033[32m";
constexpr const char *WARN = "\033[33m";
constexpr const char *ERROR = "\033[31m";
constexpr const char *CRITICAL = "\033[35m";
}  // namespace Colors

DefaultBackend::DefaultBackend() : currentLevel_(logLevelFromEnvironment().value_or(LogLevel::Debug)) {}

void DefaultBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < currentLevel_) {
        return;
    }

    std::cout << "[" << getTimestamp() << "] "
              << "[" << levelToColor(level) << levelToString(level) << Colors::RESET << "] " << message << "\n";
}

void DefaultBackend::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void DefaultBackend::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
}

const char *DefaultBackend::levelToString(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Critical:
        return "critical";
    case LogLevel::Off:
        return "off";
    default:
        return "unknown";
    }
}

const char *DefaultBackend::levelToColor(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return Colors::TRACE;
    case LogLevel::Debug:
        return Colors::DEBUG;
    case LogLevel::Info:
        return Colors::INFO;
    case LogLevel::Warn:
        return Colors::WARN;
    case LogLevel::Error:
        return Colors::ERROR;
    case LogLevel::Critical:
        return Colors::CRITICAL;
    default:
        return Colors::RESET;
    }
}

std::string DefaultBackend::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto nowTime = std::chrono::system_clock::to_time_t(now);
    auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmBuf;
#ifdef _WIN32
    localtime_s(&tmBuf, &nowTime);
#else
    localtime_r(&nowTime, &tmBuf);
#endif

    return std::format("{:02d}:{:02d}:{:02d}.{:03d}", tmBuf.tm_hour, tmBuf.tm_min, tmBuf.tm_sec,
                       static_cast<int>(nowMs.count()));
}

}  // namespace JAIL
