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

#include "common/Logger.h"

#ifdef JAIL_USE_SPDLOG
#include "backends/SpdlogBackend.h"
#else
#include "backends/DefaultBackend.h"
#endif

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

namespace JAIL {

std::unique_ptr<ILoggerBackend> Logger::backend_;

static std::mutex backend_mutex;

namespace {

void writeEntry(ILoggerBackend &backend, LogLevel level, const std::string &functionName, const std::string &message,
                const std::source_location &loc) {
    backend.log(level, functionName + "() - " + message, loc);
}

}  // namespace

std::optional<LogLevel> parseLogLevel(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") {
        return LogLevel::Trace;
    } else if (name == "debug") {
        return LogLevel::Debug;
    } else if (name == "info") {
        return LogLevel::Info;
    } else if (name == "warn" || name == "warning") {
        return LogLevel::Warn;
    } else if (name == "err" || name == "error") {
        return LogLevel::Error;
    } else if (name == "critical") {
        return LogLevel::Critical;
    } else if (name == "off") {
        return LogLevel::Off;
    }
    return std::nullopt;
}

std::optional<LogLevel> logLevelFromEnvironment() {
    const char *env = std::getenv("SPDLOG_LEVEL");
    if (!env) {
        return std::nullopt;
    }
    return parseLogLevel(env);
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
#ifdef JAIL_USE_SPDLOG
        backend_ = std::make_unique<SpdlogBackend>();
#else
        backend_ = std::make_unique<DefaultBackend>();
#endif
    }
}

void Logger::initialize([[maybe_unused]] const std::string &logDir, [[maybe_unused]] bool logToFile) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
#ifdef JAIL_USE_SPDLOG
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
#else
        // DefaultBackend has no file sink
        backend_ = std::make_unique<DefaultBackend>();
#endif
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    writeEntry(*backend_, LogLevel::Trace, extractCleanFunctionName(loc), message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    writeEntry(*backend_, LogLevel::Debug, extractCleanFunctionName(loc), message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    writeEntry(*backend_, LogLevel::Info, extractCleanFunctionName(loc), message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    writeEntry(*backend_, LogLevel::Warn, extractCleanFunctionName(loc), message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    writeEntry(*backend_, LogLevel::Error, extractCleanFunctionName(loc), message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    const std::string signature = loc.function_name();

    size_t paren = signature.find('(');
    if (paren == std::string::npos) {
        return "UnknownFunction";
    }

    // Last top-level space before the argument list separates the return type
    size_t start = 0;
    int depth = 0;
    for (size_t i = 0; i < paren; ++i) {
        char c = signature[i];
        if (c == '<') {
            depth++;
        } else if (c == '>') {
            depth--;
        } else if (c == ' ' && depth == 0) {
            start = i + 1;
        }
    }

    std::string name;
    depth = 0;
    for (size_t i = start; i < paren; ++i) {
        char c = signature[i];
        if (c == '<') {
            depth++;
        } else if (c == '>') {
            depth--;
        } else if (depth == 0 && c != '*' && c != '&') {
            name += c;
        }
    }

    while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) {
        name.pop_back();
    }

    return name.empty() ? "UnknownFunction" : name;
}

}  // namespace JAIL
