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

#pragma once

#include "common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace JAIL {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * 1. Default mode: built-in backend (spdlog when JAIL_USE_SPDLOG is set, DefaultBackend otherwise)
 * 2. Custom mode: the host injects its own ILoggerBackend implementation
 *
 * @code
 * JAIL::Logger::initialize();
 * LOG_INFO("Cell '{}' bootstrapped", cellId);
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stdout, no file)
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     *
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace JAIL

#define LOG_TRACE(...) JAIL::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) JAIL::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) JAIL::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) JAIL::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) JAIL::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
