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

#include <optional>
#include <source_location>
#include <string>

namespace JAIL {

/**
 * @brief Log level enumeration
 *
 * Matches common logging frameworks (spdlog, glog, etc.)
 */
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Parse a level name as accepted by SPDLOG_LEVEL ("trace", "warn", "err", ...), case-insensitive
 */
std::optional<LogLevel> parseLogLevel(std::string name);

/**
 * @brief Level requested through the SPDLOG_LEVEL environment variable, if any
 */
std::optional<LogLevel> logLevelFromEnvironment();

/**
 * @brief Logger backend interface for dependency injection
 *
 * Hosts embedding the jail can route its diagnostics into their own logging
 * system by implementing this interface and passing it to Logger::setBackend().
 *
 * @code
 * class HostLogger : public JAIL::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string &message, const std::source_location &loc) override {
 *         hostLog->write(level, message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { hostLog->setMinLevel(level); }
 *     void flush() override { hostLog->flush(); }
 * };
 *
 * JAIL::Logger::setBackend(std::make_unique<HostLogger>());
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @brief Log a message with source location
     *
     * @param level Log level
     * @param message Pre-formatted message (function name already included)
     * @param loc Source location (file, line, function)
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /**
     * @brief Set minimum log level
     *
     * Messages below this level should be ignored.
     */
    virtual void setLevel(LogLevel level) = 0;

    /**
     * @brief Flush log buffers
     */
    virtual void flush() = 0;
};

}  // namespace JAIL
