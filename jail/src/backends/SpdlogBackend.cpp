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

#include "backends/SpdlogBackend.h"
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace JAIL {

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile) {
    if (logDir.empty() || !logToFile) {
        logger_ = spdlog::get("JAIL");
        if (!logger_) {
            logger_ = spdlog::stdout_color_mt("JAIL");
        }
        logger_->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    } else {
        std::vector<spdlog::sink_ptr> sinks;

        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(consoleSink);

        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "jail.log";

        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(fileSink);

        spdlog::drop("JAIL");
        logger_ = std::make_shared<spdlog::logger>("JAIL", sinks.begin(), sinks.end());
        spdlog::register_logger(logger_);
    }

    logger_->set_level(convertLevel(logLevelFromEnvironment().value_or(LogLevel::Debug)));
}

void SpdlogBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    if (logger_) {
        logger_->log(convertLevel(level), message);
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(convertLevel(level));
    }
}

void SpdlogBackend::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    default:
        return spdlog::level::debug;
    }
}

}  // namespace JAIL
