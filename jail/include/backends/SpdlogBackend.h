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
#include <memory>
#include <spdlog/spdlog.h>

namespace JAIL {

/**
 * @brief spdlog-based logger backend
 *
 * Default backend when the jail is built with JAIL_USE_SPDLOG=ON. Logs to a
 * colored console sink and optionally to <logDir>/jail.log.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace JAIL
