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
#include <mutex>

namespace JAIL {

/**
 * @brief Plain stdout logger used when the jail is built without spdlog
 *
 * Thread-safe, timestamped (HH:MM:SS.mmm), ANSI-colored level tags.
 * No file output and no rotation.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel currentLevel_;
    std::mutex mutex_;

    const char *levelToString(LogLevel level);
    const char *levelToColor(LogLevel level);
    std::string getTimestamp();
};

}  // namespace JAIL
