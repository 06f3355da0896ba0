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
#include "common/JsonUtils.h"
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace JAIL {

/**
 * @brief Registry-wide settings
 *
 * JSON form (all keys optional):
 * @code
 * {
 *   "gateTimeoutMs": 60000,
 *   "memoryLimitBytes": 0,
 *   "bridgeName": "jeth",
 *   "catalogName": "_status_catalog",
 *   "clientLibrary": "...web3 bundle...",
 *   "logLevel": "info"
 * }
 * @endcode
 */
struct JailConfig {
    // Bounded wait for a cell's execution gate
    std::chrono::milliseconds gateTimeout{std::chrono::seconds(60)};

    // Per-cell QuickJS heap limit, 0 = unlimited
    size_t memoryLimitBytes = 0;

    std::string bridgeName = "jeth";
    std::string catalogName = "_status_catalog";

    // Web3-compatible client bundle evaluated before the preamble (opaque)
    std::string clientLibrary;

    std::optional<LogLevel> logLevel;

    static JailConfig fromJson(const json &object);

    /**
     * @brief Load configuration from a JSON file
     * @param path File path
     * @param errorOut Optional error message output
     * @return Config or nullopt if the file cannot be read or parsed
     */
    static std::optional<JailConfig> loadFromFile(const std::string &path, std::string *errorOut = nullptr);
};

/**
 * @brief Connection settings for one backend node
 *
 * @code
 * { "url": "http://127.0.0.1:8545", "rpcTimeoutMs": 30000, "headers": { "Authorization": "..." } }
 * @endcode
 */
struct NodeConfig {
    std::string url;
    std::chrono::milliseconds rpcTimeout{std::chrono::seconds(30)};
    std::map<std::string, std::string> headers;

    static NodeConfig fromJson(const json &object);
    static std::optional<NodeConfig> loadFromFile(const std::string &path, std::string *errorOut = nullptr);
};

}  // namespace JAIL
