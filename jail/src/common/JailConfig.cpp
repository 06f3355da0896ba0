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

#include "common/JailConfig.h"
#include "common/Logger.h"
#include <fstream>
#include <sstream>

namespace JAIL {

namespace {

std::optional<json> readJsonFile(const std::string &path, std::string *errorOut) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (errorOut) {
            *errorOut = "Cannot open config file: " + path;
        }
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto parsed = JsonUtils::parseJson(buffer.str(), errorOut);
    if (parsed && !parsed->is_object()) {
        if (errorOut) {
            *errorOut = "Config root must be a JSON object: " + path;
        }
        return std::nullopt;
    }
    return parsed;
}

}  // namespace

JailConfig JailConfig::fromJson(const json &object) {
    JailConfig config;

    config.gateTimeout = JsonUtils::getMilliseconds(object, "gateTimeoutMs", config.gateTimeout);

    int64_t memoryLimit = JsonUtils::getInt(object, "memoryLimitBytes", 0);
    config.memoryLimitBytes = memoryLimit > 0 ? static_cast<size_t>(memoryLimit) : 0;

    config.bridgeName = JsonUtils::getString(object, "bridgeName", config.bridgeName);
    config.catalogName = JsonUtils::getString(object, "catalogName", config.catalogName);
    config.clientLibrary = JsonUtils::getString(object, "clientLibrary");

    if (JsonUtils::hasKey(object, "logLevel")) {
        config.logLevel = parseLogLevel(JsonUtils::getString(object, "logLevel"));
        if (!config.logLevel) {
            LOG_WARN("JailConfig: Unknown log level '{}'", JsonUtils::getString(object, "logLevel"));
        }
    }

    return config;
}

std::optional<JailConfig> JailConfig::loadFromFile(const std::string &path, std::string *errorOut) {
    auto object = readJsonFile(path, errorOut);
    if (!object) {
        return std::nullopt;
    }
    LOG_DEBUG("JailConfig: Loaded {}", path);
    return fromJson(*object);
}

NodeConfig NodeConfig::fromJson(const json &object) {
    NodeConfig config;
    config.url = JsonUtils::getString(object, "url");
    config.rpcTimeout = JsonUtils::getMilliseconds(object, "rpcTimeoutMs", config.rpcTimeout);
    config.headers = JsonUtils::getStringMap(object, "headers");
    return config;
}

std::optional<NodeConfig> NodeConfig::loadFromFile(const std::string &path, std::string *errorOut) {
    auto object = readJsonFile(path, errorOut);
    if (!object) {
        return std::nullopt;
    }
    return fromJson(*object);
}

}  // namespace JAIL
