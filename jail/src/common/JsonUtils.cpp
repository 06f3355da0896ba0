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

#include "common/JsonUtils.h"
#include "common/Logger.h"

namespace JAIL {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        if (errorOut) {
            *errorOut = "Empty JSON string";
        }
        return std::nullopt;
    }

    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", e.what());
        return std::nullopt;
    }
}

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_string()) {
        return defaultValue;
    }

    return value.get<std::string>();
}

int64_t JsonUtils::getInt(const json &object, const std::string &key, int64_t defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_number_integer()) {
        return defaultValue;
    }

    return value.get<int64_t>();
}

std::chrono::milliseconds JsonUtils::getMilliseconds(const json &object, const std::string &key,
                                                     std::chrono::milliseconds defaultValue) {
    int64_t ms = getInt(object, key, defaultValue.count());
    if (ms < 0) {
        LOG_WARN("JsonUtils: Negative duration for '{}' ignored", key);
        return defaultValue;
    }
    return std::chrono::milliseconds(ms);
}

std::map<std::string, std::string> JsonUtils::getStringMap(const json &object, const std::string &key) {
    std::map<std::string, std::string> result;
    if (!object.is_object() || !object.contains(key) || !object[key].is_object()) {
        return result;
    }

    for (const auto &[name, value] : object[key].items()) {
        if (value.is_string()) {
            result[name] = value.get<std::string>();
        }
    }
    return result;
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    return object.is_object() && object.contains(key) && !object[key].is_null();
}

}  // namespace JAIL
