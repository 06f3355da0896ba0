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

#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace JAIL {

using json = nlohmann::json;

/**
 * @brief Shared nlohmann/json helpers for the wire codec, envelopes and configuration
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON string with error handling
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed json or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");

    static int64_t getInt(const json &object, const std::string &key, int64_t defaultValue = 0);

    /**
     * @brief Read a millisecond count stored under key, falling back to defaultValue
     */
    static std::chrono::milliseconds getMilliseconds(const json &object, const std::string &key,
                                                     std::chrono::milliseconds defaultValue);

    /**
     * @brief Read an object of string values (e.g. HTTP headers); non-string members are skipped
     */
    static std::map<std::string, std::string> getStringMap(const json &object, const std::string &key);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const json &object, const std::string &key);
};

}  // namespace JAIL
