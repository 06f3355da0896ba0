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

#include "common/ResultEnvelope.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"

namespace JAIL {

std::string makeResultEnvelope(const std::string &rawJson) {
    json result;
    if (rawJson.empty() || rawJson == "undefined") {
        result = nullptr;
    } else if (auto parsed = JsonUtils::parseJson(rawJson)) {
        result = std::move(*parsed);
    } else {
        LOG_DEBUG("ResultEnvelope: Result is not JSON text, wrapping as string");
        result = rawJson;
    }
    return json{{"result", result}}.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string makeErrorEnvelope(const std::string &message) {
    return json{{"error", message}}.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace JAIL
