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

#include "common/JsonUtils.h"
#include "quickjs.h"
#include <optional>
#include <string>

namespace JAIL {

/**
 * @brief The only place host values cross into (and out of) a cell's value space
 *
 * Host side values are JSON (text or nlohmann::json); script side values are
 * QuickJS JSValues owned by the caller. Conversions go through the VM's own
 * JSON.stringify / JSON.parse so that a value means the same thing on both sides.
 */
class ScriptValueConverter {
public:
    /**
     * @brief JSON.stringify(value) as the script sees it
     *
     * @return JSON text; nullopt for values JSON cannot represent (undefined, functions)
     *         or when stringify throws, in which case errorOut receives the message
     *         and the exception is cleared
     */
    static std::optional<std::string> stringify(JSContext *ctx, JSValueConst value, std::string *errorOut = nullptr);

    /**
     * @brief JSON.parse(text); returns JS_EXCEPTION with the exception pending on invalid JSON
     */
    static JSValue parse(JSContext *ctx, const std::string &text);

    /**
     * @brief Host JSON value as a new script value
     */
    static JSValue fromJson(JSContext *ctx, const json &value);

    /**
     * @brief Text rendering of a call/eval result: strings verbatim, "undefined", else JSON text
     */
    static std::optional<std::string> toResultText(JSContext *ctx, JSValueConst value,
                                                   std::string *errorOut = nullptr);

    static std::string toStdString(JSContext *ctx, JSValueConst value);

    /**
     * @brief Message of the pending exception (with stack when available); clears it
     */
    static std::string takeException(JSContext *ctx);
};

}  // namespace JAIL
