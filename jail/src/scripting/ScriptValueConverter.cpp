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

#include "scripting/ScriptValueConverter.h"
#include "common/Logger.h"

namespace JAIL {

std::optional<std::string> ScriptValueConverter::stringify(JSContext *ctx, JSValueConst value, std::string *errorOut) {
    JSValue text = JS_JSONStringify(ctx, value, JS_UNDEFINED, JS_UNDEFINED);
    if (JS_IsException(text)) {
        std::string message = takeException(ctx);
        if (errorOut) {
            *errorOut = message;
        }
        return std::nullopt;
    }

    if (JS_IsUndefined(text)) {
        if (errorOut) {
            errorOut->clear();
        }
        return std::nullopt;
    }

    std::string result = toStdString(ctx, text);
    JS_FreeValue(ctx, text);
    return result;
}

JSValue ScriptValueConverter::parse(JSContext *ctx, const std::string &text) {
    return JS_ParseJSON(ctx, text.c_str(), text.length(), "<json>");
}

JSValue ScriptValueConverter::fromJson(JSContext *ctx, const json &value) {
    return parse(ctx, value.dump(-1, ' ', false, json::error_handler_t::replace));
}

std::optional<std::string> ScriptValueConverter::toResultText(JSContext *ctx, JSValueConst value,
                                                              std::string *errorOut) {
    if (JS_IsUndefined(value)) {
        return std::string("undefined");
    }
    if (JS_IsString(value)) {
        return toStdString(ctx, value);
    }

    std::string error;
    auto text = stringify(ctx, value, &error);
    if (!text) {
        if (!error.empty()) {
            if (errorOut) {
                *errorOut = error;
            }
            return std::nullopt;
        }
        // Functions and symbols have no JSON form
        return std::string("undefined");
    }
    return text;
}

std::string ScriptValueConverter::toStdString(JSContext *ctx, JSValueConst value) {
    size_t length = 0;
    const char *str = JS_ToCStringLen(ctx, &length, value);
    if (!str) {
        // ToString itself threw (e.g. Symbol); nothing meaningful to render
        JSValue ignored = JS_GetException(ctx);
        JS_FreeValue(ctx, ignored);
        return "[unprintable]";
    }
    std::string result(str, length);
    JS_FreeCString(ctx, str);
    return result;
}

std::string ScriptValueConverter::takeException(JSContext *ctx) {
    JSValue exception = JS_GetException(ctx);
    if (JS_IsNull(exception) || JS_IsUndefined(exception)) {
        JS_FreeValue(ctx, exception);
        return "Unknown JavaScript error";
    }

    std::string message = toStdString(ctx, exception);

    if (JS_IsObject(exception)) {
        JSValue stack = JS_GetPropertyStr(ctx, exception, "stack");
        if (JS_IsString(stack)) {
            std::string stackText = toStdString(ctx, stack);
            if (!stackText.empty()) {
                LOG_DEBUG("ScriptValueConverter: {}\n{}", message, stackText);
            }
        }
        JS_FreeValue(ctx, stack);
    }

    JS_FreeValue(ctx, exception);
    return message;
}

}  // namespace JAIL
