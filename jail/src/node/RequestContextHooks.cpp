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

#include "node/RequestContextHooks.h"
#include "common/Logger.h"
#include "scripting/ScriptValueConverter.h"
#include "quickjs.h"

namespace JAIL {

std::string RequestContextHooks::preProcessRequest(JSContext *ctx, const RpcCall &call) {
    std::string messageId = readMessageId(ctx);
    if (!messageId.empty()) {
        LOG_DEBUG("RequestContextHooks: {} issued for message {}", call.method, messageId);
    }
    return messageId;
}

void RequestContextHooks::postProcessRequest(JSContext *ctx, const RpcCall &call, const std::string &messageId) {
    if (messageId.empty()) {
        return;
    }

    addContext(ctx, messageId, MESSAGE_ID_KEY, false);
    if (call.method == SEND_TRANSACTION_METHOD) {
        addContext(ctx, messageId, SEND_TRANSACTION_METHOD, true);
    }
}

std::string RequestContextHooks::readMessageId(JSContext *ctx) const {
    JSValue global = JS_GetGlobalObject(ctx);
    JSValue value = JS_GetPropertyStr(ctx, global, MESSAGE_ID_GLOBAL);
    JS_FreeValue(ctx, global);

    std::string messageId;
    if (JS_IsException(value)) {
        LOG_WARN("RequestContextHooks: Failed to read {}: {}", MESSAGE_ID_GLOBAL,
                 ScriptValueConverter::takeException(ctx));
    } else if (!JS_IsUndefined(value) && !JS_IsNull(value)) {
        messageId = ScriptValueConverter::toStdString(ctx, value);
    }
    JS_FreeValue(ctx, value);
    return messageId;
}

void RequestContextHooks::addContext(JSContext *ctx, const std::string &messageId, const std::string &key,
                                     bool flag) const {
    JSValue global = JS_GetGlobalObject(ctx);
    JSValue fn = JS_GetPropertyStr(ctx, global, ADD_CONTEXT_FUNCTION);

    if (!JS_IsFunction(ctx, fn)) {
        LOG_DEBUG("RequestContextHooks: No {} function in cell, skipping context for {}", ADD_CONTEXT_FUNCTION,
                  messageId);
        if (JS_IsException(fn)) {
            ScriptValueConverter::takeException(ctx);
        }
        JS_FreeValue(ctx, fn);
        JS_FreeValue(ctx, global);
        return;
    }

    JSValue args[3] = {JS_NewStringLen(ctx, messageId.data(), messageId.size()),
                       JS_NewStringLen(ctx, key.data(), key.size()),
                       flag ? JS_NewBool(ctx, true) : JS_NewStringLen(ctx, messageId.data(), messageId.size())};

    JSValue result = JS_Call(ctx, fn, JS_UNDEFINED, 3, args);
    if (JS_IsException(result)) {
        LOG_WARN("RequestContextHooks: {}({}, {}) threw: {}", ADD_CONTEXT_FUNCTION, messageId, key,
                 ScriptValueConverter::takeException(ctx));
    }

    JS_FreeValue(ctx, result);
    for (JSValue &arg : args) {
        JS_FreeValue(ctx, arg);
    }
    JS_FreeValue(ctx, fn);
    JS_FreeValue(ctx, global);
}

}  // namespace JAIL
