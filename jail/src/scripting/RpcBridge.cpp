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

#include "scripting/RpcBridge.h"
#include "common/JailError.h"
#include "common/Logger.h"
#include "scripting/BatchScope.h"
#include "scripting/ScriptValueConverter.h"
#include "scripting/ScriptingCell.h"

namespace JAIL {

namespace {

JSValue newErrorResponse(JSContext *ctx, int code, const std::string &message, const json &id) {
    return ScriptValueConverter::fromJson(ctx, makeRpcErrorResponse(code, message, id));
}

JSValue newResponse(JSContext *ctx, const json &id) {
    JSValue response = JS_NewObject(ctx);
    JS_SetPropertyStr(ctx, response, "jsonrpc", JS_NewString(ctx, "2.0"));
    JS_SetPropertyStr(ctx, response, "id", ScriptValueConverter::fromJson(ctx, id));
    return response;
}

}  // namespace

RpcBridge::RpcBridge(IBackendAccessor &backend) : backend_(backend) {}

void RpcBridge::install(ScriptingCell &cell, const std::string &name) {
    auto lock = cell.enter();
    JSContext *ctx = cell.getContext();

    cell.setBridge(this);

    JSValue global = JS_GetGlobalObject(ctx);
    JSValue provider = JS_NewObject(ctx);

    JS_SetPropertyStr(ctx, provider, "send", JS_NewCFunction(ctx, sendWrapper, "send", 2));
    JS_SetPropertyStr(ctx, provider, "sendAsync", JS_NewCFunction(ctx, sendWrapper, "sendAsync", 2));

    JS_SetPropertyStr(ctx, global, name.c_str(), provider);
    JS_FreeValue(ctx, global);

    LOG_DEBUG("RpcBridge: Bound '{}' into Cell[{}]", name, cell.getId());
}

JSValue RpcBridge::sendWrapper(JSContext *ctx, JSValueConst /*thisVal*/, int argc, JSValueConst *argv) {
    ScriptingCell *cell = ScriptingCell::fromContext(ctx);
    if (!cell || !cell->getBridge()) {
        return JS_ThrowInternalError(ctx, "RPC bridge is not available in this context");
    }
    return cell->getBridge()->send(*cell, argc, argv);
}

JSValue RpcBridge::send(ScriptingCell &cell, int argc, JSValueConst *argv) {
    JSContext *ctx = cell.getContext();

    ExecutionGate::Lock lock;
    try {
        lock = cell.enter();
    } catch (const JailException &e) {
        return JS_ThrowInternalError(ctx, "%s", e.what());
    }

    // Re-serialize with the script's own JSON encoder
    JSValue requestText = JS_JSONStringify(ctx, argc > 0 ? argv[0] : JS_UNDEFINED, JS_UNDEFINED, JS_UNDEFINED);
    if (JS_IsException(requestText)) {
        return JS_EXCEPTION;
    }
    if (JS_IsUndefined(requestText)) {
        return JS_ThrowTypeError(ctx, "RPC request must be a call object or an array of calls");
    }
    std::string text = ScriptValueConverter::toStdString(ctx, requestText);
    JS_FreeValue(ctx, requestText);

    RpcRequest request;
    try {
        request = decodeRpcRequest(text);
    } catch (const JailException &e) {
        return JS_ThrowTypeError(ctx, "%s", e.what());
    }

    std::shared_ptr<IRequestHooks> hooks;
    try {
        hooks = backend_.getRequestHooks();
    } catch (const std::exception &e) {
        LOG_WARN("RpcBridge: Request hooks unavailable for Cell[{}], dispatching without them: {}", cell.getId(),
                 e.what());
    }

    BatchScope scope(ctx, hooks);
    JSValue responses = JS_NewArray(ctx);
    JSValue response = JS_UNDEFINED;
    uint32_t index = 0;
    bool aborted = false;

    for (const auto &call : request.calls) {
        scope.begin(call);

        std::shared_ptr<IRpcClient> client;
        try {
            client = backend_.getClient();
        } catch (const std::exception &e) {
            LOG_ERROR("RpcBridge: No backend client for Cell[{}]: {}", cell.getId(), e.what());
            response = newErrorResponse(ctx, Constants::RPC_INTERNAL_ERROR, e.what(), call.id);
            aborted = true;
            break;
        }

        JSValue callResponse = dispatchCall(ctx, *client, call);
        if (JS_IsException(callResponse)) {
            JS_FreeValue(ctx, responses);
            JSValue pending = JS_GetException(ctx);
            scope.close();
            return JS_Throw(ctx, pending);
        }
        JS_SetPropertyUint32(ctx, responses, index++, callResponse);
    }

    if (aborted) {
        JS_FreeValue(ctx, responses);
    } else if (request.batch) {
        response = responses;
    } else {
        response = JS_GetPropertyUint32(ctx, responses, 0);
        JS_FreeValue(ctx, responses);
    }

    JSValue result = deliver(ctx, response, argc, argv);
    if (JS_IsException(result)) {
        // Hooks may call into the VM; keep the callback's exception out of their way
        JSValue pending = JS_GetException(ctx);
        scope.close();
        return JS_Throw(ctx, pending);
    }

    scope.close();
    return result;
}

JSValue RpcBridge::dispatchCall(JSContext *ctx, IRpcClient &client, const RpcCall &call) {
    std::string raw;
    try {
        raw = client.call(call.method, call.params);
    } catch (const RpcError &e) {
        LOG_DEBUG("RpcBridge: {} returned error {}: {}", call.method, e.code(), e.what());
        JSValue response = newResponse(ctx, call.id);
        JSValue error = JS_NewObject(ctx);
        JS_SetPropertyStr(ctx, error, "code", JS_NewInt32(ctx, e.code()));
        JS_SetPropertyStr(ctx, error, "message", JS_NewString(ctx, e.what()));
        JS_SetPropertyStr(ctx, response, "error", error);
        return response;
    } catch (const std::exception &e) {
        LOG_WARN("RpcBridge: {} failed: {}", call.method, e.what());
        return newErrorResponse(ctx, Constants::RPC_INTERNAL_ERROR, e.what(), call.id);
    }

    if (raw.empty() || raw == "null") {
        JSValue response = newResponse(ctx, call.id);
        JS_SetPropertyStr(ctx, response, "result", JS_NULL);
        return response;
    }

    JSValue result = ScriptValueConverter::parse(ctx, raw);
    if (JS_IsException(result)) {
        std::string message = ScriptValueConverter::takeException(ctx);
        LOG_WARN("RpcBridge: {} result is not valid JSON: {}", call.method, message);
        return newErrorResponse(ctx, Constants::RPC_INTERNAL_ERROR, message, call.id);
    }

    JSValue response = newResponse(ctx, call.id);
    JS_SetPropertyStr(ctx, response, "result", result);
    return response;
}

JSValue RpcBridge::deliver(JSContext *ctx, JSValue response, int argc, JSValueConst *argv) {
    if (argc < 2 || !JS_IsFunction(ctx, argv[1])) {
        return response;
    }

    JSValue args[2] = {JS_NULL, response};
    JSValue ret = JS_Call(ctx, argv[1], JS_NULL, 2, args);
    JS_FreeValue(ctx, response);

    if (JS_IsException(ret)) {
        return JS_EXCEPTION;
    }
    JS_FreeValue(ctx, ret);
    return JS_UNDEFINED;
}

}  // namespace JAIL
