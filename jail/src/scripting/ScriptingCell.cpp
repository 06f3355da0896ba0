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

#include "scripting/ScriptingCell.h"
#include "common/JailError.h"
#include "common/Logger.h"
#include "scripting/ScriptValueConverter.h"
#include <sstream>

namespace JAIL {

ScriptingCell::ScriptingCell(std::string id, std::chrono::milliseconds gateTimeout, size_t memoryLimitBytes)
    : id_(std::move(id)), gate_(id_, gateTimeout) {
    runtime_ = JS_NewRuntime();
    if (!runtime_) {
        throw JailException(ErrorCode::InternalError, "Failed to create QuickJS runtime for Cell[" + id_ + "]");
    }

    if (memoryLimitBytes > 0) {
        JS_SetMemoryLimit(runtime_, memoryLimitBytes);
    }

    ctx_ = JS_NewContext(runtime_);
    if (!ctx_) {
        JS_FreeRuntime(runtime_);
        runtime_ = nullptr;
        throw JailException(ErrorCode::InternalError, "Failed to create QuickJS context for Cell[" + id_ + "]");
    }

    JS_SetContextOpaque(ctx_, this);
    setupConsole();

    LOG_DEBUG("ScriptingCell: Created Cell[{}]", id_);
}

ScriptingCell::~ScriptingCell() {
    // Owners hold the cell by shared_ptr across every call, so nothing is running here
    if (ctx_) {
        JS_UpdateStackTop(runtime_);
        JS_FreeContext(ctx_);
        ctx_ = nullptr;
    }
    if (runtime_) {
        JS_FreeRuntime(runtime_);
        runtime_ = nullptr;
    }
    LOG_DEBUG("ScriptingCell: Destroyed Cell[{}]", id_);
}

ExecutionGate::Lock ScriptingCell::enter() {
    auto lock = gate_.acquire();
    // QuickJS checks stack depth against the thread that last touched the runtime
    JS_UpdateStackTop(runtime_);
    return lock;
}

CellResult ScriptingCell::evaluate(const std::string &script, const std::string &filename) {
    auto lock = enter();
    JSValue value = JS_Eval(ctx_, script.c_str(), script.length(), filename.c_str(), JS_EVAL_TYPE_GLOBAL);
    return toCellResult(value);
}

CellResult ScriptingCell::callFunction(const std::string &name, const std::vector<std::string> &args) {
    auto lock = enter();

    JSValue global = JS_GetGlobalObject(ctx_);
    JSValue fn = JS_GetPropertyStr(ctx_, global, name.c_str());
    JS_FreeValue(ctx_, global);

    if (JS_IsException(fn)) {
        return CellResult::createError(ScriptValueConverter::takeException(ctx_));
    }
    if (!JS_IsFunction(ctx_, fn)) {
        bool missing = JS_IsUndefined(fn);
        JS_FreeValue(ctx_, fn);
        return CellResult::createError(missing ? "ReferenceError: " + name + " is not defined"
                                               : "TypeError: " + name + " is not a function");
    }

    std::vector<JSValue> argv;
    argv.reserve(args.size());
    for (const auto &arg : args) {
        argv.push_back(JS_NewStringLen(ctx_, arg.data(), arg.size()));
    }

    JSValue value = JS_Call(ctx_, fn, JS_UNDEFINED, static_cast<int>(argv.size()), argv.data());

    for (JSValue &arg : argv) {
        JS_FreeValue(ctx_, arg);
    }
    JS_FreeValue(ctx_, fn);

    return toCellResult(value);
}

std::optional<std::string> ScriptingCell::getGlobalString(const std::string &name) {
    auto lock = enter();

    JSValue global = JS_GetGlobalObject(ctx_);
    JSValue value = JS_GetPropertyStr(ctx_, global, name.c_str());
    JS_FreeValue(ctx_, global);

    if (JS_IsException(value)) {
        LOG_WARN("ScriptingCell: Cell[{}] failed to read {}: {}", id_, name, ScriptValueConverter::takeException(ctx_));
        return std::nullopt;
    }

    std::optional<std::string> result;
    if (!JS_IsUndefined(value)) {
        result = ScriptValueConverter::toStdString(ctx_, value);
    }
    JS_FreeValue(ctx_, value);
    return result;
}

ScriptingCell *ScriptingCell::fromContext(JSContext *ctx) {
    return ctx ? static_cast<ScriptingCell *>(JS_GetContextOpaque(ctx)) : nullptr;
}

CellResult ScriptingCell::toCellResult(JSValue value) {
    if (JS_IsException(value)) {
        return CellResult::createError(ScriptValueConverter::takeException(ctx_));
    }

    std::string error;
    auto text = ScriptValueConverter::toResultText(ctx_, value, &error);
    JS_FreeValue(ctx_, value);

    if (!text) {
        return CellResult::createError(error);
    }
    return CellResult::createSuccess(std::move(*text));
}

void ScriptingCell::setupConsole() {
    JSValue global = JS_GetGlobalObject(ctx_);
    JSValue consoleObj = JS_NewObject(ctx_);

    JS_SetPropertyStr(ctx_, consoleObj, "log", JS_NewCFunction(ctx_, consoleLogWrapper, "log", 1));

    JS_SetPropertyStr(ctx_, global, "console", consoleObj);
    JS_FreeValue(ctx_, global);
}

JSValue ScriptingCell::consoleLogWrapper(JSContext *ctx, JSValueConst /*thisVal*/, int argc, JSValueConst *argv) {
    std::stringstream ss;

    for (int i = 0; i < argc; i++) {
        if (i > 0) {
            ss << " ";
        }

        const char *str = JS_ToCString(ctx, argv[i]);
        if (str) {
            ss << str;
            JS_FreeCString(ctx, str);
        } else {
            JSValue ignored = JS_GetException(ctx);
            JS_FreeValue(ctx, ignored);
            ss << "[object]";
        }
    }

    ScriptingCell *cell = fromContext(ctx);
    LOG_INFO("Cell[{}] console.log: {}", cell ? cell->getId() : std::string("?"), ss.str());
    return JS_UNDEFINED;
}

}  // namespace JAIL
