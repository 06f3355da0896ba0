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

#include "scripting/CellResult.h"
#include "scripting/ExecutionGate.h"
#include "quickjs.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace JAIL {

class RpcBridge;

/**
 * @brief One isolated script execution context
 *
 * A cell exclusively owns its QuickJS runtime and context. All script work
 * runs on the calling thread while the cell's gate is held; evaluate() and
 * callFunction() take the gate themselves, so a caller that already holds it
 * (the bridge, or a bootstrap sequence) simply re-enters.
 *
 * The context opaque pointer is the cell itself, which is how native
 * callbacks find their way back (see fromContext()).
 */
class ScriptingCell {
public:
    /**
     * @throws JailException(InternalError) if the runtime or context cannot be created
     */
    ScriptingCell(std::string id, std::chrono::milliseconds gateTimeout, size_t memoryLimitBytes = 0);
    ~ScriptingCell();

    ScriptingCell(const ScriptingCell &) = delete;
    ScriptingCell &operator=(const ScriptingCell &) = delete;

    /**
     * @brief Acquire the gate and make the VM usable from this thread
     * @throws JailException(Busy) if the bounded wait elapses
     */
    ExecutionGate::Lock enter();

    /**
     * @brief Evaluate script text in the global scope
     * @throws JailException(Busy) if the gate cannot be acquired
     */
    CellResult evaluate(const std::string &script, const std::string &filename = "<cell>");

    /**
     * @brief Call a global function with string arguments
     * @throws JailException(Busy) if the gate cannot be acquired
     */
    CellResult callFunction(const std::string &name, const std::vector<std::string> &args);

    /**
     * @brief String value of a global, nullopt when it is undefined
     */
    std::optional<std::string> getGlobalString(const std::string &name);

    const std::string &getId() const {
        return id_;
    }

    JSContext *getContext() const {
        return ctx_;
    }

    JSRuntime *getRuntime() const {
        return runtime_;
    }

    void setBridge(RpcBridge *bridge) {
        bridge_ = bridge;
    }

    RpcBridge *getBridge() const {
        return bridge_;
    }

    /**
     * @brief Cell owning ctx, nullptr for contexts not created by a cell
     */
    static ScriptingCell *fromContext(JSContext *ctx);

private:
    void setupConsole();
    CellResult toCellResult(JSValue value);

    static JSValue consoleLogWrapper(JSContext *ctx, JSValueConst thisVal, int argc, JSValueConst *argv);

    std::string id_;
    ExecutionGate gate_;
    JSRuntime *runtime_ = nullptr;
    JSContext *ctx_ = nullptr;
    RpcBridge *bridge_ = nullptr;
};

}  // namespace JAIL
