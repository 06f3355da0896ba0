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

#include "node/IRequestHooks.h"
#include "rpc/IRpcClient.h"
#include "quickjs.h"
#include <memory>
#include <string>

namespace JAIL {

class ScriptingCell;

/**
 * @brief Where the bridge gets its backend client and request hooks from
 */
class IBackendAccessor {
public:
    virtual ~IBackendAccessor() = default;

    /**
     * @throws JailException(NodeUnavailable) when no node is running
     */
    virtual std::shared_ptr<IRpcClient> getClient() = 0;

    /**
     * @throws JailException(NodeUnavailable) when no node is running
     */
    virtual std::shared_ptr<IRequestHooks> getRequestHooks() = 0;
};

/**
 * @brief Script-facing JSON-RPC provider bound into every cell
 *
 * Scripts see an object with send(request, callback) and sendAsync(request,
 * callback); both are the same native function. request is a call object or
 * an array of them. The response (an object, or an array in request order)
 * is returned, or handed to callback(null, response) when a function is
 * supplied, in which case send returns undefined.
 */
class RpcBridge {
public:
    explicit RpcBridge(IBackendAccessor &backend);

    RpcBridge(const RpcBridge &) = delete;
    RpcBridge &operator=(const RpcBridge &) = delete;

    /**
     * @brief Bind the provider object into the cell's global scope
     * @throws JailException(Busy) if the cell's gate cannot be acquired
     */
    void install(ScriptingCell &cell, const std::string &name);

    /**
     * @brief Body of send/sendAsync for a call made from inside cell
     */
    JSValue send(ScriptingCell &cell, int argc, JSValueConst *argv);

private:
    static JSValue sendWrapper(JSContext *ctx, JSValueConst thisVal, int argc, JSValueConst *argv);

    JSValue dispatchCall(JSContext *ctx, IRpcClient &client, const RpcCall &call);
    JSValue deliver(JSContext *ctx, JSValue response, int argc, JSValueConst *argv);

    IBackendAccessor &backend_;
};

}  // namespace JAIL
