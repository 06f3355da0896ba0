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
#include <memory>
#include <string>
#include <vector>

namespace JAIL {

/**
 * @brief Processing scope of one bridge invocation
 *
 * begin() runs the pre-dispatch hook for a call and queues its post-dispatch
 * hook together with what the pre-dispatch hook captured. The queued hooks run in registration order when the scope is closed,
 * either explicitly or on destruction, whatever happened to the calls.
 * Hook failures are logged and never reach the caller.
 */
class BatchScope {
public:
    BatchScope(JSContext *ctx, std::shared_ptr<IRequestHooks> hooks);
    ~BatchScope();

    BatchScope(const BatchScope &) = delete;
    BatchScope &operator=(const BatchScope &) = delete;

    void begin(const RpcCall &call);

    /**
     * @brief Run the queued post-dispatch hooks; later calls are no-ops
     */
    void close();

private:
    JSContext *ctx_;
    std::shared_ptr<IRequestHooks> hooks_;
    struct DeferredCall {
        RpcCall call;
        std::string captured;
    };

    std::vector<DeferredCall> deferred_;
    bool closed_ = false;
};

}  // namespace JAIL
