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

#include "rpc/RpcTypes.h"
#include <string>

struct JSContext;

namespace JAIL {

/**
 * @brief Pre/post processing invoked around every RPC call a cell dispatches
 *
 * preProcessRequest runs before the call reaches the node; postProcessRequest
 * runs when the enclosing batch finishes, whether or not the call succeeded.
 * Whatever preProcessRequest returns is handed back to postProcessRequest for
 * the same call, so state captured before dispatch stays paired with its call
 * even when batches nest.
 * Both run on the cell's thread with its gate held, so they may read or call
 * into ctx. Failures inside a hook never change the call's outcome.
 */
class IRequestHooks {
public:
    virtual ~IRequestHooks() = default;

    virtual std::string preProcessRequest(JSContext *ctx, const RpcCall &call) = 0;
    virtual void postProcessRequest(JSContext *ctx, const RpcCall &call, const std::string &captured) = 0;
};

}  // namespace JAIL
