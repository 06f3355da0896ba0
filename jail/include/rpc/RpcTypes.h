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
#include <string>
#include <vector>

namespace JAIL {

/**
 * @brief One JSON-RPC request issued by a script
 *
 * The id is echoed back untouched (any JSON scalar); ids are neither
 * validated nor deduplicated.
 */
struct RpcCall {
    json id;
    std::string method;
    json params = json::array();

    /**
     * @throws JailException(MalformedRequest) if value is not a call object
     */
    static RpcCall fromJson(const json &value);

    json toJson() const;
};

/**
 * @brief Decoded script request: a single call or an ordered batch
 */
struct RpcRequest {
    bool batch = false;
    std::vector<RpcCall> calls;
};

/**
 * @brief Decode the JSON text of a script request
 *
 * The first non-whitespace byte decides the shape: '[' is a batch, anything
 * else a single call, which is wrapped in a one-element sequence.
 *
 * @throws JailException(MalformedRequest) on invalid JSON or call shape
 */
RpcRequest decodeRpcRequest(const std::string &text);

/**
 * @brief {"jsonrpc":"2.0","id":id,"error":{"code":code,"message":message}}
 */
json makeRpcErrorResponse(int code, const std::string &message, const json &id);

}  // namespace JAIL
