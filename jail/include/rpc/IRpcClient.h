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

namespace JAIL {

/**
 * @brief Network-facing JSON-RPC client connected to a node
 */
class IRpcClient {
public:
    virtual ~IRpcClient() = default;

    /**
     * @brief Invoke method with params and return the raw JSON text of the result
     *
     * @return Result JSON text; "null" when the node returned a null or absent result
     * @throws RpcError when the node answers with a JSON-RPC error object
     * @throws JailException for transport failures (NodeUnavailable, InternalError)
     */
    virtual std::string call(const std::string &method, const json &params) = 0;
};

}  // namespace JAIL
