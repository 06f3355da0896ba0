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
#include <memory>

namespace JAIL {

/**
 * @brief What the jail consumes from node lifecycle management
 */
class INodeManager {
public:
    virtual ~INodeManager() = default;

    virtual bool hasNode() const = 0;

    /**
     * @brief Client handle that stays valid across node restarts
     * @throws JailException(NodeUnavailable) when no node is running
     */
    virtual std::shared_ptr<IRpcClient> getClient() = 0;

    /**
     * @throws JailException(NodeUnavailable) when no node is running
     */
    virtual std::shared_ptr<IRequestHooks> getRequestHooks() = 0;
};

}  // namespace JAIL
