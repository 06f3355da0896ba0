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

#include "common/JailConfig.h"
#include "rpc/IHttpClient.h"
#include "rpc/IRpcClient.h"
#include <atomic>
#include <memory>

namespace JAIL {

/**
 * @brief JSON-RPC 2.0 over HTTP POST
 *
 * Each call(): POST {"jsonrpc":"2.0","id":<n>,"method":...,"params":[...]} to
 * the node URL and decode the single response object.
 */
class HttpRpcClient : public IRpcClient {
public:
    explicit HttpRpcClient(NodeConfig config, std::unique_ptr<IHttpClient> transport = createHttpClient());

    std::string call(const std::string &method, const json &params) override;

private:
    NodeConfig config_;
    std::unique_ptr<IHttpClient> transport_;
    std::atomic<uint64_t> nextId_{1};
};

}  // namespace JAIL
