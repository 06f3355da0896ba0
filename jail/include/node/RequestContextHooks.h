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
#include <string>

namespace JAIL {

/**
 * @brief Default hook policy: ties RPC calls to the chat message that caused them
 *
 * Before dispatch the script global _status_message_id is captured and travels
 * with the call. After the batch completes, a captured id is reported back
 * through the script function
 * addContext(messageId, key, value):
 *   - addContext(id, "message_id", id) for every call
 *   - addContext(id, "eth_sendTransaction", true) for eth_sendTransaction
 *
 * Scripts that define no addContext are left alone.
 */
class RequestContextHooks : public IRequestHooks {
public:
    static constexpr const char *MESSAGE_ID_GLOBAL = "_status_message_id";
    static constexpr const char *ADD_CONTEXT_FUNCTION = "addContext";
    static constexpr const char *MESSAGE_ID_KEY = "message_id";
    static constexpr const char *SEND_TRANSACTION_METHOD = "eth_sendTransaction";

    /**
     * @brief Capture the current message id; empty when the script has none
     */
    std::string preProcessRequest(JSContext *ctx, const RpcCall &call) override;
    void postProcessRequest(JSContext *ctx, const RpcCall &call, const std::string &messageId) override;

private:
    std::string readMessageId(JSContext *ctx) const;
    void addContext(JSContext *ctx, const std::string &messageId, const std::string &key, bool flag) const;
};

}  // namespace JAIL
