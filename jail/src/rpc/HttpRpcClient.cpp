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

#include "rpc/HttpRpcClient.h"
#include "common/JailError.h"
#include "common/Logger.h"

namespace JAIL {

HttpRpcClient::HttpRpcClient(NodeConfig config, std::unique_ptr<IHttpClient> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("HttpRpcClient: transport cannot be null");
    }
    transport_->setTimeout(config_.rpcTimeout);
    LOG_DEBUG("HttpRpcClient: Created for {}", config_.url);
}

std::string HttpRpcClient::call(const std::string &method, const json &params) {
    const uint64_t wireId = nextId_.fetch_add(1);

    HttpClient::Request request;
    request.method = "POST";
    request.url = config_.url;
    request.contentType = "application/json";
    request.headers = config_.headers;
    request.body = json{{"jsonrpc", "2.0"}, {"id", wireId}, {"method", method}, {"params", params}}.dump();

    LOG_DEBUG("HttpRpcClient: -> {} (id={})", method, wireId);

    // Transport timeouts bound this wait
    HttpClient::Response response = transport_->sendRequest(request).get();

    if (response.statusCode == 0) {
        throw JailException(ErrorCode::NodeUnavailable, "Node unreachable at " + config_.url + ": " + response.error);
    }

    std::string parseError;
    auto body = JsonUtils::parseJson(response.body, &parseError);
    if (!body || !body->is_object()) {
        if (!response.success) {
            throw JailException(ErrorCode::InternalError,
                                "HTTP " + std::to_string(response.statusCode) + " from " + config_.url);
        }
        throw JailException(ErrorCode::InternalError, "Invalid JSON-RPC response: " + parseError);
    }

    if (JsonUtils::hasKey(*body, "error")) {
        const json &error = (*body)["error"];
        int code = static_cast<int>(JsonUtils::getInt(error, "code", Constants::RPC_INTERNAL_ERROR));
        std::string message = JsonUtils::getString(error, "message", "Unknown RPC error");
        LOG_DEBUG("HttpRpcClient: <- {} error {} '{}'", method, code, message);
        throw RpcError(code, message);
    }

    if (!response.success) {
        throw JailException(ErrorCode::InternalError,
                            "HTTP " + std::to_string(response.statusCode) + " from " + config_.url);
    }

    if (!body->contains("result")) {
        return "null";
    }
    return (*body)["result"].dump();
}

}  // namespace JAIL
