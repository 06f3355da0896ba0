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

#include "rpc/RpcTypes.h"
#include "common/JailError.h"
#include <cctype>

namespace JAIL {

RpcCall RpcCall::fromJson(const json &value) {
    if (!value.is_object()) {
        throw JailException(ErrorCode::MalformedRequest, "RPC call must be a JSON object");
    }

    RpcCall call;
    if (value.contains("id")) {
        call.id = value["id"];
    }

    if (!value.contains("method") || !value["method"].is_string()) {
        throw JailException(ErrorCode::MalformedRequest, "RPC call is missing a string 'method'");
    }
    call.method = value["method"].get<std::string>();

    if (JsonUtils::hasKey(value, "params")) {
        if (!value["params"].is_array()) {
            throw JailException(ErrorCode::MalformedRequest,
                                "RPC call '" + call.method + "' has non-array 'params'");
        }
        call.params = value["params"];
    }

    return call;
}

json RpcCall::toJson() const {
    return json{{"id", id}, {"method", method}, {"params", params}};
}

RpcRequest decodeRpcRequest(const std::string &text) {
    size_t first = 0;
    while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) {
        ++first;
    }
    if (first == text.size()) {
        throw JailException(ErrorCode::MalformedRequest, "Empty RPC request");
    }

    std::string parseError;
    auto parsed = JsonUtils::parseJson(text, &parseError);
    if (!parsed) {
        throw JailException(ErrorCode::MalformedRequest, "Invalid RPC request JSON: " + parseError);
    }

    RpcRequest request;
    request.batch = text[first] == '[';

    if (request.batch) {
        request.calls.reserve(parsed->size());
        for (const auto &element : *parsed) {
            request.calls.push_back(RpcCall::fromJson(element));
        }
    } else {
        request.calls.push_back(RpcCall::fromJson(*parsed));
    }

    return request;
}

json makeRpcErrorResponse(int code, const std::string &message, const json &id) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

}  // namespace JAIL
