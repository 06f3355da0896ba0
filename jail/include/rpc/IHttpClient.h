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

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <string>

namespace JAIL {

namespace HttpClient {

/**
 * @brief Outgoing HTTP request
 */
struct Request {
    std::string method;                          // "POST", "GET"
    std::string url;                             // Full URL: "http://127.0.0.1:8545/"
    std::string body;
    std::string contentType;
    std::map<std::string, std::string> headers;
};

/**
 * @brief Incoming HTTP response
 */
struct Response {
    bool success = false;  // true if HTTP 200-299 and no network error
    int statusCode = 0;    // 0 on network error
    std::string body;
    std::map<std::string, std::string> headers;
    std::string error;     // Transport error description when statusCode == 0
};

}  // namespace HttpClient

/**
 * @brief Transport used by HttpRpcClient to reach the node
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Send HTTP request asynchronously
     *
     * Safe from any thread; the returned future is the only hand-off between
     * the caller and the transport.
     */
    virtual std::future<HttpClient::Response> sendRequest(const HttpClient::Request &request) = 0;

    virtual void setTimeout(std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Default transport (cpp-httplib)
 */
std::unique_ptr<IHttpClient> createHttpClient();

}  // namespace JAIL
