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

#include "rpc/IHttpClient.h"
#include <optional>

namespace JAIL {

/**
 * @brief Native HTTP client using cpp-httplib
 *
 * A fresh httplib::Client is created per request, so one instance can be
 * shared by every cell without extra locking.
 */
class CppHttplibClient : public IHttpClient {
public:
    CppHttplibClient();
    ~CppHttplibClient() override = default;

    std::future<HttpClient::Response> sendRequest(const HttpClient::Request &request) override;
    void setTimeout(std::chrono::milliseconds timeout) override;

    void setSSLVerification(bool verify);

    struct UrlParts {
        std::string scheme;
        std::string host;
        int port = 0;
        std::string path;
    };

    /**
     * @brief Split http(s)://host[:port][/path]; nullopt if the URL is not understood
     */
    static std::optional<UrlParts> parseUrl(const std::string &url);

private:
    std::chrono::milliseconds timeout_{30000};
    bool sslVerification_{true};
};

}  // namespace JAIL
