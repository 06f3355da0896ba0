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

#include "rpc/CppHttplibClient.h"
#include "common/Logger.h"
#include <algorithm>
#include <httplib.h>
#include <regex>

namespace JAIL {

namespace {

HttpClient::Response transportFailure(const std::string &error) {
    HttpClient::Response response;
    response.error = error;
    return response;
}

}  // namespace

CppHttplibClient::CppHttplibClient() {
    LOG_DEBUG("CppHttplibClient: Created native HTTP client");
}

std::optional<CppHttplibClient::UrlParts> CppHttplibClient::parseUrl(const std::string &url) {
    static const std::regex uriPattern(R"(^(https?)://([^:/\s]+)(?::(\d+))?(/.*)?$)", std::regex_constants::icase);
    std::smatch match;

    if (!std::regex_match(url, match, uriPattern)) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = match[1].str();
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    parts.host = match[2].str();

    if (match[3].matched) {
        try {
            parts.port = std::stoi(match[3].str());
        } catch (const std::exception &) {
            return std::nullopt;
        }
    } else {
        parts.port = (parts.scheme == "https") ? 443 : 80;
    }

    parts.path = match[4].matched ? match[4].str() : "/";
    return parts;
}

std::future<HttpClient::Response> CppHttplibClient::sendRequest(const HttpClient::Request &request) {
    auto timeout = timeout_;
    auto sslVerify = sslVerification_;

    return std::async(std::launch::async, [request, timeout, sslVerify]() -> HttpClient::Response {
        auto parts = parseUrl(request.url);
        if (!parts) {
            LOG_ERROR("CppHttplibClient: Invalid URL: {}", request.url);
            return transportFailure("Invalid URL: " + request.url);
        }

        std::string baseUrl = parts->scheme + "://" + parts->host;
        if ((parts->scheme == "http" && parts->port != 80) || (parts->scheme == "https" && parts->port != 443)) {
            baseUrl += ":" + std::to_string(parts->port);
        }

        LOG_TRACE("CppHttplibClient: {} {} (timeout={}ms)", request.method, baseUrl + parts->path, timeout.count());

        try {
            httplib::Client client(baseUrl);

            auto timeoutSec = std::max<long long>(1, std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
            client.set_connection_timeout(static_cast<time_t>(timeoutSec));
            client.set_read_timeout(static_cast<time_t>(timeoutSec));
            client.set_write_timeout(static_cast<time_t>(timeoutSec));

#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
            if (parts->scheme == "https") {
                client.enable_server_certificate_verification(sslVerify);
            }
#else
            (void)sslVerify;
#endif

            httplib::Headers headers;
            for (const auto &[key, value] : request.headers) {
                headers.emplace(key, value);
            }

            httplib::Result result;
            if (request.method == "POST") {
                result = client.Post(parts->path, headers, request.body, request.contentType);
            } else if (request.method == "GET") {
                result = client.Get(parts->path, headers);
            } else {
                LOG_ERROR("CppHttplibClient: Unsupported HTTP method: {}", request.method);
                return transportFailure("Unsupported HTTP method: " + request.method);
            }

            if (!result) {
                auto err = httplib::to_string(result.error());
                LOG_DEBUG("CppHttplibClient: Request to {} failed - {}", baseUrl, err);
                return transportFailure(err);
            }

            HttpClient::Response response;
            response.success = (result->status >= 200 && result->status < 300);
            response.statusCode = result->status;
            response.body = result->body;
            for (const auto &[key, value] : result->headers) {
                response.headers[key] = value;
            }

            LOG_TRACE("CppHttplibClient: Response {} (body {} bytes)", result->status, response.body.size());
            return response;
        } catch (const std::exception &e) {
            LOG_ERROR("CppHttplibClient: Exception: {}", e.what());
            return transportFailure(e.what());
        }
    });
}

void CppHttplibClient::setTimeout(std::chrono::milliseconds timeout) {
    timeout_ = timeout;
    LOG_DEBUG("CppHttplibClient: Set timeout to {}ms", timeout.count());
}

void CppHttplibClient::setSSLVerification(bool verify) {
    sslVerification_ = verify;
    LOG_DEBUG("CppHttplibClient: SSL verification {}", verify ? "enabled" : "disabled");
}

std::unique_ptr<IHttpClient> createHttpClient() {
    return std::make_unique<CppHttplibClient>();
}

}  // namespace JAIL
