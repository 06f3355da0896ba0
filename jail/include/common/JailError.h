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

#include <stdexcept>
#include <string>

namespace JAIL {

/**
 * @brief Failure categories of the jail core
 */
enum class ErrorCode {
    NotInitialized,    // Operation invoked against an absent registry
    CellNotFound,      // No cell for the session identifier
    NodeUnavailable,   // No backend node/client reachable
    Busy,              // Cell gate not acquired within the bounded wait
    MalformedRequest,  // Script-supplied JSON is not a call (or batch of calls)
    BackendError,      // Structured JSON-RPC error from the node
    InternalError      // Anything else
};

const char *errorCodeToString(ErrorCode code);

/**
 * @brief Exception used inside the core; rendered into the error envelope at public entry points
 */
class JailException : public std::runtime_error {
public:
    JailException(ErrorCode code, const std::string &message) : std::runtime_error(message), code_(code) {}

    ErrorCode code() const {
        return code_;
    }

private:
    ErrorCode code_;
};

/**
 * @brief Structured JSON-RPC error reported by the node, passed through verbatim
 */
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string &message) : std::runtime_error(message), code_(code) {}

    int code() const {
        return code_;
    }

private:
    int code_;
};

namespace Constants {

// JSON-RPC 2.0 "Internal error"
constexpr int RPC_INTERNAL_ERROR = -32603;

}  // namespace Constants

}  // namespace JAIL
