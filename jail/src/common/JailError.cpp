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

#include "common/JailError.h"

namespace JAIL {

const char *errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::NotInitialized:
        return "NotInitialized";
    case ErrorCode::CellNotFound:
        return "CellNotFound";
    case ErrorCode::NodeUnavailable:
        return "NodeUnavailable";
    case ErrorCode::Busy:
        return "Busy";
    case ErrorCode::MalformedRequest:
        return "MalformedRequest";
    case ErrorCode::BackendError:
        return "BackendError";
    case ErrorCode::InternalError:
        return "InternalError";
    default:
        return "Unknown";
    }
}

}  // namespace JAIL
