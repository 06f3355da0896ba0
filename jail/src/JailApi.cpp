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

#include "JailApi.h"
#include "common/JailError.h"
#include "common/Logger.h"
#include "common/ResultEnvelope.h"

namespace JAIL {
namespace Api {

std::string parse(Jail *jail, const std::string &id, const std::string &script) {
    if (!jail) {
        LOG_ERROR("Api: parse({}) on uninitialized jail", id);
        return makeErrorEnvelope(NOT_INITIALIZED_MESSAGE);
    }
    return jail->parse(id, script);
}

std::string call(Jail *jail, const std::string &id, const std::string &path, const std::string &args) {
    if (!jail) {
        LOG_ERROR("Api: call({}, {}) on uninitialized jail", id, path);
        return makeErrorEnvelope(NOT_INITIALIZED_MESSAGE);
    }
    return jail->call(id, path, args);
}

std::shared_ptr<ScriptingCell> getVM(Jail *jail, const std::string &id) {
    if (!jail) {
        throw JailException(ErrorCode::NotInitialized, NOT_INITIALIZED_MESSAGE);
    }
    return jail->getVM(id);
}

}  // namespace Api
}  // namespace JAIL
