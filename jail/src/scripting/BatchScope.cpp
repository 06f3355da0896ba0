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

#include "scripting/BatchScope.h"
#include "common/Logger.h"

namespace JAIL {

BatchScope::BatchScope(JSContext *ctx, std::shared_ptr<IRequestHooks> hooks) : ctx_(ctx), hooks_(std::move(hooks)) {}

BatchScope::~BatchScope() {
    close();
}

void BatchScope::begin(const RpcCall &call) {
    std::string captured;
    if (hooks_) {
        try {
            captured = hooks_->preProcessRequest(ctx_, call);
        } catch (const std::exception &e) {
            LOG_WARN("BatchScope: Pre-dispatch hook failed for {}: {}", call.method, e.what());
        }
    }
    deferred_.push_back({call, std::move(captured)});
}

void BatchScope::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (!hooks_) {
        return;
    }

    for (const auto &deferred : deferred_) {
        try {
            hooks_->postProcessRequest(ctx_, deferred.call, deferred.captured);
        } catch (const std::exception &e) {
            LOG_WARN("BatchScope: Post-dispatch hook failed for {}: {}", deferred.call.method, e.what());
        }
    }
}

}  // namespace JAIL
