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

#include "scripting/ExecutionGate.h"
#include "common/JailError.h"
#include "common/Logger.h"

namespace JAIL {

ExecutionGate::ExecutionGate(std::string owner, std::chrono::milliseconds maxWait)
    : owner_(std::move(owner)), maxWait_(maxWait) {}

ExecutionGate::Lock ExecutionGate::acquire() {
    Lock lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(maxWait_)) {
        LOG_WARN("ExecutionGate: Cell '{}' still busy after {}ms", owner_, maxWait_.count());
        throw JailException(ErrorCode::Busy, "Cell[" + owner_ + "] is busy: request timed out after " +
                                                 std::to_string(maxWait_.count()) + "ms");
    }
    return lock;
}

ExecutionGate::Lock ExecutionGate::tryAcquire() {
    return Lock(mutex_, std::try_to_lock);
}

}  // namespace JAIL
