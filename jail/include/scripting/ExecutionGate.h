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
#include <mutex>
#include <string>

namespace JAIL {

/**
 * @brief Single-slot gate serializing work inside one cell
 *
 * Capacity is one across threads. The thread holding the gate may enter it
 * again (the bridge runs nested inside a call into the same cell); any other
 * thread waits up to the bounded wait and then fails with Busy.
 */
class ExecutionGate {
public:
    using Lock = std::unique_lock<std::recursive_timed_mutex>;

    ExecutionGate(std::string owner, std::chrono::milliseconds maxWait);

    ExecutionGate(const ExecutionGate &) = delete;
    ExecutionGate &operator=(const ExecutionGate &) = delete;

    /**
     * @brief Wait for the gate; released when the returned lock goes out of scope
     * @throws JailException(Busy) if the bounded wait elapses
     */
    Lock acquire();

    /**
     * @brief Non-blocking attempt; the lock does not own the gate on failure
     */
    Lock tryAcquire();

    std::chrono::milliseconds getMaxWait() const {
        return maxWait_;
    }

private:
    std::string owner_;
    std::chrono::milliseconds maxWait_;
    std::recursive_timed_mutex mutex_;
};

}  // namespace JAIL
