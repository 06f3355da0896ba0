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

#include "Jail.h"

namespace JAIL {

/**
 * @brief Host-facing entry points tolerating an absent registry
 *
 * Intended for bindings that hold a possibly-null Jail pointer (FFI layers,
 * late-initialized services). A null jail never faults; it reports the
 * NotInitialized error in-band.
 */
namespace Api {

constexpr const char *NOT_INITIALIZED_MESSAGE = "jail environment is not properly initialized";

std::string parse(Jail *jail, const std::string &id, const std::string &script);

std::string call(Jail *jail, const std::string &id, const std::string &path, const std::string &args);

/**
 * @throws JailException(NotInitialized) for a null jail, JailException(CellNotFound) for an unknown id
 */
std::shared_ptr<ScriptingCell> getVM(Jail *jail, const std::string &id);

}  // namespace Api

}  // namespace JAIL
