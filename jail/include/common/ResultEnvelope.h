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

#include <string>

namespace JAIL {

/**
 * @brief {"result": <rawJson>}
 *
 * rawJson is JSON text produced inside a cell. The literal "undefined" becomes
 * null; text that is not valid JSON is carried as a JSON string.
 */
std::string makeResultEnvelope(const std::string &rawJson);

/**
 * @brief {"error": "<message>"}
 */
std::string makeErrorEnvelope(const std::string &message);

}  // namespace JAIL
