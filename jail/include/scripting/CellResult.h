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
 * @brief Outcome of running script code in a cell
 *
 * On success the value is rendered as text: strings verbatim, "undefined"
 * for undefined, JSON.stringify output for everything else.
 */
class CellResult {
public:
    static CellResult createSuccess(std::string text = "undefined") {
        CellResult result;
        result.success_ = true;
        result.text_ = std::move(text);
        return result;
    }

    static CellResult createError(std::string message) {
        CellResult result;
        result.success_ = false;
        result.errorMessage_ = std::move(message);
        return result;
    }

    bool isSuccess() const {
        return success_;
    }

    bool isError() const {
        return !success_;
    }

    const std::string &getText() const {
        return text_;
    }

    const std::string &getErrorMessage() const {
        return errorMessage_;
    }

private:
    bool success_ = false;
    std::string text_;
    std::string errorMessage_;
};

}  // namespace JAIL
