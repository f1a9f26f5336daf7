//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the source location value attached to diagnostics raised
//          while evaluating a constant.
// Key invariants: file_id == 0 denotes an unknown location; line/column are
//                 1-based when present.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace kiln::support
{

/// @brief Position of the constant (or use site) an evaluation is attributed to.
/// @invariant file_id == 0 indicates an unknown location.
struct SourceLoc
{
    /// @brief Identifier of the file assigned by the front end; 0 when unknown.
    uint32_t file_id = 0;

    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location references a tracked file.
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace kiln::support
