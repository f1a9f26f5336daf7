//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: eval/EvalConfig.hpp
// Purpose: Knobs of an evaluation session.
// Key invariants: Defaults describe a 64-bit little-endian target with a
//                 64 MiB synthetic memory budget.
// Ownership/Lifetime: Plain value copied into the session.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mem/TargetDataLayout.hpp"

#include <cstdint>

namespace kiln::eval
{

struct EvalConfig
{
    mem::TargetDataLayout target{};           ///< Pointer width and byte order.
    uint64_t memoryLimit = uint64_t{64} << 20; ///< Synthetic memory cap in bytes; zero disables it.
    bool debugLog = false;                     ///< Force [DEBUG] output on while the session lives.

    /// @brief Defaults overridden by the KILN_* environment variables.
    /// @details KILN_POINTER_WIDTH accepts 2, 4 or 8; KILN_MEMORY_LIMIT a
    ///          decimal byte count; a non-empty KILN_DEBUG_EVAL enables
    ///          logging.  Malformed values are ignored.
    static EvalConfig fromEnvironment();
};

} // namespace kiln::eval
