//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: traits/Obligation.hpp
// Purpose: Trait predicates handed to the selection engine together with the
//          environment they must be proven in.
// Key invariants: An obligation never outlives the selection call it was
//                 built for.
// Ownership/Lifetime: Value types.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/TraitRef.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <vector>

namespace kiln::traits
{

/// @brief Trait bounds in scope for the item being evaluated.
/// @details Constant evaluation normally runs with an empty environment since
///          it works on fully monomorphic items.
struct ParamEnv
{
    std::vector<core::TraitRef> callerBounds;

    [[nodiscard]] bool empty() const noexcept
    {
        return callerBounds.empty();
    }
};

/// @brief Why an obligation exists; used only for error reporting.
struct ObligationCause
{
    support::SourceLoc loc{};

    /// @brief Cause for obligations synthesised by the compiler itself.
    static ObligationCause dummy()
    {
        return ObligationCause{};
    }
};

/// @brief "predicate holds under paramEnv".
struct Obligation
{
    ObligationCause cause;
    ParamEnv paramEnv;
    core::TraitRef predicate;
    uint32_t recursionDepth = 0;
};

} // namespace kiln::traits
