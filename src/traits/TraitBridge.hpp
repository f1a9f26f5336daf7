//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: traits/TraitBridge.hpp
// Purpose: One-shot trait selection on behalf of the constant evaluator.
// Key invariants: Each call runs in its own InferCtxt.  Solver errors never
//                 propagate; they become SelectOutcome::Kind::NotFound.
// Ownership/Lifetime: Stateless free function; borrows its arguments.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/TraitRef.hpp"
#include "core/Type.hpp"
#include "traits/Obligation.hpp"
#include "traits/Selection.hpp"

namespace kiln::traits
{

struct SelectOutcome
{
    enum class Kind : uint8_t
    {
        Selected,  ///< `source` is the unique proof, free of inference variables.
        Ambiguous, ///< Not decidable yet; callers defer.
        NotFound,  ///< Definitively unimplemented.
    };

    Kind kind = Kind::NotFound;
    ImplSource source; ///< Only meaningful for Kind::Selected.

    [[nodiscard]] bool isSelected() const noexcept
    {
        return kind == Kind::Selected;
    }
};

/// @brief Select the implementation of @p traitRef under @p paramEnv.
/// @details A Selected answer whose impl substitutions still mention
///          unresolved inference variables is reported as Ambiguous.
SelectOutcome selectImplementation(SelectionEngine &engine,
                                   core::TypeTable &types,
                                   const core::TraitRef &traitRef,
                                   const ParamEnv &paramEnv);

} // namespace kiln::traits
