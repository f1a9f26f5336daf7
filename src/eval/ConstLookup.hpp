//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: eval/ConstLookup.hpp
// Purpose: Maps a reference to a constant onto the item that defines its
//          value, resolving trait-associated constants through selection.
// Key invariants: Free constants, inherent-impl constants and impl items are
//                 returned unchanged.  A trait constant resolves to the impl's
//                 override, to itself when the trait supplies a default, or to
//                 nothing.
// Ownership/Lifetime: ConstLookupEnv borrows the session's tables and
//                     selection engine for the duration of one call.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/DefId.hpp"
#include "core/Items.hpp"
#include "core/Type.hpp"
#include "eval/EvalError.hpp"
#include "traits/Obligation.hpp"
#include "traits/Selection.hpp"

#include <optional>

namespace kiln::eval
{

/// @brief A constant item applied to its substitutions.
struct ConstRef
{
    core::DefId def{};
    core::Substs substs;
};

inline bool operator==(const ConstRef &a, const ConstRef &b)
{
    return a.def == b.def && a.substs == b.substs;
}

/// @brief Compiler services needed to resolve constants.
struct ConstLookupEnv
{
    const core::ItemTable &items;
    core::TypeTable &types;
    traits::SelectionEngine &selection;
};

/// @brief Resolve @p def under @p substs to the constant defining its value.
/// @return The input unchanged unless @p def is a trait-associated item; for
///         those, the result of resolveTraitAssociatedConst.
EvalResult<std::optional<ConstRef>> lookupConstById(const ConstLookupEnv &env,
                                                    const traits::ParamEnv &paramEnv,
                                                    core::DefId def,
                                                    const core::Substs &substs);

/// @brief Resolve trait constant @p def of @p traitId for @p substs.
/// @return The impl's constant of the same name with identity substitutions,
///         @p def itself when the trait declares a default, or nullopt when
///         selection is ambiguous, fails, or proves the bound by a
///         where-clause.  Internal error for any other impl source.
EvalResult<std::optional<ConstRef>> resolveTraitAssociatedConst(const ConstLookupEnv &env,
                                                                const traits::ParamEnv &paramEnv,
                                                                core::DefId def,
                                                                core::DefId traitId,
                                                                const core::Substs &substs);

} // namespace kiln::eval
