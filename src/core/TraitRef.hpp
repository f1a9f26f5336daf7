//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/TraitRef.hpp
// Purpose: A trait applied to concrete type arguments.
// Key invariants: substs[0] is the Self type; a well-formed reference always
//                 carries at least the Self argument.
// Ownership/Lifetime: Value type; Ty handles refer to the session TypeTable.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/DefId.hpp"
#include "core/Type.hpp"

namespace kiln::core
{

/// @brief `<substs[0] as Trait<substs[1..]>>`.
/// @details When a trait object `Foo<dyn Trait>` is built from `Foo<T>`, the
///          reference used for its vtable maps `T: Trait`, i.e. the erased type
///          sits in the Self slot.
struct TraitRef
{
    DefId traitId{};
    Substs substs;

    /// @brief The implementing (erased) type; invalid when substs is empty.
    [[nodiscard]] Ty selfTy() const
    {
        return substs.empty() ? Ty{} : substs.front();
    }
};

inline bool operator==(const TraitRef &a, const TraitRef &b)
{
    return a.traitId == b.traitId && a.substs == b.substs;
}

inline bool operator!=(const TraitRef &a, const TraitRef &b)
{
    return !(a == b);
}

} // namespace kiln::core
