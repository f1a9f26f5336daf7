//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: traits/VtableMethods.hpp
// Purpose: Enumerates the methods that occupy vtable slots for a trait.
// Key invariants: Slot order is trait declaration order, the trait's own
//                 methods before those of its supertraits.  Methods that
//                 cannot be called through a trait object keep their slot
//                 but leave it vacant.
// Ownership/Lifetime: ItemVtableMethods borrows the item and type tables for
//                     its whole lifetime.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/DefId.hpp"
#include "core/Items.hpp"
#include "core/TraitRef.hpp"
#include "core/Type.hpp"

#include <optional>
#include <vector>

namespace kiln::traits
{

/// @brief Trait method applied to the trait reference's substitutions.
struct MethodRef
{
    core::DefId def{};
    core::Substs substs;
};

/// @brief Source of the method list used when building a vtable.
class VtableMethodProvider
{
  public:
    virtual ~VtableMethodProvider() = default;

    /// @brief One entry per vtable method slot; nullopt marks a vacant slot.
    virtual std::vector<std::optional<MethodRef>> vtableMethods(const core::TraitRef &traitRef) = 0;
};

/// @brief Provider driven by the compiler's item table.
class ItemVtableMethods final : public VtableMethodProvider
{
  public:
    ItemVtableMethods(const core::ItemTable &items, core::TypeTable &types);

    std::vector<std::optional<MethodRef>> vtableMethods(const core::TraitRef &traitRef) override;

  private:
    const core::ItemTable &items_;
    core::TypeTable &types_;
};

} // namespace kiln::traits
