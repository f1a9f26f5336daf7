//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: eval/EvalContext.hpp
// Purpose: Evaluator state shared by the constant-evaluation driver: the
//          synthetic memory arena plus the compiler services it calls into.
//          Vtable synthesis and associated-constant resolution live here.
// Key invariants: A synthesised vtable is P * (3 + N) bytes laid out as
//                 [drop glue, size, align, method 0 .. method N-1] and is
//                 immutable once returned.
// Ownership/Lifetime: Borrows every collaborator; the session that creates
//                     the context owns them and outlives it.  One evaluation
//                     thread at a time.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Instance.hpp"
#include "core/Items.hpp"
#include "core/TraitRef.hpp"
#include "core/Type.hpp"
#include "eval/Collaborators.hpp"
#include "eval/ConstLookup.hpp"
#include "eval/EvalError.hpp"
#include "mem/Memory.hpp"
#include "mem/Pointer.hpp"
#include "mem/Value.hpp"
#include "traits/Obligation.hpp"
#include "traits/Selection.hpp"
#include "traits/VtableMethods.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

namespace kiln::eval
{

/// @brief Compiler services an EvalContext calls into.
struct EvalServices
{
    const core::ItemTable &items;
    core::TypeTable &types;
    LayoutEngine &layouts;
    InstanceResolver &instances;
    traits::SelectionEngine &selection;
    traits::VtableMethodProvider &methods;
};

class EvalContext
{
  public:
    EvalContext(mem::Memory &memory, EvalServices services, traits::ParamEnv paramEnv = {});

    EvalContext(const EvalContext &) = delete;
    EvalContext &operator=(const EvalContext &) = delete;

    [[nodiscard]] mem::Memory &memory() noexcept
    {
        return memory_;
    }

    [[nodiscard]] const traits::ParamEnv &paramEnv() const noexcept
    {
        return paramEnv_;
    }

    //===------------------------------------------------------------------===//
    // Value reads
    //===------------------------------------------------------------------===//

    /// @brief Load the pointer-sized scalar at @p ptr as a ByVal value.
    /// @details The scalar keeps its tag: a stored pointer stays a pointer,
    ///          integer bytes stay bytes and uninitialised bytes are Undef.
    EvalResult<mem::Value> readPtr(mem::MemoryPointer ptr) const;

    /// @brief Split a trait-object operand into its data and vtable pointers.
    /// @details A ByRef operand is loaded from memory first; it must be
    ///          aligned to its recorded alignment.
    EvalResult<std::pair<mem::MemoryPointer, mem::MemoryPointer>> traitObjectParts(const mem::Value &object) const;

    //===------------------------------------------------------------------===//
    // Vtables
    //===------------------------------------------------------------------===//

    /// @brief Build the vtable of @p ty for @p traitRef.
    /// @details Each call allocates a fresh vtable.  Slots of methods that
    ///          cannot be called through a trait object stay undefined.
    /// @return Pointer to offset 0 of the new vtable.  Internal error for an
    ///         unsized @p ty; layout and instance resolution errors propagate.
    EvalResult<mem::MemoryPointer> getVtable(core::Ty ty, const core::TraitRef &traitRef);

    /// @brief Destructor stored in @p vtable, or nullopt when none is needed.
    EvalResult<std::optional<core::Instance>> readDropTypeFromVtable(mem::MemoryPointer vtable) const;

    /// @brief (size, align) stored in @p vtable.
    EvalResult<std::pair<uint64_t, uint64_t>> readSizeAndAlignFromVtable(mem::MemoryPointer vtable) const;

    /// @brief Implementation in method slot @p index, or nullopt for a vacant slot.
    EvalResult<std::optional<core::Instance>> readMethodFromVtable(mem::MemoryPointer vtable, size_t index) const;

    //===------------------------------------------------------------------===//
    // Associated constants
    //===------------------------------------------------------------------===//

    /// @brief Resolve the constant referenced as @p def under @p substs.
    /// @return Nullopt when the reference cannot be resolved (yet).
    EvalResult<std::optional<ConstRef>> lookupConst(core::DefId def, const core::Substs &substs);

    /// @brief Instance whose body computes the constant @p def under @p substs.
    /// @return UnimplementedTraitSelection when no impl override or trait
    ///         default exists.
    EvalResult<core::Instance> resolveAssociatedConst(core::DefId def, const core::Substs &substs);

  private:
    EvalResult<mem::MemoryPointer> vtableSlot(mem::MemoryPointer vtable, uint64_t slot) const;
    EvalResult<void> writeVtableSlot(mem::MemoryPointer vtable, uint64_t slot, mem::PrimVal value);

    mem::Memory &memory_;
    EvalServices services_;
    traits::ParamEnv paramEnv_;
};

} // namespace kiln::eval
