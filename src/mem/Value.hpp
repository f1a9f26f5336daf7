//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: mem/Value.hpp
// Purpose: Evaluated values as the machine passes them around: one scalar, a
//          scalar pair (fat pointers), or a reference to memory holding an
//          aggregate.
// Key invariants: Only the fields selected by kind are meaningful.
// Ownership/Lifetime: Value type; ByRef values borrow synthetic memory.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mem/Pointer.hpp"
#include "mem/PrimVal.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace kiln::mem
{

/// @brief A value produced or consumed by machine-level operations.
struct Value
{
    enum class Kind : uint8_t
    {
        ByVal,     ///< Single primitive in `first`.
        ByValPair, ///< Two primitives, e.g. data pointer plus vtable pointer.
        ByRef      ///< Aggregate stored at `ref` with alignment `align`.
    };

    Kind kind = Kind::ByVal;
    PrimVal first{};
    PrimVal second{};
    MemoryPointer ref{};
    uint64_t align = 1;

    static Value byVal(PrimVal v)
    {
        Value out;
        out.kind = Kind::ByVal;
        out.first = v;
        return out;
    }

    static Value byValPair(PrimVal a, PrimVal b)
    {
        Value out;
        out.kind = Kind::ByValPair;
        out.first = a;
        out.second = b;
        return out;
    }

    static Value byRef(MemoryPointer ptr, uint64_t align)
    {
        Value out;
        out.kind = Kind::ByRef;
        out.ref = ptr;
        out.align = align;
        return out;
    }

    /// @brief The single primitive of a ByVal value.
    /// @return Internal error for pairs and references.
    [[nodiscard]] eval::EvalResult<PrimVal> toScalar() const;

    /// @brief Split a trait-object fat pointer into (data, vtable).
    /// @return Internal error unless this is a ByValPair of two pointers.
    [[nodiscard]] eval::EvalResult<std::pair<MemoryPointer, MemoryPointer>> toTraitObject() const;
};

std::string toString(const Value &value);

} // namespace kiln::mem
