//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: mem/Pointer.hpp
// Purpose: Synthetic pointers: an allocation id plus a byte offset.
// Key invariants: A pointer is never a raw host address.  Offsets only grow by
//                 non-negative deltas and must stay representable in the
//                 target pointer width.
// Ownership/Lifetime: Value types; allocations outlive every pointer into
//                     them for the whole compilation session.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "eval/EvalError.hpp"
#include "mem/TargetDataLayout.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace kiln::mem
{

/// @brief Opaque allocation identifier; 0 is never handed out.
struct AllocId
{
    uint64_t id = 0;
};

inline bool operator==(AllocId a, AllocId b) noexcept
{
    return a.id == b.id;
}

inline bool operator!=(AllocId a, AllocId b) noexcept
{
    return a.id != b.id;
}

inline bool operator<(AllocId a, AllocId b) noexcept
{
    return a.id < b.id;
}

/// @brief Pointer into synthetic memory.
struct MemoryPointer
{
    AllocId alloc{};
    uint64_t offset = 0;

    /// @brief Advance by @p delta bytes.
    /// @return The derived pointer, or an Overflow error when the new offset
    ///         does not fit the target pointer width.
    [[nodiscard]] eval::EvalResult<MemoryPointer> offsetBy(uint64_t delta,
                                                           const TargetDataLayout &layout) const;
};

inline bool operator==(const MemoryPointer &a, const MemoryPointer &b) noexcept
{
    return a.alloc == b.alloc && a.offset == b.offset;
}

inline bool operator!=(const MemoryPointer &a, const MemoryPointer &b) noexcept
{
    return !(a == b);
}

/// @brief Render as "alloc<id>+<offset>".
std::string toString(const MemoryPointer &ptr);

} // namespace kiln::mem

namespace std
{
template <> struct hash<kiln::mem::AllocId>
{
    size_t operator()(kiln::mem::AllocId id) const noexcept
    {
        return std::hash<uint64_t>{}(id.id);
    }
};
} // namespace std
