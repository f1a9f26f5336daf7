//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/symbol.hpp
// Purpose: Handle for an item name interned in a StringInterner.
// Key invariants: Id 0 is the empty name and is never handed out by intern().
//                 Two symbols from the same interner are equal exactly when
//                 their texts are equal.
// Ownership/Lifetime: Value type; only meaningful with the interner that
//                     produced it.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace kiln::support
{

struct Symbol
{
    uint32_t id = 0;
};

inline bool operator==(Symbol a, Symbol b) noexcept
{
    return a.id == b.id;
}

inline bool operator!=(Symbol a, Symbol b) noexcept
{
    return a.id != b.id;
}

} // namespace kiln::support

namespace std
{
template <> struct hash<kiln::support::Symbol>
{
    size_t operator()(kiln::support::Symbol s) const noexcept
    {
        return s.id;
    }
};
} // namespace std
