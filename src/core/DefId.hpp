//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/DefId.hpp
// Purpose: Identifier for a definition (item) in the program being compiled
//          or in one of its already-compiled dependencies.
// Key invariants: Crate 0 is the crate currently being compiled; index 0 is
//                 reserved and never names an item.
// Ownership/Lifetime: Value type.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace kiln::core
{

/// @brief Crate number of the crate being compiled.
inline constexpr uint32_t kLocalCrate = 0;

/// @brief (crate, index) pair naming a single definition.
struct DefId
{
    uint32_t krate = kLocalCrate; ///< Owning crate; kLocalCrate for local items.
    uint32_t index = 0;           ///< Item index within the crate; 0 is invalid.

    [[nodiscard]] bool isValid() const noexcept
    {
        return index != 0;
    }

    /// @brief True when the item is defined in the crate being compiled.
    [[nodiscard]] bool isLocal() const noexcept
    {
        return krate == kLocalCrate;
    }
};

inline bool operator==(DefId a, DefId b) noexcept
{
    return a.krate == b.krate && a.index == b.index;
}

inline bool operator!=(DefId a, DefId b) noexcept
{
    return !(a == b);
}

inline bool operator<(DefId a, DefId b) noexcept
{
    return a.krate != b.krate ? a.krate < b.krate : a.index < b.index;
}

/// @brief Render as "DefId(<crate>:<index>)".
std::string toString(DefId id);

} // namespace kiln::core

namespace std
{
template <> struct hash<kiln::core::DefId>
{
    size_t operator()(kiln::core::DefId id) const noexcept
    {
        return static_cast<size_t>((static_cast<uint64_t>(id.krate) << 32) | id.index);
    }
};
} // namespace std
