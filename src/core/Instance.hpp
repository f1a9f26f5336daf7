//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/Instance.hpp
// Purpose: A fully monomorphic callable the evaluator can point at.
// Key invariants: Instances compare structurally; synthetic memory maps each
//                 distinct instance to exactly one function allocation.
// Ownership/Lifetime: Value type.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/DefId.hpp"
#include "core/Type.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace kiln::core
{

/// @brief What kind of body an instance executes.
enum class InstanceKind : uint8_t
{
    Item,     ///< The body of `def` under `substs`.
    DropGlue, ///< Destructor glue of `dropTy`, rooted at drop-in-place item `def`.
};

/// @brief A definition paired with the substitutions it is instantiated with.
struct Instance
{
    InstanceKind kind = InstanceKind::Item;
    DefId def{};
    Substs substs;
    Ty dropTy{}; ///< Only meaningful for InstanceKind::DropGlue.

    static Instance item(DefId def, Substs substs)
    {
        return Instance{InstanceKind::Item, def, std::move(substs), {}};
    }

    static Instance dropGlue(DefId dropInPlace, Ty ty)
    {
        return Instance{InstanceKind::DropGlue, dropInPlace, {ty}, ty};
    }
};

bool operator==(const Instance &a, const Instance &b);
bool operator!=(const Instance &a, const Instance &b);

/// @brief Render as "item DefId(0:3)[i32]" or "drop_glue DefId(0:1)[T]".
std::string toString(const Instance &instance, const TypeTable &types);

} // namespace kiln::core

namespace std
{
template <> struct hash<kiln::core::Instance>
{
    size_t operator()(const kiln::core::Instance &instance) const noexcept;
};
} // namespace std
