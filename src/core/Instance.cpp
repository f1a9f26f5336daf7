//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Equality, hashing and printing for Instance.  Hashing is what lets the
// synthetic memory hand out one function allocation per instance.
//
//===----------------------------------------------------------------------===//

#include "core/Instance.hpp"

namespace kiln::core
{

bool operator==(const Instance &a, const Instance &b)
{
    return a.kind == b.kind && a.def == b.def && a.substs == b.substs && a.dropTy == b.dropTy;
}

bool operator!=(const Instance &a, const Instance &b)
{
    return !(a == b);
}

std::string toString(const Instance &instance, const TypeTable &types)
{
    std::string out = instance.kind == InstanceKind::DropGlue ? "drop_glue " : "item ";
    out += toString(instance.def);
    out += types.toString(instance.substs);
    return out;
}

} // namespace kiln::core

namespace std
{
size_t hash<kiln::core::Instance>::operator()(const kiln::core::Instance &instance) const noexcept
{
    size_t h = std::hash<kiln::core::DefId>{}(instance.def);
    h = h * 31 + static_cast<size_t>(instance.kind);
    for (kiln::core::Ty ty : instance.substs)
        h = h * 31 + ty.id;
    return h * 31 + instance.dropTy.id;
}
} // namespace std
