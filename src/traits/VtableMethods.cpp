//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Supertrait references are stored in terms of the subtrait's own generic
// parameters, so each one is substituted through the reference being walked
// before its methods are listed.  A trait reachable along several supertrait
// paths contributes its methods once, at its first position in the walk.
//
//===----------------------------------------------------------------------===//

#include "traits/VtableMethods.hpp"

#include <unordered_set>
#include <utility>

namespace kiln::traits
{

namespace
{
/// @brief A method is callable through a trait object unless it is generic
///        itself or requires a sized receiver.
bool isVtableSafe(const core::AssociatedItem &method)
{
    return method.method.ownGenerics == 0 && !method.method.requiresSelfSized;
}
} // namespace

ItemVtableMethods::ItemVtableMethods(const core::ItemTable &items, core::TypeTable &types)
    : items_(items), types_(types)
{
}

std::vector<std::optional<MethodRef>> ItemVtableMethods::vtableMethods(const core::TraitRef &traitRef)
{
    std::vector<std::optional<MethodRef>> slots;
    std::unordered_set<core::DefId> visited;
    std::vector<core::TraitRef> stack{traitRef};

    while (!stack.empty())
    {
        core::TraitRef current = std::move(stack.back());
        stack.pop_back();
        if (!visited.insert(current.traitId).second)
            continue;

        for (const core::AssociatedItem *item : items_.associatedItems(current.traitId))
        {
            if (item->kind != core::AssocKind::Method)
                continue;
            if (isVtableSafe(*item))
                slots.emplace_back(MethodRef{item->def, current.substs});
            else
                slots.emplace_back(std::nullopt);
        }

        // Push in reverse so the first declared supertrait is walked next.
        const auto &supers = items_.supertraits(current.traitId);
        for (auto it = supers.rbegin(); it != supers.rend(); ++it)
            stack.push_back(core::TraitRef{it->traitId, types_.substAll(it->substs, current.substs)});
    }
    return slots;
}

} // namespace kiln::traits
