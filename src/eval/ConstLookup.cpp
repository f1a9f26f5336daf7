//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: eval/ConstLookup.cpp
// Purpose: Associated-constant resolution.
// Key invariants: See ConstLookup.hpp.  An impl override is returned with the
//                 identity substitutions of the impl constant rather than the
//                 impl arguments chosen by selection; callers that evaluate
//                 generic impls must substitute themselves.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#include "eval/ConstLookup.hpp"

#include "support/debug_log.hpp"
#include "traits/TraitBridge.hpp"

#include <string>

namespace kiln::eval
{

EvalResult<std::optional<ConstRef>> lookupConstById(const ConstLookupEnv &env,
                                                    const traits::ParamEnv &paramEnv,
                                                    core::DefId def,
                                                    const core::Substs &substs)
{
    if (def.isLocal())
    {
        if (env.items.isLocalTraitItem(def))
        {
            if (auto traitId = env.items.traitOfItem(def))
                return resolveTraitAssociatedConst(env, paramEnv, def, *traitId, substs);
        }
    }
    else if (env.items.describeDef(def) == core::DefKind::AssociatedConst)
    {
        if (auto traitId = env.items.traitOfItem(def))
            return resolveTraitAssociatedConst(env, paramEnv, def, *traitId, substs);
    }
    return std::optional<ConstRef>(ConstRef{def, substs});
}

EvalResult<std::optional<ConstRef>> resolveTraitAssociatedConst(const ConstLookupEnv &env,
                                                                const traits::ParamEnv &paramEnv,
                                                                core::DefId def,
                                                                core::DefId traitId,
                                                                const core::Substs &substs)
{
    const core::TraitRef traitRef{traitId, substs};
    const auto outcome = traits::selectImplementation(env.selection, env.types, traitRef, paramEnv);
    if (!outcome.isSelected())
        return std::optional<ConstRef>();

    switch (outcome.source.kind)
    {
        case traits::ImplSourceKind::Impl:
        {
            const support::Symbol name = env.items.nameSymbol(def);
            for (const core::AssociatedItem *item : env.items.associatedItems(outcome.source.implDef))
            {
                if (item->kind == core::AssocKind::Const && item->name == name)
                {
                    support::debugLog("EVAL",
                                      "const %s resolved to impl item %s",
                                      core::toString(def).c_str(),
                                      core::toString(item->def).c_str());
                    return std::optional<ConstRef>(
                        ConstRef{item->def, env.types.identity(env.items.genericsCount(item->def))});
                }
            }
            const core::AssociatedItem *declared = env.items.associatedItem(def);
            if (declared && declared->hasValue)
                return std::optional<ConstRef>(ConstRef{def, substs});
            return std::optional<ConstRef>();
        }
        case traits::ImplSourceKind::Param:
            return std::optional<ConstRef>();
        default:
            return internalError("resolving associated constant " + core::toString(def) +
                                 ": unexpected " + std::string(traits::toString(outcome.source.kind)) +
                                 " impl source");
    }
}

} // namespace kiln::eval
