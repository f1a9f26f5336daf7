//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: traits/TraitBridge.cpp
// Purpose: Wraps a trait reference into an obligation, runs the selection
//          engine inside a fresh inference context and folds the result into
//          the three outcomes the evaluator distinguishes.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#include "traits/TraitBridge.hpp"

#include "traits/InferCtxt.hpp"
#include "support/debug_log.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace kiln::traits
{

std::string_view toString(ImplSourceKind kind) noexcept
{
    switch (kind)
    {
        case ImplSourceKind::Impl:
            return "impl";
        case ImplSourceKind::Param:
            return "param";
        case ImplSourceKind::Builtin:
            return "builtin";
        case ImplSourceKind::Object:
            return "object";
        case ImplSourceKind::Closure:
            return "closure";
        case ImplSourceKind::FnPointer:
            return "fn-pointer";
    }
    return "unknown";
}

SelectOutcome selectImplementation(SelectionEngine &engine,
                                   core::TypeTable &types,
                                   const core::TraitRef &traitRef,
                                   const ParamEnv &paramEnv)
{
    const std::string what = core::toString(traitRef.traitId) + types.toString(traitRef.substs);

    InferCtxt infcx(types);
    Obligation obligation{ObligationCause::dummy(), paramEnv, traitRef, 0};
    SelectionResult result = engine.select(infcx, obligation);

    switch (result.status)
    {
        case SelectionResult::Status::Ambiguous:
            support::debugLog("TRAITS", "select %s: ambiguous", what.c_str());
            return SelectOutcome{SelectOutcome::Kind::Ambiguous, {}};
        case SelectionResult::Status::Error:
            support::debugLog("TRAITS", "select %s: not found (%s)", what.c_str(), result.message.c_str());
            return SelectOutcome{SelectOutcome::Kind::NotFound, {}};
        case SelectionResult::Status::Selected:
            break;
    }

    ImplSource source = std::move(result.source);
    source.substs = infcx.resolveAll(source.substs);
    const bool unresolved =
        std::any_of(source.substs.begin(), source.substs.end(), [&](core::Ty ty) { return types.hasInfer(ty); });
    if (unresolved)
    {
        support::debugLog("TRAITS", "select %s: impl arguments not inferred", what.c_str());
        return SelectOutcome{SelectOutcome::Kind::Ambiguous, {}};
    }

    support::debugLog("TRAITS",
                      "select %s: %s %s",
                      what.c_str(),
                      std::string(toString(source.kind)).c_str(),
                      source.kind == ImplSourceKind::Impl ? core::toString(source.implDef).c_str() : "");
    return SelectOutcome{SelectOutcome::Kind::Selected, std::move(source)};
}

} // namespace kiln::traits
