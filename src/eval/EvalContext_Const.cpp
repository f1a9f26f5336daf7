//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Associated-constant entry points of the evaluation context.
//
//===----------------------------------------------------------------------===//

#include "eval/EvalContext.hpp"

#include "support/debug_log.hpp"

#include <string>

namespace kiln::eval
{

EvalResult<std::optional<ConstRef>> EvalContext::lookupConst(core::DefId def, const core::Substs &substs)
{
    const ConstLookupEnv env{services_.items, services_.types, services_.selection};
    return lookupConstById(env, paramEnv_, def, substs);
}

EvalResult<core::Instance> EvalContext::resolveAssociatedConst(core::DefId def, const core::Substs &substs)
{
    auto resolved = lookupConst(def, substs);
    if (!resolved)
        return resolved.error();
    if (!resolved.value())
    {
        support::debugLog("EVAL", "const %s has no implementation", core::toString(def).c_str());
        return makeEvalError(EvalErrorKind::UnimplementedTraitSelection,
                             "no implementation or default value for associated constant `" +
                                 std::string(services_.items.name(def)) + "` with " +
                                 services_.types.toString(substs));
    }
    return core::Instance::item(resolved.value()->def, resolved.value()->substs);
}

} // namespace kiln::eval
