//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Inference variables are numbered densely from zero within each context.
// Two contexts therefore hand out the same Infer(n) types; that is harmless
// because a context's types are resolved before it is dropped.
//
//===----------------------------------------------------------------------===//

#include "traits/InferCtxt.hpp"

#include <utility>

namespace kiln::traits
{

InferCtxt::InferCtxt(core::TypeTable &types) : types_(types) {}

core::Ty InferCtxt::newTyVar()
{
    const auto var = static_cast<uint32_t>(vars_.size());
    vars_.emplace_back();
    return types_.inferTy(var);
}

bool InferCtxt::bind(uint32_t var, core::Ty ty)
{
    if (var >= vars_.size())
        return false;
    auto &slot = vars_[var];
    if (slot)
        return *slot == ty;
    slot = ty;
    return true;
}

core::Ty InferCtxt::resolve(core::Ty ty)
{
    if (!ty.isValid() || !types_.hasInfer(ty))
        return ty;

    // Copy: interning below may grow the table and invalidate references.
    const core::TyData data = types_.get(ty);
    switch (data.kind)
    {
        case core::TyKind::Infer:
            if (data.index < vars_.size() && vars_[data.index])
                return resolve(*vars_[data.index]);
            return ty;
        case core::TyKind::Tuple:
            return types_.tupleTy(resolveAll(data.args));
        case core::TyKind::Adt:
            return types_.adtTy(data.def, resolveAll(data.args));
        case core::TyKind::RawPtr:
            return types_.rawPtrTy(resolve(data.args.front()));
        case core::TyKind::Slice:
            return types_.sliceTy(resolve(data.args.front()));
        case core::TyKind::FnDef:
            return types_.fnDefTy(data.def, resolveAll(data.args));
        default:
            return ty;
    }
}

core::Substs InferCtxt::resolveAll(const core::Substs &substs)
{
    core::Substs out;
    out.reserve(substs.size());
    for (core::Ty ty : substs)
        out.push_back(resolve(ty));
    return out;
}

void InferCtxt::registerObligation(Obligation obligation)
{
    pending_.push_back(std::move(obligation));
}

} // namespace kiln::traits
