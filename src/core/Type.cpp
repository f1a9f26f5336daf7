//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the type interner.  Types are hash-consed on their structural
// key so that substitution results compare equal to independently built types,
// which lets selection fakes and the evaluator compare Ty handles directly.
//
//===----------------------------------------------------------------------===//

#include "core/Type.hpp"

#include <sstream>
#include <utility>

namespace kiln::core
{

TypeTable::TypeTable()
{
    types_.emplace_back();
}

Ty TypeTable::intern(TyData data)
{
    std::vector<uint32_t> argIds;
    argIds.reserve(data.args.size());
    for (Ty arg : data.args)
        argIds.push_back(arg.id);
    Key key{static_cast<uint8_t>(data.kind),
            data.bits,
            data.index,
            data.def.krate,
            data.def.index,
            std::move(argIds)};
    auto it = index_.find(key);
    if (it != index_.end())
        return it->second;
    Ty ty{static_cast<uint32_t>(types_.size())};
    types_.push_back(std::move(data));
    index_.emplace(std::move(key), ty);
    return ty;
}

Ty TypeTable::boolTy()
{
    return intern(TyData{TyKind::Bool});
}

Ty TypeTable::intTy(uint32_t bits)
{
    return intern(TyData{TyKind::Int, bits});
}

Ty TypeTable::uintTy(uint32_t bits)
{
    return intern(TyData{TyKind::Uint, bits});
}

Ty TypeTable::charTy()
{
    return intern(TyData{TyKind::Char});
}

Ty TypeTable::strTy()
{
    return intern(TyData{TyKind::Str});
}

Ty TypeTable::unitTy()
{
    return intern(TyData{TyKind::Tuple});
}

Ty TypeTable::tupleTy(Substs elems)
{
    return intern(TyData{TyKind::Tuple, 0, 0, {}, std::move(elems)});
}

Ty TypeTable::adtTy(DefId def, Substs args)
{
    return intern(TyData{TyKind::Adt, 0, 0, def, std::move(args)});
}

Ty TypeTable::rawPtrTy(Ty pointee)
{
    return intern(TyData{TyKind::RawPtr, 0, 0, {}, {pointee}});
}

Ty TypeTable::sliceTy(Ty elem)
{
    return intern(TyData{TyKind::Slice, 0, 0, {}, {elem}});
}

Ty TypeTable::dynamicTy(DefId traitId)
{
    return intern(TyData{TyKind::Dynamic, 0, 0, traitId, {}});
}

Ty TypeTable::fnDefTy(DefId def, Substs args)
{
    return intern(TyData{TyKind::FnDef, 0, 0, def, std::move(args)});
}

Ty TypeTable::paramTy(uint32_t index)
{
    return intern(TyData{TyKind::Param, 0, index});
}

Ty TypeTable::inferTy(uint32_t var)
{
    return intern(TyData{TyKind::Infer, 0, var});
}

Ty TypeTable::neverTy()
{
    return intern(TyData{TyKind::Never});
}

const TyData &TypeTable::get(Ty ty) const
{
    if (ty.id >= types_.size())
        return types_.front();
    return types_[ty.id];
}

bool TypeTable::hasParams(Ty ty) const
{
    const TyData &data = get(ty);
    if (data.kind == TyKind::Param)
        return true;
    for (Ty arg : data.args)
    {
        if (hasParams(arg))
            return true;
    }
    return false;
}

bool TypeTable::hasInfer(Ty ty) const
{
    const TyData &data = get(ty);
    if (data.kind == TyKind::Infer)
        return true;
    for (Ty arg : data.args)
    {
        if (hasInfer(arg))
            return true;
    }
    return false;
}

bool TypeTable::needsSubst(const Substs &substs) const
{
    for (Ty ty : substs)
    {
        if (hasParams(ty) || hasInfer(ty))
            return true;
    }
    return false;
}

/// @brief Substitute generic parameters inside @p ty.
///
/// @details Leaves without parameters are returned unchanged, so substituting
///          a fully concrete type never allocates.  Composite types are
///          rebuilt through the interner, which keeps handle equality intact.
Ty TypeTable::subst(Ty ty, const Substs &substs)
{
    if (!hasParams(ty))
        return ty;
    TyData data = get(ty);
    if (data.kind == TyKind::Param)
        return data.index < substs.size() ? substs[data.index] : ty;
    for (Ty &arg : data.args)
        arg = subst(arg, substs);
    return intern(std::move(data));
}

Substs TypeTable::substAll(const Substs &list, const Substs &substs)
{
    Substs out;
    out.reserve(list.size());
    for (Ty ty : list)
        out.push_back(subst(ty, substs));
    return out;
}

Substs TypeTable::identity(uint32_t count)
{
    Substs out;
    out.reserve(count);
    for (uint32_t i = 0; i < count; ++i)
        out.push_back(paramTy(i));
    return out;
}

std::string TypeTable::toString(Ty ty) const
{
    const TyData &data = get(ty);
    std::ostringstream os;
    switch (data.kind)
    {
        case TyKind::Bool:
            return "bool";
        case TyKind::Int:
            return "i" + std::to_string(data.bits);
        case TyKind::Uint:
            return "u" + std::to_string(data.bits);
        case TyKind::Char:
            return "char";
        case TyKind::Str:
            return "str";
        case TyKind::Never:
            return "!";
        case TyKind::Param:
            return "P" + std::to_string(data.index);
        case TyKind::Infer:
            return "?" + std::to_string(data.index);
        case TyKind::Tuple:
        {
            os << '(';
            for (size_t i = 0; i < data.args.size(); ++i)
            {
                if (i)
                    os << ", ";
                os << toString(data.args[i]);
            }
            os << ')';
            return os.str();
        }
        case TyKind::RawPtr:
            return "*" + toString(data.args.front());
        case TyKind::Slice:
            return "[" + toString(data.args.front()) + "]";
        case TyKind::Dynamic:
            return "dyn " + core::toString(data.def);
        case TyKind::Adt:
        case TyKind::FnDef:
            os << (data.kind == TyKind::FnDef ? "fn " : "") << core::toString(data.def);
            if (!data.args.empty())
                os << toString(data.args);
            return os.str();
    }
    return "<invalid>";
}

std::string TypeTable::toString(const Substs &substs) const
{
    std::ostringstream os;
    os << '[';
    for (size_t i = 0; i < substs.size(); ++i)
    {
        if (i)
            os << ", ";
        os << toString(substs[i]);
    }
    os << ']';
    return os.str();
}

} // namespace kiln::core
