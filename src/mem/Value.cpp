//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Projections out of Value.  A trait object travels through the machine as a
// ByValPair whose second half points at the vtable built by the evaluator.
//
//===----------------------------------------------------------------------===//

#include "mem/Value.hpp"

#include <utility>

namespace kiln::mem
{

eval::EvalResult<PrimVal> Value::toScalar() const
{
    if (kind != Kind::ByVal)
        return eval::internalError("expected a scalar value, found " + toString(*this));
    return first;
}

eval::EvalResult<std::pair<MemoryPointer, MemoryPointer>> Value::toTraitObject() const
{
    if (kind != Kind::ByValPair)
        return eval::internalError("expected a trait object, found " + toString(*this));
    auto data = first.toPtr();
    if (!data)
        return data.error();
    auto vtable = second.toPtr();
    if (!vtable)
        return vtable.error();
    return std::make_pair(data.value(), vtable.value());
}

std::string toString(const Value &value)
{
    switch (value.kind)
    {
        case Value::Kind::ByVal:
            return "by_val(" + toString(value.first) + ")";
        case Value::Kind::ByValPair:
            return "by_val_pair(" + toString(value.first) + ", " + toString(value.second) + ")";
        case Value::Kind::ByRef:
            return "by_ref(" + toString(value.ref) + ", align " + std::to_string(value.align) + ")";
    }
    return "by_val(undef)";
}

} // namespace kiln::mem
