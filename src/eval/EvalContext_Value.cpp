//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Typed reads shared by the vtable accessors and trait-object dispatch.  Raw
// memory hands back tagged primitives; these helpers wrap them in the Value
// shapes the evaluator passes around.
//
//===----------------------------------------------------------------------===//

#include "eval/EvalContext.hpp"

#include "support/alignment.hpp"

#include <string>

namespace kiln::eval
{

EvalResult<mem::Value> EvalContext::readPtr(mem::MemoryPointer ptr) const
{
    auto scalar = memory_.readPtrSizedUnsigned(ptr);
    if (!scalar)
        return scalar.error();
    return mem::Value::byVal(scalar.value());
}

EvalResult<std::pair<mem::MemoryPointer, mem::MemoryPointer>> EvalContext::traitObjectParts(
    const mem::Value &object) const
{
    if (object.kind != mem::Value::Kind::ByRef)
        return object.toTraitObject();

    if (!support::isPowerOfTwo(object.align) || !support::isAligned(object.ref.offset, object.align))
    {
        return makeEvalError(EvalErrorKind::AlignmentCheckFailed,
                             "trait object at " + mem::toString(object.ref) + " is not aligned to " +
                                 std::to_string(object.align));
    }
    auto data = readPtr(object.ref);
    if (!data)
        return data.error();
    auto vtableAt = object.ref.offsetBy(memory_.pointerSize(), memory_.layout());
    if (!vtableAt)
        return vtableAt.error();
    auto vtable = readPtr(vtableAt.value());
    if (!vtable)
        return vtable.error();
    return mem::Value::byValPair(data->first, vtable->first).toTraitObject();
}

} // namespace kiln::eval
