//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Checked pointer arithmetic.  Offsets are computed in 64 bits and then
// compared against the target's maximum pointer value, so a 32-bit target
// reports overflow at 2^32 even though the host could represent more.
//
//===----------------------------------------------------------------------===//

#include "mem/Pointer.hpp"

namespace kiln::mem
{

eval::EvalResult<MemoryPointer> MemoryPointer::offsetBy(uint64_t delta,
                                                        const TargetDataLayout &layout) const
{
    const uint64_t max = layout.maxPointerValue();
    if (offset > max || delta > max - offset)
    {
        return eval::makeEvalError(eval::EvalErrorKind::Overflow,
                                   "pointer offset " + std::to_string(offset) + " + " +
                                       std::to_string(delta) + " overflows the target pointer width");
    }
    return MemoryPointer{alloc, offset + delta};
}

std::string toString(const MemoryPointer &ptr)
{
    return "alloc" + std::to_string(ptr.alloc.id) + "+" + std::to_string(ptr.offset);
}

} // namespace kiln::mem
