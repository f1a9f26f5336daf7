//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Checked projections out of PrimVal.
//
//===----------------------------------------------------------------------===//

#include "mem/PrimVal.hpp"

namespace kiln::mem
{

eval::EvalResult<uint64_t> PrimVal::toBytes() const
{
    switch (kind_)
    {
        case Kind::Bytes:
            return bits_;
        case Kind::Ptr:
            return eval::makeEvalError(eval::EvalErrorKind::ReadPointerAsBytes,
                                       "expected integer bytes, found pointer " + toString(ptr_));
        case Kind::Undef:
            break;
    }
    return eval::makeEvalError(eval::EvalErrorKind::ReadUndefBytes,
                               "expected integer bytes, found uninitialized memory");
}

eval::EvalResult<MemoryPointer> PrimVal::toPtr() const
{
    switch (kind_)
    {
        case Kind::Ptr:
            return ptr_;
        case Kind::Bytes:
            return eval::makeEvalError(eval::EvalErrorKind::ReadBytesAsPointer,
                                       "expected pointer, found non-pointer bytes");
        case Kind::Undef:
            break;
    }
    return eval::makeEvalError(eval::EvalErrorKind::ReadUndefBytes,
                               "expected pointer, found uninitialized memory");
}

bool operator==(const PrimVal &a, const PrimVal &b) noexcept
{
    if (a.kind() != b.kind())
        return false;
    switch (a.kind())
    {
        case PrimVal::Kind::Bytes:
            return a.bits_ == b.bits_;
        case PrimVal::Kind::Ptr:
            return a.ptr_ == b.ptr_;
        case PrimVal::Kind::Undef:
            return true;
    }
    return false;
}

bool operator!=(const PrimVal &a, const PrimVal &b) noexcept
{
    return !(a == b);
}

std::string toString(const PrimVal &value)
{
    switch (value.kind())
    {
        case PrimVal::Kind::Bytes:
            return "bytes(" + std::to_string(value.toBytes().value()) + ")";
        case PrimVal::Kind::Ptr:
            return "ptr(" + toString(value.toPtr().value()) + ")";
        case PrimVal::Kind::Undef:
            return "undef";
    }
    return "undef";
}

} // namespace kiln::mem
