//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: mem/PrimVal.hpp
// Purpose: Scalar values moved between synthetic memory and the evaluator.
// Key invariants: The tag is authoritative.  Integer bytes are never treated
//                 as a pointer and a pointer never yields integer bytes; the
//                 accessors fail instead of converting.
// Ownership/Lifetime: Value type.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "eval/EvalError.hpp"
#include "mem/Pointer.hpp"

#include <cstdint>
#include <string>

namespace kiln::mem
{

/// @brief A primitive: integer bit-pattern, synthetic pointer, or undefined.
class PrimVal
{
  public:
    enum class Kind : uint8_t
    {
        Bytes, ///< Integer bit-pattern of up to 64 bits.
        Ptr,   ///< Pointer into synthetic memory.
        Undef  ///< Bytes that were never initialised.
    };

    /// @brief Default-constructed values are undefined.
    PrimVal() = default;

    static PrimVal fromBytes(uint64_t bits)
    {
        PrimVal v;
        v.kind_ = Kind::Bytes;
        v.bits_ = bits;
        return v;
    }

    static PrimVal fromPtr(MemoryPointer ptr)
    {
        PrimVal v;
        v.kind_ = Kind::Ptr;
        v.ptr_ = ptr;
        return v;
    }

    static PrimVal fromBool(bool b)
    {
        return fromBytes(b ? 1 : 0);
    }

    static PrimVal undef()
    {
        return PrimVal{};
    }

    [[nodiscard]] Kind kind() const noexcept
    {
        return kind_;
    }

    [[nodiscard]] bool isBytes() const noexcept
    {
        return kind_ == Kind::Bytes;
    }

    [[nodiscard]] bool isPtr() const noexcept
    {
        return kind_ == Kind::Ptr;
    }

    [[nodiscard]] bool isUndef() const noexcept
    {
        return kind_ == Kind::Undef;
    }

    /// @brief True for the all-zero integer pattern (the null pointer encoding).
    [[nodiscard]] bool isNull() const noexcept
    {
        return kind_ == Kind::Bytes && bits_ == 0;
    }

    /// @brief Integer bits; ReadPointerAsBytes for pointers, ReadUndefBytes for undef.
    [[nodiscard]] eval::EvalResult<uint64_t> toBytes() const;

    /// @brief Pointer payload; ReadBytesAsPointer for integers, ReadUndefBytes for undef.
    [[nodiscard]] eval::EvalResult<MemoryPointer> toPtr() const;

    friend bool operator==(const PrimVal &a, const PrimVal &b) noexcept;

  private:
    Kind kind_ = Kind::Undef;
    uint64_t bits_ = 0;
    MemoryPointer ptr_{};
};

bool operator==(const PrimVal &a, const PrimVal &b) noexcept;
bool operator!=(const PrimVal &a, const PrimVal &b) noexcept;

std::string toString(const PrimVal &value);

} // namespace kiln::mem
