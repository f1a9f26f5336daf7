//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: mem/TargetDataLayout.hpp
// Purpose: Target properties the synthetic memory must reproduce.
// Key invariants: pointerSize is 2, 4 or 8 bytes.
// Ownership/Lifetime: Value type copied into each Memory instance.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace kiln::mem
{

/// @brief Byte order used when encoding integers into synthetic memory.
enum class Endian : uint8_t
{
    Little,
    Big
};

/// @brief Pointer width and byte order of the compilation target.
struct TargetDataLayout
{
    uint64_t pointerSize = 8;    ///< Bytes per pointer (P).
    Endian endian = Endian::Little;

    /// @brief Pointers are aligned to their own size on every supported target.
    [[nodiscard]] uint64_t pointerAlign() const noexcept
    {
        return pointerSize;
    }

    [[nodiscard]] uint64_t pointerSizeBits() const noexcept
    {
        return pointerSize * 8;
    }

    /// @brief Largest offset representable in a target pointer.
    [[nodiscard]] uint64_t maxPointerValue() const noexcept
    {
        return pointerSize >= 8 ? UINT64_MAX : (uint64_t{1} << pointerSizeBits()) - 1;
    }

    [[nodiscard]] bool isSupported() const noexcept
    {
        return pointerSize == 2 || pointerSize == 4 || pointerSize == 8;
    }
};

} // namespace kiln::mem
