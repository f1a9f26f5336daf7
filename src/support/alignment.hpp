//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/alignment.hpp
// Purpose: Alignment helpers shared by synthetic memory and layout checks.
//
// Allocations in the synthetic arena carry a target alignment, and pointers
// derived from them must honour it on typed accesses.  All helpers require a
// power-of-two alignment.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <type_traits>

namespace kiln::support
{

/// @brief True when @p n is a non-zero power of two.
template <typename T> [[nodiscard]] constexpr bool isPowerOfTwo(T n) noexcept
{
    static_assert(std::is_unsigned_v<T>, "isPowerOfTwo requires an unsigned type");
    return n != 0 && (n & (n - 1)) == 0;
}

/// @brief Round @p n up to the next multiple of @p alignment.
template <typename T> [[nodiscard]] constexpr T alignUp(T n, T alignment) noexcept
{
    static_assert(std::is_integral_v<T>, "alignUp requires an integral type");
    return (n + alignment - 1) & ~(alignment - 1);
}

/// @brief Check if @p n is a multiple of @p alignment.
template <typename T> [[nodiscard]] constexpr bool isAligned(T n, T alignment) noexcept
{
    static_assert(std::is_integral_v<T>, "isAligned requires an integral type");
    return (n & (alignment - 1)) == 0;
}

} // namespace kiln::support
