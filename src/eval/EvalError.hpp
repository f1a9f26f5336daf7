//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: eval/EvalError.hpp
// Purpose: Error taxonomy and result type of the constant evaluator.
// Key invariants: Every fallible evaluator operation returns EvalResult; an
//                 error aborts evaluation of the current constant only.
// Ownership/Lifetime: Value types.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace kiln::eval
{

/// @brief Categorises evaluation failures.
enum class EvalErrorKind : int32_t
{
    Internal = 0,                    ///< Invariant violation inside the compiler.
    PointerOutOfBounds = 1,          ///< Access past the end of an allocation.
    DanglingPointerDeref = 2,        ///< Access through an unknown allocation id.
    ReadBytesAsPointer = 3,          ///< Integer bytes found where a pointer was expected.
    ReadPointerAsBytes = 4,          ///< Pointer found where integer bytes were expected.
    ReadUndefBytes = 5,              ///< Read of bytes that were never written.
    ModifiedConstantMemory = 6,      ///< Write to an immutable allocation.
    InvalidFunctionPointer = 7,      ///< Pointer does not designate a function allocation.
    AlignmentCheckFailed = 8,        ///< Access or allocation with an invalid alignment.
    MemoryExhausted = 9,             ///< Synthetic memory limit reached.
    Overflow = 10,                   ///< Pointer offset arithmetic overflowed.
    Unsized = 11,                    ///< Layout requested for an unsized type.
    Layout = 12,                     ///< Layout engine failure.
    TooGeneric = 13,                 ///< Instance resolution needs more substitutions.
    UnimplementedTraitSelection = 14 ///< No implementation and no default value.
};

/// @brief One evaluation failure.
struct EvalError
{
    EvalErrorKind kind = EvalErrorKind::Internal;
    std::string message;
};

template <class T> using EvalResult = support::Expected<T, EvalError>;

/// @brief Canonical name of @p kind, e.g. "ReadBytesAsPointer".
constexpr std::string_view toString(EvalErrorKind kind) noexcept
{
    switch (kind)
    {
        case EvalErrorKind::Internal:
            return "Internal";
        case EvalErrorKind::PointerOutOfBounds:
            return "PointerOutOfBounds";
        case EvalErrorKind::DanglingPointerDeref:
            return "DanglingPointerDeref";
        case EvalErrorKind::ReadBytesAsPointer:
            return "ReadBytesAsPointer";
        case EvalErrorKind::ReadPointerAsBytes:
            return "ReadPointerAsBytes";
        case EvalErrorKind::ReadUndefBytes:
            return "ReadUndefBytes";
        case EvalErrorKind::ModifiedConstantMemory:
            return "ModifiedConstantMemory";
        case EvalErrorKind::InvalidFunctionPointer:
            return "InvalidFunctionPointer";
        case EvalErrorKind::AlignmentCheckFailed:
            return "AlignmentCheckFailed";
        case EvalErrorKind::MemoryExhausted:
            return "MemoryExhausted";
        case EvalErrorKind::Overflow:
            return "Overflow";
        case EvalErrorKind::Unsized:
            return "Unsized";
        case EvalErrorKind::Layout:
            return "Layout";
        case EvalErrorKind::TooGeneric:
            return "TooGeneric";
        case EvalErrorKind::UnimplementedTraitSelection:
            return "UnimplementedTraitSelection";
    }
    return "Internal";
}

/// @brief Build an error of @p kind with @p message.
EvalError makeEvalError(EvalErrorKind kind, std::string message);

/// @brief Build an internal invariant violation.
EvalError internalError(std::string message);

/// @brief Convert @p error to a diagnostic attributed to @p loc.
/// @details Internal errors are prefixed "internal error:" so users can tell a
///          compiler bug from a problem in their program.
support::Diagnostic toDiagnostic(const EvalError &error, support::SourceLoc loc);

} // namespace kiln::eval
