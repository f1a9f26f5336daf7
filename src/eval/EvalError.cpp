//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Error construction and diagnostic conversion for the evaluator.
//
//===----------------------------------------------------------------------===//

#include "eval/EvalError.hpp"

#include "support/debug_log.hpp"

#include <utility>

namespace kiln::eval
{

EvalError makeEvalError(EvalErrorKind kind, std::string message)
{
    return EvalError{kind, std::move(message)};
}

/// @brief Build an internal error and log it immediately.
/// @details Internal errors point at a compiler bug, so they are logged at the
///          point of creation where the surrounding context is still visible.
EvalError internalError(std::string message)
{
    support::debugLog("EVAL", "internal error: %s", message.c_str());
    return EvalError{EvalErrorKind::Internal, std::move(message)};
}

support::Diagnostic toDiagnostic(const EvalError &error, support::SourceLoc loc)
{
    std::string text;
    if (error.kind == EvalErrorKind::Internal)
        text = "internal error: ";
    text += error.message.empty() ? std::string(toString(error.kind)) : error.message;
    if (error.kind != EvalErrorKind::Internal && !error.message.empty())
    {
        text += " [";
        text += toString(error.kind);
        text += ']';
    }
    return support::makeError(loc, std::move(text));
}

} // namespace kiln::eval
