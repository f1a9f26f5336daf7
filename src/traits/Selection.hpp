//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the narrow interface between the constant evaluator and
// the trait solver.  The evaluator never inspects the solver's internals; it
// hands over one obligation inside a fresh inference context and receives
// either the source that proves it, an ambiguity marker, or an error.
//
// ImplSource mirrors the ways a trait predicate can be satisfied.  Only the
// Impl and Param forms carry information the evaluator uses; the others exist
// so that a solver can report them faithfully and callers can reject them.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/DefId.hpp"
#include "core/Type.hpp"
#include "traits/InferCtxt.hpp"
#include "traits/Obligation.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace kiln::traits
{

/// @brief How a trait obligation was proven.
enum class ImplSourceKind : uint8_t
{
    Impl,      ///< A user-written impl block.
    Param,     ///< A where-clause of the caller's environment.
    Builtin,   ///< A compiler-provided impl (Sized, Copy, ...).
    Object,    ///< The trait object type implements its own trait.
    Closure,   ///< A closure implements an Fn trait.
    FnPointer, ///< A function pointer implements an Fn trait.
};

std::string_view toString(ImplSourceKind kind) noexcept;

struct ImplSource
{
    ImplSourceKind kind = ImplSourceKind::Builtin;
    core::DefId implDef{}; ///< Impl block, for ImplSourceKind::Impl.
    core::Substs substs;   ///< Impl parameters, for ImplSourceKind::Impl.

    static ImplSource impl(core::DefId def, core::Substs substs)
    {
        return ImplSource{ImplSourceKind::Impl, def, std::move(substs)};
    }

    static ImplSource param()
    {
        return ImplSource{ImplSourceKind::Param, {}, {}};
    }

    static ImplSource other(ImplSourceKind kind)
    {
        return ImplSource{kind, {}, {}};
    }
};

/// @brief Raw answer of the selection engine.
struct SelectionResult
{
    enum class Status : uint8_t
    {
        Selected,  ///< `source` proves the obligation.
        Ambiguous, ///< More than one candidate, or inference is incomplete.
        Error,     ///< No candidate applies.
    };

    Status status = Status::Error;
    ImplSource source;
    std::string message; ///< Explanation for Status::Error.

    static SelectionResult selected(ImplSource source)
    {
        return SelectionResult{Status::Selected, std::move(source), {}};
    }

    static SelectionResult ambiguous()
    {
        return SelectionResult{Status::Ambiguous, {}, {}};
    }

    static SelectionResult error(std::string message)
    {
        return SelectionResult{Status::Error, {}, std::move(message)};
    }
};

/// @brief Trait solver consumed by the evaluator.
class SelectionEngine
{
  public:
    virtual ~SelectionEngine() = default;

    /// @brief Find the source proving @p obligation.
    /// @param infcx Fresh context; inference variables and nested obligations
    ///        created here are discarded when the caller drops it.
    virtual SelectionResult select(InferCtxt &infcx, const Obligation &obligation) = 0;
};

} // namespace kiln::traits
