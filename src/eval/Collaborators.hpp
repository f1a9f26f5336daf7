//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: eval/Collaborators.hpp
// Purpose: Compiler services the evaluator consumes but does not implement:
//          type layout and instance resolution.
// Key invariants: Implementations report failures through EvalResult and
//                 never throw across the evaluator.
// Ownership/Lifetime: Borrowed by EvalContext; the compiler driver owns them.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/DefId.hpp"
#include "core/Instance.hpp"
#include "core/Type.hpp"
#include "eval/EvalError.hpp"

#include <cstdint>
#include <optional>

namespace kiln::eval
{

/// @brief Size and alignment of a sized type in bytes.
struct TyLayout
{
    uint64_t size = 0;
    uint64_t align = 1;
};

class LayoutEngine
{
  public:
    virtual ~LayoutEngine() = default;

    /// @brief Layout of @p ty.
    /// @return EvalErrorKind::Unsized for dynamically sized types,
    ///         EvalErrorKind::Layout for any other failure.
    virtual EvalResult<TyLayout> layoutOf(core::Ty ty) = 0;
};

class InstanceResolver
{
  public:
    virtual ~InstanceResolver() = default;

    /// @brief Monomorphic instance for calling @p def with @p substs.
    /// @return EvalErrorKind::TooGeneric when @p substs still mention parameters.
    virtual EvalResult<core::Instance> resolveInstance(core::DefId def, const core::Substs &substs) = 0;

    /// @brief Destructor glue for @p ty, or nullopt when dropping it is a no-op.
    virtual EvalResult<std::optional<core::Instance>> resolveDropGlue(core::Ty ty) = 0;
};

} // namespace kiln::eval
