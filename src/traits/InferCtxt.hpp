//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: traits/InferCtxt.hpp
// Purpose: Scratch state for one trait selection: type inference variables
//          and the obligations registered while proving a predicate.
// Key invariants: A context is created per selection call and is never shared
//                 between calls; nothing it holds escapes except types the
//                 caller resolves through it before it is destroyed.
// Ownership/Lifetime: Stack object owned by the caller of the selection
//                     engine.  Borrows the session's TypeTable for interning.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Type.hpp"
#include "traits/Obligation.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace kiln::traits
{

class InferCtxt
{
  public:
    explicit InferCtxt(core::TypeTable &types);

    InferCtxt(const InferCtxt &) = delete;
    InferCtxt &operator=(const InferCtxt &) = delete;

    [[nodiscard]] core::TypeTable &types() noexcept
    {
        return types_;
    }

    /// @brief Create an unbound type variable.
    core::Ty newTyVar();

    /// @brief Number of variables created in this context.
    [[nodiscard]] size_t varCount() const noexcept
    {
        return vars_.size();
    }

    /// @brief Bind variable @p var to @p ty.
    /// @return False when @p var is unknown or already bound to another type.
    bool bind(uint32_t var, core::Ty ty);

    /// @brief Replace every bound variable in @p ty by its binding.
    core::Ty resolve(core::Ty ty);

    core::Substs resolveAll(const core::Substs &substs);

    /// @brief Queue a nested obligation discovered during selection.
    void registerObligation(Obligation obligation);

    [[nodiscard]] const std::vector<Obligation> &pendingObligations() const noexcept
    {
        return pending_;
    }

  private:
    core::TypeTable &types_;
    std::vector<std::optional<core::Ty>> vars_;
    std::vector<Obligation> pending_;
};

} // namespace kiln::traits
