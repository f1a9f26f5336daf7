//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/kiln/eval/Session.hpp
// Purpose: Public entry point for compile-time evaluation.  Owns the
//          synthetic memory arena and evaluation context and turns failures
//          into diagnostics attributed to the constant being evaluated.
// Invariants: Every failure reported through the convenience entry points is
//             recorded exactly once in diagnostics().
// Ownership: EvalSession owns its memory, context and default vtable method
//            provider.  The compiler tables and services passed in are
//            borrowed and must outlive the session.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/DefId.hpp"
#include "core/Instance.hpp"
#include "core/Items.hpp"
#include "core/TraitRef.hpp"
#include "core/Type.hpp"
#include "eval/Collaborators.hpp"
#include "eval/EvalConfig.hpp"
#include "eval/EvalError.hpp"
#include "mem/Pointer.hpp"
#include "support/diagnostics.hpp"
#include "support/source_location.hpp"
#include "traits/Selection.hpp"
#include "traits/VtableMethods.hpp"

#include <memory>
#include <optional>

namespace kiln::mem
{
class Memory;
} // namespace kiln::mem

namespace kiln::eval
{

class EvalContext;

/// @brief Services a session borrows from the compiler.
struct SessionServices
{
    const core::ItemTable &items;
    core::TypeTable &types;
    LayoutEngine &layouts;
    InstanceResolver &instances;
    traits::SelectionEngine &selection;
    /// Vtable method source; null selects the item-table driven default.
    traits::VtableMethodProvider *methods = nullptr;
};

class EvalSession
{
  public:
    /// @brief Create a session over @p services configured by @p config.
    /// @details An unsupported pointer width in @p config falls back to the
    ///          default target and records a warning.  EvalConfig::debugLog
    ///          turns logging on until the session is destroyed.
    explicit EvalSession(SessionServices services, EvalConfig config = {});
    ~EvalSession();

    EvalSession(const EvalSession &) = delete;
    EvalSession &operator=(const EvalSession &) = delete;
    EvalSession(EvalSession &&) noexcept;
    EvalSession &operator=(EvalSession &&) noexcept;

    [[nodiscard]] const EvalConfig &config() const;

    /// @brief Evaluation context for driving evaluation directly.
    [[nodiscard]] EvalContext &context();

    [[nodiscard]] mem::Memory &memory();

    [[nodiscard]] support::DiagnosticEngine &diagnostics();
    [[nodiscard]] const support::DiagnosticEngine &diagnostics() const;

    /// @brief Record @p error as an error diagnostic at @p loc.
    void report(const EvalError &error, support::SourceLoc loc);

    /// @brief Resolve an associated constant, reporting failure at @p loc.
    std::optional<core::Instance> resolveAssociatedConst(core::DefId def,
                                                         const core::Substs &substs,
                                                         support::SourceLoc loc);

    /// @brief Build a vtable, reporting failure at @p loc.
    std::optional<mem::MemoryPointer> getVtable(core::Ty ty,
                                                const core::TraitRef &traitRef,
                                                support::SourceLoc loc);

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace kiln::eval
