//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/eval/Session.cpp
// Purpose: Implement the EvalSession facade declared in
//          include/kiln/eval/Session.hpp.
// Key invariants: The private implementation is heap allocated so the
//                 context's references into it survive moves of the facade.
// Ownership/Lifetime: Impl owns Memory, the default method provider and the
//                     EvalContext, destroyed in reverse declaration order.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#include "kiln/eval/Session.hpp"

#include "eval/EvalContext.hpp"
#include "mem/Memory.hpp"
#include "support/debug_log.hpp"

#include <optional>
#include <string>
#include <utility>

namespace kiln::eval
{

namespace
{
/// @brief Replace an unsupported target with the default one.
/// @return Warning text when the target was replaced.
std::optional<std::string> sanitizeTarget(EvalConfig &config)
{
    if (config.target.isSupported())
        return std::nullopt;
    std::string warning = "unsupported pointer width " + std::to_string(config.target.pointerSize) +
                          "; evaluating for 8-byte pointers";
    config.target = mem::TargetDataLayout{};
    return warning;
}
} // namespace

class EvalSession::Impl
{
  public:
    Impl(SessionServices services, EvalConfig config)
        : config_(std::move(config)), targetWarning_(sanitizeTarget(config_)),
          memory_(config_.target, config_.memoryLimit), defaultMethods_(services.items, services.types),
          context_(memory_,
                   EvalServices{services.items,
                                services.types,
                                services.layouts,
                                services.instances,
                                services.selection,
                                services.methods ? *services.methods : defaultMethods_})
    {
        if (config_.debugLog)
            debugScope_.emplace(true);
        if (targetWarning_)
            diags_.report(support::Diagnostic{support::Severity::Warning, *targetWarning_, {}});
        support::debugLog("EVAL",
                          "session: %llu-byte pointers, memory limit %llu",
                          static_cast<unsigned long long>(config_.target.pointerSize),
                          static_cast<unsigned long long>(config_.memoryLimit));
    }

    const EvalConfig &config() const
    {
        return config_;
    }

    EvalContext &context()
    {
        return context_;
    }

    mem::Memory &memory()
    {
        return memory_;
    }

    support::DiagnosticEngine &diagnostics()
    {
        return diags_;
    }

  private:
    std::optional<support::ScopedDebugLogging> debugScope_;
    EvalConfig config_;
    std::optional<std::string> targetWarning_;
    mem::Memory memory_;
    traits::ItemVtableMethods defaultMethods_;
    EvalContext context_;
    support::DiagnosticEngine diags_;
};

EvalSession::EvalSession(SessionServices services, EvalConfig config)
    : impl_(std::make_unique<Impl>(services, std::move(config)))
{
}

EvalSession::~EvalSession() = default;

EvalSession::EvalSession(EvalSession &&) noexcept = default;

EvalSession &EvalSession::operator=(EvalSession &&) noexcept = default;

const EvalConfig &EvalSession::config() const
{
    return impl_->config();
}

EvalContext &EvalSession::context()
{
    return impl_->context();
}

mem::Memory &EvalSession::memory()
{
    return impl_->memory();
}

support::DiagnosticEngine &EvalSession::diagnostics()
{
    return impl_->diagnostics();
}

const support::DiagnosticEngine &EvalSession::diagnostics() const
{
    return impl_->diagnostics();
}

void EvalSession::report(const EvalError &error, support::SourceLoc loc)
{
    impl_->diagnostics().report(toDiagnostic(error, loc));
}

std::optional<core::Instance> EvalSession::resolveAssociatedConst(core::DefId def,
                                                                  const core::Substs &substs,
                                                                  support::SourceLoc loc)
{
    auto instance = impl_->context().resolveAssociatedConst(def, substs);
    if (!instance)
    {
        report(instance.error(), loc);
        return std::nullopt;
    }
    return instance.value();
}

std::optional<mem::MemoryPointer> EvalSession::getVtable(core::Ty ty,
                                                         const core::TraitRef &traitRef,
                                                         support::SourceLoc loc)
{
    auto vtable = impl_->context().getVtable(ty, traitRef);
    if (!vtable)
    {
        report(vtable.error(), loc);
        return std::nullopt;
    }
    return vtable.value();
}

} // namespace kiln::eval
