//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Diagnostic record and the per-session log that collects the
//          warnings and errors raised while evaluating constants.
// Key invariants: Diagnostics are kept in report order.
// Ownership/Lifetime: The engine owns its diagnostics; one engine per session.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace kiln::support
{

enum class Severity : uint8_t
{
    Warning, ///< Evaluation continued with an adjusted setting.
    Error    ///< The constant could not be evaluated.
};

/// @brief One reported problem; an invalid @ref loc prints without a prefix.
struct Diagnostic
{
    Severity severity = Severity::Error;
    std::string message;
    SourceLoc loc{};
};

class DiagnosticEngine
{
  public:
    void report(Diagnostic diag);

    /// @brief Number of recorded diagnostics with @p severity.
    [[nodiscard]] size_t count(Severity severity) const;

    [[nodiscard]] const std::vector<Diagnostic> &diagnostics() const noexcept
    {
        return diags_;
    }

    /// @brief Print every diagnostic through printDiag, in report order.
    void printAll(std::ostream &os) const;

  private:
    std::vector<Diagnostic> diags_;
};

} // namespace kiln::support
