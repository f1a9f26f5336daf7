//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic helpers that accompany Expected: severity naming,
// error construction and single-diagnostic printing.  Keeping the wording in
// one place means every evaluator failure that reaches the user is rendered
// the same way.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

#include <utility>

namespace kiln::support
{
namespace detail
{
/// @brief Map a diagnostic severity to the lowercase word used when printing.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

/// @brief Build an error-severity diagnostic at @p loc.
Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

/// @brief Render @p diag followed by a newline.
///
/// @details Location components are emitted only when known, so a diagnostic
///          with a file but no line prints "#3: error: ...".
void printDiag(const Diag &diag, std::ostream &os)
{
    if (diag.loc.isValid())
    {
        os << '#' << diag.loc.file_id;
        if (diag.loc.hasLine())
        {
            os << ':' << diag.loc.line;
            if (diag.loc.hasColumn())
                os << ':' << diag.loc.column;
        }
        os << ": ";
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace kiln::support
