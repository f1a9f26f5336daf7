//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"

#include "support/diag_expected.hpp"

#include <algorithm>
#include <utility>

namespace kiln::support
{

void DiagnosticEngine::report(Diagnostic diag)
{
    diags_.push_back(std::move(diag));
}

size_t DiagnosticEngine::count(Severity severity) const
{
    return static_cast<size_t>(std::count_if(
        diags_.begin(), diags_.end(), [severity](const Diagnostic &d) { return d.severity == severity; }));
}

void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const Diagnostic &diag : diags_)
        printDiag(diag, os);
}

} // namespace kiln::support
