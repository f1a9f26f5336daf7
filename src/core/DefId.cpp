//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "core/DefId.hpp"

namespace kiln::core
{
std::string toString(DefId id)
{
    return "DefId(" + std::to_string(id.krate) + ":" + std::to_string(id.index) + ")";
}
} // namespace kiln::core
