//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity query for SourceLoc.  Evaluation errors are attributed
// to the location of the constant being evaluated; synthetic constants created
// by the compiler itself carry the default, invalid location.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace kiln::support
{
/// @brief Determine whether the location came from a tracked source file.
/// @return True when a non-zero file identifier is attached.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}
} // namespace kiln::support
