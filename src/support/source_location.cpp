//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the out-of-line validity query for the SourceLoc value type.  A
// location is valid when it refers to a registered file identifier; line,
// column and offset are optional extras filled in by the lexer.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace pl0::support
{

/// @brief Determine whether the location carries a real source attachment.
///
/// @details SourceManager hands out identifiers starting at one; the default
///          constructed location uses zero to mark "unknown".  Diagnostics use
///          this to decide whether a path prefix can be printed.
///
/// @return True when the location originated from a tracked source buffer.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

} // namespace pl0::support
