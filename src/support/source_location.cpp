//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Out-of-line validity query for `SourceLoc`.
/// @details Tokens scanned from an unregistered buffer still carry line and
///          column information, so validity is keyed on the line number
///          rather than on the file identifier.

#include "support/source_location.hpp"

namespace xpresso::support
{
/// @brief Report whether the location points at a real line of source.
/// @return True when @ref line is non-zero.
bool SourceLoc::isValid() const
{
    return line != 0;
}
} // namespace xpresso::support
