//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity query for SourceLoc. Tokens produced from inline text
// carry line and column information but no file identifier; only text loaded
// through a SourceManager yields a valid location.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace movetext::support
{
/// @brief Determine whether the location carries a real file attachment.
/// @return True when the location originated from a tracked source file.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}
} // namespace movetext::support
