//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line helpers for the SourceLoc value type. A location is valid once it
// refers to a document registered with a SourceManager; line and column stay
// optional because programmatically built schemas have no text to point into.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace avrokit::support
{
bool SourceLoc::isValid() const
{
    return file_id != 0;
}
} // namespace avrokit::support
