//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.cpp
// Purpose: Implements validity checks for source locations.
// Key invariants: A location is valid only when it names a file.
// Ownership/Lifetime: Value type helpers only.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace strata::support
{

/// @brief Report whether this location refers to a real file.
/// @return True when @ref file_id is non-zero.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

} // namespace strata::support
