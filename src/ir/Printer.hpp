//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Printer.hpp
// Purpose: Renders an operation tree as indented text for traces and test
//          failure messages.
// Key invariants: Values print as %<id>, blocks as ^bb<id>; ids are arena
//                 indices, so output is stable for a fixed construction order.
// Ownership/Lifetime: Stateless; borrows the Context.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Context.hpp"

#include <ostream>
#include <string>

namespace strata::ir
{

/// @brief Writes textual IR.
class Printer
{
  public:
    /// @brief Print @p op and everything nested inside it to @p os.
    static void write(const Context &ctx, OpId op, std::ostream &os);

    /// @brief Print @p op to a string.
    static std::string toString(const Context &ctx, OpId op);
};

} // namespace strata::ir
