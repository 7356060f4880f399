//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Verifier.hpp
// Purpose: Structural validation of an operation tree.
// Key invariants: Verification stops at the first violation and reports it
//                 as an InvalidIR diagnostic.
// Ownership/Lifetime: Stateless facade.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Context.hpp"
#include "support/diag_expected.hpp"

namespace strata::ir
{

/// @brief Verifies terminator placement, successor arity and operand definitions.
class Verifier
{
  public:
    /// @brief Verify @p op and all operations nested inside it.
    /// @return Success, or the diagnostic for the first violation found.
    [[nodiscard]] static support::Expected<void> verify(const Context &ctx, OpId op);
};

} // namespace strata::ir
