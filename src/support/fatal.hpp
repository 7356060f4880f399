//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/fatal.hpp
// Purpose: Provides helpers for internal-compiler-error paths.
// Key invariants: Every helper in this header never returns; each throws
//                 InternalCompilerError with a message naming the failure.
// Ownership/Lifetime: Header-only utility with no state; exceptions propagate
//                     to the enclosing pass, which aborts.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <stdexcept>
#include <string>

namespace strata::support
{

/// @brief Exception raised when the compiler reaches a state it cannot handle.
/// @details Signals a compiler bug or a not-yet-supported IR shape, never a
///          user-facing diagnostic.
class InternalCompilerError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// @brief Abort on a code path that is deliberately not implemented.
/// @param feature The name of the unsupported feature encountered.
[[noreturn]] inline void unimplemented(const std::string &feature)
{
    throw InternalCompilerError("not implemented: " + feature);
}

/// @brief Abort on a code path that is planned but not written yet.
/// @param feature The name of the missing feature encountered.
[[noreturn]] inline void todo(const std::string &feature)
{
    throw InternalCompilerError("not yet supported: " + feature);
}

/// @brief Abort on a violated structural invariant.
/// @param what Description of the broken invariant.
[[noreturn]] inline void internalError(const std::string &what)
{
    throw InternalCompilerError("internal compiler error: " + what);
}

} // namespace strata::support
