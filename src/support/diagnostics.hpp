//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares diagnostics and the engine that collects them.
// Key invariants: Counters reflect every reported diagnostic.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace strata::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Machine-readable classification of a recoverable failure.
/// @details Callers that need to react to a specific failure (rather than
///          just print it) switch on this code.
enum class ErrorCode
{
    None,
    EmptyRegion,
    InvalidIR,
    AnalysisFailed,
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;               ///< Message severity
    std::string message;             ///< Human-readable text
    SourceLoc loc;                   ///< Optional source location
    ErrorCode code = ErrorCode::None; ///< Failure class for programmatic checks
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    void printAll(std::ostream &os) const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

    /// @brief Access the recorded diagnostics in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};

} // namespace strata::support
