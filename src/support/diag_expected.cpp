//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.cpp
// Purpose: Implements Expected<void> and diagnostic formatting helpers.
// Key invariants: Expected<void> is successful exactly when no diagnostic is stored.
// Ownership/Lifetime: Diagnostics are moved into their container.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.
/// @details Analyses lean on `Expected<void>` to propagate recoverable
///          failures such as an empty region handed to the dominator tree.

#include "support/diag_expected.hpp"

namespace strata::support
{
namespace
{

const char *severityName(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}

} // namespace

Expected<void>::Expected(Diagnostic diag) : error_(std::move(diag)) {}

bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

const Diagnostic &Expected<void>::error() const &
{
    return *error_;
}

Diagnostic makeError(SourceLoc loc, std::string msg, ErrorCode code)
{
    return Diagnostic{Severity::Error, std::move(msg), loc, code};
}

/// @details Renders "file#<id>:<line>:<column>: <severity>: <message>",
///          dropping the location parts that are unknown.
void printDiag(const Diagnostic &diag, std::ostream &os)
{
    if (diag.loc.isValid())
    {
        os << "file#" << diag.loc.file_id;
        if (diag.loc.hasLine())
        {
            os << ':' << diag.loc.line;
            if (diag.loc.hasColumn())
                os << ':' << diag.loc.column;
        }
        os << ": ";
    }
    os << severityName(diag.severity) << ": " << diag.message << '\n';
}

} // namespace strata::support
