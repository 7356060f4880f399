//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides the Expected container used to propagate recoverable failures.
// Key invariants: An Expected holds either a value or a diagnostic, never both.
// Ownership/Lifetime: Owns its payload by value.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace strata::support
{

/// @brief Result of an analysis step: a value, or the diagnostic explaining
///        why none could be produced.
/// @details Only failures a caller may react to travel this way, such as an
///          empty region; broken invariants throw InternalCompilerError.
template <class T> class Expected
{
  public:
    /// @brief Wrap a successful @p value.
    /// @details Disabled for Diagnostic arguments, which select the error
    ///          constructor instead.
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diagnostic>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    Expected(Diagnostic diag) : error_(std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @pre hasValue()
    T &value()
    {
        return *value_;
    }

    /// @pre hasValue()
    const T &value() const
    {
        return *value_;
    }

    /// @brief Move the payload out, for results that cannot be copied.
    /// @pre hasValue()
    T takeValue()
    {
        return std::move(*value_);
    }

    /// @pre !hasValue()
    const Diagnostic &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diagnostic> error_;
};

/// @brief Outcome of a step that produces nothing besides success.
template <> class Expected<void>
{
  public:
    Expected() = default;
    Expected(Diagnostic diag);

    [[nodiscard]] bool hasValue() const;
    explicit operator bool() const;

    /// @pre !hasValue()
    const Diagnostic &error() const &;

  private:
    std::optional<Diagnostic> error_;
};

/// @brief Error-severity diagnostic at @p loc, which may be unknown.
/// @param code Failure class callers may switch on.
Diagnostic makeError(SourceLoc loc, std::string msg, ErrorCode code = ErrorCode::None);

/// @brief Write @p diag as one line, prefixed by whichever parts of its
///        location are known.
void printDiag(const Diagnostic &diag, std::ostream &os);

} // namespace strata::support
