//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Expected container pairing a value with a diagnostic on failure.
// Key invariants: Exactly one of value or diagnostic is present.
// Ownership/Lifetime: Expected owns whichever payload it holds.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace prov::support
{
using Diag = Diagnostic;

/// @brief Expected-style container pairing a value with a diagnostic on error.
/// @tparam T Stored value type when the operation succeeds; must not be Diag.
template <class T> class Expected
{
    static_assert(!std::is_same_v<T, Diag>, "Expected<Diag> is ambiguous");

  public:
    /// @brief Construct a successful result containing @p value.
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding diagnostic @p diag.
    Expected(Diag diag) : error_(std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value() &
    {
        return *value_;
    }

    const T &value() const &
    {
        return *value_;
    }

    /// @brief Move the stored value out; requires hasValue().
    T &&value() &&
    {
        return std::move(*value_);
    }

    /// @brief Access the diagnostic describing the failure; requires !hasValue().
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic with location and message.
/// @param origin Optional location associated with the diagnostic.
/// @param msg Human-readable diagnostic message.
/// @param help Optional suggested fix.
/// @return Diagnostic marked as an error severity.
Diag makeError(std::optional<Origin> origin, std::string msg, std::optional<std::string> help = std::nullopt);

/// @brief Print a single diagnostic to the provided stream.
/// @details Layout: `origin: severity: message`, followed by the help text and
///          the pre-rendered source excerpt when present.
void printDiag(const Diag &diag, std::ostream &os);
} // namespace prov::support
