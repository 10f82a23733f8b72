//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file ErrorClassifier.hpp
/// @brief Turns raw YAML failures into user-facing messages with a better position.
///
/// @details Grammar errors from the parser point at where parsing gave up,
/// which is rarely where the author made the mistake.  The classifier looks at
/// the source line of the failure and recognizes a few common mistakes, in
/// this order (first match wins):
///   1. a tab character;
///   2. an unquoted `{{ ... }}` template value;
///   3. an unquoted value containing `: `;
///   4. a value that opens with a quote but does not close with it, or that
///      reuses the opening quote inside.
/// Errors raised by the loader's own tag handlers are already precise and are
/// never rewritten; errors without a position keep their text.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/origin.hpp"
#include "support/source_context.hpp"
#include "yaml/Errors.hpp"

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace prov::yaml
{

/// @brief Normalized description of a failure.
struct Classification
{
    std::string message;
    support::Origin origin;
    std::optional<std::string> help;
};

/// @brief Mistake recognized on the failing source line.
struct LineFinding
{
    uint32_t column; ///< 1-based column of the mistake
    std::string message;
    std::optional<std::string> help;
};

/// @brief Classifies failures of one input text.
class ErrorClassifier
{
  public:
    /// @param source Complete input text.
    /// @param baseOrigin Origin of the first line of @p source.
    ErrorClassifier(std::string source, support::Origin baseOrigin);

    /// @brief Message, position and help for @p error.
    [[nodiscard]] Classification classify(const std::exception &error) const;

    /// @brief Build the user-facing exception for @p error.
    /// @param cause The exception being translated, kept as the cause.
    [[nodiscard]] ParsingFailedError translate(const std::exception &error, std::exception_ptr cause) const;

    /// @brief Run the line heuristics on @p line.
    [[nodiscard]] static std::optional<LineFinding> inspectLine(std::string_view line);

    /// @brief Collapse whitespace runs, capitalize, and terminate with a period.
    [[nodiscard]] static std::string normalizeMessage(std::string_view text);

  private:
    std::string source_;
    support::Origin baseOrigin_;
};

} // namespace prov::yaml
