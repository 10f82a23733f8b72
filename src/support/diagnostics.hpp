//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic sink collecting warnings and deprecation notices.
// Key invariants: Counts reflect reported diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/origin.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

/// @brief Records diagnostics and prints them later.
/// @invariant Counts reflect reported diagnostics.
/// @ownership Owns stored diagnostic messages.
namespace prov::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Deprecation,
    Error
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;                 ///< Message severity
    std::string message;               ///< Human-readable text
    std::optional<Origin> origin;      ///< Where the problem was found
    std::optional<std::string> help;   ///< Suggested fix
    std::optional<std::string> version; ///< Removal version (deprecations only)
    std::string sourceContext;         ///< Pre-rendered excerpt; may be empty
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    /// @param d Diagnostic to store.
    void report(Diagnostic d);

    /// @brief Record a warning at @p origin.
    void warning(std::string message,
                 std::optional<Origin> origin,
                 std::optional<std::string> help = std::nullopt);

    /// @brief Record a deprecation notice for a feature removed in @p version.
    void deprecated(std::string message,
                    std::string version,
                    std::optional<Origin> origin,
                    std::optional<std::string> help = std::nullopt);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param os Output stream.
    void printAll(std::ostream &os) const;

    /// @brief Every diagnostic in report order.
    [[nodiscard]] const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

    /// @brief Number of deprecation notices reported.
    size_t deprecationCount() const;

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
    size_t deprecations_ = 0;
};
} // namespace prov::support
