//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic helpers shared by Expected-returning APIs and the
// DiagnosticEngine.  Keeping the printer in one place means a parse failure
// returned from tryLoad() renders exactly like a warning collected during a
// successful load.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Severity names, error construction and diagnostic printing.

#include "support/diag_expected.hpp"

namespace prov::support
{
namespace detail
{
/// @brief Translate a diagnostic severity enumerator into a printable label.
/// @param severity Severity reported by a diagnostic.
/// @return Static lowercase string naming the severity.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Deprecation:
            return "deprecation";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

/// @brief Build an error-severity diagnostic.
/// @param origin Location to attach, if known.
/// @param msg Message text moved into the diagnostic.
/// @param help Suggested fix, if any.
Diag makeError(std::optional<Origin> origin, std::string msg, std::optional<std::string> help)
{
    return Diag{Severity::Error, std::move(msg), std::move(origin), std::move(help), std::nullopt, {}};
}

/// @brief Emit a diagnostic in the canonical text format.
///
/// @details The first line is `origin: severity: message`; the origin prefix
///          is dropped when unknown.  Deprecations name their removal version
///          on the same line.  Help text and the source excerpt follow on
///          separate, indented lines.
void printDiag(const Diag &diag, std::ostream &os)
{
    if (diag.origin)
        os << diag.origin->toString() << ": ";
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message;
    if (diag.version)
        os << " This feature will be removed in version " << *diag.version << '.';
    os << '\n';
    if (diag.help)
        os << "  help: " << *diag.help << '\n';
    if (!diag.sourceContext.empty())
        os << '\n' << diag.sourceContext << '\n';
}
} // namespace prov::support
