/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The engine is the warning channel of the loader: duplicate mapping keys
 *     under the `warn` policy and deprecated tags end up here.  Diagnostics are
 *     stored until callers explicitly print or inspect them.
 */

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"

#include <utility>

namespace prov::support
{
/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * The diagnostic is appended to the internal vector for later inspection.
 * Notes are stored without touching any counter.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    switch (d.severity)
    {
        case Severity::Error:
            ++errors_;
            break;
        case Severity::Warning:
            ++warnings_;
            break;
        case Severity::Deprecation:
            ++deprecations_;
            break;
        case Severity::Note:
            break;
    }
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::warning(std::string message,
                               std::optional<Origin> origin,
                               std::optional<std::string> help)
{
    report(Diagnostic{Severity::Warning, std::move(message), std::move(origin), std::move(help), std::nullopt, {}});
}

void DiagnosticEngine::deprecated(std::string message,
                                  std::string version,
                                  std::optional<Origin> origin,
                                  std::optional<std::string> help)
{
    report(Diagnostic{
        Severity::Deprecation, std::move(message), std::move(origin), std::move(help), std::move(version), {}});
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so that errors surfaced through
 * `Expected` and warnings collected here look the same.
 *
 * @param os Output stream that receives the formatted diagnostics.
 */
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

size_t DiagnosticEngine::deprecationCount() const
{
    return deprecations_;
}
} // namespace prov::support
