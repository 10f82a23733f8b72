//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Builds the what() text of the loader exceptions.  A MarkedYamlError reads
// like a small report: context, context position, problem, problem position,
// note, one per line, skipping whatever is absent.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief MarkedYamlError and ParsingFailedError implementations.

#include "yaml/Errors.hpp"

#include <utility>

namespace prov::yaml
{
namespace
{
std::string describeMark(const Mark &mark)
{
    return "  in line " + std::to_string(mark.line + 1) + ", column " + std::to_string(mark.column + 1);
}

std::string describe(const std::string &context,
                     const std::optional<Mark> &contextMark,
                     const std::string &problem,
                     const std::optional<Mark> &problemMark,
                     const std::string &note)
{
    std::string out;
    auto append = [&out](const std::string &line)
    {
        if (!out.empty())
            out += '\n';
        out += line;
    };
    if (!context.empty())
        append(context);
    // The context position is only interesting when it differs from the problem's.
    if (contextMark && (problem.empty() || !problemMark || contextMark->line != problemMark->line ||
                        contextMark->column != problemMark->column))
        append(describeMark(*contextMark));
    if (!problem.empty())
        append(problem);
    if (problemMark)
        append(describeMark(*problemMark));
    if (!note.empty())
        append(note);
    return out;
}
} // namespace

MarkedYamlError::MarkedYamlError(std::string context,
                                 std::optional<Mark> contextMark,
                                 std::string problem,
                                 std::optional<Mark> problemMark,
                                 std::string note)
    : std::runtime_error(describe(context, contextMark, problem, problemMark, note)),
      context_(std::move(context)), contextMark_(contextMark), problem_(std::move(problem)),
      problemMark_(problemMark), note_(std::move(note))
{
}

ParsingFailedError::ParsingFailedError(std::string message,
                                       support::Origin origin,
                                       std::string sourceContext,
                                       std::optional<std::string> help,
                                       std::exception_ptr cause)
    : std::runtime_error("YAML parsing failed: " + message), message_(std::move(message)),
      origin_(std::move(origin)), sourceContext_(std::move(sourceContext)), help_(std::move(help)),
      cause_(std::move(cause))
{
}

support::Diagnostic ParsingFailedError::toDiagnostic() const
{
    return support::Diagnostic{support::Severity::Error, message_, origin_, help_, std::nullopt, sourceContext_};
}

} // namespace prov::yaml
