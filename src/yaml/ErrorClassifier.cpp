//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the failure heuristics.  Every heuristic inspects only the
// source line reported by the parser and, when it fires, replaces the column
// of the origin with the position of the suspected mistake.  The line is
// scanned by hand in one pass per heuristic, whatever its length.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Error classification and message normalization.

#include "yaml/ErrorClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace prov::yaml
{
namespace
{
constexpr const char *kTemplateHelp = "For example:\n\n"
                                      "    raw: {{ some_var }}\n\n"
                                      "Should be:\n\n"
                                      "    raw: \"{{ some_var }}\"";

constexpr const char *kColonHelp = "For example:\n\n"
                                   "    raw: echo 'name: value'\n\n"
                                   "Should be:\n\n"
                                   "    raw: \"echo 'name: value'\"";

constexpr const char *kUnclosedQuoteHelp = "For example:\n\n"
                                           "    raw: \"foo\" in bar\n\n"
                                           "Should be:\n\n"
                                           "    raw: '\"foo\" in bar'";

constexpr const char *kReusedQuoteHelp = "For example:\n\n"
                                         "    raw: \"foo\" in \"bar\"\n\n"
                                         "Should be:\n\n"
                                         "    raw: '\"foo\" in \"bar\"'";

std::optional<LineFinding> findTab(std::string_view line)
{
    std::size_t idx = line.find('\t');
    if (idx == std::string_view::npos)
        return std::nullopt;
    return LineFinding{static_cast<uint32_t>(idx + 1), "Tabs are usually invalid in YAML.", std::nullopt};
}

bool isSpace(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isKeyChar(char c, bool brackets)
{
    const auto u = static_cast<unsigned char>(c);
    if (std::isalnum(u) || c == '_' || isSpace(c))
        return true;
    return brackets && (c == '[' || c == ']' || c == '{' || c == '}');
}

std::size_t skipSpaces(std::string_view line, std::size_t i)
{
    while (i < line.size() && isSpace(line[i]))
        ++i;
    return i;
}

/// @brief Offset after leading indentation and any `- ` sequence markers.
std::size_t skipIndicators(std::string_view line)
{
    std::size_t i = skipSpaces(line, 0);
    while (i + 1 < line.size() && line[i] == '-' && isSpace(line[i + 1]))
        i = skipSpaces(line, i + 1);
    return i;
}

/// @brief Start of the value after a simple `key: ` at @p pos, if one is there.
std::optional<std::size_t> valueAfterKey(std::string_view line, std::size_t pos, bool brackets)
{
    std::size_t i = pos;
    while (i < line.size() && isKeyChar(line[i], brackets))
        ++i;
    if (i == pos || i + 1 >= line.size() || line[i] != ':' || !isSpace(line[i + 1]))
        return std::nullopt;
    return skipSpaces(line, i + 1);
}

/// @brief Offset where the value of @p line starts.
std::size_t valueStart(std::string_view line, bool brackets)
{
    const std::size_t pos = skipIndicators(line);
    return valueAfterKey(line, pos, brackets).value_or(pos);
}

std::string_view trimRight(std::string_view text)
{
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);
    return text;
}

/// @brief True for a value written entirely inside one pair of quotes.
bool isFullyQuoted(std::string_view value)
{
    value = trimRight(value.substr(skipSpaces(value, 0)));
    if (value.size() < 2 || (value.front() != '\'' && value.front() != '"') || value.back() != value.front())
        return false;
    return std::count(value.begin(), value.end(), value.front()) == 2;
}

std::optional<LineFinding> findUnquotedTemplate(std::string_view line)
{
    const std::size_t start = valueStart(line, false);
    if (line.substr(start, 2) != "{{" || line.find("}}", start + 2) == std::string_view::npos)
        return std::nullopt;
    return LineFinding{static_cast<uint32_t>(start + 1),
                       "This may be an issue with missing quotes around a template block.",
                       kTemplateHelp};
}

std::optional<LineFinding> findUnquotedColon(std::string_view line)
{
    const std::size_t first = skipSpaces(line, 0);
    if (first < line.size() && line[first] == ':')
        return std::nullopt;

    const std::size_t start = valueStart(line, true);
    const std::string_view value = line.substr(start);
    // A value that is quoted as a whole may contain anything.
    if (isFullyQuoted(value))
        return std::nullopt;

    for (std::size_t i = value.find(':'); i != std::string_view::npos; i = value.find(':', i + 1))
    {
        if (i + 1 == value.size() || value[i + 1] == ' ')
            return LineFinding{static_cast<uint32_t>(start + i + 1),
                               "Colons in unquoted values must be followed by a non-space character.",
                               kColonHelp};
    }
    return std::nullopt;
}

std::optional<LineFinding> findQuoteMismatch(std::string_view line)
{
    const std::size_t start = valueStart(line, false);
    if (start >= line.size() || (line[start] != '"' && line[start] != '\''))
        return std::nullopt;
    const std::string_view value = trimRight(line.substr(start));
    const auto column = static_cast<uint32_t>(start + 1);
    const char quote = value.front();

    if (value.size() < 2 || value.back() != quote)
        return LineFinding{column, "Values starting with a quote must end with the same quote.", kUnclosedQuoteHelp};
    if (std::count(value.begin(), value.end(), quote) > 2)
        return LineFinding{column,
                           "Values starting with a quote must end with the same quote, and not contain that quote.",
                           kReusedQuoteHelp};
    return std::nullopt;
}
} // namespace

ErrorClassifier::ErrorClassifier(std::string source, support::Origin baseOrigin)
    : source_(std::move(source)), baseOrigin_(std::move(baseOrigin))
{
}

std::optional<LineFinding> ErrorClassifier::inspectLine(std::string_view line)
{
    if (auto finding = findTab(line))
        return finding;
    if (auto finding = findUnquotedTemplate(line))
        return finding;
    if (auto finding = findUnquotedColon(line))
        return finding;
    return findQuoteMismatch(line);
}

/// @brief Canonical message form.
/// @details Whitespace runs (newlines included) become one space, the first
///          letter is capitalized and a final period is added when missing.
std::string ErrorClassifier::normalizeMessage(std::string_view text)
{
    std::istringstream words{std::string(text)};
    std::string word;
    std::string out;
    while (words >> word)
    {
        if (!out.empty())
            out += ' ';
        out += word;
    }
    if (out.empty())
        return "Unknown error.";
    out.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(out.front())));
    if (out.back() != '.')
        out += '.';
    return out;
}

/// @brief Classify @p error.
/// @details Positioned errors move the origin to the failing line.  Only
///          grammar-level errors are inspected by the line heuristics.
Classification ErrorClassifier::classify(const std::exception &error) const
{
    const auto *marked = dynamic_cast<const MarkedYamlError *>(&error);
    if (marked == nullptr || !marked->problemMark())
        return Classification{normalizeMessage(error.what()), baseOrigin_, std::nullopt};

    const Mark &mark = *marked->problemMark();
    const support::Origin origin = baseOrigin_.replace(support::OriginUpdate{
        .lineNum = mark.line + baseOrigin_.lineNum(),
        .colNum = mark.column + 1,
    });

    if (dynamic_cast<const StructuralConstructionError *>(&error) == nullptr)
    {
        if (auto line = support::sourceLine(source_, mark.line))
        {
            if (auto finding = inspectLine(*line))
                return Classification{finding->message, origin.withColumn(finding->column), finding->help};
        }
    }

    std::string joined;
    for (const std::string *part : {&marked->context(), &marked->problem(), &marked->note()})
    {
        if (part->empty())
            continue;
        if (!joined.empty())
            joined += ' ';
        joined += *part;
    }
    return Classification{normalizeMessage(joined), origin, std::nullopt};
}

ParsingFailedError ErrorClassifier::translate(const std::exception &error, std::exception_ptr cause) const
{
    Classification c = classify(error);
    const support::SourceContext context =
        support::SourceContext::fromOrigin(c.origin, source_, baseOrigin_.lineNum());
    return ParsingFailedError(std::move(c.message), std::move(c.origin), context.str(), std::move(c.help), cause);
}

} // namespace prov::yaml
