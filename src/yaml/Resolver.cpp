//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements YAML 1.1 implicit resolution for plain scalars.  The patterns are
// the YAML 1.1 type repository definitions; registration order decides which
// type wins when several patterns match.  Numbers are matched by linear
// scanners and the regex patterns only see values up to their maximum length,
// so arbitrarily long scalars resolve without deep recursion.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Resolver construction and tag lookup.

#include "yaml/Resolver.hpp"

namespace prov::yaml
{

const char *nodeKindName(NodeKind kind)
{
    switch (kind)
    {
        case NodeKind::Scalar:
            return "scalar";
        case NodeKind::Sequence:
            return "sequence";
        case NodeKind::Mapping:
            return "mapping";
    }
    return "node";
}

namespace
{

bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

bool isHexDigit(char c)
{
    return isDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

/// @brief Advance @p i past characters accepted by @p accept.
template <typename Pred> std::size_t skipWhile(std::string_view s, std::size_t i, Pred accept)
{
    while (i < s.size() && accept(s[i]))
        ++i;
    return i;
}

bool isDigitOrUnderscore(char c)
{
    return isDigit(c) || c == '_';
}

/// @brief Match `(:[0-5]?[0-9])+` starting at @p i; returns the end or npos.
std::size_t skipSexagesimal(std::string_view s, std::size_t i)
{
    std::size_t groups = 0;
    while (i < s.size() && s[i] == ':')
    {
        ++i;
        if (i >= s.size() || !isDigit(s[i]))
            return std::string_view::npos;
        if (i + 1 < s.size() && isDigit(s[i + 1]) && s[i] <= '5')
            i += 2;
        else
            ++i;
        ++groups;
    }
    return groups > 0 ? i : std::string_view::npos;
}

/// @brief True when @p s from @p i is empty or `[eE][-+][0-9]+`.
bool isOptionalExponent(std::string_view s, std::size_t i)
{
    if (i == s.size())
        return true;
    if (s[i] != 'e' && s[i] != 'E')
        return false;
    if (++i >= s.size() || (s[i] != '-' && s[i] != '+'))
        return false;
    const std::size_t digits = ++i;
    i = skipWhile(s, i, isDigit);
    return i > digits && i == s.size();
}

/// @brief YAML 1.1 int: binary, octal, decimal, hex or sexagesimal.
bool scanInt(std::string_view s)
{
    std::size_t i = 0;
    if (i < s.size() && (s[i] == '-' || s[i] == '+'))
        ++i;
    if (i >= s.size() || !isDigit(s[i]))
        return false;

    std::string_view body = s.substr(i);
    if (body == "0")
        return true;
    if (body.size() > 2 && body[0] == '0' && body[1] == 'b')
        return skipWhile(body, 2, [](char c) { return c == '0' || c == '1' || c == '_'; }) == body.size();
    if (body.size() > 2 && body[0] == '0' && body[1] == 'x')
        return skipWhile(body, 2, [](char c) { return isHexDigit(c) || c == '_'; }) == body.size();
    if (body[0] == '0')
        return skipWhile(body, 1, [](char c) { return (c >= '0' && c <= '7') || c == '_'; }) == body.size();

    std::size_t j = skipWhile(body, 1, isDigitOrUnderscore);
    if (j == body.size())
        return true;
    return skipSexagesimal(body, j) == body.size();
}

/// @brief YAML 1.1 float: fixed, exponent, sexagesimal, inf and nan forms.
bool scanFloat(std::string_view s)
{
    if (s == ".nan" || s == ".NaN" || s == ".NAN")
        return true;
    if (s.size() > 1 && s[0] == '.' && isDigit(s[1]))
        return isOptionalExponent(s, skipWhile(s, 2, isDigitOrUnderscore));

    std::size_t i = 0;
    if (i < s.size() && (s[i] == '-' || s[i] == '+'))
        ++i;
    std::string_view body = s.substr(i);
    if (body == ".inf" || body == ".Inf" || body == ".INF")
        return true;
    if (body.empty() || !isDigit(body[0]))
        return false;

    std::size_t j = skipWhile(body, 1, isDigitOrUnderscore);
    if (j < body.size() && body[j] == '.')
        return isOptionalExponent(body, skipWhile(body, j + 1, isDigitOrUnderscore));
    j = skipSexagesimal(body, j);
    if (j == std::string_view::npos || j >= body.size() || body[j] != '.')
        return false;
    return skipWhile(body, j + 1, isDigitOrUnderscore) == body.size();
}

} // namespace

/// @brief Register the YAML 1.1 implicit types.
Resolver::Resolver()
{
    addImplicit(tag_names::kBool,
                "yes|Yes|YES|no|No|NO|true|True|TRUE|false|False|FALSE|on|On|ON|off|Off|OFF",
                5,
                "yYnNtTfFoO");
    addImplicit(tag_names::kFloat, scanFloat, "-+0123456789.");
    addImplicit(tag_names::kInt, scanInt, "-+0123456789");
    addImplicit(tag_names::kMerge, "<<", 2, "<");
    addImplicit(tag_names::kNull, "~|null|Null|NULL|", 4, "~nN", true);
    addImplicit(tag_names::kTimestamp,
                R"([0-9][0-9][0-9][0-9]-[0-9][0-9]-[0-9][0-9])"
                R"(|[0-9][0-9][0-9][0-9]-[0-9][0-9]?-[0-9][0-9]?)"
                R"((?:[Tt]|[ \t]+)[0-9][0-9]?)"
                R"(:[0-9][0-9]:[0-9][0-9](?:\.[0-9]*)?)"
                R"((?:[ \t]*(?:Z|[-+][0-9][0-9]?(?::[0-9][0-9])?))?)",
                kMaxTimestampLength,
                "0123456789");
    addImplicit(tag_names::kValue, "=", 1, "=");
}

void Resolver::addImplicit(
    std::string_view tag, const char *pattern, std::size_t maxLength, std::string firstChars, bool matchesEmpty)
{
    ImplicitResolver r;
    r.tag = tag;
    r.pattern = std::regex(std::string("^(?:") + pattern + ")$");
    r.maxLength = maxLength;
    r.firstChars = std::move(firstChars);
    r.matchesEmpty = matchesEmpty;
    implicit_.push_back(std::move(r));
}

void Resolver::addImplicit(std::string_view tag, bool (*scan)(std::string_view), std::string firstChars)
{
    ImplicitResolver r;
    r.tag = tag;
    r.scan = scan;
    r.firstChars = std::move(firstChars);
    implicit_.push_back(std::move(r));
}

/// @brief Resolve the tag of an untagged node.
/// @details Collections and quoted scalars have a fixed tag.  Plain scalars try
///          each implicit type whose first-character set admits the value and
///          fall back to `str`.
std::string Resolver::resolve(NodeKind kind, std::string_view value, bool plain) const
{
    if (kind == NodeKind::Sequence)
        return std::string(tag_names::kSeq);
    if (kind == NodeKind::Mapping)
        return std::string(tag_names::kMap);

    if (plain)
    {
        for (const ImplicitResolver &r : implicit_)
        {
            const bool candidate =
                value.empty() ? r.matchesEmpty : r.firstChars.find(value.front()) != std::string::npos;
            if (!candidate)
                continue;
            const bool matched = r.scan ? r.scan(value)
                                        : value.size() <= r.maxLength &&
                                              std::regex_match(value.begin(), value.end(), r.pattern);
            if (matched)
                return std::string(r.tag);
        }
    }
    return std::string(tag_names::kStr);
}

} // namespace prov::yaml
