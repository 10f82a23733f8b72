//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements source excerpt rendering for parse failures.  The excerpt shows
// up to two lines of leading context and the target line, each prefixed with a
// right-aligned line number, followed by a marker line.  When the origin has a
// column the marker is a caret labelled with the column; otherwise the whole
// target line is underlined.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief SourceContext construction and rendering.

#include "support/source_context.hpp"

#include <algorithm>

namespace prov::support
{
namespace
{
constexpr std::string_view kTruncationMarker = "...";

/// @brief Make a source line printable: drop CR, expand tabs to one space, clamp width.
std::string displayLine(std::string line, std::size_t maxLen)
{
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    std::replace(line.begin(), line.end(), '\t', ' ');
    if (line.size() > maxLen)
    {
        line.resize(maxLen - kTruncationMarker.size());
        line += kTruncationMarker;
    }
    return line;
}

std::string rightAlign(const std::string &text, std::size_t width)
{
    if (text.size() >= width)
        return text;
    return std::string(width - text.size(), ' ') + text;
}
} // namespace

/// @brief Retrieve a single line from @p text.
/// @details Lines are separated by '\n' only; the returned text excludes the
///          separator.  Out-of-range indices yield an empty optional.
std::optional<std::string> sourceLine(std::string_view text, std::size_t index)
{
    std::size_t start = 0;
    for (std::size_t l = 0; l < index; ++l)
    {
        std::size_t pos = text.find('\n', start);
        if (pos == std::string_view::npos)
            return std::nullopt;
        start = pos + 1;
    }
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos)
        end = text.size();
    return std::string(text.substr(start, end - start));
}

/// @brief Collect the excerpt lines and build the marker line.
///
/// @details Lines are labelled with their absolute number, right-aligned to the
///          width of the target line's number.  A column marker reads
///          `^ column N` after the caret, or `column N ^` when the label would
///          run past the width limit.  Columns beyond the clamped line width
///          point at the truncation marker.
SourceContext SourceContext::fromOrigin(const Origin &origin, std::string_view text, uint32_t firstLine)
{
    SourceContext ctx;
    ctx.origin = origin;

    if (origin.lineNum() < firstLine)
    {
        ctx.unavailableReason = "origin precedes the start of the source text";
        return ctx;
    }
    const std::size_t targetIdx = origin.lineNum() - firstLine;
    const std::size_t startIdx = targetIdx > kContextLines ? targetIdx - kContextLines : 0;

    const std::size_t labelWidth = std::to_string(origin.lineNum()).size();
    const std::size_t maxSrcLen = kMaxLineWidth - labelWidth - 1;

    std::string targetDisplay;
    for (std::size_t idx = startIdx; idx <= targetIdx; ++idx)
    {
        auto raw = sourceLine(text, idx);
        if (!raw)
        {
            ctx.annotatedLines.clear();
            ctx.unavailableReason = "source text ends before line " + std::to_string(origin.lineNum());
            return ctx;
        }
        std::string shown = displayLine(*raw, maxSrcLen);
        std::string label = rightAlign(std::to_string(firstLine + idx), labelWidth);
        ctx.annotatedLines.push_back(shown.empty() ? label : label + ' ' + shown);
        if (idx == targetIdx)
        {
            ctx.targetLine = *raw;
            targetDisplay = std::move(shown);
        }
    }

    const std::string gutter(labelWidth + 1, ' ');
    if (auto col = origin.colNum())
    {
        const std::string label = "column " + std::to_string(*col);
        const std::size_t caretIdx = std::min<std::size_t>(*col - 1, maxSrcLen - 1);
        if (caretIdx + 2 + label.size() <= maxSrcLen)
        {
            ctx.annotatedLines.push_back(gutter + std::string(caretIdx, ' ') + "^ " + label);
        }
        else
        {
            const std::size_t lead = caretIdx >= label.size() + 1 ? caretIdx - label.size() - 1 : 0;
            ctx.annotatedLines.push_back(gutter + std::string(lead, ' ') + label + " ^");
        }
    }
    else
    {
        ctx.annotatedLines.push_back(gutter + std::string(std::max<std::size_t>(targetDisplay.size(), 1), '^'));
    }
    return ctx;
}

std::string SourceContext::str() const
{
    std::string out = "Origin: " + origin.toString() + "\n\n";
    if (unavailableReason)
        return out + "(source not shown: " + *unavailableReason + ")";
    for (std::size_t i = 0; i < annotatedLines.size(); ++i)
    {
        if (i != 0)
            out += '\n';
        out += annotatedLines[i];
    }
    return out;
}

} // namespace prov::support
