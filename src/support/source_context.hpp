//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_context.hpp
// Purpose: Renders a numbered source excerpt with a caret under an origin.
// Key invariants: Rendered lines never exceed kMaxLineWidth characters.
// Ownership/Lifetime: Owns copies of the excerpt lines; keeps no reference to the source text.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/origin.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prov::support
{

/// @brief Numbered excerpt of the lines leading up to an origin.
struct SourceContext
{
    /// Lines shown before the target line.
    static constexpr uint32_t kContextLines = 2;
    /// Width limit of a rendered line, label included.
    static constexpr std::size_t kMaxLineWidth = 120;

    Origin origin;
    std::vector<std::string> annotatedLines;   ///< Label-prefixed lines plus the marker line
    std::optional<std::string> targetLine;     ///< Raw text of the origin line
    std::optional<std::string> unavailableReason; ///< Set when no excerpt could be built

    /// @brief Build the excerpt for @p origin out of @p text.
    /// @param origin Position to point at; its line is absolute.
    /// @param text Source text whose first line is numbered @p firstLine.
    /// @param firstLine Line number of the first line of @p text.
    static SourceContext fromOrigin(const Origin &origin, std::string_view text, uint32_t firstLine = 1);

    /// @brief Multi-line rendering: header, blank line, excerpt.
    [[nodiscard]] std::string str() const;
};

/// @brief Line @p index (0-based) of @p text without its terminator.
/// @details A trailing newline yields a final empty line.
std::optional<std::string> sourceLine(std::string_view text, std::size_t index);

} // namespace prov::support
