//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/origin.hpp
// Purpose: Declares the immutable source position record attached to loaded values.
// Key invariants: line numbers are 1-based and never 0; column is 1-based or absent.
// Ownership/Lifetime: Value type owning its optional path string.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace prov::support
{

/// @brief Field overrides accepted by Origin::replace().
/// @details Unset members keep the value of the origin being replaced.
struct OriginUpdate
{
    std::optional<std::string> path;
    std::optional<uint32_t> lineNum;
    std::optional<uint32_t> colNum;
};

/// @brief Source position and document identity of a constructed value.
/// @invariant lineNum() >= 1; colNum() is either empty or >= 1.
/// @ownership Value type; copies are independent.
class Origin
{
  public:
    /// @brief Unknown document, line 1, no column.
    Origin() = default;

    /// @brief Create an origin for @p path at @p lineNum / @p colNum.
    /// @param path Document name; empty when the document is anonymous.
    /// @param lineNum 1-based line; 0 is normalized to 1.
    /// @param colNum 1-based column; 0 is normalized to "no column".
    explicit Origin(std::optional<std::string> path,
                    uint32_t lineNum = 1,
                    std::optional<uint32_t> colNum = std::nullopt);

    [[nodiscard]] const std::optional<std::string> &path() const
    {
        return path_;
    }

    [[nodiscard]] uint32_t lineNum() const
    {
        return lineNum_;
    }

    [[nodiscard]] std::optional<uint32_t> colNum() const
    {
        return colNum_;
    }

    /// @brief Return a copy with the fields set in @p update replaced.
    [[nodiscard]] Origin replace(const OriginUpdate &update) const;

    /// @brief Return a copy whose column is @p colNum (or absent).
    [[nodiscard]] Origin withColumn(std::optional<uint32_t> colNum) const;

    /// @brief Render as `path:line:col`, omitting the column when absent.
    /// @details Anonymous documents render their path as `<unknown>`.
    [[nodiscard]] std::string toString() const;

    bool operator==(const Origin &other) const = default;

  private:
    std::optional<std::string> path_;
    uint32_t lineNum_ = 1;
    std::optional<uint32_t> colNum_;
};

std::ostream &operator<<(std::ostream &os, const Origin &origin);

} // namespace prov::support
