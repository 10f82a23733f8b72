//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the Origin value type.  Origins are created once per constructed
// YAML node and never mutated; every "change" produces a new record through
// replace().  Normalization of the line and column happens in the constructor
// so that no other code needs to care about 0 sentinels coming from callers.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Out-of-line helpers for `prov::support::Origin`.

#include "support/origin.hpp"

#include <utility>

namespace prov::support
{

/// @brief Build an origin, normalizing missing line/column values.
///
/// @details A zero line is treated as "start of document" and becomes 1.  A
///          zero column carries no information and is dropped, which keeps
///          equality comparisons between synthesized and parsed origins
///          meaningful.
Origin::Origin(std::optional<std::string> path, uint32_t lineNum, std::optional<uint32_t> colNum)
    : path_(std::move(path)), lineNum_(lineNum == 0 ? 1 : lineNum), colNum_(colNum)
{
    if (colNum_ && *colNum_ == 0)
        colNum_.reset();
}

/// @brief Produce a new origin with selected fields overridden.
/// @param update Fields to replace; unset members are carried over.
/// @return Fresh origin; `*this` is left untouched.
Origin Origin::replace(const OriginUpdate &update) const
{
    return Origin(update.path ? update.path : path_,
                  update.lineNum.value_or(lineNum_),
                  update.colNum ? update.colNum : colNum_);
}

Origin Origin::withColumn(std::optional<uint32_t> colNum) const
{
    return Origin(path_, lineNum_, colNum);
}

/// @brief Format the origin the way diagnostics print locations.
/// @return `path:line` or `path:line:col`.
std::string Origin::toString() const
{
    std::string out = path_ ? *path_ : std::string("<unknown>");
    out += ':';
    out += std::to_string(lineNum_);
    if (colNum_)
    {
        out += ':';
        out += std::to_string(*colNum_);
    }
    return out;
}

std::ostream &operator<<(std::ostream &os, const Origin &origin)
{
    return os << origin.toString();
}

} // namespace prov::support
