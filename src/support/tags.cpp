//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the TagSet container.  Sets are tiny (one entry per tag type), so
// a linear vector keeps insertion order and beats any associative container.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief TagSet insertion and overlay.

#include "support/tags.hpp"

#include <algorithm>

namespace prov::support
{

const char *tagName(const Tag &tag)
{
    return std::holds_alternative<Origin>(tag) ? "Origin" : "TrustedAsTemplate";
}

/// @brief Insert @p tag, overwriting an existing tag of the same alternative.
/// @details The slot of the replaced tag is reused so iteration order stays
///          stable across repeated overlays.
void TagSet::apply(const Tag &tag)
{
    auto same = std::find_if(tags_.begin(),
                             tags_.end(),
                             [&](const Tag &existing) { return existing.index() == tag.index(); });
    if (same != tags_.end())
        *same = tag;
    else
        tags_.push_back(tag);
}

void TagSet::overlay(const TagSet &other)
{
    for (const Tag &tag : other.tags_)
        apply(tag);
}

} // namespace prov::support
