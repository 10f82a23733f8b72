//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file InputSource.hpp
/// @brief YAML text handed to a Loader, with its name and out-of-band tags.
///
/// @details An input may already carry an Origin (for example when the text
/// was cut out of a larger file) and a TrustedAsTemplate marker.  The Origin
/// becomes the base that every node position is offset against; the marker
/// decides trust when the loader configuration does not.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/tags.hpp"

#include <optional>
#include <string>
#include <utility>

namespace prov::yaml
{

/// @brief Text stream plus identity and tags.
class InputSource
{
  public:
    explicit InputSource(std::string text, std::optional<std::string> name = std::nullopt)
        : text_(std::move(text)), name_(std::move(name))
    {
    }

    [[nodiscard]] const std::string &text() const
    {
        return text_;
    }

    /// @brief Document name used when no Origin tag is attached.
    [[nodiscard]] const std::optional<std::string> &name() const
    {
        return name_;
    }

    support::TagSet &tags()
    {
        return tags_;
    }

    const support::TagSet &tags() const
    {
        return tags_;
    }

  private:
    std::string text_;
    std::optional<std::string> name_;
    support::TagSet tags_;
};

/// @brief Inputs accept every tag.
inline bool canCarry(const InputSource &, const support::Tag &)
{
    return true;
}

} // namespace prov::yaml
