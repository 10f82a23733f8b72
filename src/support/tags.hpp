//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/tags.hpp
// Purpose: Out-of-band metadata ("tags") carried next to a value: attach, query, copy.
// Key invariants: A TagSet holds at most one tag of each type; later tags overlay earlier ones.
// Ownership/Lifetime: TagSet owns copies of its tags.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/origin.hpp"

#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace prov::support
{

/// @brief Marker: the string may be expanded as a template downstream.
/// @details Carries no data; only its presence matters.
struct TrustedAsTemplate
{
    bool operator==(const TrustedAsTemplate &) const = default;
};

/// @brief Any out-of-band tag a value can carry.
using Tag = std::variant<Origin, TrustedAsTemplate>;

/// @brief Name of the tag alternative, for error messages.
const char *tagName(const Tag &tag);

/// @brief Small ordered set of tags keyed by tag type.
class TagSet
{
  public:
    /// @brief Attach @p tag, replacing any tag of the same type.
    void apply(const Tag &tag);

    /// @brief Attach every tag of @p other on top of this set.
    void overlay(const TagSet &other);

    /// @brief Drop all tags.
    void clear()
    {
        tags_.clear();
    }

    [[nodiscard]] bool empty() const
    {
        return tags_.empty();
    }

    [[nodiscard]] std::size_t size() const
    {
        return tags_.size();
    }

    [[nodiscard]] const std::vector<Tag> &all() const
    {
        return tags_;
    }

    /// @brief Retrieve the tag of type @p T, or nullptr when absent.
    template <class T> [[nodiscard]] const T *get() const
    {
        for (const Tag &tag : tags_)
        {
            if (const T *found = std::get_if<T>(&tag))
                return found;
        }
        return nullptr;
    }

    template <class T> [[nodiscard]] bool has() const
    {
        return get<T>() != nullptr;
    }

    /// @brief Remove the tag of type @p T if present.
    template <class T> void remove()
    {
        std::erase_if(tags_, [](const Tag &tag) { return std::holds_alternative<T>(tag); });
    }

  private:
    std::vector<Tag> tags_;
};

// Generic tag operations.  A "carrier" is any type exposing `tags()` in const
// and non-const form plus an ADL-visible `canCarry(const Carrier &, const Tag &)`.

/// @brief Apply @p tags to @p value in order; later tags overlay earlier ones.
/// @throws std::invalid_argument when the carrier cannot hold one of the tags.
template <class Carrier> Carrier &tag(Carrier &value, std::initializer_list<Tag> tags)
{
    for (const Tag &t : tags)
    {
        if (!canCarry(value, t))
            throw std::invalid_argument(std::string("value cannot carry the ") + tagName(t) + " tag");
        value.tags().apply(t);
    }
    return value;
}

/// @brief Copy every tag of @p src that @p dst can carry onto @p dst.
template <class Source, class Carrier> Carrier &tagCopy(const Source &src, Carrier &dst)
{
    for (const Tag &t : src.tags().all())
    {
        if (canCarry(dst, t))
            dst.tags().apply(t);
    }
    return dst;
}

/// @brief Return a copy of @p value without any tags.
template <class Carrier> Carrier untag(const Carrier &value)
{
    Carrier copy = value;
    copy.tags().clear();
    return copy;
}

/// @brief Whether @p value carries a tag of type @p T.
template <class T, class Carrier> bool isTaggedOn(const Carrier &value)
{
    return value.tags().template has<T>();
}

/// @brief Tag of type @p T on @p value, or nullptr.
template <class T, class Carrier> const T *getTag(const Carrier &value)
{
    return value.tags().template get<T>();
}

/// @brief Origin already attached to @p stream, else `{path: name, line: 1}`.
template <class Carrier>
Origin getOrCreateOrigin(const Carrier &stream, const std::optional<std::string> &name)
{
    if (const Origin *origin = getTag<Origin>(stream))
        return *origin;
    return Origin(name, 1);
}

} // namespace prov::support
