//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Resolver.hpp
/// @brief YAML 1.1 implicit tag resolution.
///
/// @details Plain scalars are matched against the YAML 1.1 implicit types
/// (bool, float, int, merge, null, timestamp, value) in that order; the
/// candidate list is narrowed by the first character of the scalar.  Quoted
/// scalars always resolve to `str`, collections to `seq` / `map`.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "yaml/Node.hpp"

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace prov::yaml
{

/// @brief Fully-qualified tag names used by the loader.
namespace tag_names
{
inline constexpr std::string_view kNull = "tag:yaml.org,2002:null";
inline constexpr std::string_view kBool = "tag:yaml.org,2002:bool";
inline constexpr std::string_view kInt = "tag:yaml.org,2002:int";
inline constexpr std::string_view kFloat = "tag:yaml.org,2002:float";
inline constexpr std::string_view kStr = "tag:yaml.org,2002:str";
inline constexpr std::string_view kBinary = "tag:yaml.org,2002:binary";
inline constexpr std::string_view kTimestamp = "tag:yaml.org,2002:timestamp";
inline constexpr std::string_view kMerge = "tag:yaml.org,2002:merge";
inline constexpr std::string_view kValue = "tag:yaml.org,2002:value";
inline constexpr std::string_view kSeq = "tag:yaml.org,2002:seq";
inline constexpr std::string_view kMap = "tag:yaml.org,2002:map";
inline constexpr std::string_view kSet = "tag:yaml.org,2002:set";
inline constexpr std::string_view kOmap = "tag:yaml.org,2002:omap";
inline constexpr std::string_view kPairs = "tag:yaml.org,2002:pairs";

inline constexpr std::string_view kUnsafe = "!unsafe";
inline constexpr std::string_view kVault = "!vault";
inline constexpr std::string_view kVaultEncrypted = "!vault-encrypted";
} // namespace tag_names

/// @brief Longest text matched as a timestamp.
/// @details Bounds the backtracking regex; real timestamps stay under 40 characters.
inline constexpr std::size_t kMaxTimestampLength = 64;

/// @brief Maps untagged nodes to their YAML 1.1 tag.
class Resolver
{
  public:
    Resolver();

    /// @brief Tag for a node of @p kind with text @p value.
    /// @param plain True when the scalar was written unquoted; only plain
    ///        scalars take part in implicit resolution.
    [[nodiscard]] std::string resolve(NodeKind kind, std::string_view value, bool plain) const;

  private:
    struct ImplicitResolver
    {
        std::string_view tag;
        std::regex pattern;
        bool (*scan)(std::string_view){nullptr}; ///< Linear matcher used instead of @c pattern
        std::size_t maxLength{0};                ///< Longest value @c pattern is tried on
        std::string firstChars;                  ///< Leading characters that may start a match
        bool matchesEmpty{false};
    };

    void addImplicit(std::string_view tag,
                     const char *pattern,
                     std::size_t maxLength,
                     std::string firstChars,
                     bool matchesEmpty = false);
    void addImplicit(std::string_view tag, bool (*scan)(std::string_view), std::string firstChars);

    std::vector<ImplicitResolver> implicit_;
};

} // namespace prov::yaml
