//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Node.hpp
/// @brief Representation graph produced by the Composer.
///
/// @details A Node is a tagged scalar, sequence or mapping together with the
/// position where it starts.  Aliases are represented by sharing: an alias
/// points at the anchored Node, so the graph may contain shared and even
/// recursive references.  Nodes live in a support::Arena owned by the
/// Composer and are referenced through raw, non-owning pointers.
///
/// @invariant `tag` is always resolved; non-specific tags never reach the
///            constructors.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace prov::yaml
{

/// @brief 0-based position inside the source text.
struct Mark
{
    std::size_t index{0};
    uint32_t line{0};
    uint32_t column{0};

    bool operator==(const Mark &) const = default;
};

enum class NodeKind
{
    Scalar,
    Sequence,
    Mapping
};

/// @brief Lowercase name of @p kind for error messages ("scalar", "sequence", "mapping").
const char *nodeKindName(NodeKind kind);

/// @brief One node of the representation graph.
struct Node
{
    NodeKind kind{NodeKind::Scalar};
    std::string tag;
    Mark startMark;
    /// Scalar text; empty for collections.
    std::string value;
    /// Sequence entries in document order.
    std::vector<Node *> items;
    /// Mapping entries in document order, duplicates included.
    std::vector<std::pair<Node *, Node *>> pairs;
};

} // namespace prov::yaml
