//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Composer.hpp
/// @brief Builds the Node graph of each document from yaml-cpp parser events.
///
/// @details The Composer drives a YAML::Parser over the source text and turns
/// its event stream into Nodes: anchors are remembered per document and
/// aliases resolve to the anchored Node itself.  Non-specific tags reported by
/// the parser ("?" for plain, "!" for quoted) are resolved here so that every
/// Node leaving the Composer carries a concrete tag.
///
/// Ownership/Lifetime: Nodes stay valid for the lifetime of the Composer, across
/// documents.
///
/// @see Resolver.hpp for the implicit tag rules.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/arena.hpp"
#include "yaml/Node.hpp"
#include "yaml/Resolver.hpp"

#include <memory>
#include <sstream>
#include <string>

namespace YAML
{
class Parser;
}

namespace prov::yaml
{

/// @brief Root of one composed document.
struct ComposedDocument
{
    Node *root{nullptr};
    Mark startMark;
};

/// @brief Pull-style document composer.
class Composer
{
  public:
    /// @param text Complete YAML stream; copied.
    /// @param resolver Resolver for non-specific tags; must outlive the Composer.
    Composer(std::string text, const Resolver &resolver);
    ~Composer();

    Composer(const Composer &) = delete;
    Composer &operator=(const Composer &) = delete;

    /// @brief Compose the next document of the stream.
    /// @return False once the stream holds no further document.
    /// @throws MarkedYamlError on malformed YAML.
    bool nextDocument(ComposedDocument &out);

  private:
    class Builder;

    std::string text_; ///< Source of the stream, for tags the parser drops
    std::istringstream stream_;
    std::unique_ptr<YAML::Parser> parser_;
    const Resolver &resolver_;
    support::Arena<Node> nodes_;
};

} // namespace prov::yaml
