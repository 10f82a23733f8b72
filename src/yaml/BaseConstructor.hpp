//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file BaseConstructor.hpp
/// @brief Turns composed Nodes into Values for the standard YAML 1.1 tags.
///
/// @details Every constructed value is tagged with an Origin computed from its
/// node's start mark and the loader's base Origin.  Strings additionally get
/// TrustedAsTemplate when the TrustTracker allows it.  Mappings apply merge
/// keys (`<<`) and the duplicate-key policy.
///
/// Tag handlers are looked up by exact tag.  Subclasses add handlers by
/// overriding registerTagHandlers(); the Loader calls it once after
/// construction.
///
/// Containers are constructed in two phases: the empty container is allocated
/// and cached for its node first, then filled.  This lets aliases inside a
/// collection refer back to the collection itself.
///
/// Ownership/Lifetime: Values are allocated in the Document passed to
/// constructDocument(); the constructor keeps no reference after it returns.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/arena.hpp"
#include "support/diagnostics.hpp"
#include "support/origin.hpp"
#include "yaml/LoaderConfig.hpp"
#include "yaml/Node.hpp"
#include "yaml/Resolver.hpp"
#include "yaml/TrustTracker.hpp"
#include "yaml/Value.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace prov::yaml
{

/// @brief Version in which the deprecated tags stop being accepted.
inline constexpr const char *kDeprecatedTagRemovalVersion = "2.0";

/// @brief Constructor for the generic YAML 1.1 tag repository.
class BaseConstructor
{
  public:
    /// @param policy Reaction to duplicate mapping keys.
    /// @param trustedAsTemplate Whether strings of this load are trusted.
    /// @param resolver Resolver used to re-resolve retagged nodes; must outlive the constructor.
    /// @param warnings Sink for duplicate-key warnings and deprecations; must outlive the constructor.
    /// @param baseOrigin Origin of the first line of the text.
    BaseConstructor(DuplicateKeyPolicy policy,
                    bool trustedAsTemplate,
                    const Resolver &resolver,
                    support::DiagnosticEngine &warnings,
                    support::Origin baseOrigin);
    virtual ~BaseConstructor();

    BaseConstructor(const BaseConstructor &) = delete;
    BaseConstructor &operator=(const BaseConstructor &) = delete;

    /// @brief Install the tag handlers of this constructor.
    virtual void registerTagHandlers();

    /// @brief Construct the value graph of @p root into @p document.
    /// @return The root value, also stored as the document root.
    /// @throws MarkedYamlError on construction failures.
    Value *constructDocument(const Node &root, Document &document);

    /// @brief Construct (or fetch the cached value of) @p node.
    Value *constructObject(const Node &node);

    /// @brief Origin of @p node: its 0-based mark offset by the base Origin.
    [[nodiscard]] support::Origin nodeOrigin(const Node &node) const;

    [[nodiscard]] DuplicateKeyPolicy duplicateKeyPolicy() const
    {
        return policy_;
    }

    [[nodiscard]] const TrustTracker &trust() const
    {
        return trust_;
    }

  protected:
    using TagHandler = std::function<Value *(const Node &)>;

    void addTagHandler(std::string_view tag, TagHandler handler);

    /// @brief Construct @p node as if it had been written without a tag.
    Value *resolveAndConstruct(const Node &node);

    /// @brief Allocate @p value in the current document and tag it with the node's Origin.
    Value &emit(Value value, const Node &node);

    TrustTracker &trustTracker()
    {
        return trust_;
    }

    support::DiagnosticEngine &warnings()
    {
        return warnings_;
    }

    /// @brief Scalar text of @p node.
    /// @throws MarkedYamlError when @p node is a collection.
    const std::string &scalarText(const Node &node) const;

  private:
    using NodePair = std::pair<const Node *, const Node *>;

    Value *constructNull(const Node &node);
    Value *constructBool(const Node &node);
    Value *constructInt(const Node &node);
    Value *constructFloat(const Node &node);
    Value *constructStr(const Node &node);
    Value *constructBinary(const Node &node);
    Value *constructTimestamp(const Node &node);
    Value *constructSeq(const Node &node);
    Value *constructMap(const Node &node);
    Value *constructSet(const Node &node);
    Value *constructOrderedPairs(const Node &node, std::string_view tagLabel, std::string_view context);
    Value *constructUndefined(const Node &node);

    /// @brief Allocate an empty container and cache it for @p node.
    Value &beginContainer(Value container, const Node &node);

    /// @brief Fill @p target from mapping @p node: merges, keys, duplicates.
    void constructMapping(const Node &node, Mapping &target);

    /// @brief Entries of a mapping node split into merged and own entries.
    struct FlatMapping
    {
        std::vector<NodePair> merged; ///< Entries pulled in through `<<`, in merge order
        std::vector<NodePair> own;    ///< Entries written in the mapping itself
    };

    /// @brief Expand the merge keys of @p node.
    /// @param active Mapping nodes currently being flattened, for cycle detection.
    FlatMapping flattenMapping(const Node &node, std::vector<const Node *> &active);

    /// @brief Apply the duplicate-key policy to a repeated key.
    void reportDuplicateKey(const Value &key, const Node &keyNode);

    DuplicateKeyPolicy policy_;
    TrustTracker trust_;
    const Resolver &resolver_;
    support::DiagnosticEngine &warnings_;
    support::Origin baseOrigin_;

    std::unordered_map<std::string, TagHandler> handlers_;
    std::unordered_map<const Node *, Value *> constructed_;
    std::unordered_set<const Node *> inProgress_;
    Document *document_{nullptr};
    support::Arena<Node> retagged_;
};

} // namespace prov::yaml
