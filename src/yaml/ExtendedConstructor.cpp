//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the custom tag handlers.  Both handlers re-resolve the tagged
// node as plain text before constructing it, so `!unsafe 1` is an integer and
// `!vault 1` is rejected instead of being read as the string "1".
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Handlers for `!unsafe` and the vault tags.

#include "yaml/ExtendedConstructor.hpp"
#include "yaml/Errors.hpp"

namespace prov::yaml
{

void ExtendedConstructor::registerTagHandlers()
{
    BaseConstructor::registerTagHandlers();
    addTagHandler(tag_names::kUnsafe, [this](const Node &n) { return constructUnsafe(n); });
    addTagHandler(tag_names::kVault, [this](const Node &n) { return constructVault(n); });
    addTagHandler(tag_names::kVaultEncrypted, [this](const Node &n) { return constructVaultEncrypted(n); });
}

/// @brief Construct @p node untrusted.
/// @details The scope guard covers the whole subtree, so strings nested
///          arbitrarily deep (or under further `!unsafe` tags) stay untrusted,
///          and the depth is restored even when construction throws.
Value *ExtendedConstructor::constructUnsafe(const Node &node)
{
    TrustTracker::UnsafeScope scope(trustTracker());
    return resolveAndConstruct(node);
}

/// @brief Wrap a string as an EncryptedString.
/// @details The ciphertext inherits every tag the string received, including
///          TrustedAsTemplate.
Value *ExtendedConstructor::constructVault(const Node &node)
{
    Value *text = resolveAndConstruct(node);
    if (!text->isString())
        throw StructuralConstructionError(
            {}, std::nullopt, "the '" + std::string(tag_names::kVault) + "' tag requires a string value", node.startMark);

    Value &secret = emit(Value::encrypted(EncryptedString{text->asString()}), node);
    secret.tags().clear();
    support::tagCopy(*text, secret);
    return &secret;
}

Value *ExtendedConstructor::constructVaultEncrypted(const Node &node)
{
    warnings().deprecated("Use of the `" + std::string(tag_names::kVaultEncrypted) + "` tag is deprecated.",
                          kDeprecatedTagRemovalVersion,
                          nodeOrigin(node),
                          "Use the `" + std::string(tag_names::kVault) + "` tag instead.");
    return constructVault(node);
}

} // namespace prov::yaml
