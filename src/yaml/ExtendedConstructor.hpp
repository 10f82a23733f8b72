//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file ExtendedConstructor.hpp
/// @brief Adds the custom `!unsafe`, `!vault` and `!vault-encrypted` tags.
///
/// @details
///   - `!unsafe` constructs its node as if untagged while suppressing
///     TrustedAsTemplate for every string inside it, nested tags included.
///   - `!vault` requires a string and produces an EncryptedString that keeps
///     the string's tags.
///   - `!vault-encrypted` is a deprecated spelling of `!vault`.
///
/// @see BaseConstructor.hpp for the generic tags.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "yaml/BaseConstructor.hpp"

namespace prov::yaml
{

/// @brief Constructor accepting the loader's custom tags on top of YAML 1.1.
class ExtendedConstructor : public BaseConstructor
{
  public:
    using BaseConstructor::BaseConstructor;

    void registerTagHandlers() override;

  private:
    Value *constructUnsafe(const Node &node);
    Value *constructVault(const Node &node);
    Value *constructVaultEncrypted(const Node &node);
};

} // namespace prov::yaml
