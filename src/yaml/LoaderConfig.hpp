//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file LoaderConfig.hpp
/// @brief Options controlling a Loader: duplicate-key policy and trust override.
///
/// @details The duplicate-key policy has no built-in default; callers choose
/// one explicitly or read it from the environment via
/// LoaderConfig::fromEnvironment():
///   - PROV_DUPLICATE_YAML_DICT_KEY   error | warn | ignore (required)
///   - PROV_YAML_TRUSTED_AS_TEMPLATE  boolean (optional)
///
/// Ownership/Lifetime: Value type, copied into each Loader.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <optional>
#include <string_view>

namespace prov::yaml
{

/// @brief Reaction to a mapping that repeats a key.
enum class DuplicateKeyPolicy
{
    Error,  ///< Fail the load.
    Warn,   ///< Report a warning; the last value wins.
    Ignore, ///< Silently keep the last value.
};

/// @brief Environment variable naming the duplicate-key policy.
inline constexpr const char *kDuplicateKeyEnvVar = "PROV_DUPLICATE_YAML_DICT_KEY";
/// @brief Environment variable forcing the trust decision.
inline constexpr const char *kTrustedAsTemplateEnvVar = "PROV_YAML_TRUSTED_AS_TEMPLATE";

/// @brief Lowercase policy name ("error", "warn", "ignore").
const char *duplicateKeyPolicyName(DuplicateKeyPolicy policy);

/// @brief Parse a policy name; surrounding whitespace and case are ignored.
support::Expected<DuplicateKeyPolicy> parseDuplicateKeyPolicy(std::string_view text);

/// @brief Parse a boolean option value (true/false, yes/no, on/off, 1/0).
support::Expected<bool> parseBoolOption(std::string_view name, std::string_view text);

/// @brief Loader options.
struct LoaderConfig
{
    explicit LoaderConfig(DuplicateKeyPolicy policy, std::optional<bool> trusted = std::nullopt)
        : duplicateKeyPolicy(policy), trustedAsTemplate(trusted)
    {
    }

    DuplicateKeyPolicy duplicateKeyPolicy;

    /// @brief Explicit trust decision; when empty the input's tags decide.
    std::optional<bool> trustedAsTemplate;

    /// @brief Read the configuration from the process environment.
    static support::Expected<LoaderConfig> fromEnvironment();
};

} // namespace prov::yaml
