//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Parses loader options from text.  Failures are returned as diagnostics
// rather than thrown so that a driver can report them alongside other
// configuration problems.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Duplicate-key policy names and environment configuration.

#include "yaml/LoaderConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace prov::yaml
{
namespace
{
/// @brief Lowercased copy of @p text with surrounding whitespace removed.
std::string normalize(std::string_view text)
{
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(text.begin(), text.end(), notSpace);
    auto last = std::find_if(text.rbegin(), text.rend(), notSpace).base();
    std::string out;
    if (first < last)
        out.assign(first, last);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}
} // namespace

const char *duplicateKeyPolicyName(DuplicateKeyPolicy policy)
{
    switch (policy)
    {
        case DuplicateKeyPolicy::Error:
            return "error";
        case DuplicateKeyPolicy::Warn:
            return "warn";
        case DuplicateKeyPolicy::Ignore:
            return "ignore";
    }
    return "error";
}

support::Expected<DuplicateKeyPolicy> parseDuplicateKeyPolicy(std::string_view text)
{
    const std::string name = normalize(text);
    if (name == "error")
        return DuplicateKeyPolicy::Error;
    if (name == "warn")
        return DuplicateKeyPolicy::Warn;
    if (name == "ignore")
        return DuplicateKeyPolicy::Ignore;
    return support::makeError(std::nullopt,
                              "invalid duplicate key policy '" + std::string(text) + "'",
                              "Valid policies are 'error', 'warn' and 'ignore'.");
}

support::Expected<bool> parseBoolOption(std::string_view name, std::string_view text)
{
    const std::string value = normalize(text);
    if (value == "1" || value == "true" || value == "yes" || value == "on")
        return true;
    if (value == "0" || value == "false" || value == "no" || value == "off")
        return false;
    return support::makeError(std::nullopt,
                              "invalid boolean '" + std::string(text) + "' for " + std::string(name));
}

/// @brief Build a configuration from PROV_* environment variables.
/// @details The duplicate-key policy must be set; the trust override is
///          optional.
support::Expected<LoaderConfig> LoaderConfig::fromEnvironment()
{
    const char *policyText = std::getenv(kDuplicateKeyEnvVar);
    if (policyText == nullptr)
        return support::makeError(std::nullopt, std::string(kDuplicateKeyEnvVar) + " is not set");
    auto policy = parseDuplicateKeyPolicy(policyText);
    if (!policy)
        return policy.error();

    LoaderConfig config(policy.value());
    if (const char *trustText = std::getenv(kTrustedAsTemplateEnvVar))
    {
        auto trusted = parseBoolOption(kTrustedAsTemplateEnvVar, trustText);
        if (!trusted)
            return trusted.error();
        config.trustedAsTemplate = trusted.value();
    }
    return config;
}

} // namespace prov::yaml
