//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the CLI entry point that loads a YAML file and prints every
// value with its origin and trust marker.  Warnings collected during the load
// are printed to stderr after the listing; a parse failure is printed with
// its source excerpt and makes the tool exit non-zero.
//
//===----------------------------------------------------------------------===//

#include "prov/yaml/Loader.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

using namespace prov::yaml;
using namespace prov::support;

namespace
{
constexpr std::string_view kUsage = "usage: prov-yaml-check [--duplicate-keys=error|warn|ignore] "
                                    "[--trusted|--untrusted] [--generic] <file.yml>\n";

/// @brief Print @p value and its children, one line per value.
/// @details Lines read `<path> <kind> <origin> [trusted] <repr>`.  Shared
///          values (aliases) are listed once.
void dump(const Value &value, const std::string &path, std::unordered_set<const Value *> &seen)
{
    std::cout << path << ' ' << valueKindName(value.kind()) << ' '
              << (value.origin() ? value.origin()->toString() : std::string("-"));
    if (value.trustedAsTemplate())
        std::cout << " trusted";
    if (!seen.insert(&value).second)
    {
        std::cout << " (alias)\n";
        return;
    }
    if (value.kind() == ValueKind::Sequence)
    {
        std::cout << '\n';
        for (std::size_t i = 0; i < value.size(); ++i)
            dump(value.at(i), path + '[' + std::to_string(i) + ']', seen);
        return;
    }
    if (value.kind() == ValueKind::Mapping || value.kind() == ValueKind::Set)
    {
        std::cout << '\n';
        for (const auto &[key, item] : value.asMapping())
            dump(*item, path + '.' + repr(*key), seen);
        return;
    }
    std::cout << ' ' << repr(value) << '\n';
}
} // namespace

/// @brief Tool entry point.
///
/// The duplicate-key policy comes from `--duplicate-keys` or, when absent,
/// from the PROV_* environment variables.
///
/// @return 0 on success, 1 on a load failure, 2 on bad usage.
int main(int argc, char **argv)
{
    std::optional<std::string> policyText;
    std::optional<bool> trusted;
    LoaderKind kind = LoaderKind::CustomTags;
    std::optional<std::string> path;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg.starts_with("--duplicate-keys="))
            policyText = std::string(arg.substr(arg.find('=') + 1));
        else if (arg == "--trusted")
            trusted = true;
        else if (arg == "--untrusted")
            trusted = false;
        else if (arg == "--generic")
            kind = LoaderKind::GenericTags;
        else if (!arg.starts_with("--") && !path)
            path = std::string(arg);
        else
        {
            std::cerr << kUsage;
            return 2;
        }
    }
    if (!path)
    {
        std::cerr << kUsage;
        return 2;
    }

    std::optional<LoaderConfig> config;
    if (policyText)
    {
        auto policy = parseDuplicateKeyPolicy(*policyText);
        if (!policy)
        {
            printDiag(policy.error(), std::cerr);
            return 2;
        }
        config.emplace(policy.value());
    }
    else
    {
        auto fromEnv = LoaderConfig::fromEnvironment();
        if (!fromEnv)
        {
            printDiag(fromEnv.error(), std::cerr);
            return 2;
        }
        config.emplace(fromEnv.value());
    }
    if (trusted)
        config->trustedAsTemplate = trusted;

    DiagnosticEngine warnings;
    auto document = loadFile(*path, *config, warnings, kind);
    warnings.printAll(std::cerr);
    if (!document)
    {
        printDiag(document.error(), std::cerr);
        return 1;
    }

    std::unordered_set<const Value *> seen;
    dump(*document.value().root(), "$", seen);
    return 0;
}
