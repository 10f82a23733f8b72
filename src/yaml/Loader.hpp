//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Loader.hpp
/// @brief Entry point: parse a YAML input into Documents with provenance.
///
/// @details A Loader wires the pipeline for one input:
///
/// 1. **Composition** - yaml-cpp events become a Node graph (Composer)
/// 2. **Resolution** - untagged nodes get their YAML 1.1 tag (Resolver)
/// 3. **Construction** - Nodes become Values tagged with Origins and trust
///    (BaseConstructor, or ExtendedConstructor for the custom tags)
/// 4. **Classification** - any failure becomes a ParsingFailedError
///    (ErrorClassifier)
///
/// ## Usage
///
/// ```cpp
/// support::DiagnosticEngine warnings;
/// Loader loader(InputSource(text, "site.yml"),
///               LoaderConfig(DuplicateKeyPolicy::Warn),
///               warnings);
/// Document doc = loader.load();
/// ```
///
/// ## Trust
///
/// Strings are marked TrustedAsTemplate when the configuration says so or,
/// when the configuration is silent, when the input itself carries the
/// marker.  Strings under `!unsafe` are never marked.
///
/// @invariant A Loader parses its input once.
/// @invariant Every failure leaving load()/loadAll() is a ParsingFailedError.
///
/// Ownership/Lifetime: The Loader owns its input and intermediate Nodes;
/// returned Documents are independent of it.  The warning sink must outlive
/// the Loader.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/origin.hpp"
#include "yaml/BaseConstructor.hpp"
#include "yaml/Composer.hpp"
#include "yaml/ErrorClassifier.hpp"
#include "yaml/Errors.hpp"
#include "yaml/InputSource.hpp"
#include "yaml/LoaderConfig.hpp"
#include "yaml/Resolver.hpp"
#include "yaml/Value.hpp"

#include <memory>
#include <string>
#include <vector>

namespace prov::yaml
{

/// @brief Which tag set a Loader accepts.
enum class LoaderKind
{
    GenericTags, ///< YAML 1.1 tags only; custom tags are unknown tags.
    CustomTags,  ///< YAML 1.1 tags plus `!unsafe`, `!vault`, `!vault-encrypted`.
};

/// @brief Parses one input.
class Loader
{
  public:
    /// @param input Text to parse, with optional name and tags.
    /// @param config Duplicate-key policy and trust override.
    /// @param warnings Sink for warnings and deprecations.
    /// @param kind Accepted tag set.
    Loader(InputSource input,
           const LoaderConfig &config,
           support::DiagnosticEngine &warnings,
           LoaderKind kind = LoaderKind::CustomTags);
    ~Loader();

    Loader(const Loader &) = delete;
    Loader &operator=(const Loader &) = delete;

    /// @brief Load a stream holding at most one document.
    /// @details An empty stream yields a null root tagged with the base Origin.
    /// @throws ParsingFailedError on any failure, including a second document.
    /// @throws std::logic_error when the input was already consumed.
    Document load();

    /// @brief Load every document of the stream.
    /// @throws ParsingFailedError on any failure.
    std::vector<Document> loadAll();

    /// @brief load(), reporting a failure as a diagnostic instead of throwing.
    support::Expected<Document> tryLoad();

    /// @brief Origin that node positions are offset against.
    [[nodiscard]] const support::Origin &baseOrigin() const
    {
        return baseOrigin_;
    }

    /// @brief Effective trust decision for this input.
    [[nodiscard]] bool trustedAsTemplate() const
    {
        return trusted_;
    }

    [[nodiscard]] LoaderKind kind() const
    {
        return kind_;
    }

  private:
    void markConsumed();
    Document emptyDocument() const;

    InputSource input_;
    support::Origin baseOrigin_;
    bool trusted_;
    LoaderKind kind_;
    Resolver resolver_;
    Composer composer_;
    std::unique_ptr<BaseConstructor> constructor_;
    ErrorClassifier classifier_;
    bool consumed_{false};
};

/// @brief Load a single document from @p input.
Document loadDocument(InputSource input,
                      const LoaderConfig &config,
                      support::DiagnosticEngine &warnings,
                      LoaderKind kind = LoaderKind::CustomTags);

/// @brief Load a single document from the file at @p path.
/// @return The document, or an error diagnostic when the file cannot be read
///         or parsed.
support::Expected<Document> loadFile(const std::string &path,
                                     const LoaderConfig &config,
                                     support::DiagnosticEngine &warnings,
                                     LoaderKind kind = LoaderKind::CustomTags);

} // namespace prov::yaml
