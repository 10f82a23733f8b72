//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the Loader.  All failures of composition and construction are
// caught at this boundary and translated by the ErrorClassifier, so callers
// only ever see ParsingFailedError (or a diagnostic from tryLoad()).
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Loader assembly and the file/string entry points.

#include "yaml/Loader.hpp"
#include "yaml/ExtendedConstructor.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace prov::yaml
{
namespace
{
std::unique_ptr<BaseConstructor> makeConstructor(LoaderKind kind,
                                                 DuplicateKeyPolicy policy,
                                                 bool trusted,
                                                 const Resolver &resolver,
                                                 support::DiagnosticEngine &warnings,
                                                 const support::Origin &baseOrigin)
{
    std::unique_ptr<BaseConstructor> constructor;
    if (kind == LoaderKind::CustomTags)
        constructor = std::make_unique<ExtendedConstructor>(policy, trusted, resolver, warnings, baseOrigin);
    else
        constructor = std::make_unique<BaseConstructor>(policy, trusted, resolver, warnings, baseOrigin);
    constructor->registerTagHandlers();
    return constructor;
}
} // namespace

/// @brief Assemble the pipeline for @p input.
/// @details The base Origin is the input's own Origin tag when present, else
///          line 1 of the input's name.  An explicit trust setting in
///          @p config takes precedence over the input's TrustedAsTemplate tag.
Loader::Loader(InputSource input,
               const LoaderConfig &config,
               support::DiagnosticEngine &warnings,
               LoaderKind kind)
    : input_(std::move(input)), baseOrigin_(support::getOrCreateOrigin(input_, input_.name())),
      trusted_(config.trustedAsTemplate.value_or(support::isTaggedOn<support::TrustedAsTemplate>(input_))),
      kind_(kind), composer_(input_.text(), resolver_),
      constructor_(makeConstructor(kind, config.duplicateKeyPolicy, trusted_, resolver_, warnings, baseOrigin_)),
      classifier_(input_.text(), baseOrigin_)
{
}

Loader::~Loader() = default;

void Loader::markConsumed()
{
    if (consumed_)
        throw std::logic_error("a Loader parses its input only once");
    consumed_ = true;
}

Document Loader::emptyDocument() const
{
    Document document;
    Value &root = document.make(Value::null());
    root.tags().apply(baseOrigin_);
    document.setRoot(&root);
    return document;
}

Document Loader::load()
{
    markConsumed();
    try
    {
        ComposedDocument first;
        if (!composer_.nextDocument(first))
            return emptyDocument();

        ComposedDocument extra;
        if (composer_.nextDocument(extra))
            throw MarkedYamlError("expected a single document in the stream",
                                  first.startMark,
                                  "but found another document",
                                  extra.startMark);

        Document document;
        constructor_->constructDocument(*first.root, document);
        return document;
    }
    catch (const std::exception &ex)
    {
        throw classifier_.translate(ex, std::current_exception());
    }
}

std::vector<Document> Loader::loadAll()
{
    markConsumed();
    std::vector<Document> documents;
    try
    {
        ComposedDocument composed;
        while (composer_.nextDocument(composed))
        {
            Document document;
            constructor_->constructDocument(*composed.root, document);
            documents.push_back(std::move(document));
        }
    }
    catch (const std::exception &ex)
    {
        throw classifier_.translate(ex, std::current_exception());
    }
    return documents;
}

support::Expected<Document> Loader::tryLoad()
{
    try
    {
        return load();
    }
    catch (const ParsingFailedError &err)
    {
        return err.toDiagnostic();
    }
}

Document loadDocument(InputSource input,
                      const LoaderConfig &config,
                      support::DiagnosticEngine &warnings,
                      LoaderKind kind)
{
    Loader loader(std::move(input), config, warnings, kind);
    return loader.load();
}

/// @brief Read @p path and load its single document.
/// @details The path names the document in every Origin.
support::Expected<Document> loadFile(const std::string &path,
                                     const LoaderConfig &config,
                                     support::DiagnosticEngine &warnings,
                                     LoaderKind kind)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
        return support::makeError(support::Origin(path), "Failed to open file: " + path);

    std::stringstream buffer;
    buffer << file.rdbuf();

    Loader loader(InputSource(buffer.str(), path), config, warnings, kind);
    return loader.tryLoad();
}

} // namespace prov::yaml
