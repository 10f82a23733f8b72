// File: tests/unit/test_loader.cpp
// Purpose: Verify end-to-end loading: origins, document handling and error translation.
// Key invariants: Every value carries an Origin; failures surface as ParsingFailedError.
// Ownership/Lifetime: Temporary files are removed by the test that creates them.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "YamlTestSupport.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace prov::support;
using namespace prov::yaml;
using namespace prov::yaml::testing;

namespace
{
const Value &keyNamed(const Value &mapping, std::string_view name)
{
    return *mapping.asMapping().findKey(Value::string(std::string(name)));
}
} // namespace

TEST(Loader, BlockMappingOrigins)
{
    DiagnosticEngine warnings;
    Document doc = loadText("webster: daniel\noed: oxford\n", warnings);
    const Value &root = *doc.root();
    EXPECT_EQ(originOf(root), at(1, 1));
    EXPECT_EQ(originOf(keyNamed(root, "webster")), at(1, 1));
    EXPECT_EQ(originOf(root.at("webster")), at(1, 10));
    EXPECT_EQ(originOf(keyNamed(root, "oed")), at(2, 1));
    EXPECT_EQ(originOf(root.at("oed")), at(2, 6));
}

TEST(Loader, FlowMappingOrigins)
{
    DiagnosticEngine warnings;
    Document doc = loadText("\n    {\"webster\": \"daniel\",\n    \"oed\": \"oxford\"}\n", warnings);
    const Value &root = *doc.root();
    EXPECT_EQ(originOf(root), at(2, 5));
    EXPECT_EQ(originOf(keyNamed(root, "webster")), at(2, 6));
    EXPECT_EQ(originOf(root.at("webster")), at(2, 17));
    EXPECT_EQ(originOf(keyNamed(root, "oed")), at(3, 5));
    EXPECT_EQ(originOf(root.at("oed")), at(3, 12));
}

TEST(Loader, DocumentMarkerShiftsLines)
{
    DiagnosticEngine warnings;
    Document doc = loadText("---\nfoo: bar\n", warnings);
    EXPECT_EQ(originOf(*doc.root()), at(2, 1));
    EXPECT_EQ(originOf(doc.root()->at("foo")), at(2, 6));
}

TEST(Loader, NestedSequenceOrigins)
{
    DiagnosticEngine warnings;
    Document doc = loadText(" - foo: bar\n   baz: qux\n", warnings);
    const Value &seq = *doc.root();
    EXPECT_EQ(originOf(seq), at(1, 2));
    const Value &map = seq.at(std::size_t{0});
    EXPECT_EQ(originOf(map), at(1, 4));
    EXPECT_EQ(originOf(map.at("foo")), at(1, 9));
    EXPECT_EQ(originOf(map.at("baz")), at(2, 9));
}

TEST(Loader, BaseOriginOffsetsLinesNotColumns)
{
    InputSource input("a: b\nc: d\n", std::string("ignored.yml"));
    tag(input, {Origin(std::string("play.yml"), 10)});
    DiagnosticEngine warnings;
    Loader loader(std::move(input), LoaderConfig(DuplicateKeyPolicy::Error), warnings);
    EXPECT_EQ(loader.baseOrigin(), Origin(std::string("play.yml"), 10));

    Document doc = loader.load();
    EXPECT_EQ(originOf(doc.root()->at("a")).toString(), "play.yml:10:4");
    EXPECT_EQ(originOf(doc.root()->at("c")).toString(), "play.yml:11:4");
}

TEST(Loader, AnonymousInputHasNoPath)
{
    DiagnosticEngine warnings;
    Document doc = loadDocument(InputSource("a: b\n"), LoaderConfig(DuplicateKeyPolicy::Error), warnings);
    EXPECT_EQ(originOf(doc.root()->at("a")).toString(), "<unknown>:1:4");
}

TEST(Loader, ScalarsCarryOrigins)
{
    DiagnosticEngine warnings;
    Document doc = loadText("- 1\n- true\n- 2.5\n", warnings);
    EXPECT_EQ(originOf(doc.root()->at(std::size_t{0})), at(1, 3));
    EXPECT_EQ(originOf(doc.root()->at(std::size_t{1})), at(2, 3));
    EXPECT_EQ(originOf(doc.root()->at(std::size_t{2})), at(3, 3));
}

TEST(Loader, EmptyStreamYieldsNull)
{
    DiagnosticEngine warnings;
    Document doc = loadText("", warnings);
    ASSERT_NE(doc.root(), nullptr);
    EXPECT_TRUE(doc.root()->isNull());
    EXPECT_EQ(originOf(*doc.root()), Origin(std::string(kTestPath), 1));

    Document comments = loadText("# nothing here\n", warnings);
    EXPECT_TRUE(comments.root()->isNull());
}

TEST(Loader, RejectsSecondDocument)
{
    auto failure = loadFailure("a: 1\n---\nb: 2\n");
    ASSERT_TRUE(failure);
    EXPECT_EQ(failure->message(), "Expected a single document in the stream but found another document.");
    EXPECT_EQ(failure->origin(), at(2, 1));
}

TEST(Loader, LoadAllReturnsEveryDocument)
{
    DiagnosticEngine warnings;
    Loader loader(InputSource("a: 1\n---\nb: 2\n", std::string(kTestPath)),
                  LoaderConfig(DuplicateKeyPolicy::Error),
                  warnings);
    std::vector<Document> docs = loader.loadAll();
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs[0].root()->at("a").asInt(), 1);
    EXPECT_EQ(docs[1].root()->at("b").asInt(), 2);
    EXPECT_EQ(originOf(docs[1].root()->at("b")), at(3, 4));
}

TEST(Loader, IsSingleUse)
{
    DiagnosticEngine warnings;
    Loader loader(InputSource("a: 1\n"), LoaderConfig(DuplicateKeyPolicy::Error), warnings);
    (void)loader.load();
    EXPECT_THROW((void)loader.load(), std::logic_error);
}

TEST(Loader, RepeatedLoadsAreEqual)
{
    DiagnosticEngine warnings;
    const std::string text = "a: [1, {b: c}]\nd: !!set {e}\n";
    Document first = loadText(text, warnings);
    Document second = loadText(text, warnings);
    EXPECT_TRUE(first == second);
    EXPECT_EQ(originOf(first.root()->at("a")), originOf(second.root()->at("a")));
}

TEST(Loader, GenericLoaderRejectsCustomTags)
{
    DiagnosticEngine warnings;
    Loader loader(InputSource("!unsafe x\n", std::string(kTestPath)),
                  LoaderConfig(DuplicateKeyPolicy::Error),
                  warnings,
                  LoaderKind::GenericTags);
    EXPECT_EQ(loader.kind(), LoaderKind::GenericTags);
    EXPECT_THROW((void)loader.load(), ParsingFailedError);
}

TEST(Loader, ParsingFailedErrorCarriesCauseAndContext)
{
    auto failure = loadFailure("a: [1, 2\n");
    ASSERT_TRUE(failure);
    EXPECT_EQ(std::string(failure->what()).rfind("YAML parsing failed: ", 0), 0u);
    EXPECT_EQ(failure->sourceContext().rfind("Origin: test.yml:", 0), 0u);

    ASSERT_TRUE(failure->cause());
    try
    {
        std::rethrow_exception(failure->cause());
    }
    catch (const MarkedYamlError &err)
    {
        EXPECT_TRUE(err.problemMark().has_value());
    }

    Diagnostic diag = failure->toDiagnostic();
    EXPECT_EQ(diag.severity, Severity::Error);
    EXPECT_EQ(diag.message, failure->message());
}

TEST(Loader, TryLoadReturnsDiagnostic)
{
    DiagnosticEngine warnings;
    Loader loader(InputSource("{a: 1, a: 2}\n", std::string(kTestPath)),
                  LoaderConfig(DuplicateKeyPolicy::Error),
                  warnings);
    auto result = loader.tryLoad();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().message, "Found duplicate mapping key 'a'.");
    EXPECT_EQ(result.error().origin, std::optional<Origin>(at(1, 8)));
}

TEST(Loader, LoadFileUsesPathAsName)
{
    const auto path = std::filesystem::temp_directory_path() / "prov_loader_test.yml";
    {
        std::ofstream out(path);
        out << "name: value\n";
    }
    DiagnosticEngine warnings;
    auto loaded = loadFile(path.string(), LoaderConfig(DuplicateKeyPolicy::Error), warnings);
    std::filesystem::remove(path);

    ASSERT_TRUE(loaded);
    const Value &value = loaded.value().root()->at("name");
    EXPECT_EQ(value.asString(), "value");
    EXPECT_EQ(originOf(value), Origin(path.string(), 1, 7u));
}

TEST(Loader, LoadFileReportsMissingFile)
{
    DiagnosticEngine warnings;
    auto loaded = loadFile("/nonexistent/prov/missing.yml", LoaderConfig(DuplicateKeyPolicy::Error), warnings);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().message, "Failed to open file: /nonexistent/prov/missing.yml");
}
