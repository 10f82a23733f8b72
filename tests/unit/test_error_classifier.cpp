// File: tests/unit/test_error_classifier.cpp
// Purpose: Verify the line heuristics and message rewriting applied to parse errors.
// Key invariants: Structural errors keep their message; heuristics only adjust the column.
// Ownership/Lifetime: Classifiers copy the source text they inspect.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "YamlTestSupport.hpp"
#include "yaml/ErrorClassifier.hpp"

#include <stdexcept>
#include <string>

using namespace prov::support;
using namespace prov::yaml;
using namespace prov::yaml::testing;

namespace
{
const char *kTemplateMessage = "This may be an issue with missing quotes around a template block.";
const char *kUnclosedQuoteMessage = "Values starting with a quote must end with the same quote.";
} // namespace

TEST(ErrorClassifier, UnquotedTemplateColumn)
{
    auto bare = ErrorClassifier::inspectLine("{{ bar }}");
    ASSERT_TRUE(bare);
    EXPECT_EQ(bare->column, 1u);
    EXPECT_EQ(bare->message, kTemplateMessage);

    auto keyed = ErrorClassifier::inspectLine("raw: {{ bar }}");
    ASSERT_TRUE(keyed);
    EXPECT_EQ(keyed->column, 6u);

    auto listed = ErrorClassifier::inspectLine("- raw: {{ bar }}");
    ASSERT_TRUE(listed);
    EXPECT_EQ(listed->column, 8u);
}

TEST(ErrorClassifier, TabColumn)
{
    auto finding = ErrorClassifier::inspectLine("foo:\tbar");
    ASSERT_TRUE(finding);
    EXPECT_EQ(finding->column, 5u);
    EXPECT_EQ(finding->message, "Tabs are usually invalid in YAML.");
    EXPECT_FALSE(finding->help.has_value());
}

TEST(ErrorClassifier, ColonInUnquotedValue)
{
    auto finding = ErrorClassifier::inspectLine("raw: echo 'name: value'");
    ASSERT_TRUE(finding);
    EXPECT_EQ(finding->column, 16u);
    EXPECT_EQ(finding->message, "Colons in unquoted values must be followed by a non-space character.");

    EXPECT_FALSE(ErrorClassifier::inspectLine("raw: \"echo 'name: value'\""));
    EXPECT_FALSE(ErrorClassifier::inspectLine("url: http://example.com"));
    EXPECT_FALSE(ErrorClassifier::inspectLine(": foo"));
}

TEST(ErrorClassifier, QuoteMismatch)
{
    auto unclosed = ErrorClassifier::inspectLine("raw: \"foo\" in bar");
    ASSERT_TRUE(unclosed);
    EXPECT_EQ(unclosed->column, 6u);
    EXPECT_EQ(unclosed->message, kUnclosedQuoteMessage);

    auto reused = ErrorClassifier::inspectLine("raw: \"foo\" in \"bar\"");
    ASSERT_TRUE(reused);
    EXPECT_EQ(reused->column, 6u);
    EXPECT_EQ(reused->message,
              "Values starting with a quote must end with the same quote, and not contain that quote.");

    EXPECT_FALSE(ErrorClassifier::inspectLine("a: b"));
    EXPECT_FALSE(ErrorClassifier::inspectLine("a: 'b'"));
}

TEST(ErrorClassifier, NormalizesMessages)
{
    EXPECT_EQ(ErrorClassifier::normalizeMessage("  found   unhashable\nkey "), "Found unhashable key.");
    EXPECT_EQ(ErrorClassifier::normalizeMessage("Done."), "Done.");
    EXPECT_EQ(ErrorClassifier::normalizeMessage(""), "Unknown error.");
}

TEST(ErrorClassifier, UnmarkedErrorsUseBaseOrigin)
{
    const Origin base(std::string("f.yml"), 10);
    ErrorClassifier classifier("a: 1\n", base);

    Classification plain = classifier.classify(std::runtime_error("boom"));
    EXPECT_EQ(plain.message, "Boom.");
    EXPECT_EQ(plain.origin, base);

    Classification unmarked = classifier.classify(MarkedYamlError("while x", std::nullopt, "bad thing", std::nullopt));
    EXPECT_EQ(unmarked.origin, base);
}

TEST(ErrorClassifier, MarkedErrorsAreOffsetByBaseOrigin)
{
    ErrorClassifier classifier("x: 1\nraw: {{ bar }}\n", Origin(std::string("f.yml"), 10));
    Classification c = classifier.classify(MarkedYamlError({}, std::nullopt, "whatever", Mark{0, 1, 5}));
    EXPECT_EQ(c.message, kTemplateMessage);
    EXPECT_EQ(c.origin, Origin(std::string("f.yml"), 11, 6u));
    ASSERT_TRUE(c.help);
    EXPECT_NE(c.help->find("Should be:"), std::string::npos);
}

TEST(ErrorClassifier, TabOnMarkedLine)
{
    ErrorClassifier classifier("a:\n  b:\tc\n", Origin(std::string("f.yml"), 1));
    Classification c = classifier.classify(MarkedYamlError({}, std::nullopt, "found character", Mark{3, 1, 0}));
    EXPECT_EQ(c.message, "Tabs are usually invalid in YAML.");
    EXPECT_EQ(c.origin, Origin(std::string("f.yml"), 2, 5u));
}

TEST(ErrorClassifier, StructuralErrorsSkipHeuristics)
{
    ErrorClassifier classifier("raw: {{ bar }}\n", Origin(std::string("f.yml"), 1));
    Classification c =
        classifier.classify(StructuralConstructionError({}, std::nullopt, "found duplicate thing", Mark{2, 0, 2}));
    EXPECT_EQ(c.message, "Found duplicate thing.");
    EXPECT_EQ(c.origin, Origin(std::string("f.yml"), 1, 3u));
    EXPECT_FALSE(c.help.has_value());
}

TEST(ErrorClassifier, FallbackJoinsContextProblemAndNote)
{
    ErrorClassifier classifier("a: 1\n", Origin(std::string("f.yml"), 1));
    Classification c = classifier.classify(
        MarkedYamlError("while scanning", Mark{0, 0, 0}, "found oddity", Mark{3, 0, 3}, "see docs"));
    EXPECT_EQ(c.message, "While scanning found oddity see docs.");
    EXPECT_EQ(c.origin, Origin(std::string("f.yml"), 1, 4u));
}

TEST(ErrorClassifier, LoaderReportsTemplateColumn)
{
    auto bare = loadFailure("{{ bar }}\n");
    ASSERT_TRUE(bare);
    EXPECT_EQ(bare->message(), kTemplateMessage);
    EXPECT_EQ(bare->origin(), at(1, 1));

    auto keyed = loadFailure("raw: {{ bar }}\n");
    ASSERT_TRUE(keyed);
    EXPECT_EQ(keyed->message(), kTemplateMessage);
    EXPECT_EQ(keyed->origin(), at(1, 6));
}

TEST(ErrorClassifier, LoaderReportsUnclosedQuote)
{
    auto failure = loadFailure("raw: \"foo\" in bar\n");
    ASSERT_TRUE(failure);
    EXPECT_EQ(failure->message(), kUnclosedQuoteMessage);
    EXPECT_EQ(failure->origin(), at(1, 6));
    EXPECT_NE(failure->sourceContext().find("1 raw: \"foo\" in bar"), std::string::npos);
}

TEST(ErrorClassifier, LongLines)
{
    const std::string filler(100000, 'x');
    auto colon = ErrorClassifier::inspectLine("a: b: " + filler);
    ASSERT_TRUE(colon);
    EXPECT_EQ(colon->column, 5u);

    auto block = ErrorClassifier::inspectLine("raw: {{ " + filler + " }}");
    ASSERT_TRUE(block);
    EXPECT_EQ(block->column, 6u);
    EXPECT_EQ(block->message, kTemplateMessage);

    auto unclosed = ErrorClassifier::inspectLine("raw: \"" + filler);
    ASSERT_TRUE(unclosed);
    EXPECT_EQ(unclosed->column, 6u);
    EXPECT_EQ(unclosed->message, kUnclosedQuoteMessage);

    EXPECT_FALSE(ErrorClassifier::inspectLine("raw: " + filler));
}

TEST(ErrorClassifier, LoaderReportsColonOnLongLine)
{
    auto failure = loadFailure("a: b: " + std::string(100000, 'x') + "\n");
    ASSERT_TRUE(failure);
    EXPECT_EQ(failure->message(), "Colons in unquoted values must be followed by a non-space character.");
    EXPECT_EQ(failure->origin(), at(1, 5));
}
