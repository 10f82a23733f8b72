// File: tests/unit/test_constructor.cpp
// Purpose: Verify construction of YAML 1.1 scalars, collections, merge keys and deprecated tags.
// Key invariants: Unknown tags and malformed values surface as ParsingFailedError.
// Ownership/Lifetime: Values belong to the Document returned by each load.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "YamlTestSupport.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

using namespace prov::support;
using namespace prov::yaml;
using namespace prov::yaml::testing;

namespace
{
bool contains(const std::string &text, const std::string &needle)
{
    return text.find(needle) != std::string::npos;
}
} // namespace

TEST(Constructor, Scalars)
{
    DiagnosticEngine warnings;
    Document doc = loadText("a: 1\n"
                            "b: 1.5\n"
                            "c: true\n"
                            "d: ~\n"
                            "e: hello\n"
                            "f: 0x1F\n"
                            "g: 1:30\n"
                            "h: -.inf\n"
                            "i: 0b101\n"
                            "j: 017\n"
                            "k: 1_000\n"
                            "l: 1:30.5\n"
                            "m: \"1\"\n",
                            warnings);
    const Value &root = *doc.root();
    EXPECT_EQ(root.at("a").asInt(), 1);
    EXPECT_DOUBLE_EQ(root.at("b").asFloat(), 1.5);
    EXPECT_TRUE(root.at("c").asBool());
    EXPECT_TRUE(root.at("d").isNull());
    EXPECT_EQ(root.at("e").asString(), "hello");
    EXPECT_EQ(root.at("f").asInt(), 31);
    EXPECT_EQ(root.at("g").asInt(), 90);
    EXPECT_EQ(root.at("h").asFloat(), -std::numeric_limits<double>::infinity());
    EXPECT_EQ(root.at("i").asInt(), 5);
    EXPECT_EQ(root.at("j").asInt(), 15);
    EXPECT_EQ(root.at("k").asInt(), 1000);
    EXPECT_DOUBLE_EQ(root.at("l").asFloat(), 90.5);
    EXPECT_EQ(root.at("m").asString(), "1");
}

TEST(Constructor, NotANumber)
{
    DiagnosticEngine warnings;
    Document doc = loadText("v: .NaN\n", warnings);
    EXPECT_TRUE(std::isnan(doc.root()->at("v").asFloat()));
}

TEST(Constructor, IntegerRange)
{
    DiagnosticEngine warnings;
    Document doc = loadText("low: -9223372036854775808\n", warnings);
    EXPECT_EQ(doc.root()->at("low").asInt(), std::numeric_limits<int64_t>::min());

    auto failure = loadFailure("high: 9223372036854775808\n");
    ASSERT_TRUE(failure);
    EXPECT_TRUE(contains(failure->message(), "is out of range")) << failure->message();
}

TEST(Constructor, Timestamps)
{
    DiagnosticEngine warnings;
    Document doc = loadText("date: 2001-12-14\n"
                            "stamp: 2001-12-14t21:59:43.10-05:00\n"
                            "utc: 2001-12-15T02:59:43.1Z\n",
                            warnings);
    const Timestamp &date = doc.root()->at("date").asTimestamp();
    EXPECT_FALSE(date.hasTime);
    EXPECT_EQ(date.toString(), "2001-12-14");

    const Timestamp &stamp = doc.root()->at("stamp").asTimestamp();
    EXPECT_EQ(stamp.hour, 21u);
    EXPECT_EQ(stamp.microsecond, 100000u);
    EXPECT_EQ(stamp.utcOffsetMinutes, std::optional<int>(-300));

    EXPECT_EQ(doc.root()->at("utc").asTimestamp().utcOffsetMinutes, std::optional<int>(0));

    auto failure = loadFailure("bad: 2001-02-30\n");
    ASSERT_TRUE(failure);
    EXPECT_TRUE(contains(failure->message(), "invalid timestamp value")) << failure->message();
}

TEST(Constructor, Binary)
{
    DiagnosticEngine warnings;
    Document doc = loadText("data: !!binary aGVsbG8=\n", warnings);
    const Bytes &bytes = doc.root()->at("data").asBinary();
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "hello");

    auto failure = loadFailure("data: !!binary aGVsbG8\n");
    ASSERT_TRUE(failure);
    EXPECT_TRUE(contains(failure->message(), "base64")) << failure->message();
}

TEST(Constructor, ExplicitTagsOverrideResolution)
{
    DiagnosticEngine warnings;
    Document doc = loadText("a: !!str 123\nb: !!int \"7\"\nc: !!float 2\n", warnings);
    EXPECT_EQ(doc.root()->at("a").asString(), "123");
    EXPECT_EQ(doc.root()->at("b").asInt(), 7);
    EXPECT_DOUBLE_EQ(doc.root()->at("c").asFloat(), 2.0);
}

TEST(Constructor, MergeKeysPreferOwnEntries)
{
    DiagnosticEngine warnings;
    Document doc = loadText("base: &b {x: 1, y: 2}\n"
                            "derived:\n"
                            "  <<: *b\n"
                            "  y: 3\n",
                            warnings,
                            LoaderConfig(DuplicateKeyPolicy::Warn));
    const Value &derived = doc.root()->at("derived");
    EXPECT_EQ(derived.size(), 2u);
    EXPECT_EQ(derived.at("x").asInt(), 1);
    EXPECT_EQ(derived.at("y").asInt(), 3);
    EXPECT_EQ(warnings.warningCount(), 0u);
}

TEST(Constructor, MergeListEarlierSourcesWin)
{
    DiagnosticEngine warnings;
    Document doc = loadText("a: &a {k: 1}\n"
                            "b: &b {k: 2, j: 3}\n"
                            "c:\n"
                            "  <<: [*a, *b]\n",
                            warnings);
    const Value &c = doc.root()->at("c");
    EXPECT_EQ(c.at("k").asInt(), 1);
    EXPECT_EQ(c.at("j").asInt(), 3);
}

TEST(Constructor, MergeRejectsNonMappings)
{
    auto inList = loadFailure("a:\n  <<:\n    - 1\n");
    ASSERT_TRUE(inList);
    EXPECT_TRUE(contains(inList->message(), "expected a mapping for merging, but found scalar"))
        << inList->message();
    EXPECT_EQ(inList->origin().lineNum(), 3u);

    auto scalar = loadFailure("a:\n  <<:\n    1\n");
    ASSERT_TRUE(scalar);
    EXPECT_TRUE(contains(scalar->message(), "expected a mapping or list of mappings for merging"))
        << scalar->message();
}

TEST(Constructor, ValueKeyIsAString)
{
    DiagnosticEngine warnings;
    Document doc = loadText("=: a\n", warnings);
    const Value *key = doc.root()->asMapping().begin()->first;
    EXPECT_EQ(key->asString(), "=");
}

TEST(Constructor, Set)
{
    DiagnosticEngine warnings;
    Document doc = loadText("!!set {a, b}\n", warnings);
    ASSERT_EQ(doc.root()->kind(), ValueKind::Set);
    EXPECT_EQ(doc.root()->size(), 2u);
    EXPECT_TRUE(doc.root()->asMapping().contains(Value::string("b")));
}

TEST(Constructor, OrderedMapIsDeprecated)
{
    DiagnosticEngine warnings;
    Document doc = loadText("!!omap [{a: 1}, {b: 2}]\n", warnings);
    const Value &root = *doc.root();
    ASSERT_EQ(root.kind(), ValueKind::Sequence);
    ASSERT_EQ(root.size(), 2u);
    EXPECT_EQ(root.at(std::size_t{1}).at(std::size_t{0}).asString(), "b");
    EXPECT_EQ(root.at(std::size_t{1}).at(std::size_t{1}).asInt(), 2);

    ASSERT_EQ(warnings.deprecationCount(), 1u);
    const Diagnostic &diag = warnings.diagnostics().front();
    EXPECT_EQ(diag.message, "Use of the YAML `!!omap` tag is deprecated.");
    EXPECT_EQ(diag.version, std::optional<std::string>("2.0"));
    EXPECT_EQ(diag.origin, at(1, 1));
}

TEST(Constructor, UnknownTag)
{
    auto failure = loadFailure("!unsafe foo\n", LoaderConfig(DuplicateKeyPolicy::Error), LoaderKind::GenericTags);
    ASSERT_TRUE(failure);
    EXPECT_EQ(failure->message(), "Could not determine a constructor for the tag '!unsafe'.");
    EXPECT_EQ(failure->origin(), at(1, 1));
}

TEST(Constructor, NodeKindMismatch)
{
    auto failure = loadFailure("!!map [1]\n");
    ASSERT_TRUE(failure);
    EXPECT_EQ(failure->message(), "Expected a mapping node, but found sequence.");
}

TEST(Constructor, RecursiveCollections)
{
    DiagnosticEngine warnings;
    Document doc = loadText("&a [*a]\n", warnings);
    EXPECT_EQ(&doc.root()->at(std::size_t{0}), doc.root());

    auto failure = loadFailure("&a !unsafe [*a]\n");
    ASSERT_TRUE(failure);
    EXPECT_EQ(failure->message(), "Found unconstructable recursive node.");
}

TEST(Constructor, LongPlainScalars)
{
    const std::string digits(100000, '2');
    DiagnosticEngine warnings;
    Document doc = loadText("a: 1" + digits + "x\n", warnings);
    EXPECT_EQ(doc.root()->at("a").asString(), "1" + digits + "x");

    auto failure = loadFailure("a: 1" + digits + "\n");
    ASSERT_TRUE(failure);
    EXPECT_TRUE(contains(failure->message(), "is out of range"));

    auto stamp = loadFailure("a: !!timestamp 2001-12-14 " + digits + "\n");
    ASSERT_TRUE(stamp);
    EXPECT_TRUE(contains(stamp->message(), "invalid timestamp value"));
}
