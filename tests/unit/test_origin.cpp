// File: tests/unit/test_origin.cpp
// Purpose: Verify Origin normalization, replacement and formatting.
// Key invariants: Lines are never 0; a 0 column means "no column".
// Ownership/Lifetime: Tests construct origins by value.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "support/origin.hpp"

#include <sstream>

using namespace prov::support;

TEST(Origin, DefaultsToUnknownDocumentLineOne)
{
    Origin origin;
    EXPECT_FALSE(origin.path().has_value());
    EXPECT_EQ(origin.lineNum(), 1u);
    EXPECT_FALSE(origin.colNum().has_value());
    EXPECT_EQ(origin.toString(), "<unknown>:1");
}

TEST(Origin, NormalizesZeroLineAndColumn)
{
    Origin origin(std::string("a.yml"), 0, 0u);
    EXPECT_EQ(origin.lineNum(), 1u);
    EXPECT_FALSE(origin.colNum().has_value());
}

TEST(Origin, ReplaceOverridesOnlySetFields)
{
    const Origin base(std::string("site.yml"), 10);
    const Origin moved = base.replace(OriginUpdate{.lineNum = 12u, .colNum = 4u});

    EXPECT_EQ(moved.path(), std::optional<std::string>("site.yml"));
    EXPECT_EQ(moved.lineNum(), 12u);
    EXPECT_EQ(moved.colNum(), std::optional<uint32_t>(4));
    EXPECT_EQ(base.lineNum(), 10u);
    EXPECT_FALSE(base.colNum().has_value());

    const Origin renamed = moved.replace(OriginUpdate{.path = std::string("other.yml")});
    EXPECT_EQ(renamed.toString(), "other.yml:12:4");
}

TEST(Origin, WithColumnCanDropTheColumn)
{
    const Origin origin(std::string("a.yml"), 3, 7u);
    EXPECT_EQ(origin.withColumn(2u).toString(), "a.yml:3:2");
    EXPECT_EQ(origin.withColumn(std::nullopt).toString(), "a.yml:3");
}

TEST(Origin, EqualityComparesAllFields)
{
    EXPECT_EQ(Origin(std::string("a"), 1, 2u), Origin(std::string("a"), 1, 2u));
    EXPECT_NE(Origin(std::string("a"), 1, 2u), Origin(std::string("a"), 1, 3u));
    EXPECT_NE(Origin(std::string("a"), 1), Origin(std::nullopt, 1));
}

TEST(Origin, StreamsAsString)
{
    std::ostringstream os;
    os << Origin(std::string("x.yml"), 2, 5u);
    EXPECT_EQ(os.str(), "x.yml:2:5");
}
