// File: tests/unit/test_value.cpp
// Purpose: Verify value equality, hashing, mapping keys and rendering.
// Key invariants: Numeric keys compare across bool/int/float; the first key object is kept.
// Ownership/Lifetime: Values live in a Document arena or on the stack.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "yaml/Value.hpp"

#include <stdexcept>
#include <variant>

using namespace prov::support;
using namespace prov::yaml;

TEST(Value, NumericEqualityAcrossKinds)
{
    const Value one = Value::integer(1);
    EXPECT_EQ(one, Value::real(1.0));
    EXPECT_EQ(one, Value::boolean(true));
    EXPECT_EQ(hashValue(one), hashValue(Value::real(1.0)));
    EXPECT_EQ(hashValue(one), hashValue(Value::boolean(true)));
    EXPECT_FALSE(one == Value::string("1"));
}

TEST(Value, EqualityIgnoresTags)
{
    Value a = Value::string("x");
    Value b = Value::string("x");
    tag(a, {Origin(std::string("a.yml"), 3), TrustedAsTemplate{}});
    EXPECT_EQ(a, b);
}

TEST(Mapping, KeepsFirstKeyAndLastValue)
{
    Document doc;
    Value &first = doc.make(Value::string("a"));
    tag(first, {Origin(std::string("m.yml"), 1, 1u)});
    Value &second = doc.make(Value::string("a"));
    tag(second, {Origin(std::string("m.yml"), 2, 1u)});

    Mapping map;
    EXPECT_TRUE(map.insertOrAssign(&first, &doc.make(Value::integer(1))));
    EXPECT_FALSE(map.insertOrAssign(&second, &doc.make(Value::integer(2))));

    ASSERT_EQ(map.size(), 1u);
    EXPECT_EQ(map.findKey(second), &first);
    EXPECT_EQ(map.find("a")->asInt(), 2);
}

TEST(Mapping, NumericKeysAddressTheSameEntry)
{
    Document doc;
    Mapping map;
    map.insertOrAssign(&doc.make(Value::integer(1)), &doc.make(Value::string("one")));
    ASSERT_NE(map.find(Value::real(1.0)), nullptr);
    EXPECT_EQ(map.find(Value::real(1.0))->asString(), "one");
    EXPECT_TRUE(map.contains(Value::boolean(true)));
    EXPECT_FALSE(map.contains(Value::integer(2)));
}

TEST(Value, CollectionsAreNotHashable)
{
    EXPECT_FALSE(Value::sequence().isHashable());
    EXPECT_FALSE(Value::mapping().isHashable());
    EXPECT_TRUE(Value::string("x").isHashable());
    EXPECT_THROW((void)hashValue(Value::sequence()), std::invalid_argument);
}

TEST(Value, AccessorsRejectWrongKindsAndMissingEntries)
{
    Document doc;
    Value &root = doc.make(Value::mapping());
    root.asMapping().insertOrAssign(&doc.make(Value::string("k")), &doc.make(Value::integer(5)));

    EXPECT_EQ(root.at("k").asInt(), 5);
    EXPECT_THROW((void)root.at("missing"), std::out_of_range);
    EXPECT_THROW((void)root.at("k").asString(), std::bad_variant_access);
    EXPECT_THROW((void)Value::sequence().at(std::size_t{0}), std::out_of_range);
}

TEST(Value, ReprQuotesStringsAndMarksFloats)
{
    Document doc;
    Value &root = doc.make(Value::mapping());
    Value &list = doc.make(Value::sequence());
    list.asSequence().push_back(&doc.make(Value::real(1.0)));
    list.asSequence().push_back(&doc.make(Value::boolean(false)));
    list.asSequence().push_back(&doc.make(Value::null()));
    root.asMapping().insertOrAssign(&doc.make(Value::string("it's")), &list);

    EXPECT_EQ(repr(root), "{'it\\'s': [1.0, false, null]}");
    EXPECT_EQ(repr(Value::real(0.5)), "0.5");
    EXPECT_EQ(repr(Value::integer(-3)), "-3");
}

TEST(Value, TimestampRendersIso8601)
{
    Timestamp ts;
    ts.year = 2001;
    ts.month = 12;
    ts.day = 14;
    EXPECT_EQ(ts.toString(), "2001-12-14");

    ts.hasTime = true;
    ts.hour = 21;
    ts.minute = 59;
    ts.second = 43;
    ts.microsecond = 100000;
    ts.utcOffsetMinutes = -300;
    EXPECT_EQ(ts.toString(), "2001-12-14T21:59:43.100000-05:00");
}

TEST(Value, TrustOnlyFitsStringsAndCiphertext)
{
    const Tag trusted = TrustedAsTemplate{};
    EXPECT_TRUE(canCarry(Value::string("x"), trusted));
    EXPECT_TRUE(canCarry(Value::encrypted(EncryptedString{"c"}), trusted));
    EXPECT_FALSE(canCarry(Value::integer(1), trusted));
    EXPECT_FALSE(canCarry(Value::mapping(), trusted));
    EXPECT_TRUE(canCarry(Value::mapping(), Tag(Origin())));
}

TEST(Document, MoveKeepsValuesAlive)
{
    Document a;
    a.setRoot(&a.make(Value::string("kept")));
    Document b = std::move(a);
    ASSERT_NE(b.root(), nullptr);
    EXPECT_EQ(b.root()->asString(), "kept");
    EXPECT_EQ(b.valueCount(), 1u);

    Document c;
    c.setRoot(&c.make(Value::string("kept")));
    EXPECT_TRUE(b == c);
}
