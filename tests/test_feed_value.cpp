#include <gtest/gtest.h>

#include <cstring>

#include "core/feed_value.hpp"

using dash::FeedValue;

namespace
{
    FeedValue parse(const char *s)
    {
        return FeedValue::parse(s, static_cast<int>(std::strlen(s)));
    }
}

TEST(FeedValue, DefaultIsUnset)
{
    FeedValue v;
    EXPECT_FALSE(v.is_set());
    EXPECT_EQ(v.kind(), FeedValue::Kind::None);
    EXPECT_FALSE(v.as_bool());
}

TEST(FeedValue, BooleansParseInAnyCase)
{
    EXPECT_EQ(parse("True").kind(), FeedValue::Kind::Bool);
    EXPECT_TRUE(parse("TRUE").as_bool());
    EXPECT_FALSE(parse("false").as_bool());
    EXPECT_EQ(parse("fAlSe").raw(), "False");
}

TEST(FeedValue, NumbersKeepTheirWireText)
{
    FeedValue v = parse("44.0");
    ASSERT_EQ(v.kind(), FeedValue::Kind::Number);
    EXPECT_DOUBLE_EQ(v.as_number(), 44.0);
    EXPECT_EQ(v.raw(), "44.0");

    EXPECT_DOUBLE_EQ(parse("-3").as_number(), -3.0);
    EXPECT_DOUBLE_EQ(parse("1e3").as_number(), 1000.0);
}

TEST(FeedValue, NonDecimalPayloadsAreText)
{
    EXPECT_EQ(parse("12abc").kind(), FeedValue::Kind::Text);
    EXPECT_EQ(parse(" 5").kind(), FeedValue::Kind::Text);
    EXPECT_EQ(parse("inf").kind(), FeedValue::Kind::Text);
    EXPECT_EQ(parse("nan").kind(), FeedValue::Kind::Text);
    EXPECT_EQ(parse("0x10").kind(), FeedValue::Kind::Text);
    EXPECT_EQ(parse("-").kind(), FeedValue::Kind::Text);
}

TEST(FeedValue, EmptyPayloadIsEmptyText)
{
    FeedValue v = FeedValue::parse(nullptr, 0);
    EXPECT_TRUE(v.is_set());
    EXPECT_EQ(v.kind(), FeedValue::Kind::Text);
    EXPECT_EQ(v.raw(), "");
}

TEST(FeedValue, PayloadIsBoundedByLength)
{
    const char buf[] = "12345";
    FeedValue v = FeedValue::parse(buf, 2);
    EXPECT_EQ(v.raw(), "12");
}

TEST(FeedValue, Truthiness)
{
    EXPECT_TRUE(FeedValue::number(2).as_bool());
    EXPECT_FALSE(FeedValue::number(0).as_bool());
    EXPECT_TRUE(FeedValue::text("On").as_bool());
    EXPECT_TRUE(FeedValue::text("1").as_bool());
    EXPECT_FALSE(FeedValue::text("off").as_bool());
}

TEST(FeedValue, LocalNumbersUseShortestForm)
{
    EXPECT_EQ(FeedValue::number(21.5).raw(), "21.5");
    EXPECT_EQ(FeedValue::number(3).raw(), "3");
}

TEST(FeedValue, EqualityComparesKindAndValue)
{
    EXPECT_EQ(parse("1.0"), FeedValue::number(1));
    EXPECT_NE(FeedValue::boolean(true), FeedValue::number(1));
    EXPECT_NE(FeedValue::text("a"), FeedValue::text("b"));
    EXPECT_EQ(FeedValue(), FeedValue());
}
