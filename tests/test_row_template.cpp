#include <gtest/gtest.h>

#include "core/row_template.hpp"

using dash::FeedValue;
using dash::RowTemplate;

namespace
{
    RowTemplate compiled(const char *text)
    {
        RowTemplate t;
        EXPECT_EQ(RowTemplate::compile(text, t), ESP_OK) << text;
        return t;
    }

    std::string apply(const char *text, const FeedValue &v)
    {
        std::string out;
        EXPECT_TRUE(compiled(text).format(v, out)) << text;
        return out;
    }
}

TEST(RowTemplate, RejectsZeroOrSeveralConversions)
{
    RowTemplate t;
    EXPECT_EQ(RowTemplate::compile("Lamp", t), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(RowTemplate::compile("100%%", t), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(RowTemplate::compile("%s / %s", t), ESP_ERR_INVALID_ARG);
}

TEST(RowTemplate, RejectsUnsupportedSpecifiers)
{
    RowTemplate t;
    EXPECT_EQ(RowTemplate::compile("%*d", t), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(RowTemplate::compile("%ld", t), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(RowTemplate::compile("%n", t), ESP_ERR_INVALID_ARG);
    EXPECT_EQ(RowTemplate::compile("trailing %", t), ESP_ERR_INVALID_ARG);
}

TEST(RowTemplate, PercentLiteralsAroundTheConversion)
{
    EXPECT_EQ(apply("Humidity: %.2f%%", FeedValue::number(44.0)), "Humidity: 44.00%");
    EXPECT_EQ(apply("%%%d", FeedValue::number(5)), "%5");
}

TEST(RowTemplate, StringConversionUsesRawForm)
{
    EXPECT_EQ(apply("Lamp: %s", FeedValue::boolean(false)), "Lamp: False");
    EXPECT_EQ(apply("Door: %s", FeedValue::text("open")), "Door: open");
    EXPECT_EQ(apply("[%5s]", FeedValue::text("ab")), "[   ab]");
}

TEST(RowTemplate, FloatConversions)
{
    EXPECT_EQ(apply("Temperature: %.1f C", FeedValue::number(21.5)), "Temperature: 21.5 C");
    EXPECT_EQ(apply("%.0f", FeedValue::boolean(true)), "1");
    EXPECT_EQ(apply("%e", FeedValue::number(0)), "0.000000e+00");
}

TEST(RowTemplate, IntegerConversionsNeedIntegralValues)
{
    EXPECT_EQ(apply("Battery: %d %%", FeedValue::number(87)), "Battery: 87 %");
    EXPECT_EQ(apply("%x", FeedValue::number(255)), "ff");
    EXPECT_EQ(apply("%03d", FeedValue::boolean(true)), "001");

    RowTemplate t = compiled("%d");
    std::string out = "untouched";
    EXPECT_FALSE(t.format(FeedValue::number(1.5), out));
    EXPECT_EQ(out, "untouched");

    EXPECT_FALSE(compiled("%u").format(FeedValue::number(-1), out));
}

TEST(RowTemplate, TextIntoNumericConversionIsAMismatch)
{
    std::string out;
    EXPECT_FALSE(compiled("%.1f").format(FeedValue::text("n/a"), out));
    EXPECT_FALSE(compiled("%d").format(FeedValue::text("12"), out));
}

TEST(RowTemplate, UnsetValueDoesNotFormat)
{
    std::string out;
    EXPECT_FALSE(compiled("%s").format(FeedValue(), out));
}

TEST(RowTemplate, KeepsSourceAndConversion)
{
    RowTemplate t = compiled("T=%-6.2f|");
    EXPECT_EQ(t.source(), "T=%-6.2f|");
    EXPECT_EQ(t.conversion(), 'f');
    EXPECT_EQ(apply("T=%-6.2f|", FeedValue::number(1.5)), "T=1.50  |");
}
