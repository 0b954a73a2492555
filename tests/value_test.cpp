#include <gtest/gtest.h>
#include "value.h"

TEST(ValueTest, NumberEqualsNumericText) {
    EXPECT_TRUE(Value::compareValues(Value::number(1), Value::text("1")));
    EXPECT_TRUE(Value::compareValues(Value::number(1), Value::text(" 1.0 ")));
    EXPECT_TRUE(Value::compareValues(Value::text("2.50"), Value::number(2.5)));
    EXPECT_FALSE(Value::compareValues(Value::number(1), Value::text("1a")));
}

TEST(ValueTest, EmptyTextEqualsNull) {
    EXPECT_TRUE(Value::compareValues(Value::null(), Value::text("")));
    EXPECT_TRUE(Value::compareValues(Value::null(), Value::text("   ")));
    EXPECT_TRUE(Value::compareValues(Value::text("\t"), Value::text("")));
    EXPECT_FALSE(Value::compareValues(Value::null(), Value::number(0)));
}

TEST(ValueTest, TextIsTrimmed) {
    EXPECT_TRUE(Value::compareValues(Value::text("  Ann "), Value::text("Ann")));
    EXPECT_FALSE(Value::compareValues(Value::text("A nn"), Value::text("Ann")));
}

TEST(ValueTest, ComparisonIsCaseSensitive) {
    EXPECT_FALSE(Value::compareValues(Value::text("Ann"), Value::text("ann")));
    EXPECT_FALSE(Value::compareValues(Value::boolean(true), Value::text("TRUE")));
    EXPECT_TRUE(Value::compareValues(Value::boolean(true), Value::text("true")));
}

TEST(ValueTest, NumbersMatchToFourDecimalPlaces) {
    EXPECT_TRUE(Value::compareValues(Value::number(3.14159265), Value::number(3.14159999)))
        << "Should match at 4 decimal places";
    EXPECT_FALSE(Value::compareValues(Value::number(3.14159265), Value::number(3.14169999)))
        << "Should NOT match at 4 decimal places";
    EXPECT_TRUE(Value::compareValues(Value::number(0.1 + 0.2), Value::text("0.3")));
    EXPECT_TRUE(Value::compareValues(Value::number(-0.0), Value::number(0)));
    EXPECT_TRUE(Value::compareValues(Value::number(-0.00001), Value::number(0)));
}

TEST(ValueTest, NonFiniteTextStaysText) {
    EXPECT_EQ(Value::text("inf").canonical(), "inf");
    EXPECT_EQ(Value::text("nan").canonical(), "nan");
    EXPECT_EQ(Value::text("1e3").canonical(), "1000");
}

TEST(ValueTest, LongDigitStringsStayText) {
    EXPECT_FALSE(Value::compareValues(Value::text("6011000990139424123"),
        Value::text("6011000990139424124")));
    EXPECT_FALSE(Value::compareValues(Value::text("9007199254740993"),
        Value::text("9007199254740992")));
    EXPECT_EQ(Value::text(" 9007199254740993 ").canonical(), "9007199254740993");
    EXPECT_EQ(Value::text("0.12345678901234567").canonical(), "0.12345678901234567");

    // Up to 15 significant digits still read as a number
    EXPECT_TRUE(Value::compareValues(Value::text("123456789012345"), Value::number(123456789012345.0)));
    EXPECT_TRUE(Value::compareValues(Value::text("000000000000000001.5"), Value::number(1.5)));
    EXPECT_TRUE(Value::compareValues(Value::text("1.50000000000000000000"), Value::number(1.5)));
}

TEST(ValueTest, CanonicalForms) {
    EXPECT_EQ(Value::number(1).canonical(), "1");
    EXPECT_EQ(Value::number(1.00001).canonical(), "1");
    EXPECT_EQ(Value::number(-12.5).canonical(), "-12.5");
    EXPECT_EQ(Value::boolean(false).canonical(), "false");
    EXPECT_EQ(Value::null().canonical(), "");
}

TEST(ValueTest, DisplayForms) {
    EXPECT_EQ(Value::number(42).toString(), "42");
    EXPECT_EQ(Value::number(2.5).toString(), "2.5");
    EXPECT_EQ(Value::number(3.14159265).toString(), "3.14159265");
    EXPECT_EQ(Value::text(" padded ").toString(), " padded ");
    EXPECT_EQ(Value::boolean(true).toString(), "true");
    EXPECT_EQ(Value::null().toString(), "");
}

TEST(ValueTest, KindAccessors) {
    EXPECT_EQ(Value().kind(), Value::Kind::Null);
    EXPECT_EQ(Value::number(1).kind(), Value::Kind::Number);
    EXPECT_EQ(Value::text("x").asText(), "x");
    EXPECT_TRUE(Value::boolean(true).asBool());
    EXPECT_THROW(Value::text("x").asNumber(), std::bad_variant_access);
}
