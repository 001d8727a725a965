#include "dcvt/decimal.h"

#include <gtest/gtest.h>

#include <string>

using namespace dcvt;

TEST(ParseErrorTest, DefaultIsNoError) {
    const parse_error err;
    EXPECT_EQ(err.code(), parse_errc::ok);
    EXPECT_FALSE(err);
    EXPECT_EQ(err.message(), "no error");
}

TEST(ParseErrorTest, InvalidDigitCarriesByte) {
    const auto err = parse_error::invalid_digit('!');
    EXPECT_TRUE(err);
    EXPECT_EQ(err.code(), parse_errc::invalid_digit);
    EXPECT_EQ(err.byte(), '!');
    EXPECT_EQ(err.message(), "invalid decimal digit '!'");
    EXPECT_EQ(parse_error::invalid_digit('\x01').message(), "invalid decimal digit 0x01");
    EXPECT_EQ(parse_error::invalid_digit('\xe9').message(), "invalid decimal digit 0xe9");
}

TEST(ParseErrorTest, Overflow) {
    const auto err = parse_error::overflow();
    EXPECT_EQ(err.code(), parse_errc::overflow);
    EXPECT_EQ(err.byte(), 0u);
    EXPECT_EQ(err.message(), "number too long for the target type");
}

TEST(ParseErrorTest, Equality) {
    EXPECT_EQ(parse_error::invalid_digit('a'), parse_error::invalid_digit('a'));
    EXPECT_NE(parse_error::invalid_digit('a'), parse_error::invalid_digit('b'));
    EXPECT_NE(parse_error::invalid_digit('a'), parse_error::overflow());
    EXPECT_NE(parse_error(), parse_error::overflow());
}

TEST(ParseResultTest, HoldsValue) {
    const parse_result<std::uint32_t> r = parse_unsigned<std::uint32_t>("42");
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42u);
    EXPECT_EQ(r.value_or(7), 42u);
    EXPECT_FALSE(r.error());
}

TEST(ParseResultTest, HoldsError) {
    const auto r = parse_unsigned<std::uint32_t>("4x");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.value_or(7), 7u);
    EXPECT_EQ(r.error(), parse_error::invalid_digit('x'));
    try {
        (void)r.value();
        FAIL() << "exception expected";
    } catch (const decimal_error& e) {
        EXPECT_EQ(e.error(), parse_error::invalid_digit('x'));
        EXPECT_STREQ(e.what(), "invalid decimal digit 'x'");
    }
}

TEST(ParseResultTest, Equality) {
    EXPECT_EQ(parse_unsigned<std::uint8_t>("12"), parse_result<std::uint8_t>(12));
    EXPECT_EQ(parse_unsigned<std::uint8_t>("1x"), parse_result<std::uint8_t>(parse_error::invalid_digit('x')));
    EXPECT_NE(parse_unsigned<std::uint8_t>("12"), parse_result<std::uint8_t>(13));
}

TEST(FromDecimalTest, ReturnsValue) {
    EXPECT_EQ(from_decimal<int>("-77"), -77);
    EXPECT_EQ(from_decimal<std::uint16_t>("65535"), 65535u);
}

TEST(FromDecimalTest, ThrowsOnError) {
    EXPECT_THROW(from_decimal<std::uint8_t>("1000"), decimal_error);
    EXPECT_THROW(from_decimal<int>("12 "), decimal_error);
    try {
        from_decimal<std::uint8_t>("1000");
    } catch (const decimal_error& e) {
        EXPECT_EQ(e.error(), parse_error::overflow());
        EXPECT_STREQ(e.what(), "number too long for the target type");
    }
}

TEST(DecimalErrorTest, IsRuntimeErrorCarryingParseError) {
    const decimal_error e(parse_error::invalid_digit('\x7f'));
    const std::runtime_error& base = e;
    EXPECT_STREQ(base.what(), "invalid decimal digit 0x7f");
    EXPECT_EQ(e.error(), parse_error::invalid_digit('\x7f'));
    EXPECT_EQ(e.error().code(), parse_errc::invalid_digit);
}
