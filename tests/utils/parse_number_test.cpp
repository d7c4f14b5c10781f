// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <uuid7der/uuid7der_utils.hpp>

using uuid7der::utils::parse_decimal_u64;

TEST(ParseNumberTest, Decimal) {
    EXPECT_EQ(parse_decimal_u64("0"), 0U);
    EXPECT_EQ(parse_decimal_u64("1712345678901"), 1'712'345'678'901ULL);
    EXPECT_EQ(parse_decimal_u64("18446744073709551615"), 18'446'744'073'709'551'615ULL);
}

TEST(ParseNumberTest, LeadingZeroIsNotOctal) {
    EXPECT_EQ(parse_decimal_u64("010"), 10U);
}

TEST(ParseNumberTest, RejectsSignsAndWhitespace) {
    EXPECT_FALSE(parse_decimal_u64("-1").has_value());
    EXPECT_FALSE(parse_decimal_u64(" -1").has_value());
    EXPECT_FALSE(parse_decimal_u64(" 5").has_value());
    EXPECT_FALSE(parse_decimal_u64("+5").has_value());
    EXPECT_FALSE(parse_decimal_u64("5 ").has_value());
}

TEST(ParseNumberTest, RejectsMalformed) {
    EXPECT_FALSE(parse_decimal_u64("").has_value());
    EXPECT_FALSE(parse_decimal_u64("0x10").has_value());
    EXPECT_FALSE(parse_decimal_u64("12a").has_value());
    EXPECT_FALSE(parse_decimal_u64("18446744073709551616").has_value());
}
