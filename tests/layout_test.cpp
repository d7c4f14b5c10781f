#include <gtest/gtest.h>
#include <uuid7der/layout.hpp>

using namespace uuid7der;

TEST(LayoutTest, MasksMatchWidths) {
    EXPECT_EQ(layout::unix_ts_ms_mask, (1ULL << layout::unix_ts_ms_bits) - 1);
    EXPECT_EQ(layout::version_mask, (1ULL << layout::version_bits) - 1);
    EXPECT_EQ(layout::rand_a_mask, (1ULL << layout::rand_a_bits) - 1);
    EXPECT_EQ(layout::variant_mask, (1ULL << layout::variant_bits) - 1);
    EXPECT_EQ(layout::rand_b_mask, (1ULL << layout::rand_b_bits) - 1);
}

TEST(LayoutTest, FieldsAreContiguous) {
    EXPECT_EQ(layout::rand_b_shift + layout::rand_b_bits, layout::variant_shift);
    EXPECT_EQ(layout::variant_shift + layout::variant_bits, layout::rand_a_shift);
    EXPECT_EQ(layout::rand_a_shift + layout::rand_a_bits, layout::version_shift);
    EXPECT_EQ(layout::version_shift + layout::version_bits, layout::unix_ts_ms_shift);
    EXPECT_EQ(layout::unix_ts_ms_shift + layout::unix_ts_ms_bits, 128);
}

TEST(LayoutTest, BitStringWidths) {
    EXPECT_EQ(layout::rand_a_field.unused_bits(), 4U);
    EXPECT_EQ(layout::variant_field.unused_bits(), 6U);
    EXPECT_EQ(layout::rand_b_field.unused_bits(), 2U);
}

TEST(LayoutTest, SetFieldPreservesNeighbours) {
    uint128 all_ones = make_uint128(~0ULL, ~0ULL);
    uint128 cleared = layout::set_field(all_ones, layout::version_shift, layout::version_mask, 0);

    EXPECT_EQ(high64(cleared), 0xFFFF'FFFF'FFFF'0FFFULL);
    EXPECT_EQ(low64(cleared), ~0ULL);
}

TEST(LayoutTest, SetFieldDiscardsExcessBits) {
    uint128 value = layout::set_field(0, layout::variant_shift, layout::variant_mask, 0xFF);

    EXPECT_EQ(high64(value), 0U);
    EXPECT_EQ(low64(value), 0xC000'0000'0000'0000ULL);
    EXPECT_EQ(layout::get_field(value, layout::variant_shift, layout::variant_mask), 3U);
}
