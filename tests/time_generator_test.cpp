#include <chrono>
#include <utility>
#include <variant>
#include <vector>

#include <gtest/gtest.h>
#include <uuid7der/time_generator.hpp>

#include "der_test_helpers.hpp"

using namespace uuid7der;

namespace {

uint64_t wall_clock_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::system_clock::now().time_since_epoch())
                                     .count());
}

// Reassemble the 128-bit value from a projection
uint128 packed_value(const RawUuidV7Asn1& record) {
    RawUuidV7 raw = record.raw();
    uint128 value = 0;
    value = layout::set_field(value, layout::unix_ts_ms_shift, layout::unix_ts_ms_mask,
                              raw.unix_ts_ms);
    value = layout::set_field(value, layout::version_shift, layout::version_mask, raw.version);
    value = layout::set_field(value, layout::rand_a_shift, layout::rand_a_mask, raw.rand_a);
    value = layout::set_field(value, layout::variant_shift, layout::variant_mask, raw.variant);
    value = layout::set_field(value, layout::rand_b_shift, layout::rand_b_mask, raw.rand_b);
    return value;
}

} // namespace

TEST(NewRawUuidAsn1NowTest, EndToEnd) {
    uint64_t before = wall_clock_ms();
    auto asn1 = new_raw_uuid_v7_asn1_now();
    uint64_t after = wall_clock_ms();
    ASSERT_TRUE(is_ok(asn1)) << std::get<IoError>(asn1).error_message();

    auto der = std::get<RawUuidV7Asn1>(asn1).to_der_bytes();
    ASSERT_TRUE(is_ok(der));

    auto elements = test_helpers::parse_sequence(std::get<std::vector<uint8_t>>(der));
    ASSERT_EQ(elements.size(), 5U);

    uint64_t unix_ts_ms = test_helpers::integer_value(elements[0]);
    EXPECT_GE(unix_ts_ms, before);
    EXPECT_LE(unix_ts_ms, after);
    EXPECT_EQ(test_helpers::integer_value(elements[1]), 7U);
}

TEST(NewRawUuidAsn1NowTest, TagBitsAreSet) {
    auto asn1 = new_raw_uuid_v7_asn1_now();
    ASSERT_TRUE(is_ok(asn1));

    EXPECT_TRUE(is_valid(validate(UnverifiedUuidV7(packed_value(std::get<RawUuidV7Asn1>(asn1))))));
}

TEST(NewRawUuidAsn1NowTest, IncreasingWithinThread) {
    auto previous = new_raw_uuid_v7_asn1_now();
    ASSERT_TRUE(is_ok(previous));

    for (int i = 0; i < 1000; ++i) {
        auto current = new_raw_uuid_v7_asn1_now();
        ASSERT_TRUE(is_ok(current));
        EXPECT_TRUE(packed_value(std::get<RawUuidV7Asn1>(current)) >
                    packed_value(std::get<RawUuidV7Asn1>(previous)));
        previous = std::move(current);
    }
}
