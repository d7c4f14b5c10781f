#include <array>

#include <cstdint>
#include <cstring>
#include <gtest/gtest.h>
#include <uuid7der/detail/buffer_io.hpp>
#include <uuid7der/detail/endian.hpp>

using namespace uuid7der;

TEST(EndianTest, ByteSwap64) {
    uint64_t value = 0x123456789ABCDEF0ULL;
    uint64_t swapped = detail::byteswap64(value);
    EXPECT_EQ(swapped, 0xF0DEBC9A78563412ULL);

    // Double swap should return original
    EXPECT_EQ(detail::byteswap64(swapped), value);
}

TEST(EndianTest, NetworkIsBigEndian) {
    uint64_t network = detail::host_to_network64(0x0102030405060708ULL);

    uint8_t bytes[8];
    std::memcpy(bytes, &network, 8);

    EXPECT_EQ(bytes[0], 0x01); // MSB
    EXPECT_EQ(bytes[3], 0x04);
    EXPECT_EQ(bytes[7], 0x08); // LSB
    EXPECT_EQ(detail::network_to_host64(network), 0x0102030405060708ULL);
}

// Test platform detection
TEST(EndianTest, PlatformDetection) {
    EXPECT_TRUE(detail::is_little_endian || detail::is_big_endian);
    EXPECT_FALSE(detail::is_little_endian && detail::is_big_endian);

#if defined(__x86_64__) || defined(__i386__)
    EXPECT_TRUE(detail::is_little_endian);
#endif
}

TEST(BufferIoTest, Write128IsBigEndian) {
    std::array<uint8_t, 16> buffer{};
    detail::write_u128(buffer.data(), 0,
                       make_uint128(0x0011223344556677ULL, 0x8899AABBCCDDEEFFULL));

    for (size_t i = 0; i < buffer.size(); ++i) {
        EXPECT_EQ(buffer[i], static_cast<uint8_t>(i * 0x11)) << "byte " << i;
    }
}

TEST(BufferIoTest, Read128AtOffset) {
    std::array<uint8_t, 20> buffer{};
    for (size_t i = 0; i < 16; ++i) {
        buffer[i + 4] = static_cast<uint8_t>(0xF0 - i);
    }

    uint128 value = detail::read_u128(buffer.data(), 4);
    EXPECT_EQ(high64(value), 0xF0EFEEEDECEBEAE9ULL);
    EXPECT_EQ(low64(value), 0xE8E7E6E5E4E3E2E1ULL);
}
