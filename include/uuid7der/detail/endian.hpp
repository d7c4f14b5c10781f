#pragma once

#include <bit>

#include <cstdint>

namespace uuid7der::detail {

// Platform endianness detection
inline constexpr bool is_little_endian = (std::endian::native == std::endian::little);
inline constexpr bool is_big_endian = (std::endian::native == std::endian::big);

static_assert(is_little_endian || is_big_endian, "Mixed endianness not supported");

// Byte swap operations (constexpr for compile-time use)
constexpr uint64_t byteswap64(uint64_t value) noexcept {
    return __builtin_bswap64(value);
}

// Convert to network byte order (big-endian)
constexpr uint64_t host_to_network64(uint64_t value) noexcept {
    if constexpr (is_little_endian) {
        return byteswap64(value);
    } else {
        return value;
    }
}

// Convert from network byte order (big-endian) to host
constexpr uint64_t network_to_host64(uint64_t value) noexcept {
    return host_to_network64(value); // Same operation
}

} // namespace uuid7der::detail
