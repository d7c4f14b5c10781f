#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "../types.hpp"
#include "endian.hpp"

namespace uuid7der::detail {

/**
 * @brief Endian-safe buffer read/write helpers
 *
 * Single source of truth for moving integers in and out of byte buffers in
 * network (big-endian) byte order. All functions use std::memcpy for
 * alignment safety.
 */

/**
 * Read a 64-bit value from buffer with network-to-host conversion
 * @param buffer Pointer to buffer
 * @param offset Byte offset into buffer
 * @return Value in host byte order
 */
inline uint64_t read_u64(const uint8_t* buffer, size_t offset) noexcept {
    uint64_t value;
    std::memcpy(&value, buffer + offset, sizeof(value));
    return network_to_host64(value);
}

/**
 * Write a 64-bit value to buffer with host-to-network conversion
 * @param buffer Pointer to buffer
 * @param offset Byte offset into buffer
 * @param value Value in host byte order
 */
inline void write_u64(uint8_t* buffer, size_t offset, uint64_t value) noexcept {
    value = host_to_network64(value);
    std::memcpy(buffer + offset, &value, sizeof(value));
}

// 128-bit big-endian read (16 bytes)
inline uint128 read_u128(const uint8_t* buffer, size_t offset) noexcept {
    return make_uint128(read_u64(buffer, offset), read_u64(buffer, offset + 8));
}

// 128-bit big-endian write (16 bytes)
inline void write_u128(uint8_t* buffer, size_t offset, uint128 value) noexcept {
    write_u64(buffer, offset, high64(value));
    write_u64(buffer, offset + 8, low64(value));
}

} // namespace uuid7der::detail
