#pragma once

#include <vector>

#include <cstddef>
#include <cstdint>

#include "../types.hpp"

namespace uuid7der::asn1 {

// ASN.1 universal tags used by the UUIDv7 module
enum class Tag : uint8_t {
    integer = 0x02,
    bit_string = 0x03,
    sequence = 0x30 // Constructed
};

// Largest unused bit count a BIT STRING may declare
inline constexpr uint8_t max_unused_bits = 7;

// Longest length field emitted (0x84 followed by four octets)
inline constexpr uint64_t max_content_length = 0xFFFF'FFFFULL;

/**
 * Append a DER length field
 *
 * Short form for lengths below 128, otherwise long form with the minimal
 * number of length octets (up to four).
 *
 * @param length Content length in octets
 * @param out Destination buffer
 * @return EncodeError::length_overflow if length exceeds max_content_length
 */
inline EncodeError encode_length(uint64_t length, std::vector<uint8_t>& out) {
    if (length > max_content_length) {
        return EncodeError::length_overflow;
    }

    if (length < 0x80) {
        out.push_back(static_cast<uint8_t>(length));
        return EncodeError::none;
    }

    uint8_t num_octets = 0;
    for (uint64_t rest = length; rest != 0; rest >>= 8) {
        ++num_octets;
    }

    out.push_back(static_cast<uint8_t>(0x80 | num_octets));
    for (int i = num_octets - 1; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(length >> (8 * i)));
    }
    return EncodeError::none;
}

/**
 * Append the content octets of a non-negative INTEGER
 *
 * Minimal two's-complement form: no redundant leading zero octets, plus a
 * single 0x00 when the most significant bit would otherwise read as a sign.
 * Zero encodes as one 0x00 octet.
 */
inline void encode_unsigned_integer(uint64_t value, std::vector<uint8_t>& out) {
    int top = 7;
    while (top > 0 && ((value >> (8 * top)) & 0xFF) == 0) {
        --top;
    }

    if ((value >> (8 * top)) & 0x80) {
        out.push_back(0x00);
    }
    for (int i = top; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

} // namespace uuid7der::asn1
