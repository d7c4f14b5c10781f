#pragma once

#include <cstddef>
#include <cstdint>

#include "types.hpp"

namespace uuid7der {

/**
 * @brief UUIDv7 bit positions, masks, and field manipulation helpers
 *
 * Layout (128 bits, bit 127 is the most significant):
 * - Bits 127-80: unix_ts_ms (48 bits, milliseconds since the Unix epoch)
 * - Bits 79-76:  version (4 bits, 0b0111)
 * - Bits 75-64:  rand_a (12 bits)
 * - Bits 63-62:  variant (2 bits, 0b10)
 * - Bits 61-0:   rand_b (62 bits)
 *
 * Used by both packing (UuidV7Seeds) and unpacking (UnverifiedUuidV7).
 */
namespace layout {

// ========================================================================
// Timestamp Field (bits 127-80)
// ========================================================================
inline constexpr uint8_t unix_ts_ms_shift = 80;
inline constexpr uint8_t unix_ts_ms_bits = 48;
inline constexpr uint64_t unix_ts_ms_mask = 0xFFFF'FFFF'FFFFULL; // After shift

// Largest timestamp representable in the layout (year ~10889)
inline constexpr uint64_t max_unix_ts_ms = unix_ts_ms_mask;

// ========================================================================
// Version Field (bits 79-76)
// ========================================================================
inline constexpr uint8_t version_shift = 76;
inline constexpr uint8_t version_bits = 4;
inline constexpr uint64_t version_mask = 0xF; // After shift

// ========================================================================
// rand_a Field (bits 75-64)
// ========================================================================
inline constexpr uint8_t rand_a_shift = 64;
inline constexpr uint8_t rand_a_bits = 12;
inline constexpr uint64_t rand_a_mask = 0xFFF; // After shift

// ========================================================================
// Variant Field (bits 63-62)
// ========================================================================
inline constexpr uint8_t variant_shift = 62;
inline constexpr uint8_t variant_bits = 2;
inline constexpr uint64_t variant_mask = 0x3; // After shift

// ========================================================================
// rand_b Field (bits 61-0)
// ========================================================================
inline constexpr uint8_t rand_b_shift = 0;
inline constexpr uint8_t rand_b_bits = 62;
inline constexpr uint64_t rand_b_mask = 0x3FFF'FFFF'FFFF'FFFFULL; // After shift

// ========================================================================
// Tag Values
// ========================================================================
inline constexpr uint8_t uuid_version = 7;  // 0b0111
inline constexpr uint8_t rfc_variant = 2;   // 0b10

static_assert(unix_ts_ms_bits + version_bits + rand_a_bits + variant_bits + rand_b_bits == 128,
              "UUIDv7 fields must cover all 128 bits");

/**
 * Extract a field from a 128-bit value
 * @param value Packed 128-bit value
 * @param shift Bit position of the field's least significant bit
 * @param mask Field mask (after shift)
 * @return Field value, zero-extended
 */
constexpr uint64_t get_field(uint128 value, uint8_t shift, uint64_t mask) noexcept {
    return static_cast<uint64_t>(value >> shift) & mask;
}

/**
 * Replace a field in a 128-bit value
 *
 * Bits of field_value above the mask are discarded.
 *
 * @param value Packed 128-bit value
 * @param shift Bit position of the field's least significant bit
 * @param mask Field mask (after shift)
 * @param field_value New field value
 * @return value with the field cleared and field_value inserted
 */
constexpr uint128 set_field(uint128 value, uint8_t shift, uint64_t mask,
                            uint64_t field_value) noexcept {
    value &= ~(static_cast<uint128>(mask) << shift);
    value |= static_cast<uint128>(field_value & mask) << shift;
    return value;
}

} // namespace layout

/**
 * @brief Width of a sub-byte field projected into an ASN.1 BIT STRING
 *
 * The field occupies bit_width significant bits, left-aligned in a buffer of
 * byte_width octets; the remaining low-order bits of the last octet are the
 * BIT STRING "unused bits".
 */
struct BitField {
    size_t bit_width;
    size_t byte_width;

    constexpr size_t unused_bits() const noexcept { return byte_width * 8 - bit_width; }
};

namespace layout {

inline constexpr BitField rand_a_field{rand_a_bits, 2};
inline constexpr BitField variant_field{variant_bits, 1};
inline constexpr BitField rand_b_field{rand_b_bits, 8};

static_assert(rand_a_field.unused_bits() == 4, "rand_a carries 4 unused bits");
static_assert(variant_field.unused_bits() == 6, "variant carries 6 unused bits");
static_assert(rand_b_field.unused_bits() == 2, "rand_b carries 2 unused bits");

} // namespace layout

} // namespace uuid7der
