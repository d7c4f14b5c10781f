#pragma once

#include <cstddef>
#include <cstdint>

namespace uuid7der {

// 128-bit unsigned integer (GCC/Clang extension)
__extension__ typedef unsigned __int128 uint128;

// Compose a 128-bit value from its high and low 64-bit halves
constexpr uint128 make_uint128(uint64_t high, uint64_t low) noexcept {
    return (static_cast<uint128>(high) << 64) | low;
}

constexpr uint64_t high64(uint128 value) noexcept {
    return static_cast<uint64_t>(value >> 64);
}

constexpr uint64_t low64(uint128 value) noexcept {
    return static_cast<uint64_t>(value);
}

// UUID size in octets
inline constexpr size_t uuid_size_bytes = 16;

// Validation error codes for UUIDv7 version/variant checks
enum class ValidationError : uint8_t {
    none = 0,        // No error, value is a UUIDv7
    invalid_version, // Version nibble (bits 76-79) is not 0b0111
    invalid_variant, // Variant bits (bits 62-63) are not 0b10
};

// Convert validation error to human-readable string
constexpr const char* validation_error_string(ValidationError err) noexcept {
    switch (err) {
        case ValidationError::none:
            return "No error";
        case ValidationError::invalid_version:
            return "Invalid version";
        case ValidationError::invalid_variant:
            return "Invalid variant";
        default:
            return "Unknown error";
    }
}

// Structural error codes for ASN.1 BIT STRING construction and DER encoding
enum class EncodeError : uint8_t {
    none = 0,                 // No error
    unused_bits_out_of_range, // Unused bit count greater than 7
    unused_bits_without_data, // Non-zero unused bit count on an empty buffer
    nonzero_padding_bits,     // Unused trailing bits are not zero
    bit_width_mismatch,       // Buffer length cannot hold the declared bit width
    value_exceeds_bit_width,  // Field value has bits set above its declared width
    length_overflow,          // Content length exceeds the DER length encoding limit
};

// Convert encode error to human-readable string
constexpr const char* encode_error_string(EncodeError err) noexcept {
    switch (err) {
        case EncodeError::none:
            return "No error";
        case EncodeError::unused_bits_out_of_range:
            return "BIT STRING unused bit count out of range (0-7)";
        case EncodeError::unused_bits_without_data:
            return "BIT STRING declares unused bits but has no content";
        case EncodeError::nonzero_padding_bits:
            return "BIT STRING padding bits are not zero";
        case EncodeError::bit_width_mismatch:
            return "Buffer length doesn't match declared bit width";
        case EncodeError::value_exceeds_bit_width:
            return "Field value exceeds declared bit width";
        case EncodeError::length_overflow:
            return "Content length too large for DER encoding";
        default:
            return "Unknown error";
    }
}

} // namespace uuid7der
