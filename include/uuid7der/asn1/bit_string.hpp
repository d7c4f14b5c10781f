#pragma once

#include <span>
#include <utility>
#include <variant>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../layout.hpp"
#include "../types.hpp"
#include "der.hpp"

namespace uuid7der::asn1 {

class BitString;

using BitStringResult = std::variant<BitString, EncodeError>;

/**
 * @brief ASN.1 BIT STRING value
 *
 * Content octets plus the number of unused low-order bits in the last octet.
 * Every instance satisfies the DER constraints: unused bit count 0-7, no
 * unused bits on an empty string, and zero padding bits.
 */
class BitString {
private:
    std::vector<uint8_t> bytes_;
    uint8_t unused_bits_;

    BitString(std::vector<uint8_t> bytes, uint8_t unused_bits)
        : bytes_(std::move(bytes)),
          unused_bits_(unused_bits) {}

public:
    /**
     * @brief Create a bit string from raw content octets
     *
     * @param bytes Content octets, most significant bit first
     * @param unused_bits Number of padding bits at the end of the last octet
     * @return BitString, or the EncodeError describing the inconsistency
     */
    [[nodiscard]] static BitStringResult create(std::span<const uint8_t> bytes,
                                                uint8_t unused_bits) {
        if (unused_bits > max_unused_bits) {
            return EncodeError::unused_bits_out_of_range;
        }
        if (bytes.empty()) {
            if (unused_bits != 0) {
                return EncodeError::unused_bits_without_data;
            }
            return BitString({}, 0);
        }

        uint8_t padding_mask = static_cast<uint8_t>((1U << unused_bits) - 1);
        if ((bytes.back() & padding_mask) != 0) {
            return EncodeError::nonzero_padding_bits;
        }

        return BitString(std::vector<uint8_t>(bytes.begin(), bytes.end()), unused_bits);
    }

    /**
     * @brief Project an integer field into a left-aligned bit string
     *
     * The field's bit_width significant bits are placed at the start of a
     * byte_width octet buffer (big-endian) and the trailing
     * byte_width * 8 - bit_width bits are reported as unused.
     *
     * @param value Field value (only the low bit_width bits may be set)
     * @param field Declared field width
     * @return BitString, or:
     *   - bit_width_mismatch if the buffer cannot hold the width with at most
     *     7 padding bits, or the width is zero or wider than 64 bits
     *   - value_exceeds_bit_width if value has bits above bit_width
     */
    [[nodiscard]] static BitStringResult from_field(uint64_t value, BitField field) {
        if (field.bit_width == 0 || field.bit_width > 64 || field.byte_width > 8 ||
            field.byte_width * 8 < field.bit_width ||
            field.byte_width * 8 - field.bit_width > max_unused_bits) {
            return EncodeError::bit_width_mismatch;
        }
        if (field.bit_width < 64 && (value >> field.bit_width) != 0) {
            return EncodeError::value_exceeds_bit_width;
        }

        size_t unused = field.unused_bits();
        uint64_t aligned = value << unused;

        std::vector<uint8_t> bytes(field.byte_width);
        for (size_t i = 0; i < field.byte_width; ++i) {
            bytes[i] = static_cast<uint8_t>(aligned >> (8 * (field.byte_width - 1 - i)));
        }
        return create(bytes, static_cast<uint8_t>(unused));
    }

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept { return bytes_; }
    [[nodiscard]] uint8_t unused_bits() const noexcept { return unused_bits_; }

    // Number of significant bits
    [[nodiscard]] size_t bit_length() const noexcept {
        return bytes_.size() * 8 - unused_bits_;
    }

    // Significant bits as an integer (strings up to 64 bits)
    [[nodiscard]] uint64_t to_uint64() const noexcept {
        uint64_t value = 0;
        for (uint8_t b : bytes_) {
            value = (value << 8) | b;
        }
        return value >> unused_bits_;
    }

    bool operator==(const BitString&) const = default;
};

inline bool is_ok(const BitStringResult& result) noexcept {
    return std::holds_alternative<BitString>(result);
}

} // namespace uuid7der::asn1
