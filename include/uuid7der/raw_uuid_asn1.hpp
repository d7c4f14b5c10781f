#pragma once

#include <utility>
#include <variant>
#include <vector>

#include <cstdint>

#include <boost/uuid/uuid.hpp>

#include "asn1/bit_string.hpp"
#include "asn1/der_writer.hpp"
#include "io_error.hpp"
#include "layout.hpp"
#include "raw_uuid.hpp"
#include "types.hpp"
#include "uuid.hpp"

namespace uuid7der {

class RawUuidV7Asn1;

using Asn1Result = std::variant<RawUuidV7Asn1, EncodeError>;
using DerResult = std::variant<std::vector<uint8_t>, IoError>;

/**
 * @brief ASN.1 projection of a RawUuidV7
 *
 * Serializes as
 * @code
 * RawUuidV7 ::= SEQUENCE {
 *     unixTsMs   INTEGER,
 *     version    INTEGER,
 *     randA      BIT STRING,  -- 12 bits, 4 unused, 2 octets
 *     variant    BIT STRING,  -- 2 bits, 6 unused, 1 octet
 *     randB      BIT STRING   -- 62 bits, 2 unused, 8 octets
 * }
 * @endcode
 * Field order is part of the wire contract.
 */
class RawUuidV7Asn1 {
private:
    uint64_t unix_ts_ms_;
    uint8_t version_;
    asn1::BitString rand_a_;
    asn1::BitString variant_;
    asn1::BitString rand_b_;

    RawUuidV7Asn1(uint64_t unix_ts_ms, uint8_t version, asn1::BitString rand_a,
                  asn1::BitString variant, asn1::BitString rand_b)
        : unix_ts_ms_(unix_ts_ms),
          version_(version),
          rand_a_(std::move(rand_a)),
          variant_(std::move(variant)),
          rand_b_(std::move(rand_b)) {}

public:
    /**
     * @brief Project a raw field record
     *
     * rand_a, variant and rand_b become left-aligned bit strings; the first
     * bit-string failure is returned unchanged.
     */
    [[nodiscard]] static Asn1Result from_raw(const RawUuidV7& raw) {
        auto rand_a = asn1::BitString::from_field(raw.rand_a, layout::rand_a_field);
        if (auto* err = std::get_if<EncodeError>(&rand_a)) {
            return *err;
        }

        auto variant = asn1::BitString::from_field(raw.variant, layout::variant_field);
        if (auto* err = std::get_if<EncodeError>(&variant)) {
            return *err;
        }

        auto rand_b = asn1::BitString::from_field(raw.rand_b, layout::rand_b_field);
        if (auto* err = std::get_if<EncodeError>(&rand_b)) {
            return *err;
        }

        return RawUuidV7Asn1(raw.unix_ts_ms, raw.version,
                             std::get<asn1::BitString>(std::move(rand_a)),
                             std::get<asn1::BitString>(std::move(variant)),
                             std::get<asn1::BitString>(std::move(rand_b)));
    }

    // Unpack and project any 128-bit value (no version/variant check)
    [[nodiscard]] static Asn1Result from_uint128(uint128 value) {
        return from_raw(to_raw(UnverifiedUuidV7(value)));
    }

    // Project a boost::uuids::uuid as-is (no version/variant check)
    [[nodiscard]] static Asn1Result from_uuid(const boost::uuids::uuid& uuid) {
        return from_raw(to_raw(UnverifiedUuidV7::from_boost_uuid(uuid)));
    }

    [[nodiscard]] static Asn1Result from_uuid(const UuidV7& uuid) {
        return from_raw(to_raw(uuid));
    }

    // Accessors
    [[nodiscard]] uint64_t unix_ts_ms() const noexcept { return unix_ts_ms_; }
    [[nodiscard]] uint8_t version() const noexcept { return version_; }
    [[nodiscard]] const asn1::BitString& rand_a() const noexcept { return rand_a_; }
    [[nodiscard]] const asn1::BitString& variant() const noexcept { return variant_; }
    [[nodiscard]] const asn1::BitString& rand_b() const noexcept { return rand_b_; }

    // Field record recovered from the bit strings
    [[nodiscard]] RawUuidV7 raw() const noexcept {
        return RawUuidV7{unix_ts_ms_, version_, static_cast<uint16_t>(rand_a_.to_uint64()),
                         rand_b_.to_uint64(), static_cast<uint8_t>(variant_.to_uint64())};
    }

    // Append the SEQUENCE to writer
    void encode(asn1::DerWriter& writer) const {
        writer.write_sequence([this](asn1::DerWriter& seq) {
            seq.write_unsigned_integer(unix_ts_ms_);
            seq.write_unsigned_integer(version_);
            seq.write_bit_string(rand_a_);
            seq.write_bit_string(variant_);
            seq.write_bit_string(rand_b_);
        });
    }

    /**
     * @brief Serialize to canonical DER
     * @return Encoded bytes, or IoError of kind encode
     */
    [[nodiscard]] DerResult to_der_bytes() const {
        asn1::DerWriter writer;
        encode(writer);
        if (!writer.ok()) {
            return IoError::from_encode_error(writer.error());
        }
        return std::move(writer).release();
    }

    bool operator==(const RawUuidV7Asn1&) const = default;
};

inline bool is_ok(const Asn1Result& result) noexcept {
    return std::holds_alternative<RawUuidV7Asn1>(result);
}

inline bool is_ok(const DerResult& result) noexcept {
    return std::holds_alternative<std::vector<uint8_t>>(result);
}

} // namespace uuid7der
