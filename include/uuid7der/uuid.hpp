#pragma once

#include <compare>
#include <string>
#include <variant>

#include <cstdint>

#include <boost/uuid/uuid.hpp>

#include "detail/buffer_io.hpp"
#include "layout.hpp"
#include "types.hpp"

namespace uuid7der {

static_assert(boost::uuids::uuid::static_size() == uuid_size_bytes,
              "boost::uuids::uuid must hold exactly 16 octets");

/**
 * @brief Unchecked view of a 128-bit value as a UUIDv7
 *
 * Field accessors extract bits at the fixed UUIDv7 offsets without checking
 * the version or variant, so malformed or foreign UUIDs can still be
 * inspected. Immutable after construction.
 */
class UnverifiedUuidV7 {
private:
    uint128 value_;

public:
    constexpr explicit UnverifiedUuidV7(uint128 value) noexcept : value_(value) {}

    // Factory method to decode a boost::uuids::uuid (octets in network byte order)
    [[nodiscard]] static UnverifiedUuidV7 from_boost_uuid(const boost::uuids::uuid& uuid) noexcept {
        return UnverifiedUuidV7(detail::read_u128(uuid.begin(), 0));
    }

    [[nodiscard]] constexpr uint128 value() const noexcept { return value_; }

    // Field accessors
    [[nodiscard]] constexpr uint64_t unix_ts_ms() const noexcept {
        return layout::get_field(value_, layout::unix_ts_ms_shift, layout::unix_ts_ms_mask);
    }
    [[nodiscard]] constexpr uint8_t version() const noexcept {
        return static_cast<uint8_t>(
            layout::get_field(value_, layout::version_shift, layout::version_mask));
    }
    [[nodiscard]] constexpr uint16_t rand_a() const noexcept {
        return static_cast<uint16_t>(
            layout::get_field(value_, layout::rand_a_shift, layout::rand_a_mask));
    }
    [[nodiscard]] constexpr uint8_t variant() const noexcept {
        return static_cast<uint8_t>(
            layout::get_field(value_, layout::variant_shift, layout::variant_mask));
    }
    [[nodiscard]] constexpr uint64_t rand_b() const noexcept {
        return layout::get_field(value_, layout::rand_b_shift, layout::rand_b_mask);
    }

    [[nodiscard]] boost::uuids::uuid to_boost_uuid() const noexcept {
        boost::uuids::uuid uuid{};
        detail::write_u128(uuid.begin(), 0, value_);
        return uuid;
    }

    constexpr bool operator==(const UnverifiedUuidV7&) const noexcept = default;
};

struct UuidV7Seeds;
class UuidV7;

/**
 * @brief Error result when a value fails UUIDv7 validation
 *
 * Carries the failed check and the offending field value (the version nibble
 * for invalid_version, the two variant bits for invalid_variant).
 */
struct InvalidUuid {
    ValidationError error; ///< The check that failed
    uint8_t actual;        ///< Offending field value

    std::string error_message() const {
        return std::string(validation_error_string(error)) + ": " + std::to_string(actual);
    }

    constexpr bool operator==(const InvalidUuid&) const noexcept = default;
};

using ValidationResult = std::variant<UuidV7, InvalidUuid>;

/**
 * @brief A 128-bit value known to carry version 7 and variant 0b10
 *
 * Bit-identical to the UnverifiedUuidV7 it was created from. Two paths create
 * one:
 * - validate(), the checked conversion from an UnverifiedUuidV7
 * - UuidV7Seeds::to_uuid(), which writes version 7 and variant 0b10 while
 *   packing, so its result always equals validate() of the packed value
 */
class UuidV7 {
private:
    uint128 value_;

    constexpr explicit UuidV7(uint128 value) noexcept : value_(value) {}

    friend constexpr ValidationResult validate(UnverifiedUuidV7 unverified) noexcept;
    friend struct UuidV7Seeds;

public:
    [[nodiscard]] constexpr uint128 value() const noexcept { return value_; }

    // Drop the guarantee and expose the field accessors
    [[nodiscard]] constexpr UnverifiedUuidV7 unverified() const noexcept {
        return UnverifiedUuidV7(value_);
    }

    [[nodiscard]] boost::uuids::uuid to_boost_uuid() const noexcept {
        return unverified().to_boost_uuid();
    }

    constexpr bool operator==(const UuidV7&) const noexcept = default;
    constexpr auto operator<=>(const UuidV7&) const noexcept = default;
};

/**
 * @brief Check the version and variant of an unverified value
 *
 * The version is checked first; when both fields are wrong only
 * invalid_version is reported.
 *
 * @param unverified Value to check
 * @return UuidV7 on success, InvalidUuid naming the failed field otherwise
 */
[[nodiscard]] constexpr ValidationResult validate(UnverifiedUuidV7 unverified) noexcept {
    uint8_t version = unverified.version();
    if (version != layout::uuid_version) {
        return InvalidUuid{ValidationError::invalid_version, version};
    }

    uint8_t variant = unverified.variant();
    if (variant != layout::rfc_variant) {
        return InvalidUuid{ValidationError::invalid_variant, variant};
    }

    return UuidV7(unverified.value());
}

inline bool is_valid(const ValidationResult& result) noexcept {
    return std::holds_alternative<UuidV7>(result);
}

} // namespace uuid7der
