#pragma once

#include <optional>

#include <cstdint>

#include "layout.hpp"
#include "types.hpp"
#include "uuid.hpp"

namespace uuid7der {

/**
 * @brief Inputs for building one UUIDv7
 *
 * unix_ts_ms is expected to fit in 48 bits. to_uint128() truncates wider
 * values; use checked() to reject them instead.
 */
struct UuidV7Seeds {
    uint64_t unix_ts_ms;  ///< Milliseconds since the Unix epoch (48 bits)
    uint128 random_bytes; ///< Source of the 74 random bits

    /**
     * @brief Build seeds, rejecting timestamps wider than 48 bits
     * @return Seeds, or std::nullopt if unix_ts_ms > layout::max_unix_ts_ms
     */
    [[nodiscard]] static constexpr std::optional<UuidV7Seeds> checked(uint64_t unix_ts_ms,
                                                                      uint128 random_bytes) noexcept {
        if (unix_ts_ms > layout::max_unix_ts_ms) {
            return std::nullopt;
        }
        return UuidV7Seeds{unix_ts_ms, random_bytes};
    }

    /**
     * @brief Pack the seeds into the UUIDv7 layout
     *
     * Overwrites the timestamp, version and variant fields of random_bytes:
     * 1. Bits 127-80 <- unix_ts_ms (bits above 48 are discarded)
     * 2. Bits 79-76  <- 0b0111
     * 3. Bits 63-62  <- 0b10
     * All other bits keep the caller-supplied randomness.
     */
    [[nodiscard]] constexpr uint128 to_uint128() const noexcept {
        uint128 uuid = random_bytes;
        uuid = layout::set_field(uuid, layout::unix_ts_ms_shift, layout::unix_ts_ms_mask,
                                 unix_ts_ms);
        uuid = layout::set_field(uuid, layout::version_shift, layout::version_mask,
                                 layout::uuid_version);
        uuid = layout::set_field(uuid, layout::variant_shift, layout::variant_mask,
                                 layout::rfc_variant);
        return uuid;
    }

    // Packing always yields a valid UUIDv7
    [[nodiscard]] constexpr UuidV7 to_uuid() const noexcept { return UuidV7(to_uint128()); }

    constexpr bool operator==(const UuidV7Seeds&) const noexcept = default;
};

} // namespace uuid7der
