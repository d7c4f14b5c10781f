#pragma once

#include <iomanip>
#include <ostream>

#include <cstdint>

#include "uuid.hpp"

namespace uuid7der {

/**
 * @brief Fully decomposed view of a UUIDv7 bit pattern
 *
 * A transparent projection of whatever 128-bit value produced it; no field is
 * checked. Widths: unix_ts_ms 48, version 4, rand_a 12, variant 2, rand_b 62.
 */
struct RawUuidV7 {
    uint64_t unix_ts_ms; ///< Milliseconds since the Unix epoch (bits 127-80)
    uint8_t version;     ///< Version nibble (bits 79-76)
    uint16_t rand_a;     ///< Random bits 75-64
    uint64_t rand_b;     ///< Random bits 61-0
    uint8_t variant;     ///< Variant bits 63-62

    constexpr bool operator==(const RawUuidV7&) const noexcept = default;
};

constexpr RawUuidV7 to_raw(UnverifiedUuidV7 uuid) noexcept {
    return RawUuidV7{uuid.unix_ts_ms(), uuid.version(), uuid.rand_a(), uuid.rand_b(),
                     uuid.variant()};
}

constexpr RawUuidV7 to_raw(UuidV7 uuid) noexcept {
    return to_raw(uuid.unverified());
}

// Print one field per line, hex for the random parts
inline void describe(const RawUuidV7& raw, std::ostream& out) {
    std::ios::fmtflags flags(out.flags());
    char fill = out.fill();
    out << "  unix_ts_ms: " << std::dec << raw.unix_ts_ms << "\n";
    out << "  version:    " << static_cast<int>(raw.version) << "\n";
    out << "  rand_a:     0x" << std::hex << std::setfill('0') << std::setw(3) << raw.rand_a
        << "\n";
    out << "  variant:    " << std::dec << static_cast<int>(raw.variant) << "\n";
    out << "  rand_b:     0x" << std::hex << std::setfill('0') << std::setw(16) << raw.rand_b
        << "\n";
    out.fill(fill);
    out.flags(flags);
}

} // namespace uuid7der
