// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <utility>
#include <variant>

#include <cstdint>

#include <boost/uuid/entropy_error.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>

#include "io_error.hpp"
#include "layout.hpp"
#include "raw_uuid_asn1.hpp"
#include "seeds.hpp"
#include "uuid.hpp"

namespace uuid7der {

using RandomResult = std::variant<uint128, IoError>;
using NewAsn1Result = std::variant<RawUuidV7Asn1, IoError>;

/**
 * @brief Draw 128 bits from boost::uuids::random_generator
 *
 * The generator emits version 4 UUIDs. Their fixed version and variant bits
 * sit at the same positions as in UUIDv7, so every bit UuidV7Seeds keeps
 * (rand_a and rand_b) is random.
 *
 * @return Bits, or IoError of kind random_source if the entropy source failed
 */
inline RandomResult random_u128() {
    try {
        thread_local boost::uuids::random_generator generator;
        return UnverifiedUuidV7::from_boost_uuid(generator()).value();
    } catch (const boost::uuids::entropy_error& e) {
        return IoError::from_errno(IoErrorKind::random_source, e.what(),
                                   static_cast<int>(e.errcode()));
    }
}

namespace detail {

inline NewAsn1Result project_generated(const boost::uuids::uuid& uuid) {
    auto asn1 = RawUuidV7Asn1::from_uuid(uuid);
    if (auto* err = std::get_if<EncodeError>(&asn1)) {
        return IoError::from_encode_error(*err);
    }
    return std::get<RawUuidV7Asn1>(std::move(asn1));
}

} // namespace detail

/**
 * @brief Generate a UUIDv7 for unix_ts_ms and project it
 *
 * Packs fresh random bits with the caller's timestamp. No state is carried
 * between calls, so two values for the same millisecond are unordered.
 *
 * @param unix_ts_ms Milliseconds since the Unix epoch (48 bits)
 * @return Projection, or IoError of kind clock (timestamp out of range),
 *         random_source or encode
 */
inline NewAsn1Result new_raw_uuid_v7_asn1(uint64_t unix_ts_ms) {
    if (unix_ts_ms > layout::max_unix_ts_ms) {
        return IoError{IoErrorKind::clock, "Timestamp exceeds 48-bit range"};
    }

    auto random = random_u128();
    if (auto* err = std::get_if<IoError>(&random)) {
        return *err;
    }

    auto seeds = UuidV7Seeds::checked(unix_ts_ms, std::get<uint128>(random));
    if (!seeds) {
        return IoError{IoErrorKind::clock, "Timestamp exceeds 48-bit range"};
    }
    return detail::project_generated(seeds->to_uuid().to_boost_uuid());
}

inline bool is_ok(const RandomResult& result) noexcept {
    return std::holds_alternative<uint128>(result);
}

inline bool is_ok(const NewAsn1Result& result) noexcept {
    return std::holds_alternative<RawUuidV7Asn1>(result);
}

} // namespace uuid7der
