// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <boost/uuid/entropy_error.hpp>
#include <boost/uuid/time_generator_v7.hpp>

#include "generator.hpp"
#include "io_error.hpp"

namespace uuid7der {

/**
 * @brief Generate a UUIDv7 from the wall clock and project it
 *
 * Each thread owns one boost::uuids::time_generator_v7, so values produced by
 * the same thread increase as long as the system clock does not step back by
 * a millisecond or more.
 *
 * Requires Boost 1.86 or later.
 *
 * @return Projection, or IoError of kind random_source (generator seeding
 *         failed) or encode
 */
inline NewAsn1Result new_raw_uuid_v7_asn1_now() {
    try {
        thread_local boost::uuids::time_generator_v7 generator;
        return detail::project_generated(generator());
    } catch (const boost::uuids::entropy_error& e) {
        return IoError::from_errno(IoErrorKind::random_source, e.what(),
                                   static_cast<int>(e.errcode()));
    }
}

} // namespace uuid7der
