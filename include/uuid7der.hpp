#pragma once

// UUID7DER - UUIDv7 bit layout and ASN.1 DER projection
//
// A header-only C++20 library converting between three views of a UUIDv7:
// - Packed 128-bit value (UuidV7Seeds packs, UnverifiedUuidV7 unpacks)
// - Named fields (RawUuidV7), optionally after version/variant validation
// - ASN.1 DER SEQUENCE with BIT STRING sub-fields (RawUuidV7Asn1)
//
// Generation (Boost.UUID):
// - new_raw_uuid_v7_asn1() packs boost::uuids::random_generator bits
// - new_raw_uuid_v7_asn1_now() in uuid7der/time_generator.hpp wraps
//   boost::uuids::time_generator_v7 (Boost 1.86+), included separately

// ====================
// Public API
// ====================

// Core types, error codes, and bit layout
#include "uuid7der/layout.hpp"
#include "uuid7der/types.hpp"
#include "uuid7der/version.hpp"

// 128-bit views and validation
#include "uuid7der/raw_uuid.hpp"
#include "uuid7der/seeds.hpp"
#include "uuid7der/uuid.hpp"

// ASN.1 projection
#include "uuid7der/raw_uuid_asn1.hpp"

// Generation
#include "uuid7der/generator.hpp"
#include "uuid7der/io_error.hpp"
