// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <string>

#include <cstdint>
#include <cstring>

#include "types.hpp"

namespace uuid7der {

// Stage at which an externally visible operation failed
enum class IoErrorKind : uint8_t {
    clock,         ///< Timestamp acquisition failed or is out of range
    random_source, ///< Random byte source failed
    encode,        ///< BIT STRING construction or DER encoding failed
    write          ///< Writing encoded bytes failed
};

constexpr const char* io_error_kind_string(IoErrorKind kind) noexcept {
    switch (kind) {
        case IoErrorKind::clock:
            return "clock";
        case IoErrorKind::random_source:
            return "random_source";
        case IoErrorKind::encode:
            return "encode";
        case IoErrorKind::write:
            return "write";
    }
    return "unknown";
}

/**
 * @brief Uniform error reported by the generation and output paths
 *
 * Wraps the underlying cause without interpreting it: the errno of a failed
 * system call, or the EncodeError of a failed projection.
 */
struct IoError {
    IoErrorKind kind;                     ///< Failing stage
    std::string message;                  ///< Description of the failure
    int sys_errno = 0;                    ///< errno, 0 if not from a system call
    EncodeError encode = EncodeError::none; ///< Cause for encode failures

    static IoError from_encode_error(EncodeError err) {
        return IoError{IoErrorKind::encode, encode_error_string(err), 0, err};
    }

    static IoError from_errno(IoErrorKind kind, const std::string& what, int err) {
        return IoError{kind, what, err, EncodeError::none};
    }

    std::string error_message() const {
        std::string msg = std::string(io_error_kind_string(kind)) + ": " + message;
        if (sys_errno != 0) {
            msg += " (errno=" + std::to_string(sys_errno) + ": " + std::strerror(sys_errno) + ")";
        }
        return msg;
    }
};

} // namespace uuid7der
