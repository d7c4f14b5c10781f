// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>

namespace uuid7der::utils {

/**
 * @brief Status codes for DER output operations
 *
 * Represents the current state of an output sink, including error
 * conditions that may arise during a write.
 */
enum class OutputStatus : uint8_t {
    ready,             ///< Sink is ready for write operations
    write_error,       ///< Write system call failed
    closed,            ///< Sink has been closed
    disk_full,         ///< Disk is full (ENOSPC)
    permission_denied, ///< Permission denied (EACCES/EPERM)
    broken_pipe        ///< Reader went away (EPIPE)
};

/**
 * @brief Convert OutputStatus to human-readable string
 *
 * @param status The status code to convert
 * @return String representation of the status
 */
constexpr const char* output_status_string(OutputStatus status) noexcept {
    switch (status) {
        case OutputStatus::ready:
            return "ready";
        case OutputStatus::write_error:
            return "write_error";
        case OutputStatus::closed:
            return "closed";
        case OutputStatus::disk_full:
            return "disk_full";
        case OutputStatus::permission_denied:
            return "permission_denied";
        case OutputStatus::broken_pipe:
            return "broken_pipe";
    }
    return "unknown";
}

} // namespace uuid7der::utils
