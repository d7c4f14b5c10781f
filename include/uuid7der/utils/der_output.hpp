// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <span>
#include <stdexcept>
#include <string>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <fcntl.h>
#include <unistd.h>

#include "../io_error.hpp"
#include "output_status.hpp"

namespace uuid7der::utils {

/**
 * @brief Unbuffered sink for encoded DER values
 *
 * Writes each buffer completely to a file descriptor: partial writes and
 * EINTR continue with the remaining bytes.
 *
 * Error Handling:
 * - Constructor taking a path may throw on file creation failure
 * - After construction, all operations are noexcept
 * - Errors stored in sticky state (remains until clear_error())
 * - Returns false on error, true on success
 * - errno preserved in last_errno()
 *
 * Thread Safety:
 * - Not thread-safe: single thread should own this instance
 * - Safe to move between threads (move-only)
 */
class DerOutput {
public:
    // Standard output, not owned
    DerOutput() noexcept : DerOutput(STDOUT_FILENO) {}

    // Existing descriptor, not owned (caller closes it)
    explicit DerOutput(int fd) noexcept : fd_(fd), owns_fd_(false) {}

    /**
     * @brief Create or truncate the file at path
     *
     * @param file_path Path to output file
     * @throws std::runtime_error if file cannot be created
     */
    explicit DerOutput(const std::string& file_path) : fd_(-1), owns_fd_(true) {
        fd_ = ::open(file_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd_ < 0) {
            throw std::runtime_error("Failed to create file: " + file_path +
                                     " (errno=" + std::to_string(errno) + ")");
        }
    }

    ~DerOutput() { close(); }

    // Move-only (descriptor ownership)
    DerOutput(const DerOutput&) = delete;
    DerOutput& operator=(const DerOutput&) = delete;

    DerOutput(DerOutput&& other) noexcept
        : fd_(other.fd_),
          owns_fd_(other.owns_fd_),
          status_(other.status_),
          values_written_(other.values_written_),
          bytes_written_(other.bytes_written_),
          last_errno_(other.last_errno_) {
        other.fd_ = -1;
        other.owns_fd_ = false;
        other.status_ = OutputStatus::closed;
    }

    DerOutput& operator=(DerOutput&& other) noexcept {
        if (this != &other) {
            close();

            fd_ = other.fd_;
            owns_fd_ = other.owns_fd_;
            status_ = other.status_;
            values_written_ = other.values_written_;
            bytes_written_ = other.bytes_written_;
            last_errno_ = other.last_errno_;

            other.fd_ = -1;
            other.owns_fd_ = false;
            other.status_ = OutputStatus::closed;
        }
        return *this;
    }

    /**
     * @brief Write one encoded value
     *
     * @param bytes Encoded bytes
     * @return true if every byte was written, false on error
     */
    bool write(std::span<const uint8_t> bytes) noexcept {
        if (status_ != OutputStatus::ready) {
            return false;
        }

        size_t done = 0;
        while (done < bytes.size()) {
            ssize_t n = ::write(fd_, bytes.data() + done, bytes.size() - done);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                set_error(errno);
                return false;
            }
            done += static_cast<size_t>(n);
        }

        values_written_++;
        bytes_written_ += bytes.size();
        return true;
    }

    // Close the descriptor if owned; further writes fail with status closed
    void close() noexcept {
        if (owns_fd_ && fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = -1;
        owns_fd_ = false;
        status_ = OutputStatus::closed;
    }

    [[nodiscard]] OutputStatus status() const noexcept { return status_; }
    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] int last_errno() const noexcept { return last_errno_; }
    [[nodiscard]] size_t values_written() const noexcept { return values_written_; }
    [[nodiscard]] size_t bytes_written() const noexcept { return bytes_written_; }

    // Resets a write error to allow another attempt; a closed sink stays closed
    void clear_error() noexcept {
        if (is_open()) {
            status_ = OutputStatus::ready;
            last_errno_ = 0;
        }
    }

    // Current failure as the uniform error type
    [[nodiscard]] IoError error() const {
        return IoError::from_errno(IoErrorKind::write,
                                   std::string("Output ") + output_status_string(status_),
                                   last_errno_);
    }

private:
    void set_error(int err) noexcept {
        last_errno_ = err;
        switch (err) {
            case ENOSPC:
                status_ = OutputStatus::disk_full;
                break;
            case EACCES:
            case EPERM:
                status_ = OutputStatus::permission_denied;
                break;
            case EPIPE:
                status_ = OutputStatus::broken_pipe;
                break;
            default:
                status_ = OutputStatus::write_error;
                break;
        }
    }

    int fd_;                                    ///< File descriptor
    bool owns_fd_;                              ///< Close fd_ on destruction
    OutputStatus status_ = OutputStatus::ready; ///< Sticky status
    size_t values_written_ = 0;                 ///< Values written successfully
    size_t bytes_written_ = 0;                  ///< Total bytes written
    int last_errno_ = 0;                        ///< Last error number
};

} // namespace uuid7der::utils
