#pragma once

#include <span>
#include <utility>
#include <vector>

#include <cstdint>

#include "../types.hpp"
#include "bit_string.hpp"
#include "der.hpp"

namespace uuid7der::asn1 {

/**
 * @brief Append-only DER encoder
 *
 * Writes TLV elements into an internal buffer in call order. Errors are
 * sticky: after the first failure every write is a no-op and error() keeps
 * reporting the first failure until the writer is discarded.
 *
 * Example:
 * @code
 * DerWriter writer;
 * writer.write_sequence([&](DerWriter& seq) {
 *     seq.write_unsigned_integer(42);
 *     seq.write_bit_string(bits);
 * });
 * if (writer.ok()) send(writer.bytes());
 * @endcode
 */
class DerWriter {
public:
    void write_unsigned_integer(uint64_t value) {
        if (!ok()) {
            return;
        }
        std::vector<uint8_t> content;
        encode_unsigned_integer(value, content);
        write_tlv(Tag::integer, content);
    }

    void write_bit_string(const BitString& bits) {
        if (!ok()) {
            return;
        }
        auto bytes = bits.bytes();
        std::vector<uint8_t> content;
        content.reserve(bytes.size() + 1);
        content.push_back(bits.unused_bits());
        content.insert(content.end(), bytes.begin(), bytes.end());
        write_tlv(Tag::bit_string, content);
    }

    /**
     * @brief Write a SEQUENCE whose elements are produced by body
     *
     * body receives a nested writer; its first error becomes this writer's
     * error.
     */
    template <typename Body>
    void write_sequence(Body&& body) {
        if (!ok()) {
            return;
        }
        DerWriter nested;
        std::forward<Body>(body)(nested);
        if (!nested.ok()) {
            error_ = nested.error();
            return;
        }
        write_tlv(Tag::sequence, nested.bytes());
    }

    [[nodiscard]] bool ok() const noexcept { return error_ == EncodeError::none; }
    [[nodiscard]] EncodeError error() const noexcept { return error_; }

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept { return buffer_; }
    [[nodiscard]] std::vector<uint8_t> release() && { return std::move(buffer_); }

private:
    void write_tlv(Tag tag, std::span<const uint8_t> content) {
        std::vector<uint8_t> header;
        header.push_back(static_cast<uint8_t>(tag));
        EncodeError err = encode_length(content.size(), header);
        if (err != EncodeError::none) {
            error_ = err;
            return;
        }
        buffer_.insert(buffer_.end(), header.begin(), header.end());
        buffer_.insert(buffer_.end(), content.begin(), content.end());
    }

    std::vector<uint8_t> buffer_;
    EncodeError error_ = EncodeError::none;
};

} // namespace uuid7der::asn1
