// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>

#include <cstdint>

namespace uuid7der::utils {

/**
 * @brief Parse a command-line count or timestamp
 *
 * Accepts only decimal digits: no sign, no whitespace, no base prefix, so
 * "010" is ten.
 *
 * @param text Argument text
 * @return Value, or std::nullopt if text is empty, malformed, or above
 *         UINT64_MAX
 */
inline std::optional<uint64_t> parse_decimal_u64(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }

    uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 10);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace uuid7der::utils
