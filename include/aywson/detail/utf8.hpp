#pragma once

/// @file detail/utf8.hpp
/// @brief UTF-8 helpers used when decoding \uXXXX escapes in document strings.

#include <cstdint>
#include <string>

namespace aywson::detail::utf8 {

/// @brief Encodes a Unicode code point as UTF-8 and appends to the string.
/// @param cp   Unicode code point (0x0000..0x10FFFF).
/// @param out  Destination string for UTF-8 bytes.
inline void encode(uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/// @brief Value of one hex digit, or -1.
inline int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// True for the high half of a UTF-16 surrogate pair.
inline bool is_high_surrogate(uint32_t cp) noexcept { return cp >= 0xD800 && cp <= 0xDBFF; }
inline bool is_low_surrogate(uint32_t cp) noexcept { return cp >= 0xDC00 && cp <= 0xDFFF; }

/// @brief Combine a surrogate pair into a code point.
inline uint32_t combine_surrogates(uint32_t high, uint32_t low) noexcept {
    return 0x10000u + ((high - 0xD800u) << 10) + (low - 0xDC00u);
}

} // namespace aywson::detail::utf8
