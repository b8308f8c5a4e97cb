#pragma once

/// @file detail/dtoa.hpp
/// @brief Number to string conversion for values written into documents.
///
/// Guarantees:
///   - Output is always a valid JSON number
///   - Roundtrip: parse(format_double(x)) == x (shortest representation)
///   - Floats always contain '.' or 'e' to distinguish them from integers

#include "../config.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <string>

namespace aywson::detail {

inline void append_int64(std::string& out, int64_t val) {
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), val);
    out.append(buf, static_cast<size_t>(ptr - buf));
}

inline void append_uint64(std::string& out, uint64_t val) {
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), val);
    out.append(buf, static_cast<size_t>(ptr - buf));
}

/// @brief Append the shortest round-trip form of a finite double.
/// Caller handles NaN/Infinity.
inline void append_double(std::string& out, double val) {
    // Zero is written without a sign so that -0.0 and 0.0 serialize alike.
    if (val == 0.0) {
        out += "0.0";
        return;
    }
    char buf[40];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), val);
    const auto len = static_cast<size_t>(ptr - buf);
    bool has_dot = false;
    for (size_t i = 0; i < len; ++i) {
        if (buf[i] == '.' || buf[i] == 'e' || buf[i] == 'E') {
            has_dot = true;
            break;
        }
    }
    out.append(buf, len);
    if (!has_dot) out += ".0";
}

} // namespace aywson::detail
