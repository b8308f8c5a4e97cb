#pragma once

/// @file serializer.hpp
/// @brief Value serializer.
///
/// The compact form is what the structural editor splices into documents:
/// no whitespace inside containers, keys and strings escaped the way
/// JavaScript's JSON.stringify does (control characters, quote and
/// backslash only; non-ASCII passes through untouched).

#include "config.hpp"
#include "detail/dtoa.hpp"
#include "value.hpp"

#include <cmath>
#include <string>
#include <string_view>

namespace aywson {

namespace detail {

/// Hex digit table.
inline constexpr char kHexDigits[16] = {
    '0','1','2','3','4','5','6','7','8','9','a','b','c','d','e','f'
};

/// @brief Append a quoted, escaped string literal.
inline void append_quoted(std::string& out, std::string_view s) {
    out.push_back('"');
    const char* run = s.data();
    const char* const end = s.data() + s.size();
    for (const char* p = run; p < end; ++p) {
        const auto c = static_cast<unsigned char>(*p);
        if (AYWSON_LIKELY(c >= 0x20 && c != '"' && c != '\\')) continue;
        out.append(run, static_cast<size_t>(p - run));
        run = p + 1;
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default: {
                const char esc[6] = {'\\', 'u', '0', '0',
                                     kHexDigits[(c >> 4) & 0xF], kHexDigits[c & 0xF]};
                out.append(esc, 6);
                break;
            }
        }
    }
    out.append(run, static_cast<size_t>(end - run));
    out.push_back('"');
}

/// @brief Serializer: compact when indent < 0, pretty-printed otherwise.
class Serializer {
public:
    Serializer(std::string& out, int indent) noexcept : out_(out), indent_(indent) {}

    void write(const Value& v) {
        switch (v.type()) {
            case Type::Null:     out_ += "null"; break;
            case Type::Bool:     out_ += v.as_bool() ? "true" : "false"; break;
            case Type::Integer:  append_int64(out_, v.as_integer()); break;
            case Type::UInteger: append_uint64(out_, v.as_uinteger()); break;
            case Type::Float:    write_float(v.as_float()); break;
            case Type::String:   append_quoted(out_, v.as_string_view()); break;
            case Type::Array:    write_array(v.as_array()); break;
            case Type::Object:   write_object(v.as_object()); break;
        }
    }

private:
    std::string& out_;
    int indent_;
    int depth_ = 0;

    bool pretty() const noexcept { return indent_ >= 0; }

    void newline() {
        if (!pretty()) return;
        out_.push_back('\n');
        out_.append(static_cast<size_t>(depth_ * indent_), ' ');
    }

    void write_float(double d) {
        // Not representable in JSON.
        if (AYWSON_UNLIKELY(std::isnan(d) || std::isinf(d))) {
            out_ += "null";
            return;
        }
        append_double(out_, d);
    }

    void write_array(const Array& arr) {
        if (arr.empty()) { out_ += "[]"; return; }
        out_.push_back('[');
        ++depth_;
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) out_.push_back(',');
            newline();
            write(arr[i]);
        }
        --depth_;
        newline();
        out_.push_back(']');
    }

    void write_object(const Object& obj) {
        if (obj.empty()) { out_ += "{}"; return; }
        out_.push_back('{');
        ++depth_;
        bool first = true;
        for (const auto& [key, val] : obj) {
            if (!first) out_.push_back(',');
            first = false;
            newline();
            append_quoted(out_, key);
            out_.push_back(':');
            if (pretty()) out_.push_back(' ');
            write(val);
        }
        --depth_;
        newline();
        out_.push_back('}');
    }
};

} // namespace detail

/// @brief Serialize a value to a string.
[[nodiscard]] inline std::string serialize(const Value& value, int indent = -1) {
    std::string out;
    detail::Serializer(out, indent).write(value);
    return out;
}

inline std::string Value::dump(int indent) const {
    return serialize(*this, indent);
}

} // namespace aywson
