#pragma once

/// @file error.hpp
/// @brief Error types for aywson: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: ParseError, TypeError, OutOfRangeError, EditError
///   - Via error_code: aywson::errc enum + aywson_category() (exception-free)
///
/// Read-only document queries never throw; they report "missing" instead.
/// Use try_parse(input) for exception-free parsing.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace aywson {

// =====================================================================
// Source position for parse errors
// =====================================================================

/// @brief Position in the source document text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief aywson error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Parse errors (1-49)
    unexpected_end_of_input = 1,
    unexpected_character    = 2,
    invalid_escape          = 3,
    invalid_unicode_escape  = 4,
    invalid_number          = 5,
    unterminated_string     = 6,
    unterminated_comment    = 7,
    trailing_content        = 8,
    max_depth_exceeded      = 9,
    input_too_large         = 10,
    invalid_literal         = 11,

    // Value access errors (50-79)
    type_mismatch           = 50,
    out_of_range            = 51,
    key_not_found           = 52,

    // Edit errors (80-99)
    invalid_path            = 80,
    cannot_edit             = 81,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class aywson_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "aywson";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                      return "success";
            case errc::unexpected_end_of_input: return "unexpected end of input";
            case errc::unexpected_character:    return "unexpected character";
            case errc::invalid_escape:          return "invalid escape sequence";
            case errc::invalid_unicode_escape:  return "invalid unicode escape";
            case errc::invalid_number:          return "invalid number";
            case errc::unterminated_string:     return "unterminated string";
            case errc::unterminated_comment:    return "unterminated block comment";
            case errc::trailing_content:        return "trailing content after document";
            case errc::max_depth_exceeded:      return "maximum nesting depth exceeded";
            case errc::input_too_large:         return "input exceeds the size limit";
            case errc::invalid_literal:         return "invalid literal";
            case errc::type_mismatch:           return "type mismatch";
            case errc::out_of_range:            return "index out of range";
            case errc::key_not_found:           return "key not found";
            case errc::invalid_path:            return "invalid path";
            case errc::cannot_edit:             return "edit not applicable";
            default:                            return "unknown aywson error";
        }
    }
};

} // namespace detail

/// @brief Get the aywson error category singleton.
inline const std::error_category& aywson_category() noexcept {
    static const detail::aywson_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from aywson::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), aywson_category()};
}

/// @brief Create an error_condition from aywson::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), aywson_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Document parse error with source position information.
class ParseError : public std::system_error {
public:
    ParseError(const std::string& message, SourceLocation loc,
               errc code = errc::unexpected_character)
        : std::system_error(make_error_code(code), format_message(message, loc))
        , location_(loc) {}

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "JSONC parse error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) + ": " + msg;
    }

    SourceLocation location_;
};

/// @brief Type mismatch error when accessing a value.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

/// @brief Out-of-range error (array index, missing key, bad path segment).
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg,
                             errc code = errc::out_of_range)
        : std::system_error(make_error_code(code), msg) {}
};

/// @brief A requested edit cannot be expressed against the document
/// structure (e.g. adding a property to a number).
class EditError : public std::system_error {
public:
    explicit EditError(const std::string& msg)
        : std::system_error(make_error_code(errc::cannot_edit), msg) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [val, ec] = aywson::try_parse(input);
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace aywson

// Register aywson::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<aywson::errc> : true_type {};
} // namespace std
