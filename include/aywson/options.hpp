#pragma once

/// @file options.hpp
/// @brief Runtime options for parsing, formatting and sorting.
///
/// Limits are passed explicitly by the caller; the library never reads
/// them from the process environment.

#include "config.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace aywson {

/// @brief Limits applied when decoding a document with parse().
struct ParseOptions {
    /// Maximum nesting depth (0 = use AYWSON_MAX_DEPTH)
    size_t max_depth = 0;

    /// Maximum input size in bytes (0 = unlimited)
    size_t max_size  = 0;

    /// No size limit, default depth limit.
    static constexpr ParseOptions defaults() noexcept {
        return {};
    }

    /// Both limits set explicitly.
    static constexpr ParseOptions limited(size_t size, size_t depth) noexcept {
        ParseOptions opts;
        opts.max_size  = size;
        opts.max_depth = depth;
        return opts;
    }

    size_t effective_depth() const noexcept {
        return max_depth > 0 ? max_depth : AYWSON_MAX_DEPTH;
    }
};

/// @brief Whitespace layout used by format().
struct FormatOptions {
    size_t tab_size           = 2;     ///< Indent width when insert_spaces is set
    bool insert_spaces        = true;  ///< Spaces (true) or one tab per level (false)
    std::string eol           = "\n";  ///< Line terminator
    bool insert_final_newline = false; ///< Terminate the document with eol

    /// The text of one indentation level.
    std::string indent_unit() const {
        return insert_spaces ? std::string(tab_size, ' ') : std::string("\t");
    }
};

/// Strict-weak "less" over property keys.
using KeyComparator = std::function<bool(std::string_view, std::string_view)>;

/// @brief Byte-wise lexicographic key order.
inline bool lexicographic(std::string_view a, std::string_view b) noexcept {
    return a < b;
}

/// @brief Options for sort().
struct SortOptions {
    KeyComparator comparator = lexicographic;
    bool deep = true;  ///< Also sort objects nested inside the sorted one
};

} // namespace aywson
