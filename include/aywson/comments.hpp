#pragma once

/// @file comments.hpp
/// @brief Locating the comments that document a property.
///
/// Two kinds are recognised:
///   - leading: on the line directly above the property
///       // documents "port"
///       "port": 8080,
///   - trailing: after the value (and its comma) on the same line
///       "port": 8080, // documents "port"
///
/// A comment whose trimmed content starts with AYWSON_DETACH_MARKER is
/// detached: it survives removal of the property it sits next to.

#include "config.hpp"
#include "scanner.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace aywson {

struct Comment {
    size_t start = 0;       ///< First byte of the comment token
    size_t end = 0;         ///< One past its last byte
    std::string content;    ///< Text without delimiters, trimmed
    bool block = false;     ///< `/* */` rather than `//`
    bool detached = false;  ///< Content starts with the detach marker
    bool owns_line = true;  ///< Only indentation precedes it on its line
};

/// Half-open byte range.
struct Span {
    size_t start = 0;
    size_t end = 0;
};

namespace detail {

inline bool is_blank(char c) noexcept { return c == ' ' || c == '\t'; }

inline bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

inline std::string_view trim_left(std::string_view s) noexcept {
    size_t i = 0;
    while (i < s.size() && is_space(s[i])) ++i;
    return s.substr(i);
}

inline std::string_view trim_right(std::string_view s) noexcept {
    size_t n = s.size();
    while (n > 0 && is_space(s[n - 1])) --n;
    return s.substr(0, n);
}

inline std::string_view trim(std::string_view s) noexcept {
    return trim_right(trim_left(s));
}

inline bool starts_with(std::string_view s, std::string_view prefix) noexcept {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool all_blank(std::string_view s) noexcept {
    for (char c : s) if (!is_blank(c)) return false;
    return true;
}

/// Offset of the first byte of the line holding `pos`.
inline size_t line_start(std::string_view text, size_t pos) noexcept {
    while (pos > 0 && text[pos - 1] != '\n') --pos;
    return pos;
}

/// Offset just past the line terminator that ends the line holding `pos`
/// (text size on the last line).
inline size_t next_line_start(std::string_view text, size_t pos) noexcept {
    while (pos < text.size() && text[pos] != '\n') ++pos;
    return pos < text.size() ? pos + 1 : pos;
}

/// Line terminator used for inserted lines: CRLF when the document has one.
inline std::string_view line_terminator(std::string_view text) noexcept {
    return text.find("\r\n") != std::string_view::npos ? "\r\n" : "\n";
}

/// Spaces and tabs that open the line holding `pos`.
inline std::string_view indentation(std::string_view text, size_t pos) noexcept {
    const size_t ls = line_start(text, pos);
    size_t end = ls;
    while (end < text.size() && is_blank(text[end])) ++end;
    return text.substr(ls, end - ls);
}

inline Comment make_comment(std::string_view text, size_t start, size_t end, bool block) {
    Comment c;
    c.start = start;
    c.end = end;
    c.block = block;
    const auto body = block ? text.substr(start + 2, end - start - 4)
                            : text.substr(start + 2, end - start - 2);
    c.content = std::string(trim(body));
    c.detached = starts_with(c.content, AYWSON_DETACH_MARKER);
    return c;
}

/// Classify what precedes a comment on its first line: indentation only
/// (owns the line), an opening brace or bracket (shares it with the
/// container), or anything else (not a leading comment at all).
inline std::optional<bool> leading_prefix_owns_line(std::string_view text, size_t comment_start) {
    const size_t ls = line_start(text, comment_start);
    const auto prefix = trim(text.substr(ls, comment_start - ls));
    if (prefix.empty()) return true;
    if (prefix == "{" || prefix == "[") return false;
    return std::nullopt;
}

} // namespace detail

/// @brief Find the comment on the line(s) directly above a property.
///
/// `property_offset` is the first byte of the property's key (or of an
/// array element). Rule order: skip spaces/tabs backwards, require a
/// newline, skip one carriage return, skip the previous line's trailing
/// spaces/tabs, then try a block comment ending there before a line
/// comment making up the whole previous line. A line comment that follows
/// the container's opening brace on its line also counts.
[[nodiscard]] inline std::optional<Comment> find_leading_comment(std::string_view text,
                                                                 size_t property_offset) {
    using detail::is_blank;
    auto pos = static_cast<std::ptrdiff_t>(property_offset) - 1;

    while (pos >= 0 && is_blank(text[pos])) --pos;
    if (pos < 0 || text[pos] != '\n') return std::nullopt;
    --pos;
    if (pos >= 0 && text[pos] == '\r') --pos;
    while (pos >= 0 && is_blank(text[pos])) --pos;
    if (pos < 0) return std::nullopt;

    if (pos >= 1 && text[pos] == '/' && text[pos - 1] == '*') {
        for (auto i = pos - 2; i >= 1; --i) {
            if (text[i - 1] == '/' && text[i] == '*') {
                auto c = detail::make_comment(text, static_cast<size_t>(i - 1),
                                              static_cast<size_t>(pos + 1), true);
                const auto owns = detail::leading_prefix_owns_line(text, c.start);
                if (!owns) return std::nullopt;
                c.owns_line = *owns;
                return c;
            }
        }
        return std::nullopt;
    }

    // Line comment: the first non-blank token of the previous line, or the
    // token right after an opening brace/bracket.
    const size_t line_end = static_cast<size_t>(pos) + 1;
    const size_t ls = detail::line_start(text, line_end);
    Scanner scanner(text, ls);
    bool after_opener = false;
    for (Token t = scanner.scan(); scanner.offset() < line_end; t = scanner.scan()) {
        if (t == Token::Whitespace) continue;
        if (t == Token::LineComment) {
            auto c = detail::make_comment(text, scanner.offset(), scanner.end(), false);
            c.owns_line = !after_opener;
            return c;
        }
        if (!after_opener && (t == Token::OpenBrace || t == Token::OpenBracket)) {
            after_opener = true;
            continue;
        }
        break;
    }
    return std::nullopt;
}

/// @brief Find a comment after a value on the same line.
///
/// Scans from `value_end` past spaces/tabs, one optional comma, and more
/// spaces/tabs; recognises a line comment to end of line or one block
/// comment.
[[nodiscard]] inline std::optional<Comment> find_trailing_comment(std::string_view text,
                                                                  size_t value_end) {
    using detail::is_blank;
    size_t pos = value_end;
    while (pos < text.size() && is_blank(text[pos])) ++pos;
    if (pos < text.size() && text[pos] == ',') ++pos;
    while (pos < text.size() && is_blank(text[pos])) ++pos;
    if (pos + 1 >= text.size() || text[pos] != '/') return std::nullopt;

    if (text[pos + 1] == '/') {
        size_t end = pos + 2;
        while (end < text.size() && text[end] != '\n' && text[end] != '\r') ++end;
        auto c = detail::make_comment(text, pos, end, false);
        c.owns_line = false;
        return c;
    }
    if (text[pos + 1] == '*') {
        const size_t close = text.find("*/", pos + 2);
        if (close == std::string_view::npos) return std::nullopt;
        auto c = detail::make_comment(text, pos, close + 2, true);
        c.owns_line = false;
        return c;
    }
    return std::nullopt;
}

/// @brief Bytes to delete to remove a leading comment entirely: its whole
/// line(s) with the terminator when it owns the line, otherwise the
/// comment and the blanks before it.
[[nodiscard]] inline Span leading_comment_span(std::string_view text, const Comment& c) noexcept {
    if (c.owns_line)
        return {detail::line_start(text, c.start), detail::next_line_start(text, c.end)};
    size_t start = c.start;
    while (start > 0 && detail::is_blank(text[start - 1])) --start;
    return {start, c.end};
}

/// @brief Bytes to delete to remove a trailing comment: the comment and
/// the blanks separating it from the value or comma.
[[nodiscard]] inline Span trailing_comment_span(std::string_view text, const Comment& c) noexcept {
    size_t start = c.start;
    while (start > 0 && detail::is_blank(text[start - 1])) --start;
    return {start, c.end};
}

} // namespace aywson
