#pragma once

/// @file range.hpp
/// @brief Deletion span of a property or array element.

#include "comments.hpp"
#include "tree.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace aywson {

/// @brief Where a property sits and what removing it deletes.
///
/// `[delete_start, delete_end)` is replaced by `replacement`: the line
/// break under a removed header comment, and the indentation of a detached
/// trailing comment that stays behind. Usually empty.
struct PropertyRange {
    bool single_line = false;  ///< Shares its line with the container's opening brace
    bool own_line = true;      ///< Only indentation precedes it on its line
    size_t line_start = 0;
    size_t delete_start = 0;
    size_t delete_end = 0;
    std::string replacement;
};

/// @brief The node that is deleted together with the value at a path: the
/// property for an object member, the element itself inside an array.
/// Returns nullptr for the root value.
[[nodiscard]] inline const Node* owning_entry(const Node* value) noexcept {
    if (!value || !value->parent) return nullptr;
    return value->parent->type == NodeType::Property ? value->parent : value;
}

/// @brief Compute the deletion span of `entry` (a property or array element).
///
/// Multi-line (the entry starts its own line): from the start of its
/// non-detached leading comment, or its line, through the comma, blanks,
/// a non-detached trailing comment and the line terminator. Otherwise from
/// the entry itself through the comma and blanks.
[[nodiscard]] inline PropertyRange resolve_range(std::string_view text, const Node& entry) {
    PropertyRange r;
    r.line_start = detail::line_start(text, entry.offset);
    const auto before = text.substr(r.line_start, entry.offset - r.line_start);
    const bool in_array = entry.parent && entry.parent->type == NodeType::Array;
    r.single_line = before.find('{') != std::string_view::npos ||
                    (in_array && before.find('[') != std::string_view::npos);
    r.own_line = !r.single_line && detail::all_blank(before);

    r.delete_start = entry.offset;
    std::string kept;
    if (r.own_line) {
        r.delete_start = r.line_start;
        if (auto c = find_leading_comment(text, entry.offset); c && !c->detached) {
            const auto span = leading_comment_span(text, *c);
            r.delete_start = span.start;
            // A comment after the opening brace goes alone; the line break stays.
            if (!c->owns_line) kept = std::string(text.substr(span.end, r.line_start - span.end));
        }
    }

    size_t end = entry.end();
    bool comma = false;
    if (end < text.size() && text[end] == ',') { ++end; comma = true; }
    while (end < text.size() && detail::is_blank(text[end])) ++end;

    if (r.own_line) {
        if (auto t = find_trailing_comment(text, entry.end())) {
            if (t->detached) {
                // Keep the comment on its own line at the entry's indentation.
                r.delete_end = t->start;
                r.replacement = kept + std::string(before);
                return r;
            }
            end = t->end;
            while (end < text.size() && detail::is_blank(text[end])) ++end;
            if (!comma && end < text.size() && text[end] == ',') {
                ++end;
                while (end < text.size() && detail::is_blank(text[end])) ++end;
            }
        }
        if (end < text.size() && text[end] == '\n') {
            ++end;
        } else if (end < text.size() && text[end] == '\r') {
            ++end;
            if (end < text.size() && text[end] == '\n') ++end;
        } else if (end < text.size() && text[end] != '}' && text[end] != ']') {
            // A sibling further along the line takes over the indentation.
            kept += before;
        }
    }
    r.delete_end = end;
    r.replacement = std::move(kept);
    return r;
}

} // namespace aywson
