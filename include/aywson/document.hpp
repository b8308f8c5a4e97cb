#pragma once

/// @file document.hpp
/// @brief Lossless path operations on JSONC text.
///
/// Every function takes the document text and returns a new text; bytes
/// outside the edited span are copied unchanged, comments and formatting
/// included. Each call parses the text afresh.
///
/// Read-only queries (get, has, get_comment, get_trailing_comment) never
/// throw on bad input; they report "missing". Mutations throw ParseError
/// when the text is not valid JSONC and return the input unchanged when the
/// path does not resolve.
///
/// Usage:
///   std::string text = R"({
///     // listening port
///     "port": 8080
///   })";
///   text = aywson::set(text, "port", 9090);
///   text = aywson::set(text, "host", "localhost", "bind address");
///   auto port = aywson::get(text, "port");   // std::optional<Value>

#include "change.hpp"
#include "comments.hpp"
#include "edit.hpp"
#include "error.hpp"
#include "path.hpp"
#include "range.hpp"
#include "tree.hpp"
#include "value.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aywson {

namespace detail {

inline void require_single_line(std::string_view comment) {
    if (comment.find_first_of("\r\n") != std::string_view::npos)
        throw EditError("comment text must not contain line breaks");
}

inline std::string splice(std::string_view text, size_t start, size_t end,
                          std::string_view content) {
    std::string out;
    out.reserve(text.size() - (end - start) + content.size());
    out.append(text.substr(0, start));
    out.append(content);
    out.append(text.substr(end));
    return out;
}

/// `// text` when nothing else follows on the line, `/* text */` otherwise.
inline std::string render_trailing(std::string_view text, size_t pos, std::string_view comment) {
    size_t i = pos;
    while (i < text.size() && is_blank(text[i])) ++i;
    const bool line_ends = i >= text.size() || text[i] == '\n' || text[i] == '\r';
    return line_ends ? "// " + std::string(comment) : "/* " + std::string(comment) + " */";
}

} // namespace detail

// ─── Queries ─────────────────────────────────────────────────────────────

/// @brief Decoded value at `path`, or nullopt when missing or unparsable.
[[nodiscard]] inline std::optional<Value> get(std::string_view text, const Path& path) {
    auto tree = try_parse_tree(text);
    if (tree.ec || !tree.value) return std::nullopt;
    const Node* node = find_node(tree.value.get(), path);
    if (!node) return std::nullopt;
    return node_value(*node);
}

/// @brief Whether `path` resolves in the document.
[[nodiscard]] inline bool has(std::string_view text, const Path& path) {
    auto tree = try_parse_tree(text);
    if (tree.ec || !tree.value) return false;
    return find_node(tree.value.get(), path) != nullptr;
}

// ─── Writes ──────────────────────────────────────────────────────────────

/// @brief Write `value` at `path`, creating missing parents.
/// @throws ParseError, EditError (parent is a scalar)
[[nodiscard]] inline std::string set(std::string_view text, const Path& path, Value value) {
    const auto root = parse_tree(text);
    return apply_edits(text, set_edits(root.get(), path, std::move(value)));
}

[[nodiscard]] inline std::string set_comment(std::string_view text, const Path& path,
                                             std::string_view comment);

/// @brief Write `value` at `path` and document it with a leading comment.
/// The comment is skipped when the property shares its container's line.
[[nodiscard]] inline std::string set(std::string_view text, const Path& path, Value value,
                                     std::string_view comment) {
    return set_comment(set(text, path, std::move(value)), path, comment);
}

/// @brief Remove the property or array element at `path`, along with its
/// non-detached comments. Missing paths leave the text unchanged.
[[nodiscard]] inline std::string remove(std::string_view text, const Path& path) {
    const auto root = parse_tree(text);
    const Node* entry = owning_entry(find_node(root.get(), path));
    if (!entry) return std::string(text);

    const auto range = resolve_range(text, *entry);
    std::string before(text.substr(0, range.delete_start));
    const auto after = text.substr(range.delete_end);

    // A comma left dangling in front of the closing brace goes too.
    const auto kept = detail::trim_right(before);
    const auto rest = detail::trim_left(after);
    if (!kept.empty() && kept.back() == ',' && !rest.empty() &&
        (rest.front() == '}' || rest.front() == ']')) {
        before.erase(kept.size() - 1, 1);
    }
    before += range.replacement;
    before.append(after);
    return before;
}

// ─── Bulk changes ────────────────────────────────────────────────────────

/// @brief Apply every leaf of `change` in order; unmentioned keys stay.
[[nodiscard]] inline std::string merge(std::string_view text, const Change& change) {
    std::string out(text);
    for (const auto& leaf : flatten(change)) {
        out = leaf.is_delete() ? remove(out, leaf.path) : set(out, leaf.path, *leaf.value);
    }
    return out;
}

/// @brief Same as merge(); explicit deletes are Change::remove() entries.
[[nodiscard]] inline std::string patch(std::string_view text, const Change& change) {
    return merge(text, change);
}

/// @brief Make the document's objects hold exactly the keys `change`
/// names: unmentioned members are removed (deepest first), then the
/// change is merged.
[[nodiscard]] inline std::string replace(std::string_view text, const Change& change) {
    std::vector<Path> deletions;
    {
        const auto root = parse_tree(text);
        deletions = compute_deletions(root.get(), change);
    }
    std::stable_sort(deletions.begin(), deletions.end(),
                     [](const Path& a, const Path& b) { return a.size() > b.size(); });

    std::string out(text);
    for (const auto& path : deletions) out = remove(out, path);
    return merge(out, change);
}

/// @brief Same as replace().
[[nodiscard]] inline std::string modify(std::string_view text, const Change& change) {
    return replace(text, change);
}

// ─── Key operations ──────────────────────────────────────────────────────

/// @brief Rename the property at `path` to `new_key`, keeping its value
/// and leading comment. The renamed property is appended to its object.
/// A detached comment is copied: it also stays where it was.
/// @throws EditError if `path` names an array element
[[nodiscard]] inline std::string rename(std::string_view text, const Path& path,
                                        std::string_view new_key) {
    Value value;
    std::optional<std::string> comment;
    {
        const auto root = parse_tree(text);
        const Node* node = find_node(root.get(), path);
        const Node* entry = owning_entry(node);
        if (!entry) return std::string(text);
        if (entry->type != NodeType::Property)
            throw EditError("cannot rename array element '" + path.to_string() + "'");

        value = node_value(*node);
        if (!resolve_range(text, *entry).single_line) {
            if (auto c = find_leading_comment(text, entry->offset)) comment = std::move(c->content);
        }
    }

    const Path target = path.with_last(std::string(new_key));
    std::string out = set(remove(text, path), target, std::move(value));
    if (comment) out = set_comment(out, target, *comment);
    return out;
}

/// @brief Move the value at `from` to `to`. Comments around the source
/// are removed with it.
[[nodiscard]] inline std::string move(std::string_view text, const Path& from, const Path& to) {
    Value value;
    {
        const auto root = parse_tree(text);
        const Node* node = find_node(root.get(), from);
        if (!owning_entry(node)) return std::string(text);
        value = node_value(*node);
    }
    return set(remove(text, from), to, std::move(value));
}

// ─── Comments ────────────────────────────────────────────────────────────

/// @brief Content of the trailing comment after the value at `path`.
[[nodiscard]] inline std::optional<std::string> get_trailing_comment(std::string_view text,
                                                                     const Path& path) {
    auto tree = try_parse_tree(text);
    if (tree.ec || !tree.value) return std::nullopt;
    const Node* entry = owning_entry(find_node(tree.value.get(), path));
    if (!entry) return std::nullopt;
    if (auto c = find_trailing_comment(text, entry->end())) return std::move(c->content);
    return std::nullopt;
}

/// @brief Content of the leading comment at `path`, falling back to the
/// trailing one.
[[nodiscard]] inline std::optional<std::string> get_comment(std::string_view text,
                                                            const Path& path) {
    auto tree = try_parse_tree(text);
    if (tree.ec || !tree.value) return std::nullopt;
    const Node* entry = owning_entry(find_node(tree.value.get(), path));
    if (!entry) return std::nullopt;
    if (auto c = find_leading_comment(text, entry->offset)) return std::move(c->content);
    if (auto c = find_trailing_comment(text, entry->end())) return std::move(c->content);
    return std::nullopt;
}

/// @brief Write or replace the leading comment of the entry at `path`.
///
/// No-op for an entry on its container's opening line. An entry that
/// follows a sibling on the same line is moved to a line of its own first.
/// @throws EditError if `comment` contains a line break
[[nodiscard]] inline std::string set_comment(std::string_view text, const Path& path,
                                             std::string_view comment) {
    detail::require_single_line(comment);
    const auto root = parse_tree(text);
    const Node* entry = owning_entry(find_node(root.get(), path));
    if (!entry) return std::string(text);

    const auto range = resolve_range(text, *entry);
    if (range.single_line) return std::string(text);

    const auto eol = detail::line_terminator(text);
    const auto before = text.substr(range.line_start, entry->offset - range.line_start);
    const std::string rendered = "// " + std::string(comment);

    if (!range.own_line) {
        const std::string indent(detail::indentation(text, entry->offset));
        size_t gap = entry->offset;
        while (gap > range.line_start && detail::is_blank(text[gap - 1])) --gap;
        return detail::splice(text, gap, entry->offset,
                              std::string(eol) + indent + rendered + std::string(eol) + indent);
    }

    const std::string line = std::string(before) + rendered + std::string(eol);
    if (auto c = find_leading_comment(text, entry->offset)) {
        if (!c->owns_line) return detail::splice(text, c->start, c->end, rendered);
        const auto span = leading_comment_span(text, *c);
        return detail::splice(text, span.start, span.end, line);
    }
    return detail::splice(text, range.line_start, range.line_start, line);
}

/// @brief Write or replace the trailing comment of the entry at `path`,
/// placed after its comma. No-op for an entry on its container's opening
/// line.
/// @throws EditError if `comment` contains a line break
[[nodiscard]] inline std::string set_trailing_comment(std::string_view text, const Path& path,
                                                      std::string_view comment) {
    detail::require_single_line(comment);
    const auto root = parse_tree(text);
    const Node* entry = owning_entry(find_node(root.get(), path));
    if (!entry) return std::string(text);
    if (resolve_range(text, *entry).single_line) return std::string(text);

    if (auto c = find_trailing_comment(text, entry->end())) {
        return detail::splice(text, c->start, c->end,
                              detail::render_trailing(text, c->end, comment));
    }

    size_t pos = entry->end();
    size_t next = pos;
    while (next < text.size() && detail::is_blank(text[next])) ++next;
    if (next < text.size() && text[next] == ',') pos = next + 1;
    return detail::splice(text, pos, pos, " " + detail::render_trailing(text, pos, comment));
}

/// @brief Remove the leading comment of the entry at `path` (its whole line).
[[nodiscard]] inline std::string remove_comment(std::string_view text, const Path& path) {
    const auto root = parse_tree(text);
    const Node* entry = owning_entry(find_node(root.get(), path));
    if (!entry) return std::string(text);
    const auto c = find_leading_comment(text, entry->offset);
    if (!c) return std::string(text);
    const auto span = leading_comment_span(text, *c);
    return detail::splice(text, span.start, span.end, {});
}

/// @brief Remove the trailing comment of the entry at `path`.
[[nodiscard]] inline std::string remove_trailing_comment(std::string_view text,
                                                         const Path& path) {
    const auto root = parse_tree(text);
    const Node* entry = owning_entry(find_node(root.get(), path));
    if (!entry) return std::string(text);
    const auto c = find_trailing_comment(text, entry->end());
    if (!c) return std::string(text);
    const auto span = trailing_comment_span(text, *c);
    return detail::splice(text, span.start, span.end, {});
}

} // namespace aywson
