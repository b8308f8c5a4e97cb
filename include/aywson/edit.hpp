#pragma once

/// @file edit.hpp
/// @brief Byte-range edits: generation for value writes, application.
///
/// An Edit replaces `length` bytes at `offset` with `content`. Writing a
/// value never produces more than one edit; every byte outside it is kept.

#include "error.hpp"
#include "path.hpp"
#include "serializer.hpp"
#include "tree.hpp"
#include "value.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace aywson {

struct Edit {
    size_t offset = 0;
    size_t length = 0;
    std::string content;
};

/// @brief Edits that write `value` at `path` in the document whose tree is `root`.
///
/// Rules:
///   - an existing value is replaced by its compact serialization
///   - a missing key is appended after the last property as `,"key": value`
///     (inserted right after `{` in an empty object)
///   - an index below the array size replaces; any larger index appends
///   - missing parents are synthesized: `{"k":v}` for a key, `[v]` for an index
///   - with no root value the whole document becomes the value
///
/// @throws EditError when the parent at the insertion point is a scalar, or
///         when a key is requested on an array or an index on an object.
[[nodiscard]] inline std::vector<Edit> set_edits(const Node* root, const Path& path,
                                                 Value value) {
    std::vector<Segment> segments(path.begin(), path.end());
    const Node* parent = nullptr;
    bool have_last = false;
    Segment last(std::size_t{0});

    while (!segments.empty()) {
        last = segments.back();
        have_last = true;
        segments.pop_back();
        parent = find_node(root, Path(segments));
        if (parent) break;
        if (last.is_key()) {
            Object wrapper;
            wrapper.insert(last.key(), std::move(value));
            value = Value(std::move(wrapper));
        } else {
            Array wrapper;
            wrapper.push_back(std::move(value));
            value = Value(std::move(wrapper));
        }
    }

    if (!parent) {
        if (!root) return {Edit{0, 0, value.dump()}};
        return {Edit{root->offset, root->length, value.dump()}};
    }

    if (parent->type == NodeType::Object && have_last && last.is_key()) {
        for (const auto& prop : parent->children) {
            if (prop->value_node() && prop->key() == last.key()) {
                const Node* existing = prop->value_node();
                return {Edit{existing->offset, existing->length, value.dump()}};
            }
        }
        std::string property;
        detail::append_quoted(property, last.key());
        property += ": ";
        property += value.dump();
        if (!parent->children.empty()) {
            const Node* previous = parent->children.back().get();
            return {Edit{previous->end(), 0, "," + property}};
        }
        return {Edit{parent->offset + 1, 0, std::move(property)}};
    }

    if (parent->type == NodeType::Array && have_last && last.is_index()) {
        const auto& items = parent->children;
        const size_t index = last.index();
        if (index < items.size()) {
            const Node* existing = items[index].get();
            return {Edit{existing->offset, existing->length, value.dump()}};
        }
        if (items.empty()) return {Edit{parent->offset + 1, 0, value.dump()}};
        const Node* previous = items.back().get();
        return {Edit{previous->end(), 0, "," + value.dump()}};
    }

    std::string what = have_last && last.is_index() ? "index" : "property";
    std::string kind;
    switch (parent->type) {
        case NodeType::Object:  kind = "object";  break;
        case NodeType::Array:   kind = "array";   break;
        case NodeType::String:  kind = "string";  break;
        case NodeType::Number:  kind = "number";  break;
        case NodeType::Boolean: kind = "boolean"; break;
        default:                kind = "null";    break;
    }
    throw EditError("cannot add " + what + " '" + last.to_string() + "' to " + kind);
}

/// @brief Parse `text` and compute the edits for writing `value` at `path`.
/// @throws ParseError if the document is not valid JSONC.
[[nodiscard]] inline std::vector<Edit> set_edits(std::string_view text, const Path& path,
                                                 Value value) {
    const auto root = parse_tree(text);
    return set_edits(root.get(), path, std::move(value));
}

/// @brief Apply non-overlapping edits (any order) and return the new text.
[[nodiscard]] inline std::string apply_edits(std::string_view text, std::vector<Edit> edits) {
    std::stable_sort(edits.begin(), edits.end(),
                     [](const Edit& a, const Edit& b) { return a.offset < b.offset; });
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    for (const auto& e : edits) {
        if (AYWSON_UNLIKELY(e.offset < pos || e.offset + e.length > text.size()))
            throw EditError("overlapping or out-of-range edit at offset " + std::to_string(e.offset));
        out.append(text.substr(pos, e.offset - pos));
        out += e.content;
        pos = e.offset + e.length;
    }
    out.append(text.substr(pos));
    return out;
}

} // namespace aywson
