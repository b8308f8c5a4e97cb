#pragma once

/// @file sort.hpp
/// @brief Reorder object properties as whole text blocks.
///
/// A block is a property together with everything that belongs to it:
/// indentation, leading comments, trailing comma, trailing comment and
/// line terminator. Blocks are moved, never rewritten, except for the
/// commas needed so that every block but the last is followed by one.
/// A trailing comma after the last property survives the reorder.

#include "comments.hpp"
#include "options.hpp"
#include "path.hpp"
#include "scanner.hpp"
#include "tree.hpp"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

namespace aywson {

namespace detail {

struct PropertyBlock {
    const Node* property = nullptr;
    size_t start = 0;      ///< First byte of the block
    size_t end = 0;        ///< One past the block (line terminator included)
    size_t value_end = 0;  ///< One past the property's value
    size_t core_end = 0;   ///< One past the value, comma and same-line comments
    size_t comma = std::string_view::npos;
    size_t line_comment = std::string_view::npos;

    [[nodiscard]] bool has_comma() const noexcept { return comma != std::string_view::npos; }
};

/// Skip the same-line tail of a property: comments, one comma, comments.
inline void scan_property_tail(std::string_view text, PropertyBlock& block) {
    Scanner scanner(text, block.value_end);
    block.core_end = block.value_end;
    for (Token t = scanner.scan(); t != Token::Eof; t = scanner.scan()) {
        if (t == Token::Whitespace) continue;
        if (t == Token::LineComment) {
            block.line_comment = scanner.offset();
            block.core_end = scanner.end();
            break;
        }
        if (t == Token::BlockComment && scanner.error() == ScanError::None) {
            block.core_end = scanner.end();
            continue;
        }
        if (t == Token::Comma && !block.has_comma()) {
            block.comma = scanner.offset();
            block.core_end = scanner.end();
            continue;
        }
        break;
    }
}

/// Offset just past blanks and one line terminator at `pos`, or npos when
/// something else follows on the line.
inline size_t past_line_end(std::string_view text, size_t pos) noexcept {
    while (pos < text.size() && is_blank(text[pos])) ++pos;
    if (pos < text.size() && text[pos] == '\n') return pos + 1;
    if (pos < text.size() && text[pos] == '\r') {
        return pos + 1 < text.size() && text[pos + 1] == '\n' ? pos + 2 : pos + 1;
    }
    return std::string_view::npos;
}

class ObjectSorter {
public:
    ObjectSorter(std::string_view text, const SortOptions& opts) noexcept
        : text_(text), opts_(opts) {}

    /// Source text of `node` with nested objects sorted (when deep).
    std::string render(const Node& node) const {
        if (node.type == NodeType::Object) return sort_object(node);
        if (node.type == NodeType::Array && opts_.deep) return render_children(node);
        return std::string(text_.substr(node.offset, node.length));
    }

    /// Source text of `node` with its properties reordered.
    std::string sort_object(const Node& node) const {
        const auto& props = node.children;
        if (props.empty()) return std::string(text_.substr(node.offset, node.length));

        std::vector<PropertyBlock> blocks(props.size());
        for (size_t i = 0; i < props.size(); ++i) {
            blocks[i].property = props[i].get();
            blocks[i].value_end = props[i]->end();
            scan_property_tail(text_, blocks[i]);
        }
        const bool multi_line = layout_lines(node, blocks);
        if (!multi_line) layout_inline(node, blocks);

        std::vector<size_t> order(blocks.size());
        std::iota(order.begin(), order.end(), size_t{0});
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return opts_.comparator(blocks[a].property->key(), blocks[b].property->key());
        });

        const bool last_comma = blocks.back().has_comma();
        std::string out(text_.substr(node.offset, blocks.front().start - node.offset));
        for (size_t i = 0; i < order.size(); ++i) {
            const bool want_comma = i + 1 < order.size() || last_comma;
            const PropertyBlock& placed = blocks[order[i]];
            append_block(out, placed, want_comma);
            if (multi_line) continue;
            // Separators stay where they were; blocks move between them.
            if (i + 1 < order.size()) {
                append_gap(out, placed, blocks[i].end, blocks[i + 1].start,
                           indentation(text_, blocks[i + 1].start));
            } else {
                append_gap(out, placed, blocks.back().end, node.end(),
                           indentation(text_, node.offset));
            }
        }
        if (multi_line) out.append(text_.substr(blocks.back().end, node.end() - blocks.back().end));
        return out;
    }

private:
    std::string_view text_;
    const SortOptions& opts_;

    /// Copy `node` replacing each child container with its rendering.
    std::string render_children(const Node& node) const {
        std::string out;
        size_t pos = node.offset;
        for (const auto& child : node.children) {
            const Node& target = child->type == NodeType::Property ? *child->value_node() : *child;
            if (!target.is_container()) continue;
            out.append(text_.substr(pos, target.offset - pos));
            out += render(target);
            pos = target.end();
        }
        out.append(text_.substr(pos, node.end() - pos));
        return out;
    }

    /// Assign line-based block boundaries. False when some property does
    /// not own its line(s), in which case blocks stay inline.
    bool layout_lines(const Node& node, std::vector<PropertyBlock>& blocks) const {
        size_t start = past_line_end(text_, node.offset + 1);
        if (start == std::string_view::npos) {
            // Header comment after the brace: block 0 starts on the next line.
            start = next_line_start(text_, node.offset + 1);
            if (start >= text_.size() || start > blocks.front().property->offset) return false;
        }
        for (auto& b : blocks) {
            const size_t ls = line_start(text_, b.property->offset);
            if (ls < start || !all_blank(text_.substr(ls, b.property->offset - ls))) return false;
            const size_t end = past_line_end(text_, b.core_end);
            if (end == std::string_view::npos || end > node.end()) return false;
            b.start = start;
            b.end = end;
            start = end;
        }
        return true;
    }

    /// Inline block boundaries: from the property (or the leading comment of
    /// a property that starts its own line) through its same-line tail.
    void layout_inline(const Node& node, std::vector<PropertyBlock>& blocks) const {
        size_t min_start = node.offset + 1;
        for (auto& b : blocks) {
            const size_t offset = b.property->offset;
            const size_t ls = line_start(text_, offset);
            b.start = offset;
            if (ls >= min_start && all_blank(text_.substr(ls, offset - ls))) {
                auto c = find_leading_comment(text_, offset);
                if (c && c->owns_line && c->start >= min_start) b.start = c->start;
            }
            b.end = b.core_end;
            min_start = b.end;
        }
    }

    /// Copy the separator `[from, to)` after `placed`. A block that ends in
    /// a line comment needs a line break before whatever follows it.
    void append_gap(std::string& out, const PropertyBlock& placed, size_t from, size_t to,
                    std::string_view indent) const {
        auto gap = text_.substr(from, to - from);
        if (placed.line_comment != std::string_view::npos &&
            past_line_end(gap, 0) == std::string_view::npos) {
            size_t skip = 0;
            while (skip < gap.size() && is_blank(gap[skip])) ++skip;
            out.append(line_terminator(text_));
            out.append(indent);
            gap.remove_prefix(skip);
        }
        out.append(gap);
    }

    void append_block(std::string& out, const PropertyBlock& b, bool want_comma) const {
        const Node& value = *b.property->value_node();
        out.append(text_.substr(b.start, value.offset - b.start));
        out += opts_.deep ? render(value) : std::string(text_.substr(value.offset, value.length));

        size_t pos = b.value_end;
        if (want_comma && !b.has_comma()) {
            const size_t at = b.line_comment != std::string_view::npos ? b.value_end : b.core_end;
            out.append(text_.substr(pos, at - pos));
            out.push_back(',');
            pos = at;
        } else if (!want_comma && b.has_comma()) {
            out.append(text_.substr(pos, b.comma - pos));
            pos = b.comma + 1;
        }
        out.append(text_.substr(pos, b.end - pos));
    }
};

} // namespace detail

/// @brief Sort the properties of the object at `path`.
///
/// Missing paths and non-object values leave the text unchanged. With
/// `deep`, objects nested anywhere below are sorted too (array element
/// order is kept).
/// @throws ParseError if the document is not valid JSONC
[[nodiscard]] inline std::string sort(std::string_view text, const Path& path = {},
                                      const SortOptions& opts = {}) {
    const auto root = parse_tree(text);
    const Node* node = find_node(root.get(), path);
    if (!node || node->type != NodeType::Object) return std::string(text);

    std::string out(text.substr(0, node->offset));
    out += detail::ObjectSorter(text, opts).sort_object(*node);
    out.append(text.substr(node->end()));
    return out;
}

} // namespace aywson
