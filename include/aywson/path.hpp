#pragma once

/// @file path.hpp
/// @brief Paths into a document's logical value tree.
///
/// A path is an ordered list of segments, each a property name or an
/// array index:
///   {"config", "items", 0}  -> config.items[0]
///
/// Two notations build the same path:
///   - an explicit braced list of segments: {"a", "b", 2}
///   - a dot-and-bracket string: "a.b.2" or "a.b[2]"
/// In the string notation a token made only of digits is an index; any
/// other token (including "-1") is a key. The empty string is the root.

#include "error.hpp"

#include <charconv>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace aywson {

/// @brief One path step: a property key or an array index.
class Segment {
public:
    Segment(const char* key) : key_(key), index_(0), is_index_(false) {}
    Segment(std::string key) : key_(std::move(key)), index_(0), is_index_(false) {}
    Segment(std::string_view key) : key_(key), index_(0), is_index_(false) {}
    Segment(std::size_t index) noexcept : index_(index), is_index_(true) {}
    Segment(int index) : index_(0), is_index_(true) {
        if (index < 0)
            throw OutOfRangeError("negative array index " + std::to_string(index),
                                  errc::invalid_path);
        index_ = static_cast<std::size_t>(index);
    }

    [[nodiscard]] bool is_index() const noexcept { return is_index_; }
    [[nodiscard]] bool is_key() const noexcept { return !is_index_; }

    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] std::size_t index() const noexcept { return index_; }

    /// Positional, type-sensitive equality: key "0" != index 0.
    bool operator==(const Segment& o) const noexcept {
        if (is_index_ != o.is_index_) return false;
        return is_index_ ? index_ == o.index_ : key_ == o.key_;
    }
    bool operator!=(const Segment& o) const noexcept { return !(*this == o); }

    [[nodiscard]] std::string to_string() const {
        return is_index_ ? "[" + std::to_string(index_) + "]" : key_;
    }

private:
    std::string key_;
    std::size_t index_;
    bool is_index_;
};

/// @brief Ordered sequence of segments identifying a value.
class Path {
public:
    using const_iterator = std::vector<Segment>::const_iterator;

    /// Root path.
    Path() = default;

    Path(std::initializer_list<Segment> segments) : segments_(segments) {}
    explicit Path(std::vector<Segment> segments) : segments_(std::move(segments)) {}

    /// Dot-and-bracket notation ("a.b[2]").
    Path(const char* notation);
    Path(std::string_view notation);
    Path(const std::string& notation);

    [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return segments_.size(); }

    const Segment& operator[](std::size_t i) const { return segments_[i]; }
    const Segment& back() const { return segments_.back(); }

    const_iterator begin() const noexcept { return segments_.begin(); }
    const_iterator end() const noexcept { return segments_.end(); }

    const std::vector<Segment>& segments() const noexcept { return segments_; }

    /// Path without its last segment (root stays root).
    [[nodiscard]] Path parent() const {
        if (segments_.empty()) return {};
        return Path(std::vector<Segment>(segments_.begin(), segments_.end() - 1));
    }

    /// New path with one more segment.
    [[nodiscard]] Path append(Segment segment) const {
        std::vector<Segment> next = segments_;
        next.push_back(std::move(segment));
        return Path(std::move(next));
    }

    /// Sibling path: same parent, different last key.
    [[nodiscard]] Path with_last(Segment segment) const {
        return parent().append(std::move(segment));
    }

    /// Render in dot-and-bracket notation.
    [[nodiscard]] std::string to_string() const {
        std::string out;
        for (const auto& seg : segments_) {
            if (seg.is_index()) {
                out += seg.to_string();
            } else {
                if (!out.empty()) out += '.';
                out += seg.key();
            }
        }
        return out;
    }

    bool operator==(const Path& o) const { return segments_ == o.segments_; }
    bool operator!=(const Path& o) const { return segments_ != o.segments_; }

private:
    std::vector<Segment> segments_;
};

namespace detail {

inline bool all_digits(std::string_view tok) noexcept {
    if (tok.empty()) return false;
    for (char c : tok) if (c < '0' || c > '9') return false;
    return true;
}

inline void push_token(std::vector<Segment>& out, std::string_view tok) {
    if (tok.empty()) return;
    if (all_digits(tok)) {
        std::size_t idx = 0;
        auto [p, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), idx);
        if (ec != std::errc{} || p != tok.data() + tok.size())
            throw OutOfRangeError("path index out of range: \"" + std::string(tok) + "\"",
                                  errc::invalid_path);
        out.emplace_back(idx);
    } else {
        out.emplace_back(std::string(tok));
    }
}

} // namespace detail

/// @brief Parse dot-and-bracket notation into a Path.
///
/// "[N]" is read as ".N", so "a[0].b" and "a.0.b" are the same path.
/// Empty tokens are skipped, so "" and "." are the root.
inline Path parse_path(std::string_view notation) {
    std::vector<Segment> segments;
    std::size_t start = 0;
    for (std::size_t i = 0; i <= notation.size(); ++i) {
        const bool at_end = i == notation.size();
        const char c = at_end ? '.' : notation[i];
        if (c == '.' || c == '[' || c == ']') {
            detail::push_token(segments, notation.substr(start, i - start));
            start = i + 1;
        }
    }
    return Path(std::move(segments));
}

inline Path::Path(const char* notation) : Path(parse_path(notation ? notation : "")) {}
inline Path::Path(std::string_view notation) : Path(parse_path(notation)) {}
inline Path::Path(const std::string& notation) : Path(parse_path(notation)) {}

} // namespace aywson
