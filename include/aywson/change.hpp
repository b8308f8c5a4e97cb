#pragma once

/// @file change.hpp
/// @brief Nested change descriptions for bulk edits.
///
/// A Change is one of:
///   - Set(value)   write this value
///   - Delete       remove this key
///   - Nested(...)  ordered key -> Change mapping, applied recursively
///
/// Usage:
///   aywson::Change change = {
///       {"name",   "server"},
///       {"legacy", aywson::Change::remove()},
///       {"limits", {{"max", 10}}},
///   };

#include "path.hpp"
#include "tree.hpp"
#include "value.hpp"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace aywson {

class Change {
public:
    enum class Kind : uint8_t { Set, Delete, Nested };
    using Entry = std::pair<std::string, Change>;
    using Entries = std::vector<Entry>;

    /// Empty nested change.
    Change() : kind_(Kind::Nested) {}

    /// Nested change from key/change pairs (order kept).
    Change(std::initializer_list<Entry> entries) : kind_(Kind::Nested), entries_(entries) {}

    /// Set leaf from anything a Value is constructible from. A JSON object
    /// becomes a nested change so that its keys merge into the document.
    template <typename T,
              typename = std::enable_if_t<!std::is_same<std::decay_t<T>, Change>::value &&
                                          std::is_constructible<Value, T&&>::value>>
    Change(T&& value) : Change(from_value(Value(std::forward<T>(value)))) {}

    /// Delete leaf.
    [[nodiscard]] static Change remove() {
        Change c;
        c.kind_ = Kind::Delete;
        return c;
    }

    /// Set leaf that writes `value` as-is, objects included.
    [[nodiscard]] static Change set(Value value) {
        Change c;
        c.kind_ = Kind::Set;
        c.value_ = std::move(value);
        return c;
    }

    /// Convert a decoded change description: objects recurse, every other
    /// value is a Set leaf.
    [[nodiscard]] static Change from_value(Value value) {
        if (!value.is_object()) return set(std::move(value));
        Change c;
        for (auto& [key, v] : value.as_object())
            c.entries_.emplace_back(key, from_value(std::move(v)));
        return c;
    }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_set() const noexcept { return kind_ == Kind::Set; }
    [[nodiscard]] bool is_delete() const noexcept { return kind_ == Kind::Delete; }
    [[nodiscard]] bool is_nested() const noexcept { return kind_ == Kind::Nested; }

    [[nodiscard]] const Value& value() const noexcept { return value_; }
    [[nodiscard]] const Entries& entries() const noexcept { return entries_; }

    /// First entry for `key`, or nullptr.
    [[nodiscard]] const Change* find(std::string_view key) const noexcept {
        for (const auto& [k, c] : entries_)
            if (k == key) return &c;
        return nullptr;
    }

    /// Append an entry to a nested change.
    Change& add(std::string key, Change change) {
        entries_.emplace_back(std::move(key), std::move(change));
        return *this;
    }

private:
    Kind kind_;
    Value value_;
    Entries entries_;
};

/// One flattened instruction: write `value`, or delete when it is empty.
struct ChangeLeaf {
    Path path;
    std::optional<Value> value;

    [[nodiscard]] bool is_delete() const noexcept { return !value.has_value(); }
};

namespace detail {

inline void flatten_into(const Change& change, const Path& prefix, std::vector<ChangeLeaf>& out) {
    switch (change.kind()) {
        case Change::Kind::Set:
            out.push_back({prefix, change.value()});
            break;
        case Change::Kind::Delete:
            out.push_back({prefix, std::nullopt});
            break;
        case Change::Kind::Nested:
            for (const auto& [key, child] : change.entries())
                flatten_into(child, prefix.append(key), out);
            break;
    }
}

inline void collect_deletions(const Node* current, const Change& change, const Path& prefix,
                              std::vector<Path>& out) {
    if (!current || current->type != NodeType::Object) return;
    for (const auto& prop : current->children) {
        const auto key = prop->key();
        const Change* wanted = change.find(key);
        if (!wanted) {
            out.push_back(prefix.append(std::string(key)));
        } else if (wanted->is_nested()) {
            collect_deletions(prop->value_node(), *wanted, prefix.append(std::string(key)), out);
        }
    }
}

} // namespace detail

/// @brief Flatten a change into (path, leaf) instructions in entry order.
[[nodiscard]] inline std::vector<ChangeLeaf> flatten(const Change& change, const Path& prefix = {}) {
    std::vector<ChangeLeaf> out;
    detail::flatten_into(change, prefix, out);
    return out;
}

/// @brief Paths of object members present in the document (tree `root`)
/// but not mentioned by `change`, at every level both describe as objects.
/// An explicit Delete entry counts as mentioned.
[[nodiscard]] inline std::vector<Path> compute_deletions(const Node* root, const Change& change) {
    std::vector<Path> out;
    if (change.is_nested()) detail::collect_deletions(root, change, Path{}, out);
    return out;
}

} // namespace aywson
