#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and type aliases for aywson.

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace aywson {

// ─── Forward declarations ───────────────────────────────────────────────
class Value;
class Path;
class Change;
struct Node;

/// Value types
enum class Type : uint8_t {
    Null     = 0,
    Bool     = 1,
    Integer  = 2,
    Float    = 3,
    String   = 4,
    Array    = 5,
    Object   = 6,
    UInteger = 7
};

/// @brief Returns the string representation of a type.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:     return "null";
        case Type::Bool:     return "bool";
        case Type::Integer:  return "integer";
        case Type::Float:    return "float";
        case Type::String:   return "string";
        case Type::Array:    return "array";
        case Type::Object:   return "object";
        case Type::UInteger: return "uinteger";
    }
    return "unknown";
}

// ─── Type aliases ───────────────────────────────────────────────────────

/// Array: ordered collection of values.
using Array = std::vector<Value>;

/// @brief Object: key-value pairs in document order.
///
/// Configuration objects are small, so lookup is linear. Order matters:
/// values serialized into a document keep the order they were built in.
struct Object {
    using storage_type = std::vector<std::pair<std::string, Value>>;
    using size_type = size_t;

    storage_type entries;

    Object() = default;

    /// Initializer-list constructor: {{"key", value}, ...}
    Object(std::initializer_list<std::pair<std::string, Value>> init);

    // ─── Capacity ────────────────────────────────────────────────────────
    bool empty() const noexcept { return entries.empty(); }
    size_type size() const noexcept { return entries.size(); }

    // ─── Iterators ──────────────────────────────────────────────────────
    auto begin() noexcept { return entries.begin(); }
    auto end()   noexcept { return entries.end(); }
    auto begin() const noexcept { return entries.begin(); }
    auto end()   const noexcept { return entries.end(); }

    // ─── Methods (defined after Value in value.hpp) ──────────────────────

    Value* find(std::string_view key) noexcept;
    const Value* find(std::string_view key) const noexcept;
    bool contains(std::string_view key) const noexcept;

    /// Access or create an element by key.
    Value& operator[](std::string_view key);

    /// Const access by key. Throws OutOfRangeError if not found.
    const Value& at(std::string_view key) const;

    /// Insert or update a key-value pair; new keys go to the end.
    void insert(std::string key, Value value);

    bool erase(std::string_view key);

    /// Key-order-insensitive comparison.
    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }
};

} // namespace aywson
