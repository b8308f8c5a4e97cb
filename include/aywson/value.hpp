#pragma once

/// @file value.hpp
/// @brief Value: the decoded form of a document node.
///
/// Implementation:
///   - Tagged union: scalars inline, strings/arrays/objects on the heap
///   - Manual resource management (copy/move/destroy)
///   - Objects keep insertion order so serialized values are deterministic
///
/// Values are what get() returns and what set()/merge() write; the
/// document text itself is never represented as a Value tree.

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace aywson {

class Value {
public:
    Value() noexcept : kind_(Type::Null) { u_.i = 0; }
    Value(std::nullptr_t) noexcept : kind_(Type::Null) { u_.i = 0; }
    Value(bool v) noexcept : kind_(Type::Bool) { u_.i = 0; u_.b = v; }
    Value(int v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }
    Value(int64_t v) noexcept : kind_(Type::Integer) { u_.i = v; }
    Value(unsigned v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }
    Value(uint64_t v) noexcept : kind_(Type::UInteger) { u_.u = v; }
    Value(double v) noexcept : kind_(Type::Float) { u_.d = v; }
    Value(const char* v) : kind_(Type::Null) {
        u_.i = 0;
        if (AYWSON_UNLIKELY(!v)) return;
        kind_ = Type::String;
        u_.str = new std::string(v);
    }
    Value(std::string_view v) : kind_(Type::String) { u_.str = new std::string(v); }
    Value(const std::string& v) : kind_(Type::String) { u_.str = new std::string(v); }
    Value(std::string&& v) : kind_(Type::String) { u_.str = new std::string(std::move(v)); }
    Value(const Array& v) : kind_(Type::Array) { u_.arr = new Array(v); }
    Value(Array&& v) : kind_(Type::Array) { u_.arr = new Array(std::move(v)); }
    Value(const Object& v) : kind_(Type::Object) { u_.obj = new Object(v); }
    Value(Object&& v) : kind_(Type::Object) { u_.obj = new Object(std::move(v)); }

    Value(const Value& o) : kind_(o.kind_) { copy_payload(o); }
    Value(Value&& o) noexcept : kind_(o.kind_), u_(o.u_) {
        o.kind_ = Type::Null;  // Only this is needed for destroy() to be a no-op
    }
    Value& operator=(const Value& o) {
        if (this != &o) { Value tmp(o); swap(tmp); }
        return *this;
    }
    Value& operator=(Value&& o) noexcept {
        if (this != &o) {
            destroy();
            kind_ = o.kind_;
            u_ = o.u_;
            o.kind_ = Type::Null;
        }
        return *this;
    }
    ~Value() { destroy(); }

    void swap(Value& o) noexcept {
        std::swap(kind_, o.kind_);
        std::swap(u_, o.u_);
    }

    [[nodiscard]] static Value array() { return Value(Array{}); }
    [[nodiscard]] static Value object() { return Value(Object{}); }

    [[nodiscard]] Type type() const noexcept { return kind_; }
    [[nodiscard]] bool is_null()     const noexcept { return kind_ == Type::Null; }
    [[nodiscard]] bool is_bool()     const noexcept { return kind_ == Type::Bool; }
    [[nodiscard]] bool is_integer()  const noexcept { return kind_ == Type::Integer; }
    [[nodiscard]] bool is_uinteger() const noexcept { return kind_ == Type::UInteger; }
    [[nodiscard]] bool is_float()    const noexcept { return kind_ == Type::Float; }
    [[nodiscard]] bool is_string()   const noexcept { return kind_ == Type::String; }
    [[nodiscard]] bool is_array()    const noexcept { return kind_ == Type::Array; }
    [[nodiscard]] bool is_object()   const noexcept { return kind_ == Type::Object; }
    [[nodiscard]] bool is_number()   const noexcept { return is_integer() || is_uinteger() || is_float(); }

    bool as_bool() const {
        if (AYWSON_UNLIKELY(!is_bool()))
            throw TypeError("expected bool, got " + std::string(type_name(type())));
        return u_.b;
    }
    int64_t as_integer() const {
        if (is_integer()) return u_.i;
        if (is_uinteger() && u_.u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            return static_cast<int64_t>(u_.u);
        throw TypeError("expected integer, got " + std::string(type_name(type())));
    }
    uint64_t as_uinteger() const {
        if (is_uinteger()) return u_.u;
        if (is_integer() && u_.i >= 0) return static_cast<uint64_t>(u_.i);
        throw TypeError("expected uinteger, got " + std::string(type_name(type())));
    }
    double as_float() const {
        if (is_float()) return u_.d;
        if (is_integer()) return static_cast<double>(u_.i);
        if (is_uinteger()) return static_cast<double>(u_.u);
        throw TypeError("expected number, got " + std::string(type_name(type())));
    }

    [[nodiscard]] std::string_view as_string_view() const {
        if (AYWSON_UNLIKELY(!is_string()))
            throw TypeError("expected string, got " + std::string(type_name(type())));
        return *u_.str;
    }
    [[nodiscard]] std::string as_string() const {
        return std::string(as_string_view());
    }

    [[nodiscard]] const Array& as_array() const {
        if (AYWSON_UNLIKELY(!is_array()))
            throw TypeError("expected array, got " + std::string(type_name(type())));
        return *u_.arr;
    }
    Array& as_array() {
        if (AYWSON_UNLIKELY(!is_array()))
            throw TypeError("expected array, got " + std::string(type_name(type())));
        return *u_.arr;
    }
    [[nodiscard]] const Object& as_object() const {
        if (AYWSON_UNLIKELY(!is_object()))
            throw TypeError("expected object, got " + std::string(type_name(type())));
        return *u_.obj;
    }
    Object& as_object() {
        if (AYWSON_UNLIKELY(!is_object()))
            throw TypeError("expected object, got " + std::string(type_name(type())));
        return *u_.obj;
    }

    /// Type-safe value access with fallback, never throws.
    template <typename T>
    [[nodiscard]] T get_or(const T& dv) const noexcept {
        if constexpr (std::is_same_v<T, bool>) {
            return is_bool() ? u_.b : dv;
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, int>) {
            if (is_integer()) return static_cast<T>(u_.i);
            if (is_uinteger() && u_.u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                return static_cast<T>(u_.u);
            return dv;
        } else if constexpr (std::is_same_v<T, double>) {
            if (is_float()) return u_.d;
            if (is_integer()) return static_cast<double>(u_.i);
            if (is_uinteger()) return static_cast<double>(u_.u);
            return dv;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return is_string() ? *u_.str : dv;
        } else {
            static_assert(sizeof(T) == 0, "Unsupported type for get_or<T>()");
        }
    }

    const Value& operator[](size_t index) const {
        const auto& a = as_array();
        if (AYWSON_UNLIKELY(index >= a.size()))
            throw OutOfRangeError("array index " + std::to_string(index) +
                                  " out of range (size=" + std::to_string(a.size()) + ")");
        return a[index];
    }
    const Value& operator[](int index) const { return operator[](static_cast<size_t>(index)); }
    Value& operator[](size_t index) {
        return const_cast<Value&>(static_cast<const Value&>(*this)[index]);
    }
    Value& operator[](int index) { return operator[](static_cast<size_t>(index)); }

    Value& operator[](std::string_view key) { return as_object()[key]; }
    const Value& operator[](std::string_view key) const { return as_object().at(key); }
    Value& operator[](const char* key) { return operator[](std::string_view(key)); }
    const Value& operator[](const char* key) const { return operator[](std::string_view(key)); }

    [[nodiscard]] bool contains(std::string_view key) const {
        return is_object() && u_.obj->contains(key);
    }
    [[nodiscard]] const Value* find(std::string_view key) const {
        return is_object() ? u_.obj->find(key) : nullptr;
    }

    [[nodiscard]] size_t size() const noexcept {
        if (is_array())  return u_.arr->size();
        if (is_object()) return u_.obj->size();
        return 0;
    }
    [[nodiscard]] bool empty() const noexcept {
        if (is_null()) return true;
        if (is_array())  return u_.arr->empty();
        if (is_object()) return u_.obj->empty();
        return false;
    }

    void push_back(Value v) { as_array().push_back(std::move(v)); }
    void insert(std::string key, Value v) { as_object().insert(std::move(key), std::move(v)); }

    [[nodiscard]] bool operator==(const Value& other) const {
        if (kind_ != other.kind_) {
            if (is_number() && other.is_number()) {
                // Exact int/uint comparison without double-precision loss
                if ((is_integer() && other.is_uinteger()) || (is_uinteger() && other.is_integer())) {
                    int64_t  sv = is_integer()  ? u_.i : other.u_.i;
                    uint64_t uv = is_uinteger() ? u_.u : other.u_.u;
                    return sv >= 0 && static_cast<uint64_t>(sv) == uv;
                }
                return as_float() == other.as_float();
            }
            return false;
        }
        switch (kind_) {
            case Type::Null:     return true;
            case Type::Bool:     return u_.b == other.u_.b;
            case Type::Integer:  return u_.i == other.u_.i;
            case Type::UInteger: return u_.u == other.u_.u;
            case Type::Float:    return u_.d == other.u_.d;
            case Type::String:   return *u_.str == *other.u_.str;
            case Type::Array:    return *u_.arr == *other.u_.arr;
            case Type::Object:   return *u_.obj == *other.u_.obj;
        }
        return false;
    }
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

    /// Serialize. indent < 0 gives the compact form used for document edits.
    [[nodiscard]] std::string dump(int indent = -1) const;

private:
    Type kind_;
    union Payload {
        bool b; int64_t i; uint64_t u; double d;
        std::string* str;
        Array* arr;
        Object* obj;
    } u_;

    void copy_payload(const Value& o) {
        switch (o.kind_) {
            case Type::String: u_.str = new std::string(*o.u_.str); break;
            case Type::Array:  u_.arr = new Array(*o.u_.arr); break;
            case Type::Object: u_.obj = new Object(*o.u_.obj); break;
            default:           u_ = o.u_; break;
        }
    }

    void destroy() noexcept {
        switch (kind_) {
            case Type::String: delete u_.str; break;
            case Type::Array:  delete u_.arr; break;
            case Type::Object: delete u_.obj; break;
            default: break;
        }
    }
};

// ─── Object members ──────────────────────────────────────────────────────

inline Object::Object(std::initializer_list<std::pair<std::string, Value>> init)
    : entries(init.begin(), init.end()) {}

inline Value* Object::find(std::string_view key) noexcept {
    for (auto& [k, v] : entries) if (k == key) return &v;
    return nullptr;
}
inline const Value* Object::find(std::string_view key) const noexcept {
    for (const auto& [k, v] : entries) if (k == key) return &v;
    return nullptr;
}
inline bool Object::contains(std::string_view key) const noexcept { return find(key) != nullptr; }
inline Value& Object::operator[](std::string_view key) {
    if (auto* p = find(key)) return *p;
    entries.emplace_back(std::string(key), Value{});
    return entries.back().second;
}
inline const Value& Object::at(std::string_view key) const {
    const auto* p = find(key);
    if (AYWSON_UNLIKELY(!p))
        throw OutOfRangeError("key not found: \"" + std::string(key) + "\"", errc::key_not_found);
    return *p;
}
inline void Object::insert(std::string key, Value value) {
    if (auto* p = find(key)) { *p = std::move(value); return; }
    entries.emplace_back(std::move(key), std::move(value));
}
inline bool Object::erase(std::string_view key) {
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (it->first == key) { entries.erase(it); return true; }
    }
    return false;
}
inline bool Object::operator==(const Object& other) const {
    if (size() != other.size()) return false;
    // Key order does not matter for semantic comparison.
    for (const auto& [key, val] : entries) {
        const auto* p = other.find(key);
        if (!p || *p != val) return false;
    }
    return true;
}

} // namespace aywson
