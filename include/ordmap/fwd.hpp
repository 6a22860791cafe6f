#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and type aliases for the ordmap wire value.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ordmap {

// ─── Forward declarations ───────────────────────────────────────────────
class Value;
template <typename K, typename V,
          typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K>>
class OrderedMap;

/// Wire value types
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

/// Wire array: ordered collection of values.
using Array = std::vector<Value>;

/// @brief Wire object: fields in document order with linear lookup.
///
/// Record objects carry two fields, so a scan beats any index. The field
/// order is preserved so the writer emits "Key" before "Value".
struct Object {
    using storage_type = std::vector<std::pair<std::string, Value>>;
    using size_type = size_t;

    storage_type entries;

    Object() = default;
    Object(std::initializer_list<std::pair<std::string, Value>> init);

    bool empty() const noexcept { return entries.empty(); }
    size_type size() const noexcept { return entries.size(); }
    void reserve(size_type n) { entries.reserve(n); }

    auto begin() noexcept { return entries.begin(); }
    auto end()   noexcept { return entries.end(); }
    auto begin() const noexcept { return entries.begin(); }
    auto end()   const noexcept { return entries.end(); }

    // Defined in value.hpp, where Value is complete.

    Value* find(std::string_view key) noexcept;
    const Value* find(std::string_view key) const noexcept;
    bool contains(std::string_view key) const noexcept;

    /// Const access by name. Throws OutOfRangeError if not found.
    const Value& at(std::string_view key) const;

    /// Insert or replace a field; a new field is appended at the end.
    void insert(std::string key, Value value);

    /// Append without a duplicate check.
    void emplace_back(std::string key, Value value);

    bool erase(std::string_view key);
    void clear() noexcept { entries.clear(); }

    /// Field order does not matter for comparison.
    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }
};

} // namespace ordmap
