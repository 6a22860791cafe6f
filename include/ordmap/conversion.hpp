#pragma once

/// @file conversion.hpp
/// @brief ADL-based conversion between C++ types and the wire Value.
///
/// Provides:
///   - to_json() / from_json() for scalars, strings and STL containers
///   - to_value<T>() / from_value<T>() helper wrappers
///   - ORDMAP_DEFINE_TYPE_NON_INTRUSIVE() / ORDMAP_DEFINE_TYPE_INTRUSIVE()
///     for mapping structs used as container keys or values
///
/// Any type with a to_json/from_json pair findable by ADL can be stored in
/// an OrderedMap that is encoded or decoded.
///
/// @example
/// @code
///   struct Point { int x; int y; };
///   ORDMAP_DEFINE_TYPE_NON_INTRUSIVE(Point, x, y)
///
///   auto m = ordmap::OrderedMap<std::string, Point>()
///                .set("origin", Point{0, 0});
///   std::string text = ordmap::encode(m);
///   // [{"Key":"origin","Value":{"x":0,"y":0}}]
/// @endcode

#include "error.hpp"
#include "value.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace ordmap {

// Container overloads call each other for nested element types.
template <typename T> void to_json(Value& j, const std::vector<T>& vec);
template <typename T> void to_json(Value& j, const std::map<std::string, T>& m);
template <typename T> void to_json(Value& j, const std::optional<T>& opt);
template <typename T> void from_json(const Value& j, std::vector<T>& vec);
template <typename T> void from_json(const Value& j, std::map<std::string, T>& m);
template <typename T> void from_json(const Value& j, std::optional<T>& opt);

// =====================================================================
// to_json: C++ type -> Value
// =====================================================================

inline void to_json(Value& j, std::nullptr_t)            { j = Value(nullptr); }
inline void to_json(Value& j, bool v)                    { j = Value(v); }
inline void to_json(Value& j, int v)                     { j = Value(v); }
inline void to_json(Value& j, unsigned v)                { j = Value(v); }
inline void to_json(Value& j, long v)                    { j = Value(v); }
inline void to_json(Value& j, unsigned long v)           { j = Value(v); }
inline void to_json(Value& j, long long v)               { j = Value(v); }
inline void to_json(Value& j, unsigned long long v)      { j = Value(v); }
inline void to_json(Value& j, float v)                   { j = Value(static_cast<double>(v)); }
inline void to_json(Value& j, double v)                  { j = Value(v); }
inline void to_json(Value& j, const std::string& v)      { j = Value(v); }
inline void to_json(Value& j, std::string_view v)        { j = Value(v); }
inline void to_json(Value& j, const char* v)             { j = Value(v); }
inline void to_json(Value& j, const Value& v)            { j = v; }

template <typename T>
void to_json(Value& j, const std::vector<T>& vec) {
    Array arr;
    arr.reserve(vec.size());
    for (const auto& elem : vec) {
        Value tmp;
        to_json(tmp, elem);
        arr.push_back(std::move(tmp));
    }
    j = Value(std::move(arr));
}

template <typename T>
void to_json(Value& j, const std::map<std::string, T>& m) {
    Object obj;
    obj.reserve(m.size());
    for (const auto& [key, val] : m) {
        Value tmp;
        to_json(tmp, val);
        obj.emplace_back(key, std::move(tmp));
    }
    j = Value(std::move(obj));
}

template <typename T>
void to_json(Value& j, const std::optional<T>& opt) {
    if (opt.has_value()) {
        to_json(j, *opt);
    } else {
        j = Value(nullptr);
    }
}

// =====================================================================
// from_json: Value -> C++ type
// =====================================================================

namespace detail {

/// Integer read with a range check against the destination type.
template <typename T>
T checked_integer(const Value& j) {
    if constexpr (std::is_signed_v<T>) {
        const int64_t v = j.as_integer();
        if (v < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
            v > static_cast<int64_t>(std::numeric_limits<T>::max())) {
            throw TypeError("integer " + std::to_string(v) + " out of range for target type",
                            errc::integer_overflow);
        }
        return static_cast<T>(v);
    } else {
        const uint64_t v = j.as_uinteger();
        if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw TypeError("integer " + std::to_string(v) + " out of range for target type",
                            errc::integer_overflow);
        }
        return static_cast<T>(v);
    }
}

} // namespace detail

inline void from_json(const Value& j, bool& v)               { v = j.as_bool(); }
inline void from_json(const Value& j, int& v)                { v = detail::checked_integer<int>(j); }
inline void from_json(const Value& j, unsigned& v)           { v = detail::checked_integer<unsigned>(j); }
inline void from_json(const Value& j, long& v)               { v = detail::checked_integer<long>(j); }
inline void from_json(const Value& j, unsigned long& v)      { v = detail::checked_integer<unsigned long>(j); }
inline void from_json(const Value& j, long long& v)          { v = detail::checked_integer<long long>(j); }
inline void from_json(const Value& j, unsigned long long& v) { v = detail::checked_integer<unsigned long long>(j); }
inline void from_json(const Value& j, float& v)              { v = static_cast<float>(j.as_float()); }
inline void from_json(const Value& j, double& v)             { v = j.as_float(); }
inline void from_json(const Value& j, std::string& v)        { v = j.as_string(); }
inline void from_json(const Value& j, Value& v)              { v = j; }

template <typename T>
void from_json(const Value& j, std::vector<T>& vec) {
    const auto& arr = j.as_array();
    vec.clear();
    vec.reserve(arr.size());
    for (const auto& elem : arr) {
        T val{};
        from_json(elem, val);
        vec.push_back(std::move(val));
    }
}

template <typename T>
void from_json(const Value& j, std::map<std::string, T>& m) {
    const auto& obj = j.as_object();
    m.clear();
    for (const auto& [key, val] : obj) {
        T v{};
        from_json(val, v);
        m.emplace(key, std::move(v));
    }
}

template <typename T>
void from_json(const Value& j, std::optional<T>& opt) {
    if (j.is_null()) {
        opt = std::nullopt;
    } else {
        T val{};
        from_json(j, val);
        opt = std::move(val);
    }
}

// =====================================================================
// Helper wrappers
// =====================================================================

/// C++ value -> Value (ADL finds to_json).
template <typename T>
[[nodiscard]] Value to_value(const T& val) {
    Value j;
    to_json(j, val);
    return j;
}

/// Value -> C++ value (T must be default-constructible).
template <typename T>
[[nodiscard]] T from_value(const Value& j) {
    T val{};
    from_json(j, val);
    return val;
}

} // namespace ordmap

// =====================================================================
// Preprocessor FOREACH utilities (up to 12 fields)
// =====================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define ORDMAP_PP_CAT_I(a, b) a##b
#define ORDMAP_PP_CAT(a, b) ORDMAP_PP_CAT_I(a, b)

#define ORDMAP_PP_NARG_I(...) \
    ORDMAP_PP_ARG_N(__VA_ARGS__, 12,11,10,9,8,7,6,5,4,3,2,1,0)
#define ORDMAP_PP_ARG_N(_1,_2,_3,_4,_5,_6,_7,_8,_9,_10,_11,_12, N,...) N

#define ORDMAP_PP_FE_1(m,x) m(x)
#define ORDMAP_PP_FE_2(m,x,...) m(x) ORDMAP_PP_FE_1(m,__VA_ARGS__)
#define ORDMAP_PP_FE_3(m,x,...) m(x) ORDMAP_PP_FE_2(m,__VA_ARGS__)
#define ORDMAP_PP_FE_4(m,x,...) m(x) ORDMAP_PP_FE_3(m,__VA_ARGS__)
#define ORDMAP_PP_FE_5(m,x,...) m(x) ORDMAP_PP_FE_4(m,__VA_ARGS__)
#define ORDMAP_PP_FE_6(m,x,...) m(x) ORDMAP_PP_FE_5(m,__VA_ARGS__)
#define ORDMAP_PP_FE_7(m,x,...) m(x) ORDMAP_PP_FE_6(m,__VA_ARGS__)
#define ORDMAP_PP_FE_8(m,x,...) m(x) ORDMAP_PP_FE_7(m,__VA_ARGS__)
#define ORDMAP_PP_FE_9(m,x,...) m(x) ORDMAP_PP_FE_8(m,__VA_ARGS__)
#define ORDMAP_PP_FE_10(m,x,...) m(x) ORDMAP_PP_FE_9(m,__VA_ARGS__)
#define ORDMAP_PP_FE_11(m,x,...) m(x) ORDMAP_PP_FE_10(m,__VA_ARGS__)
#define ORDMAP_PP_FE_12(m,x,...) m(x) ORDMAP_PP_FE_11(m,__VA_ARGS__)

#define ORDMAP_PP_FOREACH(m,...) \
    ORDMAP_PP_CAT(ORDMAP_PP_FE_, ORDMAP_PP_NARG_I(__VA_ARGS__))(m, __VA_ARGS__)

// Missing fields leave the member at its default, as record fields do.
#define ORDMAP_DETAIL_TO_FIELD(fld) \
    { ::ordmap::Value _jt; to_json(_jt, v.fld); j.as_object().emplace_back(#fld, std::move(_jt)); }
#define ORDMAP_DETAIL_FROM_FIELD(fld) \
    { if (const auto* _jf = j.find(#fld)) from_json(*_jf, v.fld); }

/// Non-intrusive: use in the same namespace as the type.
#define ORDMAP_DEFINE_TYPE_NON_INTRUSIVE(Type, ...) \
    inline void to_json(::ordmap::Value& j, const Type& v) { \
        j = ::ordmap::Value::object(); \
        ORDMAP_PP_FOREACH(ORDMAP_DETAIL_TO_FIELD, __VA_ARGS__) \
    } \
    inline void from_json(const ::ordmap::Value& j, Type& v) { \
        (void)j.as_object(); \
        ORDMAP_PP_FOREACH(ORDMAP_DETAIL_FROM_FIELD, __VA_ARGS__) \
    }

/// Intrusive: use inside the class/struct body.
#define ORDMAP_DEFINE_TYPE_INTRUSIVE(Type, ...) \
    friend void to_json(::ordmap::Value& j, const Type& v) { \
        j = ::ordmap::Value::object(); \
        ORDMAP_PP_FOREACH(ORDMAP_DETAIL_TO_FIELD, __VA_ARGS__) \
    } \
    friend void from_json(const ::ordmap::Value& j, Type& v) { \
        (void)j.as_object(); \
        ORDMAP_PP_FOREACH(ORDMAP_DETAIL_FROM_FIELD, __VA_ARGS__) \
    }

// NOLINTEND(cppcoreguidelines-macro-usage)
