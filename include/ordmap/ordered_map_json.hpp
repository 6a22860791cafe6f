#pragma once

/// @file ordered_map_json.hpp
/// @brief Records codec: OrderedMap <-> [{"Key":k,"Value":v},...].
///
/// The array position of a record is its insertion position, so a decoded
/// map lists its keys in the order the records appear. Keys and values go
/// through the ADL to_json/from_json pair of their type (see conversion.hpp),
/// which lets maps nest as values of other maps.
///
/// @code
///   auto m = ordmap::OrderedMap<std::string, int>().set("a", 1).set("b", 2);
///   std::string text = ordmap::encode(m);
///   // [{"Key":"a","Value":1},{"Key":"b","Value":2}]
///   auto back = ordmap::decode<ordmap::OrderedMap<std::string, int>>(text);
/// @endcode

#include "conversion.hpp"
#include "decode_options.hpp"
#include "error.hpp"
#include "log.hpp"
#include "ordered_map.hpp"
#include "reader.hpp"
#include "value.hpp"
#include "writer.hpp"

#include <exception>
#include <new>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace ordmap {

inline constexpr std::string_view kRecordKeyField   = "Key";
inline constexpr std::string_view kRecordValueField = "Value";

// =====================================================================
// Encoding
// =====================================================================

template <typename K, typename V, typename Hash, typename KeyEqual>
void to_json(Value& j, const OrderedMap<K, V, Hash, KeyEqual>& m) {
    Array records;
    records.reserve(m.size());
    m.for_each([&records](const K& key, const V& value) {
        Value k;
        to_json(k, key);
        Value v;
        to_json(v, value);
        Object record;
        record.reserve(2);
        record.emplace_back(std::string(kRecordKeyField), std::move(k));
        record.emplace_back(std::string(kRecordValueField), std::move(v));
        records.emplace_back(std::move(record));
    });
    j = Value(std::move(records));
}

// =====================================================================
// Decoding
// =====================================================================

namespace detail {

[[noreturn]] inline void throw_field_error(size_t index, std::string_view field,
                                           const char* what, errc code) {
    throw DecodeError("record " + std::to_string(index) + ", field \"" +
                      std::string(field) + "\": " + what,
                      code);
}

/// Convert one record field; a missing or null field leaves `out` at its
/// value-initialized state.
///
/// Whatever a from_json overload throws surfaces as a DecodeError naming
/// the record and field. DecodeError and KeyAlreadyExists from a nested
/// map pass through unchanged.
template <typename T>
void read_record_field(const Object& record, std::string_view field, size_t index, T& out) {
    const Value* j = record.find(field);
    if (j == nullptr || j->is_null()) return;
    try {
        from_json(*j, out);
    } catch (const TypeError& e) {
        throw_field_error(index, field, e.what(), static_cast<errc>(e.code().value()));
    } catch (const OutOfRangeError& e) {
        throw_field_error(index, field, e.what(), static_cast<errc>(e.code().value()));
    } catch (const std::system_error&) {
        throw;
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        throw_field_error(index, field, e.what(), errc::conversion_failed);
    }
}

} // namespace detail

/// @brief Rebuild a map from its records.
///
/// `m` is assigned only after every record decoded; on any exception it
/// keeps its previous contents.
/// @throws DecodeError on a wrong shape or an unconvertible field.
/// @throws KeyAlreadyExists if two records share a key.
template <typename K, typename V, typename Hash, typename KeyEqual>
void from_json(const Value& j, OrderedMap<K, V, Hash, KeyEqual>& m) {
    using Map = OrderedMap<K, V, Hash, KeyEqual>;
    if (j.is_null()) {
        m = Map::make();
        return;
    }
    if (ORDMAP_UNLIKELY(!j.is_array())) {
        throw DecodeError(std::string("expected an array of records, got ") + type_name(j.type()),
                          errc::type_mismatch);
    }

    const Array& records = j.as_array();
    Map next = Map::make();
    for (size_t i = 0; i < records.size(); ++i) {
        const Value& rec = records[i];
        if (ORDMAP_UNLIKELY(!rec.is_object())) {
            throw DecodeError("record " + std::to_string(i) + ": expected an object, got " +
                              type_name(rec.type()),
                              errc::type_mismatch);
        }
        K key{};
        V value{};
        detail::read_record_field(rec.as_object(), kRecordKeyField, i, key);
        detail::read_record_field(rec.as_object(), kRecordValueField, i, value);
        next = std::move(next).set(std::move(key), std::move(value));
    }
    m = std::move(next);
}

// =====================================================================
// Text API
// =====================================================================

/// @brief Encode a map to text.
/// @throws EncodeError if a key or value holds NaN or infinity.
template <typename K, typename V, typename Hash, typename KeyEqual>
[[nodiscard]] std::string encode(const OrderedMap<K, V, Hash, KeyEqual>& m,
                                 const EncodeOptions& opts = {}) {
    Value j;
    to_json(j, m);
    return ordmap::write(j, opts);
}

/// @brief Encode a map to an ostream.
template <typename K, typename V, typename Hash, typename KeyEqual>
void encode(std::ostream& os, const OrderedMap<K, V, Hash, KeyEqual>& m,
            const EncodeOptions& opts = {}) {
    Value j;
    to_json(j, m);
    ordmap::write(os, j, opts);
}

/// @brief Decode text into a new map of type Map.
/// @throws DecodeError, KeyAlreadyExists
template <typename Map>
[[nodiscard]] Map decode(std::string_view text, const DecodeOptions& opts = {}) {
    try {
        Map m;
        from_json(ordmap::read(text, opts), m);
        return m;
    } catch (const std::system_error& e) {
        ORDMAP_LOG_DEBUG("decode failed: %s", e.what());
        throw;
    }
}

/// @brief Decode text into an existing map, replacing its contents on success.
template <typename K, typename V, typename Hash, typename KeyEqual>
void decode_into(std::string_view text, OrderedMap<K, V, Hash, KeyEqual>& m,
                 const DecodeOptions& opts = {}) {
    m = decode<OrderedMap<K, V, Hash, KeyEqual>>(text, opts);
}

/// @brief decode() without exceptions.
///
/// Any std::exception maps to an error code: its own code for the ordmap
/// exceptions, errc::conversion_failed for anything else.
template <typename Map>
[[nodiscard]] result<Map> try_decode(std::string_view text,
                                     const DecodeOptions& opts = {}) noexcept {
    try {
        return {decode<Map>(text, opts), {}};
    } catch (const std::system_error& e) {
        return {Map{}, e.code()};
    } catch (const std::bad_alloc&) {
        return {Map{}, std::make_error_code(std::errc::not_enough_memory)};
    } catch (const std::exception& e) {
        ORDMAP_LOG_DEBUG("decode failed: %s", e.what());
        return {Map{}, make_error_code(errc::conversion_failed)};
    }
}

template <typename K, typename V, typename Hash, typename KeyEqual>
std::ostream& operator<<(std::ostream& os, const OrderedMap<K, V, Hash, KeyEqual>& m) {
    encode(os, m);
    return os;
}

} // namespace ordmap
