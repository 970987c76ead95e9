#pragma once

#include "error.hpp"
#include "record.hpp"
#include "unfold.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace debctl::codec {

/**
 * \brief Capability of a C++ type to live in a field value.
 *
 * A specialization provides:
 *   - `static T from_raw(std::string_view raw)`: build from the raw field value
 *   - `static FieldValue to_field(const T& value)`: shape handed to the writer
 * and, for types usable as list items,
 *   - `static T from_string(std::string_view text)`
 *   - `static std::string to_string(const T& value)`
 *
 * Types without a specialization cannot be bound. Conversion failures are reported as
 * DecodeError::custom().
 */
template <typename T, typename Enable = void>
struct ValueTraits;

/**
 * \brief Base for scalar types that convert to and from one logical string.
 *
 * The raw value is unfolded before `Derived::from_string()` sees it. Enumerations
 * serialized by name specialize ValueTraits by deriving from this.
 */
template <typename T, typename Derived>
struct StringValueTraits {
    [[nodiscard]] static T from_raw(std::string_view raw) { return Derived::from_string(unfold_value(raw)); }
    [[nodiscard]] static FieldValue to_field(const T& value) { return FieldValue{Derived::to_string(value)}; }
};

template <>
struct ValueTraits<std::string> : StringValueTraits<std::string, ValueTraits<std::string>> {
    [[nodiscard]] static std::string from_string(std::string_view text) { return std::string(text); }
    [[nodiscard]] static std::string to_string(const std::string& value) { return value; }
};

/// Lists: the raw value is split on ',' and every item is built with from_string().
template <typename T>
struct ValueTraits<std::vector<T>> {
    [[nodiscard]] static std::vector<T> from_raw(std::string_view raw) {
        std::vector<T> values;
        for (const auto& item : split_sequence(raw)) {
            values.push_back(ValueTraits<T>::from_string(item));
        }
        return values;
    }

    [[nodiscard]] static FieldValue to_field(const std::vector<T>& values) {
        std::vector<std::string> items;
        items.reserve(values.size());
        for (const auto& value : values) {
            items.push_back(ValueTraits<T>::to_string(value));
        }
        return FieldValue{std::move(items)};
    }
};

template <typename T>
struct ValueTraits<std::optional<T>> {
    [[nodiscard]] static std::optional<T> from_raw(std::string_view raw) { return ValueTraits<T>::from_raw(raw); }

    [[nodiscard]] static FieldValue to_field(const std::optional<T>& value) {
        return value ? ValueTraits<T>::to_field(*value) : FieldValue{};
    }
};

/// Value of `key` in `record`; a missing key is a DecodeError naming the key.
template <typename T>
[[nodiscard]] T required_field(const RawRecord& record, std::string_view key) {
    const auto* field = record.find(key);
    if (field == nullptr) {
        throw DecodeError::custom("missing field `" + std::string(key) + "` in record starting at line " +
                                      std::to_string(record.first_line),
                                  record.first_line);
    }
    return ValueTraits<T>::from_raw(field->value);
}

template <typename T>
[[nodiscard]] std::optional<T> optional_field(const RawRecord& record, std::string_view key) {
    const auto* field = record.find(key);
    if (field == nullptr) {
        return std::nullopt;
    }
    return ValueTraits<T>::from_raw(field->value);
}

/**
 * \brief Capability of a C++ type to be a whole record.
 *
 * A specialization provides `static T from_record(const RawRecord&)` and
 * `static OutputRecord to_record(const T&)`. Structs specialize it using
 * required_field() / optional_field() and ValueTraits<>::to_field().
 */
template <typename T, typename Enable = void>
struct RecordTraits;

template <>
struct RecordTraits<RawRecord> {
    [[nodiscard]] static RawRecord from_record(const RawRecord& record) { return record; }

    /// Every field becomes an unfolded scalar.
    [[nodiscard]] static OutputRecord to_record(const RawRecord& record) {
        OutputRecord output;
        output.reserve(record.fields.size());
        for (const auto& field : record.fields) {
            output.push_back(OutputField{field.key, FieldValue{unfold_value(field.value)}});
        }
        return output;
    }
};

namespace detail {

template <typename Map>
struct MapRecordTraits {
    using Value = typename Map::mapped_type;

    [[nodiscard]] static Map from_record(const RawRecord& record) {
        Map map;
        for (const auto& field : record.fields) {
            map.insert_or_assign(field.key, ValueTraits<Value>::from_raw(field.value));
        }
        return map;
    }

    [[nodiscard]] static OutputRecord to_record(const Map& map) {
        OutputRecord output;
        output.reserve(map.size());
        for (const auto& [key, value] : map) {
            output.push_back(OutputField{key, ValueTraits<Value>::to_field(value)});
        }
        return output;
    }
};

}  // namespace detail

/// Maps keyed by field name; a repeated key keeps its last value.
template <typename V>
struct RecordTraits<std::map<std::string, V>> : detail::MapRecordTraits<std::map<std::string, V>> {};

template <typename V>
struct RecordTraits<std::unordered_map<std::string, V>>
    : detail::MapRecordTraits<std::unordered_map<std::string, V>> {};

}  // namespace debctl::codec
