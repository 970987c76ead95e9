#include "debctl_codec/json_bridge.hpp"

#include "debctl_codec/error.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace debctl::codec::json_bridge {

std::string type_name(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return "none";
        case json::value_t::boolean:
            return "bool";
        case json::value_t::number_integer:
            return "i64";
        case json::value_t::number_unsigned:
            return "u64";
        case json::value_t::number_float:
            return "f64";
        case json::value_t::string:
            return "str";
        case json::value_t::array:
            return "seq";
        case json::value_t::object:
            return "map";
        case json::value_t::binary:
            return "bytes";
        case json::value_t::discarded:
            break;
    }
    return "discarded";
}

json to_json(const OutputRecord& record) {
    json object = json::object();
    for (const auto& field : record) {
        std::visit(
            [&](const auto& v) {
                using V = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<V, std::monostate>) {
                    object[field.key] = nullptr;
                } else {
                    object[field.key] = v;
                }
            },
            field.value);
    }
    return object;
}

json to_json(const std::vector<OutputRecord>& records) {
    json array = json::array();
    for (const auto& record : records) {
        array.push_back(to_json(record));
    }
    return array;
}

OutputRecord record_from_json(const json& document) {
    if (!document.is_object()) {
        throw EncodeError::unsupported(type_name(document));
    }

    OutputRecord record;
    record.reserve(document.size());
    for (const auto& [key, value] : document.items()) {
        if (value.is_null()) {
            record.push_back(OutputField{key, FieldValue{}});
        } else if (value.is_string()) {
            record.push_back(OutputField{key, FieldValue{value.get<std::string>()}});
        } else if (value.is_array()) {
            std::vector<std::string> items;
            items.reserve(value.size());
            for (const auto& item : value) {
                if (!item.is_string()) {
                    throw EncodeError::unsupported(type_name(item));
                }
                items.push_back(item.get<std::string>());
            }
            record.push_back(OutputField{key, FieldValue{std::move(items)}});
        } else {
            throw EncodeError::unsupported(type_name(value));
        }
    }
    return record;
}

std::vector<OutputRecord> records_from_json(const json& document) {
    if (document.is_object()) {
        return {record_from_json(document)};
    }
    if (!document.is_array()) {
        throw EncodeError::unsupported(type_name(document));
    }

    std::vector<OutputRecord> records;
    records.reserve(document.size());
    for (const auto& element : document) {
        records.push_back(record_from_json(element));
    }
    return records;
}

}  // namespace debctl::codec::json_bridge
