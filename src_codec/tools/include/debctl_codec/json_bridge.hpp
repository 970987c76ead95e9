#pragma once

#include "debctl_codec/record.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace debctl::codec::json_bridge {

using json = nlohmann::ordered_json;

/**
 * \brief Converts records to JSON objects, keeping field order.
 *
 * Scalars become strings, lists become arrays of strings, absent values become null.
 */
[[nodiscard]] json to_json(const OutputRecord& record);
[[nodiscard]] json to_json(const std::vector<OutputRecord>& records);

/**
 * \brief Reads one record from a JSON object.
 *
 * Members map to fields in document order: null is absent, a string is a scalar and an
 * array of strings is a list. Anything else has no representation in a control file.
 *
 * \throws EncodeError Unsupported naming the offending JSON type (`bool`, `i64`, `u64`,
 *         `f64`, `map`, `seq`, ...).
 */
[[nodiscard]] OutputRecord record_from_json(const json& document);

/// Accepts one object or an array of objects.
[[nodiscard]] std::vector<OutputRecord> records_from_json(const json& document);

/// Name used in Unsupported errors for the type of `value`.
[[nodiscard]] std::string type_name(const json& value);

}  // namespace debctl::codec::json_bridge
