#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace debctl::codec {

/**
 * \brief One `Key: value` entry as it was read, before unfolding.
 *
 * `value` is the text after the colon plus every continuation line, joined with
 * newlines and trimmed once at both ends.
 */
struct RawField {
    std::string key;
    std::string value;
    std::size_t line{0};  ///< Physical line of the key
};

/**
 * \brief Fields of one blank-line-delimited group, in input order.
 *
 * Duplicate keys are kept; bindings decide which one wins.
 */
struct RawRecord {
    std::vector<RawField> fields;
    std::size_t first_line{0};

    [[nodiscard]] bool empty() const noexcept { return fields.empty(); }

    /// Last field named `key`, or nullptr.
    [[nodiscard]] const RawField* find(std::string_view key) const noexcept {
        for (auto it = fields.rbegin(); it != fields.rend(); ++it) {
            if (it->key == key) {
                return &*it;
            }
        }
        return nullptr;
    }
};

/**
 * \brief Shape of a value handed to the writer.
 *
 * - std::monostate: absent, nothing is written
 * - std::string: scalar, folded by FieldWriter
 * - std::vector<std::string>: list, folded by ListWriter
 */
using FieldValue = std::variant<std::monostate, std::string, std::vector<std::string>>;

struct OutputField {
    std::string key;
    FieldValue value;
};

using OutputRecord = std::vector<OutputField>;

}  // namespace debctl::codec
