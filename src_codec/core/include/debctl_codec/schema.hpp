#pragma once

#include "record.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace debctl::codec {

enum class FieldShape { Scalar, List };

enum class UnknownFields {
    Ignore,    ///< Drop keys that are not declared
    AsScalar,  ///< Keep them as unfolded scalars
    Reject,    ///< Fail with DecodeError AmbiguousType
};

struct FieldSpec {
    std::string key;
    FieldShape shape{FieldShape::Scalar};
    bool required{false};
};

/**
 * \brief Runtime description of a record, for callers that learn the shape of their
 * fields at run time (command line options, configuration).
 *
 * Binding keeps the input order of the fields, so a bound record re-encodes to the same
 * layout. Declared fields missing from the input are left out unless required, in which
 * case binding fails.
 *
 * \code
 * Schema schema;
 * schema.scalar("Package", true).list("Depends").unknown(UnknownFields::AsScalar);
 * OutputRecord record = schema.bind(decode_record(input));
 * \endcode
 */
class Schema {
public:
    Schema() = default;

    Schema& scalar(std::string key, bool required = false);
    Schema& list(std::string key, bool required = false);
    Schema& unknown(UnknownFields policy);

    [[nodiscard]] const std::vector<FieldSpec>& fields() const noexcept { return fields_; }
    [[nodiscard]] UnknownFields unknown_policy() const noexcept { return unknown_; }
    [[nodiscard]] const FieldSpec* find(std::string_view key) const noexcept;

    /**
     * \throws DecodeError Custom for a missing required field, AmbiguousType for an
     *         undeclared key under UnknownFields::Reject.
     */
    [[nodiscard]] OutputRecord bind(const RawRecord& record) const;

private:
    Schema& declare(std::string key, FieldShape shape, bool required);

    std::vector<FieldSpec> fields_;
    UnknownFields unknown_{UnknownFields::AsScalar};
};

}  // namespace debctl::codec
