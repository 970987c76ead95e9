#include "debctl_codec/schema.hpp"

#include "debctl_codec/error.hpp"
#include "debctl_codec/unfold.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace {

debctl::codec::FieldValue shape_value(const debctl::codec::RawField& field, debctl::codec::FieldShape shape) {
    using debctl::codec::FieldShape;
    using debctl::codec::FieldValue;

    if (shape == FieldShape::List) {
        return FieldValue{debctl::codec::split_sequence(field.value)};
    }
    return FieldValue{debctl::codec::unfold_value(field.value)};
}

}  // namespace

namespace debctl::codec {

Schema& Schema::declare(std::string key, FieldShape shape, bool required) {
    if (key.empty()) {
        throw std::invalid_argument("Schema field key must not be empty");
    }
    if (find(key) != nullptr) {
        throw std::invalid_argument("Schema field declared twice: " + key);
    }
    fields_.push_back(FieldSpec{std::move(key), shape, required});
    return *this;
}

Schema& Schema::scalar(std::string key, bool required) {
    return declare(std::move(key), FieldShape::Scalar, required);
}

Schema& Schema::list(std::string key, bool required) {
    return declare(std::move(key), FieldShape::List, required);
}

Schema& Schema::unknown(UnknownFields policy) {
    unknown_ = policy;
    return *this;
}

const FieldSpec* Schema::find(std::string_view key) const noexcept {
    for (const auto& decl : fields_) {
        if (decl.key == key) {
            return &decl;
        }
    }
    return nullptr;
}

OutputRecord Schema::bind(const RawRecord& record) const {
    for (const auto& decl : fields_) {
        if (decl.required && record.find(decl.key) == nullptr) {
            throw DecodeError::custom("missing field `" + decl.key + "` in record starting at line " +
                                          std::to_string(record.first_line),
                                      record.first_line);
        }
    }

    OutputRecord output;
    output.reserve(record.fields.size());
    for (const auto& field : record.fields) {
        if (const auto* decl = find(field.key)) {
            output.push_back(OutputField{field.key, shape_value(field, decl->shape)});
            continue;
        }
        switch (unknown_) {
            case UnknownFields::Ignore:
                break;
            case UnknownFields::AsScalar:
                output.push_back(OutputField{field.key, shape_value(field, FieldShape::Scalar)});
                break;
            case UnknownFields::Reject:
                throw DecodeError::ambiguous_type(field.line, field.key);
        }
    }
    return output;
}

}  // namespace debctl::codec
