#include "debctl_codec/record_writer.hpp"

#include "debctl_codec/list_writer.hpp"

#include <memory>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace debctl::codec {

void validate_key(std::string_view key) {
    if (key.empty()) {
        throw EncodeError::empty_key();
    }
    const auto pos = key.find_first_of(":\n");
    if (pos != std::string_view::npos) {
        throw EncodeError::invalid_key_char(std::string(key), key[pos], pos);
    }
}

RecordWriter::RecordWriter(std::ostream& output, FoldConfig config)
    : output_(output), config_(config) {}

void RecordWriter::check_sink() {
    if (!output_) {
        throw EncodeError::write_failed(std::make_error_code(std::io_errc::stream));
    }
}

Segmenter& RecordWriter::segmenter() {
    if (!segmenter_) {
        segmenter_ = std::make_unique<Segmenter>();
    }
    return *segmenter_;
}

void RecordWriter::begin_record() {
    if (records_ > 0) {
        output_ << '\n';
        check_sink();
    }
    ++records_;
}

void RecordWriter::write_scalar(std::string_view key, std::string_view value) {
    validate_key(key);
    output_ << key << ": ";
    FieldWriter writer(output_, config_, field_segmenter());
    writer.write(value);
    writer.finish();
    check_sink();
}

void RecordWriter::write_list(std::string_view key, const std::vector<std::string>& items) {
    validate_key(key);
    ListWriter writer(output_, std::string(key), &segmenter());
    for (const auto& item : items) {
        writer.write_element(item);
    }
    writer.end();
    check_sink();
}

void RecordWriter::write_field(std::string_view key, const FieldValue& value) {
    std::visit(
        [&](const auto& v) {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::monostate>) {
                validate_key(key);
            } else if constexpr (std::is_same_v<V, std::string>) {
                write_scalar(key, v);
            } else {
                write_list(key, v);
            }
        },
        value);
}

void RecordWriter::write_record(const OutputRecord& record) {
    begin_record();
    for (const auto& field : record) {
        write_field(field.key, field.value);
    }
}

}  // namespace debctl::codec
