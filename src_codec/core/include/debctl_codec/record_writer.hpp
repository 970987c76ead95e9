#pragma once

#include "error.hpp"
#include "field_writer.hpp"
#include "record.hpp"

#include <cstddef>
#include <ios>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace debctl::codec {

/**
 * \brief Checks that `key` can be written.
 *
 * \throws EncodeError EmptyKey, or InvalidKeyChar at the first ':' or '\n'.
 */
void validate_key(std::string_view key);

/**
 * \brief Composes records from fields, in the order they are given.
 *
 * Keys are validated before anything is written for a field. Absent values and empty
 * lists write nothing. The sink is checked after every field; a failing sink raises
 * EncodeError WriteFailed. One Segmenter serves every field of the writer.
 */
class RecordWriter {
public:
    explicit RecordWriter(std::ostream& output, FoldConfig config = {});

    RecordWriter(const RecordWriter&) = delete;
    RecordWriter& operator=(const RecordWriter&) = delete;

    /// Separates this record from the previous one with a blank line.
    void begin_record();

    void write_field(std::string_view key, const FieldValue& value);
    void write_scalar(std::string_view key, std::string_view value);
    void write_list(std::string_view key, const std::vector<std::string>& items);
    void write_record(const OutputRecord& record);

    /**
     * \brief Writes any value with an `operator<<` as a scalar field.
     *
     * The value is streamed through FieldStreamBuf, so multi-line output is folded the
     * same way as write_scalar() does.
     */
    template <typename T>
    void write_display(std::string_view key, const T& value) {
        validate_key(key);
        output_ << key << ": ";
        FieldWriter writer(output_, config_, field_segmenter());
        FieldStreamBuf buffer(writer);
        std::ostream stream(&buffer);
        stream.exceptions(std::ios::badbit);
        stream << value;
        if (stream.fail()) {
            throw EncodeError::format_failed("operator<< reported failure for key '" + std::string(key) + "'");
        }
        writer.finish();
        check_sink();
    }

    [[nodiscard]] const FoldConfig& config() const noexcept { return config_; }

    /// Number of records started so far.
    [[nodiscard]] std::size_t records() const noexcept { return records_; }

private:
    void check_sink();
    Segmenter& segmenter();
    // Only wrapping needs segmentation inside a scalar field
    Segmenter* field_segmenter() { return config_.wrap_long_lines ? &segmenter() : nullptr; }

    std::ostream& output_;
    FoldConfig config_;
    std::unique_ptr<Segmenter> segmenter_;
    std::size_t records_{0};
};

}  // namespace debctl::codec
