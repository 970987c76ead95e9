#pragma once

#include "binding.hpp"
#include "error.hpp"
#include "field_writer.hpp"
#include "record.hpp"
#include "record_reader.hpp"
#include "record_writer.hpp"

#include <istream>
#include <ostream>
#include <type_traits>
#include <utility>
#include <vector>

namespace debctl::codec {

/**
 * \brief Reads the fields of one record, up to a blank line or the end of the stream.
 *
 * Values are returned raw; see unfold_value() and split_sequence(). An input positioned
 * at a blank line or at EOF yields an empty record.
 */
[[nodiscard]] RawRecord read_record(RecordReader& reader);

/// Decodes the first record of `input`. Following records are left unread.
[[nodiscard]] RawRecord decode_record(std::istream& input);

/**
 * \brief Decodes all records of `input`.
 *
 * Records without fields (runs of blank lines, a trailing blank line) produce no element.
 * A read error on the first line after a blank line ends the sequence instead of being
 * reported, so trailing junk after the last record is tolerated; any other error
 * propagates.
 */
[[nodiscard]] std::vector<RawRecord> decode_records(std::istream& input);

/**
 * \brief Sequence decoding loop shared by the raw and typed entry points.
 *
 * `decode_one` converts a non-empty record. Errors it raises always propagate; only read
 * errors are subject to the end-of-sequence check.
 */
template <typename DecodeOne>
[[nodiscard]] auto read_records(RecordReader& reader, DecodeOne&& decode_one)
    -> std::vector<std::decay_t<std::invoke_result_t<DecodeOne&, const RawRecord&>>> {
    std::vector<std::decay_t<std::invoke_result_t<DecodeOne&, const RawRecord&>>> values;
    while (!reader.at_eof()) {
        RawRecord record;
        try {
            record = read_record(reader);
        } catch (const DecodeError&) {
            if (reader.saw_blank()) {
                break;
            }
            throw;
        }
        if (record.empty()) {
            continue;
        }
        values.push_back(decode_one(record));
    }
    return values;
}

template <typename T>
[[nodiscard]] T decode_record_as(std::istream& input) {
    return RecordTraits<T>::from_record(decode_record(input));
}

template <typename T>
[[nodiscard]] std::vector<T> decode_records_as(std::istream& input) {
    RecordReader reader(input);
    return read_records(reader, [](const RawRecord& record) { return RecordTraits<T>::from_record(record); });
}

void encode_record(std::ostream& output, const OutputRecord& record, const FoldConfig& config = {});

/// Records are separated by one blank line; the output does not end with one.
void encode_records(std::ostream& output, const std::vector<OutputRecord>& records, const FoldConfig& config = {});

template <typename T>
void encode_as(std::ostream& output, const T& value, const FoldConfig& config = {}) {
    encode_record(output, RecordTraits<T>::to_record(value), config);
}

template <typename T>
void encode_all_as(std::ostream& output, const std::vector<T>& values, const FoldConfig& config = {}) {
    RecordWriter writer(output, config);
    for (const auto& value : values) {
        writer.write_record(RecordTraits<T>::to_record(value));
    }
}

}  // namespace debctl::codec
