#include "debctl_codec/codec.hpp"

#include <optional>
#include <string>
#include <utility>

namespace debctl::codec {

RawRecord read_record(RecordReader& reader) {
    RawRecord record;
    while (true) {
        auto key = reader.next_key();
        if (!key) {
            break;
        }
        const auto line = reader.line();
        if (record.fields.empty()) {
            record.first_line = line;
        }
        auto value = reader.next_value();
        record.fields.push_back(RawField{std::move(*key), std::move(value), line});
    }
    return record;
}

RawRecord decode_record(std::istream& input) {
    RecordReader reader(input);
    return read_record(reader);
}

std::vector<RawRecord> decode_records(std::istream& input) {
    RecordReader reader(input);
    return read_records(reader, [](const RawRecord& record) { return record; });
}

void encode_record(std::ostream& output, const OutputRecord& record, const FoldConfig& config) {
    RecordWriter writer(output, config);
    writer.write_record(record);
}

void encode_records(std::ostream& output, const std::vector<OutputRecord>& records, const FoldConfig& config) {
    RecordWriter writer(output, config);
    for (const auto& record : records) {
        writer.write_record(record);
    }
}

}  // namespace debctl::codec
