#include "debctl_codec/roundtrip_engine.hpp"

#include "debctl_codec/codec.hpp"
#include "debctl_codec/error.hpp"

#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

std::string_view strip_trailing_blank_lines(std::string_view text) {
    while (text.size() >= 2 && text.substr(text.size() - 2) == "\n\n") {
        text.remove_suffix(1);
    }
    return text;
}

std::string_view line_at(std::string_view text, std::size_t begin) {
    const auto end = text.find('\n', begin);
    return text.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin);
}

// Describes the first line where `expected` and `actual` differ.
std::string describe_difference(std::string_view expected, std::string_view actual) {
    std::size_t line_no = 1;
    std::size_t line_begin = 0;
    std::size_t i = 0;
    while (i < expected.size() && i < actual.size() && expected[i] == actual[i]) {
        if (expected[i] == '\n') {
            ++line_no;
            line_begin = i + 1;
        }
        ++i;
    }

    std::ostringstream oss;
    if (i == expected.size() || i == actual.size()) {
        oss << "line " << line_no << ": output differs only in length (expected " << expected.size()
            << " bytes, re-encoded " << actual.size() << " bytes)";
        return oss.str();
    }
    oss << "line " << line_no << ": expected '";
    if (line_begin < expected.size()) {
        oss << line_at(expected, line_begin);
    } else {
        oss << "<eof>";
    }
    oss << "' but re-encoded '";
    if (line_begin < actual.size()) {
        oss << line_at(actual, line_begin);
    } else {
        oss << "<eof>";
    }
    oss << "'";
    return oss.str();
}

}  // namespace

namespace debctl::codec {

RoundTripEngine::RoundTripEngine(Config config) : config_(std::move(config)) {}

CheckOutcome RoundTripEngine::check(const ControlFile& file) const {
    CheckOutcome outcome;
    outcome.file = file.path.string();

    std::vector<OutputRecord> bound;
    try {
        std::istringstream input(file.contents);
        RecordReader reader(input);
        bound = read_records(reader, [this](const RawRecord& record) { return config_.schema.bind(record); });
    } catch (const DecodeError& ex) {
        outcome.status = "ERROR";
        outcome.message = std::string("decode: ") + ex.what();
        return outcome;
    }
    outcome.records = bound.size();

    std::ostringstream output;
    try {
        encode_records(output, bound, config_.fold);
    } catch (const EncodeError& ex) {
        outcome.status = "ERROR";
        outcome.message = std::string("encode: ") + ex.what();
        return outcome;
    }

    const auto encoded = output.str();
    std::string_view expected = file.contents;
    std::string_view actual = encoded;
    if (config_.ignore_trailing_blank_lines) {
        expected = strip_trailing_blank_lines(expected);
        actual = strip_trailing_blank_lines(actual);
    }

    if (expected == actual) {
        outcome.status = "PASS";
        outcome.message = std::to_string(outcome.records) + " record(s) reproduced";
    } else {
        outcome.status = "FAIL";
        outcome.message = describe_difference(expected, actual);
    }
    return outcome;
}

std::vector<CheckOutcome> RoundTripEngine::run(const std::vector<ControlFile>& files) const {
    std::vector<CheckOutcome> outcomes;
    outcomes.reserve(files.size());
    for (const auto& file : files) {
        outcomes.push_back(check(file));
    }
    return outcomes;
}

}  // namespace debctl::codec
