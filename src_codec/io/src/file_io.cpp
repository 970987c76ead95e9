#include "debctl_codec/file_io.hpp"

#include <cerrno>
#include <system_error>
#include <utility>

namespace {

std::error_code last_error() {
    const int code = errno;
    if (code == 0) {
        return std::make_error_code(std::io_errc::stream);
    }
    return {code, std::generic_category()};
}

}  // namespace

namespace debctl::codec {

std::ifstream open_input(const std::filesystem::path& path) {
    errno = 0;
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw ReadFileError(path, last_error());
    }
    return input;
}

std::ofstream open_output(const std::filesystem::path& path) {
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw WriteFileError(path, ec);
        }
    }
    errno = 0;
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw WriteFileError(path, last_error());
    }
    return output;
}

RawRecord record_from_string(std::string_view text) {
    std::istringstream input{std::string(text)};
    return decode_record(input);
}

std::vector<RawRecord> records_from_string(std::string_view text) {
    std::istringstream input{std::string(text)};
    return decode_records(input);
}

std::vector<RawRecord> records_from_file(const std::filesystem::path& path) {
    auto input = open_input(path);
    try {
        return decode_records(input);
    } catch (const DecodeError& error) {
        throw ReadFileError(path, error);
    }
}

std::string to_string(const OutputRecord& record, const FoldConfig& config) {
    std::ostringstream output;
    encode_record(output, record, config);
    return output.str();
}

std::string to_string(const std::vector<OutputRecord>& records, const FoldConfig& config) {
    std::ostringstream output;
    encode_records(output, records, config);
    return output.str();
}

void to_file(const std::filesystem::path& path, const std::vector<OutputRecord>& records, const FoldConfig& config) {
    auto output = open_output(path);
    try {
        encode_records(output, records, config);
    } catch (const EncodeError& error) {
        throw WriteFileError(path, error);
    }
    output.flush();
    if (!output) {
        throw WriteFileError(path, std::make_error_code(std::io_errc::stream));
    }
}

}  // namespace debctl::codec
