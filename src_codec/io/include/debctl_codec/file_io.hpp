#pragma once

#include "debctl_codec/codec.hpp"
#include "debctl_codec/error.hpp"
#include "debctl_codec/file_error.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace debctl::codec {

/**
 * \brief Opens `path` for binary reading.
 * \throws ReadFileError Open
 */
[[nodiscard]] std::ifstream open_input(const std::filesystem::path& path);

/**
 * \brief Opens `path` for binary writing, creating missing parent directories.
 * \throws WriteFileError
 */
[[nodiscard]] std::ofstream open_output(const std::filesystem::path& path);

[[nodiscard]] RawRecord record_from_string(std::string_view text);
[[nodiscard]] std::vector<RawRecord> records_from_string(std::string_view text);

/// \throws ReadFileError Open or Load, with the decode error attached.
[[nodiscard]] std::vector<RawRecord> records_from_file(const std::filesystem::path& path);

[[nodiscard]] std::string to_string(const OutputRecord& record, const FoldConfig& config = {});
[[nodiscard]] std::string to_string(const std::vector<OutputRecord>& records, const FoldConfig& config = {});

/// \throws WriteFileError
void to_file(const std::filesystem::path& path,
             const std::vector<OutputRecord>& records,
             const FoldConfig& config = {});

template <typename T>
[[nodiscard]] T from_string(std::string_view text) {
    std::istringstream input{std::string(text)};
    return decode_record_as<T>(input);
}

template <typename T>
[[nodiscard]] std::vector<T> all_from_string(std::string_view text) {
    std::istringstream input{std::string(text)};
    return decode_records_as<T>(input);
}

template <typename T>
[[nodiscard]] T from_file(const std::filesystem::path& path) {
    auto input = open_input(path);
    try {
        return decode_record_as<T>(input);
    } catch (const DecodeError& error) {
        throw ReadFileError(path, error);
    }
}

template <typename T>
[[nodiscard]] std::vector<T> all_from_file(const std::filesystem::path& path) {
    auto input = open_input(path);
    try {
        return decode_records_as<T>(input);
    } catch (const DecodeError& error) {
        throw ReadFileError(path, error);
    }
}

template <typename T>
[[nodiscard]] std::string to_string_as(const T& value, const FoldConfig& config = {}) {
    std::ostringstream output;
    encode_as(output, value, config);
    return output.str();
}

template <typename T>
[[nodiscard]] std::string all_to_string_as(const std::vector<T>& values, const FoldConfig& config = {}) {
    std::ostringstream output;
    encode_all_as(output, values, config);
    return output.str();
}

}  // namespace debctl::codec
