#pragma once

#include "debctl_codec/error.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <system_error>

namespace debctl::codec {

/**
 * \brief Opening or loading a control file failed.
 *
 * Carries the path so that the message is useful on its own. For Load the decode
 * failure is available through decode_error().
 */
class ReadFileError : public std::runtime_error {
public:
    enum class Kind { Open, Load };

    ReadFileError(std::filesystem::path path, std::error_code error);
    ReadFileError(std::filesystem::path path, const DecodeError& cause);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::error_code io_error() const noexcept { return io_error_; }
    [[nodiscard]] const std::optional<DecodeError>& decode_error() const noexcept { return cause_; }

private:
    Kind kind_;
    std::filesystem::path path_;
    std::error_code io_error_{};
    std::optional<DecodeError> cause_{};
};

class WriteFileError : public std::runtime_error {
public:
    WriteFileError(std::filesystem::path path, std::error_code error);
    WriteFileError(std::filesystem::path path, const EncodeError& cause);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::error_code io_error() const noexcept { return io_error_; }
    [[nodiscard]] const std::optional<EncodeError>& encode_error() const noexcept { return cause_; }

private:
    std::filesystem::path path_;
    std::error_code io_error_{};
    std::optional<EncodeError> cause_{};
};

}  // namespace debctl::codec
