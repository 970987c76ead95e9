#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace debctl::codec {

/**
 * \brief Failure while reading records.
 *
 * Every decode error aborts the current call. The only place an error is recovered
 * locally is the end-of-sequence check in decode_records().
 */
class DecodeError : public std::runtime_error {
public:
    enum class Kind {
        MissingColon,   ///< Non-blank line without ':'
        AmbiguousType,  ///< Caller asked for a shape the format cannot infer
        Io,             ///< Source stream failure
        Custom,         ///< Raised by the data-model binding
    };

    [[nodiscard]] static DecodeError missing_colon(std::size_t line);
    [[nodiscard]] static DecodeError ambiguous_type(std::size_t line = 0, std::string key = {});
    [[nodiscard]] static DecodeError io(std::error_code error, std::size_t line);
    [[nodiscard]] static DecodeError custom(std::string message, std::size_t line = 0);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    /// 1-based physical line the error refers to, 0 when unknown.
    [[nodiscard]] std::size_t line() const noexcept { return line_; }

    [[nodiscard]] std::error_code io_error() const noexcept { return io_error_; }

private:
    DecodeError(Kind kind, std::size_t line, const std::string& message);

    Kind kind_;
    std::size_t line_;
    std::error_code io_error_{};
};

/**
 * \brief Failure while writing records.
 *
 * WriteFailed means the sink rejected output; FormatFailed means the codec itself could
 * not produce it. The two are never merged.
 */
class EncodeError : public std::runtime_error {
public:
    enum class Kind {
        Unsupported,
        Custom,
        EmptyKey,
        InvalidKeyChar,
        WriteFailed,
        FormatFailed,
    };

    [[nodiscard]] static EncodeError unsupported(std::string type_name);
    [[nodiscard]] static EncodeError custom(std::string message);
    [[nodiscard]] static EncodeError empty_key();
    [[nodiscard]] static EncodeError invalid_key_char(std::string key, char character, std::size_t position);
    [[nodiscard]] static EncodeError write_failed(std::error_code error);
    [[nodiscard]] static EncodeError format_failed(std::string detail);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] char character() const noexcept { return character_; }
    [[nodiscard]] std::size_t position() const noexcept { return position_; }
    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }
    [[nodiscard]] std::error_code io_error() const noexcept { return io_error_; }

private:
    EncodeError(Kind kind, const std::string& message);

    Kind kind_;
    std::string key_{};
    char character_{'\0'};
    std::size_t position_{0};
    std::string type_name_{};
    std::error_code io_error_{};
};

}  // namespace debctl::codec
