#include "debctl_codec/error.hpp"

#include <sstream>
#include <string>
#include <utility>

namespace {

std::string printable(char ch) {
    if (ch == '\n') {
        return "\\n";
    }
    return std::string(1, ch);
}

}  // namespace

namespace debctl::codec {

DecodeError::DecodeError(Kind kind, std::size_t line, const std::string& message)
    : std::runtime_error(message), kind_(kind), line_(line) {}

DecodeError DecodeError::missing_colon(std::size_t line) {
    return DecodeError(Kind::MissingColon, line,
                       "Line " + std::to_string(line) + " doesn't contain a colon");
}

DecodeError DecodeError::ambiguous_type(std::size_t line, std::string key) {
    std::string message =
        "The deserialized type is ambiguous and must be explicitly specified. "
        "(RFC822 is NOT self-describing.)";
    if (!key.empty()) {
        message += " Field '" + key + "' at line " + std::to_string(line) + " has no declared shape.";
    }
    return DecodeError(Kind::AmbiguousType, line, message);
}

DecodeError DecodeError::io(std::error_code error, std::size_t line) {
    DecodeError result(Kind::Io, line,
                       "I/O error after line " + std::to_string(line) + ": " + error.message());
    result.io_error_ = error;
    return result;
}

DecodeError DecodeError::custom(std::string message, std::size_t line) {
    return DecodeError(Kind::Custom, line, message);
}

EncodeError::EncodeError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

EncodeError EncodeError::unsupported(std::string type_name) {
    EncodeError result(Kind::Unsupported, "unsupported data type " + type_name);
    result.type_name_ = std::move(type_name);
    return result;
}

EncodeError EncodeError::custom(std::string message) {
    return EncodeError(Kind::Custom, message);
}

EncodeError EncodeError::empty_key() {
    return EncodeError(Kind::EmptyKey, "empty key is not allowed");
}

EncodeError EncodeError::invalid_key_char(std::string key, char character, std::size_t position) {
    std::ostringstream oss;
    oss << "invalid char " << printable(character) << " in key '" << key << "' at position " << position;
    EncodeError result(Kind::InvalidKeyChar, oss.str());
    result.key_ = std::move(key);
    result.character_ = character;
    result.position_ = position;
    return result;
}

EncodeError EncodeError::write_failed(std::error_code error) {
    EncodeError result(Kind::WriteFailed, "failed to write: " + error.message());
    result.io_error_ = error;
    return result;
}

EncodeError EncodeError::format_failed(std::string detail) {
    return EncodeError(Kind::FormatFailed, "failed to format value: " + detail);
}

}  // namespace debctl::codec
