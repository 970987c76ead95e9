#include "debctl_codec/file_error.hpp"

#include <string>
#include <utility>

namespace debctl::codec {

ReadFileError::ReadFileError(std::filesystem::path path, std::error_code error)
    : std::runtime_error("failed to open file " + path.string() + " for reading: " + error.message()),
      kind_(Kind::Open),
      path_(std::move(path)),
      io_error_(error) {}

ReadFileError::ReadFileError(std::filesystem::path path, const DecodeError& cause)
    : std::runtime_error("failed to load file " + path.string() + ": " + cause.what()),
      kind_(Kind::Load),
      path_(std::move(path)),
      io_error_(cause.io_error()),
      cause_(cause) {}

WriteFileError::WriteFileError(std::filesystem::path path, std::error_code error)
    : std::runtime_error("failed to write file " + path.string() + ": " + error.message()),
      path_(std::move(path)),
      io_error_(error) {}

WriteFileError::WriteFileError(std::filesystem::path path, const EncodeError& cause)
    : std::runtime_error("failed to write file " + path.string() + ": " + cause.what()),
      path_(std::move(path)),
      io_error_(cause.io_error()),
      cause_(cause) {}

}  // namespace debctl::codec
