#include "debctl_codec/record_reader.hpp"

#include "debctl_codec/error.hpp"
#include "debctl_codec/unfold.hpp"

#include <ios>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace {

bool is_continuation(const std::string& line) {
    return !line.empty() && (line.front() == ' ' || line.front() == '\t');
}

}  // namespace

namespace debctl::codec {

RecordReader::RecordReader(std::istream& input) : input_(input) {}

// Reads one physical line including its terminating '\n', if any.
// Returns false when nothing was left to read.
bool RecordReader::read_line(std::string& out) {
    out.clear();
    try {
        if (!std::getline(input_, out)) {
            if (input_.bad()) {
                throw DecodeError::io(std::make_error_code(std::io_errc::stream), line_);
            }
            return false;
        }
    } catch (const std::ios_base::failure& ex) {
        throw DecodeError::io(ex.code(), line_);
    }
    if (input_.bad()) {
        throw DecodeError::io(std::make_error_code(std::io_errc::stream), line_);
    }
    if (!input_.eof()) {
        out.push_back('\n');
    }
    ++line_;
    return true;
}

std::optional<std::string> RecordReader::next_key() {
    if (!pending_) {
        std::string line;
        if (!read_line(line)) {
            eof_ = true;
            return std::nullopt;
        }
        pending_ = std::move(line);
    }

    if (*pending_ == "\n") {
        pending_.reset();
        value_pending_ = false;
        saw_blank_ = true;
        return std::nullopt;
    }

    const auto colon = pending_->find(':');
    if (colon == std::string::npos) {
        throw DecodeError::missing_colon(line_);
    }

    saw_blank_ = false;
    value_pending_ = true;
    key_end_ = colon;
    return pending_->substr(0, colon);
}

std::string RecordReader::next_value() {
    if (!value_pending_ || !pending_) {
        throw std::logic_error("RecordReader::next_value() called before next_key()");
    }

    std::string raw = pending_->substr(key_end_ + 1);
    pending_.reset();
    value_pending_ = false;

    std::string line;
    while (read_line(line)) {
        if (!is_continuation(line)) {
            pending_ = std::move(line);
            break;
        }
        raw += line;
    }

    return std::string{trim(raw)};
}

}  // namespace debctl::codec
