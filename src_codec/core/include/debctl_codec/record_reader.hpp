#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>

namespace debctl::codec {

/**
 * \brief Line scanner extracting `(key, raw value)` pairs from a byte stream.
 *
 * The reader keeps at most one physical line of lookahead: the key line while its value
 * is pending, or the first line following a value. Callers alternate next_key() and
 * next_value(); next_key() returning std::nullopt ends the current record, either at a
 * blank line (saw_blank() becomes true) or at the end of the stream (at_eof()).
 *
 * The reader borrows the stream and must be the only consumer of it for the duration
 * of the decode operation.
 */
class RecordReader {
public:
    explicit RecordReader(std::istream& input);

    RecordReader(const RecordReader&) = delete;
    RecordReader& operator=(const RecordReader&) = delete;

    /**
     * \brief Advances to the next key of the current record.
     *
     * \return the text before the first colon, or std::nullopt at a blank line or EOF.
     * \throws DecodeError MissingColon when the line has no colon, Io on stream failure.
     */
    [[nodiscard]] std::optional<std::string> next_key();

    /**
     * \brief Collects the value of the key returned by the last next_key().
     *
     * Continuation lines (starting with a space or a tab) are appended; the first other
     * line is kept for the next call to next_key(). The result is trimmed as a whole.
     */
    [[nodiscard]] std::string next_value();

    [[nodiscard]] bool at_eof() const noexcept { return eof_; }

    /// True when the last record boundary crossed was a blank line.
    [[nodiscard]] bool saw_blank() const noexcept { return saw_blank_; }

    /// Number of physical lines consumed so far.
    [[nodiscard]] std::size_t line() const noexcept { return line_; }

private:
    bool read_line(std::string& out);

    std::istream& input_;
    std::optional<std::string> pending_{};
    std::size_t key_end_{0};
    std::size_t line_{0};
    bool eof_{false};
    bool saw_blank_{false};
    bool value_pending_{false};
};

}  // namespace debctl::codec
