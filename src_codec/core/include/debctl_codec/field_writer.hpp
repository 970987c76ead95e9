#pragma once

#include <cstddef>
#include <memory>
#include <ostream>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>

namespace debctl::codec {

/**
 * \brief Layout knobs of the encoder.
 *
 * The defaults produce Debian-style output: one space of continuation indent and, when
 * wrapping is enabled, lines of at most 80 grapheme clusters.
 */
struct FoldConfig {
    bool wrap_long_lines{false};
    std::size_t wrap_width{80};
    std::size_t continuation_indent{1};
};

/**
 * \brief Word and grapheme segmentation of UTF-8 text.
 *
 * Owns the ICU break iterators, so a writer builds them once and reuses them for every
 * field. Not thread-safe.
 */
class Segmenter {
public:
    Segmenter();
    ~Segmenter();

    Segmenter(const Segmenter&) = delete;
    Segmenter& operator=(const Segmenter&) = delete;

    /// Pieces of `text` between Unicode word boundaries, whitespace runs included.
    [[nodiscard]] std::vector<std::string_view> words(std::string_view text);

    /// Number of extended grapheme clusters in `text`.
    [[nodiscard]] std::size_t graphemes(std::string_view text);

private:
    struct Iterators;
    std::unique_ptr<Iterators> iterators_;
};

/// Number of extended grapheme clusters in UTF-8 `text`.
[[nodiscard]] std::size_t grapheme_count(std::string_view text);

/**
 * \brief Folds one logical multi-line value into wire format.
 *
 * The value may arrive in several chunks. Every embedded newline becomes a newline plus
 * the continuation indent, and an empty logical line becomes the paragraph marker `.`.
 * The first line shares the physical line with `Key: ` and is never wrapped. Whether a
 * trailing newline of a chunk introduces an empty line is only known when the next chunk
 * arrives, hence the state.
 *
 * With `wrap_long_lines`, continuation lines are wrapped greedily on Unicode word
 * boundaries: a break goes before a word that would make the physical line wider than
 * `wrap_width` grapheme clusters. The column carries over from one chunk to the next,
 * and the last word of a chunk is held back until the next chunk or finish() shows where
 * it ends. Words are never split, and whitespace directly after an inserted break is
 * dropped.
 *
 * `segmenter` is borrowed when given; otherwise one is built on the first wrapped line.
 */
class FieldWriter {
public:
    FieldWriter(std::ostream& output, const FoldConfig& config, Segmenter* segmenter = nullptr);

    void write(std::string_view chunk);

    /// Flushes a held-back word and terminates the field with a newline unless the last
    /// chunk ended with one.
    void finish();

private:
    enum class State { FirstLine, Neutral, EndedWithNewline };

    void write_line(std::string_view line, bool line_open);
    void write_wrapped(std::string_view line, bool line_open);
    void write_indent();
    Segmenter& segmenter();

    std::ostream& output_;
    const FoldConfig& config_;
    Segmenter* segmenter_;
    std::unique_ptr<Segmenter> owned_segmenter_;
    State state_{State::FirstLine};
    // Columns used on the current continuation line
    std::size_t column_{0};
    bool line_has_text_{false};
    bool after_break_{false};
    std::string pending_;
};

/**
 * \brief std::streambuf front end of FieldWriter.
 *
 * Lets any `operator<<` feed a field chunk by chunk:
 * \code
 * FieldWriter writer(out, config);
 * FieldStreamBuf buf(writer);
 * std::ostream os(&buf);
 * os << value;
 * writer.finish();
 * \endcode
 */
class FieldStreamBuf : public std::streambuf {
public:
    explicit FieldStreamBuf(FieldWriter& writer) : writer_(writer) {}

protected:
    int_type overflow(int_type ch) override;
    std::streamsize xsputn(const char* data, std::streamsize count) override;

private:
    FieldWriter& writer_;
};

}  // namespace debctl::codec
