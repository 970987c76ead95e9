#include "debctl_codec/field_writer.hpp"

#include "debctl_codec/error.hpp"
#include "debctl_codec/unfold.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/utext.h>
#include <unicode/utypes.h>

namespace {

struct UTextCloser {
    void operator()(UText* text) const { utext_close(text); }
};

using UTextPtr = std::unique_ptr<UText, UTextCloser>;

void check(UErrorCode status, const char* what) {
    if (U_FAILURE(status)) {
        throw debctl::codec::EncodeError::format_failed(std::string(what) + ": " + u_errorName(status));
    }
}

UTextPtr open_utf8(std::string_view text) {
    UErrorCode status = U_ZERO_ERROR;
    UTextPtr utext(utext_openUTF8(nullptr, text.data(), static_cast<std::int64_t>(text.size()), &status));
    check(status, "utext_openUTF8");
    return utext;
}

bool is_blank(std::string_view word) {
    return word.find_first_not_of(debctl::codec::kWhitespace) == std::string_view::npos;
}

}  // namespace

namespace debctl::codec {

// Boundaries are byte offsets because the iterators run on a UTF-8 UText.
struct Segmenter::Iterators {
    std::unique_ptr<icu::BreakIterator> words;
    std::unique_ptr<icu::BreakIterator> graphemes;
};

Segmenter::Segmenter() : iterators_(std::make_unique<Iterators>()) {
    UErrorCode status = U_ZERO_ERROR;
    iterators_->words.reset(icu::BreakIterator::createWordInstance(icu::Locale::getRoot(), status));
    check(status, "word break iterator");
    status = U_ZERO_ERROR;
    iterators_->graphemes.reset(icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
    check(status, "character break iterator");
}

Segmenter::~Segmenter() = default;

std::vector<std::string_view> Segmenter::words(std::string_view text) {
    std::vector<std::string_view> result;
    if (text.empty()) {
        return result;
    }
    auto utext = open_utf8(text);
    auto& iterator = *iterators_->words;
    UErrorCode status = U_ZERO_ERROR;
    iterator.setText(utext.get(), status);
    check(status, "word segmentation");

    std::int32_t begin = iterator.first();
    for (std::int32_t end = iterator.next(); end != icu::BreakIterator::DONE; end = iterator.next()) {
        result.push_back(text.substr(static_cast<std::size_t>(begin), static_cast<std::size_t>(end - begin)));
        begin = end;
    }
    return result;
}

std::size_t Segmenter::graphemes(std::string_view text) {
    if (text.empty()) {
        return 0;
    }
    auto utext = open_utf8(text);
    auto& iterator = *iterators_->graphemes;
    UErrorCode status = U_ZERO_ERROR;
    iterator.setText(utext.get(), status);
    check(status, "grapheme segmentation");

    std::size_t count = 0;
    iterator.first();
    while (iterator.next() != icu::BreakIterator::DONE) {
        ++count;
    }
    return count;
}

std::size_t grapheme_count(std::string_view text) {
    Segmenter segmenter;
    return segmenter.graphemes(text);
}

FieldWriter::FieldWriter(std::ostream& output, const FoldConfig& config, Segmenter* segmenter)
    : output_(output), config_(config), segmenter_(segmenter) {}

Segmenter& FieldWriter::segmenter() {
    if (segmenter_ == nullptr) {
        owned_segmenter_ = std::make_unique<Segmenter>();
        segmenter_ = owned_segmenter_.get();
    }
    return *segmenter_;
}

void FieldWriter::write_indent() {
    output_ << '\n';
    for (std::size_t i = 0; i < config_.continuation_indent; ++i) {
        output_ << ' ';
    }
    column_ = config_.continuation_indent;
    line_has_text_ = false;
    after_break_ = false;
}

void FieldWriter::write_line(std::string_view line, bool line_open) {
    if (config_.wrap_long_lines) {
        write_wrapped(line, line_open);
    } else {
        output_ << line;
    }
}

void FieldWriter::write_wrapped(std::string_view line, bool line_open) {
    std::string text = std::move(pending_);
    pending_.clear();
    text.append(line);

    auto& segments = segmenter();
    auto words = segments.words(text);
    // The next chunk may extend the last word
    if (line_open && !words.empty() && !is_blank(words.back())) {
        pending_.assign(words.back());
        words.pop_back();
    }

    for (const auto word : words) {
        const bool blank = is_blank(word);
        if (blank && after_break_) {
            continue;
        }

        const auto width = segments.graphemes(word);
        // A word that alone overflows an empty line stays on it
        if (column_ + width > config_.wrap_width && line_has_text_) {
            write_indent();
            after_break_ = true;
            if (blank) {
                continue;
            }
        }

        output_ << word;
        column_ += width;
        line_has_text_ = line_has_text_ || !blank;
        after_break_ = false;
    }
}

void FieldWriter::write(std::string_view chunk) {
    if (chunk.empty()) {
        return;
    }

    auto end = chunk.find('\n');
    const auto first = chunk.substr(0, end);
    switch (state_) {
        case State::FirstLine:
            // Shares the line with "Key: ", never wrapped
            output_ << first;
            break;
        case State::EndedWithNewline:
            if (first.empty()) {
                output_ << '.';
            } else {
                write_line(first, end == std::string_view::npos);
            }
            break;
        case State::Neutral:
            write_line(first, end == std::string_view::npos);
            break;
    }

    const bool contained_newline = end != std::string_view::npos;
    while (end != std::string_view::npos) {
        const auto begin = end + 1;
        end = chunk.find('\n', begin);
        const auto line = chunk.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin);

        write_indent();
        if (line.empty()) {
            // An empty last piece may still be continued by the next chunk
            if (end != std::string_view::npos) {
                output_ << '.';
            }
        } else {
            write_line(line, end == std::string_view::npos);
        }
    }

    if (state_ == State::FirstLine && !contained_newline) {
        return;
    }
    state_ = chunk.back() == '\n' ? State::EndedWithNewline : State::Neutral;
}

void FieldWriter::finish() {
    if (!pending_.empty()) {
        write_wrapped({}, false);
    }
    if (state_ != State::EndedWithNewline) {
        output_ << '\n';
    }
}

FieldStreamBuf::int_type FieldStreamBuf::overflow(int_type ch) {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return traits_type::not_eof(ch);
    }
    const char c = traits_type::to_char_type(ch);
    writer_.write(std::string_view(&c, 1));
    return ch;
}

std::streamsize FieldStreamBuf::xsputn(const char* data, std::streamsize count) {
    writer_.write(std::string_view(data, static_cast<std::size_t>(count)));
    return count;
}

}  // namespace debctl::codec
