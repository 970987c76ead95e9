#include "debctl_codec/list_writer.hpp"

#include <utility>

namespace debctl::codec {

ListWriter::ListWriter(std::ostream& output, std::string key, Segmenter* segmenter)
    : output_(output), key_(std::move(key)), segmenter_(segmenter) {}

void ListWriter::write_element(std::string_view element) {
    if (!started_) {
        output_ << key_ << ": ";
        indent_ = (segmenter_ != nullptr ? segmenter_->graphemes(key_) : grapheme_count(key_)) + 2;
        started_ = true;
    } else {
        output_ << ",\n";
        for (std::size_t i = 0; i < indent_; ++i) {
            output_ << ' ';
        }
    }
    output_ << element;
}

void ListWriter::end() {
    if (started_) {
        output_ << '\n';
    }
}

}  // namespace debctl::codec
