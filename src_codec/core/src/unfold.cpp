#include "debctl_codec/unfold.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr std::string_view kParagraphMarker = " .";

bool has_continuation(std::string_view raw) {
    for (std::size_t pos = raw.find('\n'); pos != std::string_view::npos; pos = raw.find('\n', pos + 1)) {
        if (pos + 1 < raw.size() && (raw[pos + 1] == ' ' || raw[pos + 1] == '\t')) {
            return true;
        }
    }
    return false;
}

}  // namespace

namespace debctl::codec {

std::string_view trim(std::string_view input) noexcept {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return input.substr(begin, end - begin + 1);
}

std::string unfold_value(std::string_view raw) {
    if (!has_continuation(raw)) {
        return std::string{raw};
    }

    std::string result;
    result.reserve(raw.size());

    std::size_t begin = 0;
    bool first = true;
    while (true) {
        const auto end = raw.find('\n', begin);
        const auto segment = raw.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin);

        if (first) {
            result.append(segment);
            first = false;
        } else {
            result.push_back('\n');
            if (segment != kParagraphMarker) {
                const auto content = segment.find_first_not_of(" \t");
                if (content != std::string_view::npos) {
                    result.append(segment.substr(content));
                }
            }
        }

        if (end == std::string_view::npos) {
            break;
        }
        begin = end + 1;
    }
    return result;
}

std::vector<std::string> split_sequence(std::string_view value) {
    std::vector<std::string> items;
    std::size_t begin = 0;
    while (true) {
        const auto end = value.find(',', begin);
        if (end == std::string_view::npos) {
            items.emplace_back(trim(value.substr(begin)));
            break;
        }
        items.emplace_back(trim(value.substr(begin, end - begin)));
        begin = end + 1;
    }
    return items;
}

}  // namespace debctl::codec
