/**
 * @file test_roundtrip.cpp
 * @brief Property-style round-trip tests: encode then decode returns the input
 *
 * Strategy:
 * 1) Generate random maps from a small alphabet that includes separators (':' ',' '\n'),
 *    blanks, control characters and multi-byte UTF-8.
 * 2) Drop entries the format cannot represent (invalid keys, untrimmed lines, '.' lines,
 *    list items containing ',' or '\n').
 * 3) Encode, decode and compare; encoding the decoded value again must be stable.
 */

#include <catch2/catch_test_macros.hpp>

#include "debctl_codec/codec.hpp"
#include "debctl_codec/file_io.hpp"
#include "debctl_codec/unfold.hpp"

#include <cstddef>
#include <map>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace debctl::codec;

namespace {

using StringMap = std::map<std::string, std::string>;
using ListMap = std::map<std::string, std::vector<std::string>>;

const std::vector<std::string> kAlphabet = {
    "a", "b", "c", "x", "Z", "0", "9", "-", ".", ",", ":", " ", "\t", "\n", "\n", "\x01", "\r", "\xC3\xA9", "\xE2\x82\xBF",
};

std::string random_text(std::mt19937_64& rng, std::size_t max_len) {
    std::uniform_int_distribution<std::size_t> len(0, max_len);
    std::uniform_int_distribution<std::size_t> pick(0, kAlphabet.size() - 1);
    std::string out;
    const auto n = len(rng);
    for (std::size_t i = 0; i < n; ++i) {
        out += kAlphabet[pick(rng)];
    }
    return out;
}

bool is_trimmed(std::string_view text) {
    return trim(text) == text;
}

bool valid_key(std::string_view key) {
    return !key.empty() && key.find_first_of(std::string_view(":\n\0", 3)) == std::string_view::npos &&
           is_trimmed(key);
}

bool valid_scalar(std::string_view value) {
    if (!is_trimmed(value) || value.find('\0') != std::string_view::npos) {
        return false;
    }
    std::size_t begin = 0;
    while (true) {
        const auto end = value.find('\n', begin);
        const auto line = value.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin);
        if (!is_trimmed(line) || line == ".") {
            return false;
        }
        if (end == std::string_view::npos) {
            return true;
        }
        begin = end + 1;
    }
}

bool valid_item(std::string_view item) {
    return is_trimmed(item) && item.find_first_of(",\n") == std::string_view::npos;
}

StringMap random_string_map(std::mt19937_64& rng, std::size_t& accepted) {
    std::uniform_int_distribution<int> entries(0, 5);
    StringMap map;
    const int n = entries(rng);
    for (int i = 0; i < n; ++i) {
        auto key = random_text(rng, 6);
        auto value = random_text(rng, 16);
        if (!valid_key(key) || !valid_scalar(value)) {
            continue;
        }
        map.insert_or_assign(std::move(key), std::move(value));
        ++accepted;
    }
    return map;
}

ListMap random_list_map(std::mt19937_64& rng, std::size_t& accepted) {
    std::uniform_int_distribution<int> entries(0, 5);
    std::uniform_int_distribution<int> items(1, 4);
    ListMap map;
    const int n = entries(rng);
    for (int i = 0; i < n; ++i) {
        auto key = random_text(rng, 6);
        if (!valid_key(key)) {
            continue;
        }
        std::vector<std::string> value;
        bool ok = true;
        const int m = items(rng);
        for (int k = 0; k < m && ok; ++k) {
            value.push_back(random_text(rng, 6));
            ok = valid_item(value.back());
        }
        if (!ok) {
            continue;
        }
        map.insert_or_assign(std::move(key), std::move(value));
        ++accepted;
    }
    return map;
}

} // namespace

TEST_CASE("Random string maps survive a round trip", "[roundtrip][fuzz]") {
    std::mt19937_64 rng(0xDEB1A9ULL);
    std::size_t accepted = 0;

    for (int iter = 0; iter < 2000; ++iter) {
        const auto map = random_string_map(rng, accepted);
        const auto encoded = to_string_as(map);
        const auto decoded = from_string<StringMap>(encoded);
        INFO("encoded: " << encoded);
        REQUIRE(decoded == map);
        REQUIRE(to_string_as(decoded) == encoded);
    }

    // The filters must leave enough material for the test to mean something
    REQUIRE(accepted > 400);
}

TEST_CASE("Random list maps survive a round trip", "[roundtrip][fuzz]") {
    std::mt19937_64 rng(0xC0FFEEULL);
    std::size_t accepted = 0;

    for (int iter = 0; iter < 2000; ++iter) {
        const auto map = random_list_map(rng, accepted);
        const auto encoded = to_string_as(map);
        const auto decoded = from_string<ListMap>(encoded);
        INFO("encoded: " << encoded);
        REQUIRE(decoded == map);
        REQUIRE(to_string_as(decoded) == encoded);
    }

    REQUIRE(accepted > 150);
}

TEST_CASE("Random record sequences survive a round trip", "[roundtrip][fuzz][sequence]") {
    std::mt19937_64 rng(0x5EC0ULL);
    std::size_t accepted = 0;

    for (int iter = 0; iter < 500; ++iter) {
        std::vector<StringMap> records;
        for (int r = 0; r < 3; ++r) {
            auto map = random_string_map(rng, accepted);
            // An empty record encodes to nothing and cannot be told apart from a separator
            if (!map.empty()) {
                records.push_back(std::move(map));
            }
        }
        const auto encoded = all_to_string_as(records);
        INFO("encoded: " << encoded);
        REQUIRE(all_from_string<StringMap>(encoded) == records);
    }
}

TEST_CASE("Round trip of hand-picked values", "[roundtrip]") {
    SECTION("empty value") {
        const StringMap map{{"X", ""}};
        REQUIRE(from_string<StringMap>(to_string_as(map)) == map);
    }

    SECTION("control characters") {
        const StringMap map{{"\x01", "\x01\n" + std::string(80, '\x01')}};
        REQUIRE(from_string<StringMap>(to_string_as(map)) == map);
    }

    SECTION("several lines") {
        const StringMap map{{"X", "a\nb\nc\nd"}};
        REQUIRE(from_string<StringMap>(to_string_as(map)) == map);
    }

    SECTION("paragraphs") {
        const StringMap map{{"Description", "summary\nfirst paragraph\n\nsecond paragraph\n\n\nthird"}};
        REQUIRE(from_string<StringMap>(to_string_as(map)) == map);
    }

    SECTION("empty list items") {
        const ListMap map{{"Depends", {"", ""}}, {"Pre-Depends", {""}}};
        REQUIRE(from_string<ListMap>(to_string_as(map)) == map);
    }

    SECTION("wrapped lines decode as separate lines") {
        FoldConfig config;
        config.wrap_long_lines = true;
        config.wrap_width = 20;
        const StringMap map{{"Description", "summary\none two three four five six seven"}};
        const auto encoded = to_string_as(map, config);
        REQUIRE(encoded == "Description: summary\n one two three four \n five six seven\n");
        REQUIRE(from_string<StringMap>(encoded).at("Description") == "summary\none two three four \nfive six seven");
    }
}
