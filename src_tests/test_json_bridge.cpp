/**
 * @file test_json_bridge.cpp
 * @brief Conversion between bound records and JSON documents
 */

#include <catch2/catch_test_macros.hpp>

#include "debctl_codec/error.hpp"
#include "debctl_codec/file_io.hpp"
#include "debctl_codec/json_bridge.hpp"

#include <string>
#include <variant>
#include <vector>

using namespace debctl::codec;
using debctl::codec::json_bridge::json;

TEST_CASE("Records convert to ordered JSON objects", "[json]") {
    const OutputRecord record{
        {"Package", FieldValue{std::string("bitcoind")}},
        {"Depends", FieldValue{std::vector<std::string>{"libc6", "libevent"}}},
        {"Homepage", FieldValue{}},
    };

    const auto doc = json_bridge::to_json(record);
    REQUIRE(doc.dump() == R"({"Package":"bitcoind","Depends":["libc6","libevent"],"Homepage":null})");

    SECTION("sequences become arrays") {
        const auto array = json_bridge::to_json(std::vector<OutputRecord>{record, record});
        REQUIRE(array.is_array());
        REQUIRE(array.size() == 2);
    }
}

TEST_CASE("JSON objects convert to records", "[json]") {
    const auto doc = json::parse(R"({"Package":"bitcoind","Depends":["libc6","libevent"],"Homepage":null})");
    const auto record = json_bridge::record_from_json(doc);

    REQUIRE(record.size() == 3);
    REQUIRE(record[0].key == "Package");
    REQUIRE(std::get<std::string>(record[0].value) == "bitcoind");
    REQUIRE(std::get<std::vector<std::string>>(record[1].value) == std::vector<std::string>{"libc6", "libevent"});
    REQUIRE(std::holds_alternative<std::monostate>(record[2].value));

    REQUIRE(to_string(record) == "Package: bitcoind\nDepends: libc6,\n         libevent\n");
}

TEST_CASE("records_from_json accepts an object or an array", "[json]") {
    REQUIRE(json_bridge::records_from_json(json::parse(R"({"A":"1"})")).size() == 1);
    REQUIRE(json_bridge::records_from_json(json::parse(R"([{"A":"1"},{"A":"2"},{}])")).size() == 3);
}

TEST_CASE("JSON values without a control file form are unsupported", "[json][errors]") {
    auto expect_unsupported = [](const char* text, const std::string& type) {
        try {
            (void)json_bridge::records_from_json(json::parse(text));
            FAIL("expected EncodeError for " << text);
        } catch (const EncodeError& ex) {
            REQUIRE(ex.kind() == EncodeError::Kind::Unsupported);
            REQUIRE(ex.type_name() == type);
            REQUIRE(std::string(ex.what()) == "unsupported data type " + type);
        }
    };

    expect_unsupported(R"({"A":true})", "bool");
    expect_unsupported(R"({"A":-1})", "i64");
    expect_unsupported(R"({"A":1})", "u64");
    expect_unsupported(R"({"A":1.5})", "f64");
    expect_unsupported(R"({"A":{"nested":"x"}})", "map");
    expect_unsupported(R"({"A":["x",["y"]]})", "seq");
    expect_unsupported(R"({"A":["x",2]})", "u64");
    expect_unsupported(R"("bare string")", "str");
    expect_unsupported(R"([1])", "u64");
}
