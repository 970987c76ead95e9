/**
 * @file test_schema.cpp
 * @brief Runtime schema binding of raw records
 */

#include <catch2/catch_test_macros.hpp>

#include "debctl_codec/codec.hpp"
#include "debctl_codec/error.hpp"
#include "debctl_codec/file_io.hpp"
#include "debctl_codec/schema.hpp"

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace debctl::codec;

namespace {

const char* const kPackage =
    "Package: bitcoind\n"
    "Depends: libc6 (>= 2.34),\n"
    "         libevent-2.1-7\n"
    "Description: peer-to-peer digital currency\n"
    " Bitcoin is a free open source peer-to-peer electronic cash system.\n"
    " .\n"
    " This package provides the daemon.\n";

const std::string& scalar_of(const OutputField& field) {
    return std::get<std::string>(field.value);
}

const std::vector<std::string>& list_of(const OutputField& field) {
    return std::get<std::vector<std::string>>(field.value);
}

} // namespace

TEST_CASE("Schema shapes declared fields and keeps input order", "[schema]") {
    Schema schema;
    schema.scalar("Package", true).list("Depends");

    const auto record = schema.bind(record_from_string(kPackage));
    REQUIRE(record.size() == 3);

    REQUIRE(record[0].key == "Package");
    REQUIRE(scalar_of(record[0]) == "bitcoind");

    REQUIRE(record[1].key == "Depends");
    REQUIRE(list_of(record[1]) == std::vector<std::string>{"libc6 (>= 2.34)", "libevent-2.1-7"});

    REQUIRE(record[2].key == "Description");
    REQUIRE(scalar_of(record[2]) ==
            "peer-to-peer digital currency\n"
            "Bitcoin is a free open source peer-to-peer electronic cash system.\n"
            "\n"
            "This package provides the daemon.");
}

TEST_CASE("Bound records re-encode to the same text", "[schema][encode]") {
    Schema schema;
    schema.list("Depends");
    REQUIRE(to_string(schema.bind(record_from_string(kPackage))) == kPackage);
}

TEST_CASE("Schema unknown field policies", "[schema]") {
    const auto raw = record_from_string("Package: bitcoind\nVersion: 25.0\nArchitecture: amd64\n");

    SECTION("AsScalar keeps undeclared fields") {
        Schema schema;
        schema.scalar("Package");
        REQUIRE(schema.unknown_policy() == UnknownFields::AsScalar);
        REQUIRE(schema.bind(raw).size() == 3);
    }

    SECTION("Ignore drops undeclared fields") {
        Schema schema;
        schema.scalar("Package").unknown(UnknownFields::Ignore);
        const auto record = schema.bind(raw);
        REQUIRE(record.size() == 1);
        REQUIRE(record[0].key == "Package");
    }

    SECTION("Reject reports the first undeclared key") {
        Schema schema;
        schema.scalar("Package").unknown(UnknownFields::Reject);
        try {
            (void)schema.bind(raw);
            FAIL("expected DecodeError");
        } catch (const DecodeError& ex) {
            REQUIRE(ex.kind() == DecodeError::Kind::AmbiguousType);
            REQUIRE(ex.line() == 2);
            REQUIRE(std::string(ex.what()).find("Version") != std::string::npos);
        }
    }
}

TEST_CASE("Schema required fields", "[schema][errors]") {
    Schema schema;
    schema.scalar("Package", true).list("Depends", true);

    const auto raw = record_from_string("Package: bitcoind\n");
    try {
        (void)schema.bind(raw);
        FAIL("expected DecodeError");
    } catch (const DecodeError& ex) {
        REQUIRE(ex.kind() == DecodeError::Kind::Custom);
        REQUIRE(ex.line() == 1);
        REQUIRE(std::string(ex.what()) == "missing field `Depends` in record starting at line 1");
    }
}

TEST_CASE("Schema declarations are validated", "[schema][errors]") {
    Schema schema;
    schema.scalar("Package");

    REQUIRE_THROWS_AS(schema.scalar(""), std::invalid_argument);
    REQUIRE_THROWS_AS(schema.list("Package"), std::invalid_argument);
    REQUIRE(schema.fields().size() == 1);
    REQUIRE(schema.find("Package") != nullptr);
    REQUIRE(schema.find("Package")->shape == FieldShape::Scalar);
    REQUIRE(schema.find("Depends") == nullptr);
}
