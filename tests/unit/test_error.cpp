#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"

#include <string>

using namespace oscal;

TEST_CASE("Error: message names type, input and reason", "[error]") {
    const auto e = Error(ErrorKind::Uuid, "UUIDDatatype", "invalid hex digit 'g' at position 0")
                       .with_input("g0000000-0000-0000-0000-000000000000");

    REQUIRE(e.message() ==
            "invalid UUIDDatatype \"g0000000-0000-0000-0000-000000000000\": "
            "invalid hex digit 'g' at position 0");
}

TEST_CASE("Error: message falls back to the kind name", "[error]") {
    const Error e(ErrorKind::UriNotAbsolute, "", "missing required scheme");
    REQUIRE(e.message() == "invalid uri-not-absolute: missing required scheme");
}

TEST_CASE("Error: long inputs are truncated", "[error]") {
    const std::string input(200, 'a');
    const auto e = Error(ErrorKind::String, "StringDatatype", "too long").with_input(input);

    REQUIRE(e.input.size() == 64 + 3);
    REQUIRE(e.input.substr(64) == "...");
}

TEST_CASE("Error: at_field builds dotted and indexed paths", "[error]") {
    const Error leaf(ErrorKind::Uuid, "UUIDDatatype", "bad");

    SECTION("single field") {
        REQUIRE(leaf.at_field("uuid").path == "uuid");
    }

    SECTION("nested fields and indices") {
        const auto e = leaf.at_field("uuid").at_field("[1]").at_field("parties").at_field("metadata");
        REQUIRE(e.path == "metadata.parties[1].uuid");
        REQUIRE(e.message().rfind("metadata.parties[1].uuid: invalid UUIDDatatype", 0) == 0);
    }

    SECTION("empty segment is ignored") {
        REQUIRE(leaf.at_field("uuid").at_field("").path == "uuid");
    }
}

TEST_CASE("Error: kind names are stable", "[error]") {
    REQUIRE(kind_name(ErrorKind::Date) == "date");
    REQUIRE(kind_name(ErrorKind::Duration) == "duration");
    REQUIRE(kind_name(ErrorKind::Uri) == "uri");
    REQUIRE(kind_name(ErrorKind::UriNotAbsolute) == "uri-not-absolute");
    REQUIRE(kind_name(ErrorKind::Version) == "version");
    REQUIRE(kind_name(ErrorKind::Number) == "number");
    REQUIRE(kind_name(ErrorKind::UnrecognizedType) == "unrecognized-type");
    REQUIRE(kind_name(ErrorKind::Document) == "document");
}

TEST_CASE("Error: equality compares every field", "[error]") {
    const Error a(ErrorKind::Token, "TokenDatatype", "empty name");
    REQUIRE(a == Error(ErrorKind::Token, "TokenDatatype", "empty name"));
    REQUIRE_FALSE(a == a.with_input("x"));
    REQUIRE_FALSE(a == a.at_field("name"));
}
