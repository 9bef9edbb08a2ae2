#include <catch2/catch_test_macros.hpp>

#include "base64.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return {s.begin(), s.end()};
}

} // namespace

TEST_CASE("base64", "[base64]") {

    SECTION("Rfc4648Vectors") {
        REQUIRE(base64::encode(bytes("")) == "");
        REQUIRE(base64::encode(bytes("f")) == "Zg==");
        REQUIRE(base64::encode(bytes("fo")) == "Zm8=");
        REQUIRE(base64::encode(bytes("foo")) == "Zm9v");
        REQUIRE(base64::encode(bytes("foob")) == "Zm9vYg==");
        REQUIRE(base64::encode(bytes("fooba")) == "Zm9vYmE=");
        REQUIRE(base64::encode(bytes("foobar")) == "Zm9vYmFy");
    }

    SECTION("DecodeVectors") {
        REQUIRE(base64::decode("Zg==").value() == bytes("f"));
        REQUIRE(base64::decode("Zm8=").value() == bytes("fo"));
        REQUIRE(base64::decode("Zm9vYmFy").value() == bytes("foobar"));
        REQUIRE(base64::decode("").value().empty());
    }

    SECTION("BinaryBytes") {
        std::vector<uint8_t> data = {0x00, 0xff, 0x10, 0x80, 0x7f};
        REQUIRE(base64::encode(data) == "AP8QgH8=");
        REQUIRE(base64::decode("AP8QgH8=").value() == data);
    }

    SECTION("WhitespaceSkipped") {
        REQUIRE(base64::decode("Zm9v\nYmFy\r\n").value() == bytes("foobar"));
    }

    SECTION("InvalidCharacter") {
        auto r = base64::decode("Zm9v*mFy");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error() == "invalid base64 character '*'");
    }

    SECTION("DataAfterPadding") {
        REQUIRE_FALSE(base64::decode("Zg==Zg==").has_value());
    }

    SECTION("TooMuchPadding") {
        REQUIRE_FALSE(base64::decode("Zg===").has_value());
    }
}
