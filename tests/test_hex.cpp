#include <catch2/catch.hpp>
#include <guid/hex.hpp>
#include <array>

using namespace guid;

TEST_CASE("hex encode is lowercase, two chars per byte", "[hex]") {
    std::array<uint8_t, 8> bytes = {0x00, 0x01, 0x0a, 0x0f, 0x10, 0x7f, 0x80, 0xff};
    REQUIRE(hex::encode(bytes.data(), bytes.size()) == "00010a0f107f80ff");
    REQUIRE(hex::encode(bytes.data(), 0).empty());
}

TEST_CASE("hex decode accepts either case", "[hex]") {
    auto r = hex::decode("ABcd09");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<uint8_t>{0xab, 0xcd, 0x09});
}

TEST_CASE("hex decode of empty string is empty", "[hex]") {
    auto r = hex::decode("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().empty());
}

TEST_CASE("hex decode rejects odd length", "[hex]") {
    auto r = hex::decode("abc");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GuidError::Parse);
}

TEST_CASE("hex decode rejects non-hex characters", "[hex]") {
    auto r = hex::decode("0g");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GuidError::Parse);
    REQUIRE(r.error().cause.find("position 1") != std::string::npos);
}
