#include <catch2/catch.hpp>
#include <guid/base36.hpp>
#include <limits>

using namespace guid;

TEST_CASE("base36 format uses lowercase digits", "[base36]") {
    REQUIRE(base36::format(0) == "0");
    REQUIRE(base36::format(35) == "z");
    REQUIRE(base36::format(36) == "10");
    REQUIRE(base36::format(1622222222222) == "kp8l85n2");
}

TEST_CASE("base36 format keeps the sign", "[base36]") {
    REQUIRE(base36::format(-36) == "-10");
    REQUIRE(base36::format(std::numeric_limits<int64_t>::max()) == "1y2p0ij32e8e7");
    REQUIRE(base36::format(std::numeric_limits<int64_t>::min()) == "-1y2p0ij32e8e8");
}

TEST_CASE("base36 format_padded pads after the sign", "[base36]") {
    REQUIRE(base36::format_padded(2222, 4) == "01pq");
    REQUIRE(base36::format_padded(0, 8) == "00000000");
    REQUIRE(base36::format_padded(-1, 4) == "-001");
    REQUIRE(base36::format_padded(1679615, 4) == "zzzz");
    REQUIRE(base36::format_padded(1679616, 4) == "10000");
}

TEST_CASE("base36 parse is case-insensitive", "[base36]") {
    REQUIRE(base36::parse("zzzz").value() == 1679615);
    REQUIRE(base36::parse("ZZZZ").value() == 1679615);
    REQUIRE(base36::parse("Kp8L85n2").value() == 1622222222222);
}

TEST_CASE("base36 parse accepts a leading sign", "[base36]") {
    REQUIRE(base36::parse("-10").value() == -36);
    REQUIRE(base36::parse("+z").value() == 35);
    REQUIRE(base36::parse("-001").value() == -1);
}

TEST_CASE("base36 parse range limits", "[base36]") {
    REQUIRE(base36::parse("1y2p0ij32e8e7").value() == std::numeric_limits<int64_t>::max());
    REQUIRE(base36::parse("-1y2p0ij32e8e8").value() == std::numeric_limits<int64_t>::min());

    auto r = base36::parse("1y2p0ij32e8e8");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("value out of range") != std::string::npos);
}

TEST_CASE("base36 parse rejects malformed input", "[base36]") {
    for (const char* bad : {"", "-", "+", "ab c", "00-1", "12_3", "\xf0\x9f\x90\xb5"}) {
        auto r = base36::parse(bad);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == GuidError::Parse);
        REQUIRE(r.error().message.find("invalid syntax") != std::string::npos);
    }
}
