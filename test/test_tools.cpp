#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include "nostrfs/utils/tools.hpp"

using namespace nostrfs::utils;

namespace {
std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}
}

TEST_CASE("Tools - Base64", "[tools]") {
    SECTION("Standard encoding") {
        REQUIRE(Base64Encode(bytes("hello")) == "aGVsbG8=");
        REQUIRE(Base64Decode("aGVsbG8=") == bytes("hello"));
    }

    SECTION("Missing padding") {
        REQUIRE(Base64Decode("aGVsbG8") == bytes("hello"));
        REQUIRE(Base64Decode("aGk") == bytes("hi"));
    }

    SECTION("URL-safe alphabet") {
        std::vector<uint8_t> data = {0xfb, 0xff, 0xbf};
        REQUIRE(Base64Encode(data) == "+/+/");
        REQUIRE(Base64Decode("-_-_") == data);
    }

    SECTION("Invalid input") {
        REQUIRE_THROWS_AS(Base64Decode(""), std::runtime_error);
        REQUIRE_THROWS_AS(Base64Decode("a"), std::runtime_error);
        REQUIRE_THROWS_AS(Base64Decode("ab!d"), std::runtime_error);
        REQUIRE_THROWS_AS(Base64Decode("ab==="), std::runtime_error);
    }
}

TEST_CASE("Tools - Hex", "[tools]") {
    REQUIRE(HexEncode({0x00, 0xab, 0xff}) == "00abff");
    REQUIRE(HexDecode("00abff") == std::vector<uint8_t>{0x00, 0xab, 0xff});
    REQUIRE_THROWS_AS(HexDecode("abc"), std::invalid_argument);
    REQUIRE_THROWS_AS(HexDecode("zz"), std::invalid_argument);

    REQUIRE(IsLowerHex("00abff", 6));
    REQUIRE_FALSE(IsLowerHex("00ABFF", 6));
    REQUIRE_FALSE(IsLowerHex("00ab", 6));
}

TEST_CASE("Tools - SHA-256", "[tools]") {
    auto hash = CalculateSHA256Hash(bytes("abc"));
    REQUIRE(hash.ok());
    REQUIRE(HexEncode(hash.value()) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Tools - Path splitting", "[tools]") {
    REQUIRE(SplitPath("").empty());
    REQUIRE(SplitPath("///").empty());
    REQUIRE(SplitPath("/a//b/") == std::vector<std::string>{"a", "b"});
    REQUIRE(TrimSlashes("//abc/") == "abc");
    REQUIRE(TrimSlashes("a/b") == "a/b");
    REQUIRE(TrimSlashes("/") == "");
}
