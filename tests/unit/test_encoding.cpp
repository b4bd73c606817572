#include <catch2/catch_test_macros.hpp>
#include "bbs/utilities/encoding.hpp"
#include "bbs/crypto/sodium_interop.hpp"
#include <string>
#include <vector>
using namespace bbs::signatures;
using namespace bbs::signatures::utilities;
TEST_CASE("Encoding - AsBytes", "[encoding][utilities]") {
    SECTION("Views UTF-8 bytes without a terminator") {
        const std::string text = "caf\xC3\xA9";
        const auto bytes = Encoding::AsBytes(text);
        REQUIRE(bytes.size() == 5);
        REQUIRE(bytes[3] == 0xC3);
        REQUIRE(bytes[4] == 0xA9);
    }
    SECTION("Empty text is an empty view") {
        REQUIRE(Encoding::AsBytes("").empty());
    }
}
TEST_CASE("Encoding - Base64", "[encoding][utilities]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SECTION("Known vector") {
        const std::string text = "message_1";
        const auto encoded = Encoding::EncodeBase64(Encoding::AsBytes(text));
        REQUIRE(encoded == "bWVzc2FnZV8x");
    }
    SECTION("Padding is kept") {
        const std::vector<uint8_t> data = {0xFF, 0x00};
        REQUIRE(Encoding::EncodeBase64(data) == "/wA=");
        REQUIRE(Encoding::DecodeBase64("/wA=").Unwrap() == data);
    }
    SECTION("Empty input stays empty") {
        REQUIRE(Encoding::EncodeBase64(std::vector<uint8_t>{}).empty());
        REQUIRE(Encoding::DecodeBase64("").Unwrap().empty());
    }
    SECTION("Invalid characters are rejected") {
        auto result = Encoding::DecodeBase64("not*base64");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == BbsFailureType::InvalidInput);
    }
    SECTION("URL-safe alphabet is rejected") {
        REQUIRE(Encoding::DecodeBase64("_wA=").IsErr());
    }
}
