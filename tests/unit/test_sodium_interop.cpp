#include <catch2/catch_test_macros.hpp>
#include "bbs/crypto/sodium_interop.hpp"
#include "bbs/core/constants.hpp"
#include <algorithm>
#include <cstring>
#include <vector>
using namespace bbs::signatures;
using namespace bbs::signatures::crypto;

TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SodiumInterop::IsInitialized());
}

TEST_CASE("SodiumInterop - SecureWipe", "[sodium][crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("A secret key copy is zeroed") {
        std::vector<uint8_t> secret(32, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(secret).IsOk());
        REQUIRE(std::all_of(secret.begin(), secret.end(), [](uint8_t b) { return b == 0; }));
    }

    SECTION("Only the given range is touched") {
        std::vector<uint8_t> buffer(8, 0xAA);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer).subspan(2, 4)).IsOk());
        REQUIRE(buffer == std::vector<uint8_t>{0xAA, 0xAA, 0, 0, 0, 0, 0xAA, 0xAA});
    }

    SECTION("Empty buffer is a no-op") {
        std::vector<uint8_t> buffer;
        REQUIRE(SodiumInterop::SecureWipe(buffer).IsOk());
    }
}

TEST_CASE("SodiumInterop - Guarded copies", "[sodium][crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Contents match the source") {
        const std::vector<uint8_t> secret = {9, 8, 7, 6, 5, 4, 3, 2};
        auto copy = SodiumInterop::GuardedCopy(secret);
        REQUIRE(copy.IsOk());
        void* block = copy.Unwrap();
        REQUIRE(block != static_cast<const void*>(secret.data()));
        REQUIRE(std::memcmp(block, secret.data(), secret.size()) == 0);
        SodiumInterop::ReleaseGuarded(block);
    }

    SECTION("Empty input is rejected") {
        auto copy = SodiumInterop::GuardedCopy(std::span<const uint8_t>{});
        REQUIRE(copy.IsErr());
        REQUIRE(copy.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
}

TEST_CASE("SodiumInterop - Guarded allocation", "[sodium][crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Writable until released") {
        void* block = SodiumInterop::AllocateGuarded(48);
        REQUIRE(block != nullptr);
        std::memset(block, 0x11, 48);
        SodiumInterop::ReleaseGuarded(block);
    }

    SECTION("Zero-sized allocation yields null") {
        REQUIRE(SodiumInterop::AllocateGuarded(0) == nullptr);
    }

    SECTION("Releasing null is harmless") {
        SodiumInterop::ReleaseGuarded(nullptr);
    }
}
