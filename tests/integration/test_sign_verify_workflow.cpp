#include <catch2/catch_test_macros.hpp>
#include "bbs/provider/bbs_provider.hpp"
#include "helpers/fake_native_boundary.hpp"
#include <string>
#include <vector>

using namespace bbs::signatures;
using bbs::signatures::test_helpers::FakeNativeBoundary;

TEST_CASE("Sign and verify - Seeded key end to end", "[integration][sign]") {
    FakeNativeBoundary fake;
    const BbsProvider provider(fake);

    auto key_pair = provider.GenerateKey("test-seed").Unwrap();
    REQUIRE(key_pair.HasSecretKey());
    REQUIRE(key_pair.GetPublicKey().size() == FakeNativeBoundary::BLS_PUBLIC_KEY_SIZE);

    auto public_key = provider.DeriveBbsKey(key_pair, 2).Unwrap();
    REQUIRE(public_key.GetMessageCount() == 2);

    const std::vector<std::string> messages = {"message_1", "message_2"};
    auto signature = provider.Sign(key_pair, messages).Unwrap();
    REQUIRE(signature.size() == static_cast<size_t>(provider.SignatureSize()));

    SECTION("Same key and messages verify") {
        REQUIRE(provider.Verify(public_key, messages, signature).Unwrap());
    }

    SECTION("Key derived for another message count is a native failure, not false") {
        auto short_key = provider.DeriveBbsKey(key_pair, 1).Unwrap();
        auto result = provider.Verify(short_key, messages, signature);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == BbsFailureType::NativeProtocol);
        REQUIRE(result.UnwrapErr().code == FakeNativeBoundary::INPUT_ERROR_CODE);
        REQUIRE(result.UnwrapErr().message == "Public key to message mismatch. Expected 1, found 2");
    }

    SECTION("Reordered messages do not verify") {
        const std::vector<std::string> reordered = {"message_2", "message_1"};
        auto result = provider.Verify(public_key, reordered, signature);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.Unwrap());
    }

    SECTION("Tampered signature does not verify") {
        signature[0] ^= 0x01;
        REQUIRE_FALSE(provider.Verify(public_key, messages, signature).Unwrap());
    }

    SECTION("Empty signature is rejected by the native library") {
        auto result = provider.Verify(public_key, messages, std::vector<uint8_t>{});
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().code == FakeNativeBoundary::INPUT_ERROR_CODE);
        REQUIRE(result.UnwrapErr().message == "Invalid signature length: expected 112, found 0");
    }

    REQUIRE(fake.LiveBuffers() == 0);
    REQUIRE(fake.LiveStrings() == 0);
    REQUIRE(fake.InvalidFrees() == 0);
}

TEST_CASE("Sign and verify - Key generation", "[integration][keys]") {
    FakeNativeBoundary fake;
    const BbsProvider provider(fake);

    SECTION("Same seed gives the same key") {
        auto first = provider.GenerateKey("repeatable").Unwrap();
        auto second = provider.GenerateKey("repeatable").Unwrap();
        REQUIRE(first.GetPublicKey() == second.GetPublicKey());
    }

    SECTION("Different seeds give different keys") {
        auto first = provider.GenerateKey("seed-a").Unwrap();
        auto second = provider.GenerateKey("seed-b").Unwrap();
        REQUIRE(first.GetPublicKey() != second.GetPublicKey());
    }

    SECTION("No seed draws fresh randomness") {
        auto first = provider.GenerateKey().Unwrap();
        auto second = provider.GenerateKey().Unwrap();
        REQUIRE(first.HasSecretKey());
        REQUIRE(first.GetPublicKey() != second.GetPublicKey());
    }

    SECTION("Byte seeds match their text form") {
        const std::string text = "bytes-seed";
        const std::vector<uint8_t> bytes(text.begin(), text.end());
        auto from_text = provider.GenerateKey(text).Unwrap();
        auto from_bytes = provider.GenerateKey(std::span<const uint8_t>(bytes)).Unwrap();
        REQUIRE(from_text.GetPublicKey() == from_bytes.GetPublicKey());
    }

    SECTION("Secret key output is wiped before release") {
        REQUIRE(provider.GenerateKey("wiped").IsOk());
        REQUIRE(fake.ZeroedOnFree() == 1);
    }

    SECTION("Deriving for zero messages surfaces the native failure") {
        auto key_pair = provider.GenerateKey("zero").Unwrap();
        auto result = provider.DeriveBbsKey(key_pair, 0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().IsNative());
        REQUIRE(result.UnwrapErr().message == "Message count must be greater than zero");
    }

    SECTION("Sizes come from the native library") {
        REQUIRE(provider.SignatureSize() == FakeNativeBoundary::SIGNATURE_SIZE);
        REQUIRE(provider.BlindSignatureSize() == FakeNativeBoundary::BLIND_SIGNATURE_SIZE);
    }

    REQUIRE(fake.LiveBuffers() == 0);
    REQUIRE(fake.InvalidFrees() == 0);
}

TEST_CASE("Sign and verify - Message counts", "[integration][sign]") {
    FakeNativeBoundary fake;
    const BbsProvider provider(fake);
    auto key_pair = provider.GenerateKey("count-seed").Unwrap();

    SECTION("Single message") {
        const std::vector<std::string> messages = {"only"};
        auto public_key = provider.DeriveBbsKey(key_pair, 1).Unwrap();
        auto signature = provider.Sign(key_pair, messages).Unwrap();
        REQUIRE(provider.Verify(public_key, messages, signature).Unwrap());
    }

    SECTION("Empty and non-ASCII messages are signed as bytes") {
        const std::vector<std::string> messages = {"", "\xC3\xA9t\xC3\xA9", std::string("nul\0byte", 8)};
        auto public_key = provider.DeriveBbsKey(key_pair, 3).Unwrap();
        auto signature = provider.Sign(key_pair, messages).Unwrap();
        REQUIRE(provider.Verify(public_key, messages, signature).Unwrap());

        const std::vector<std::string> truncated = {"", "\xC3\xA9t\xC3\xA9", "nul"};
        REQUIRE_FALSE(provider.Verify(public_key, truncated, signature).Unwrap());
    }

    SECTION("Signature from another key does not verify") {
        const std::vector<std::string> messages = {"a", "b"};
        auto other = provider.GenerateKey("other-seed").Unwrap();
        auto other_public = provider.DeriveBbsKey(other, 2).Unwrap();
        auto signature = provider.Sign(key_pair, messages).Unwrap();
        REQUIRE_FALSE(provider.Verify(other_public, messages, signature).Unwrap());
    }
}
