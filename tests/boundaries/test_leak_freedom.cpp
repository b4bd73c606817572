#include <catch2/catch_test_macros.hpp>
#include "bbs/provider/bbs_provider.hpp"
#include "helpers/fake_native_boundary.hpp"
#include <functional>
#include <string>
#include <utility>
#include <vector>

using namespace bbs::signatures;
using bbs::signatures::enums::ProofMessageType;
using bbs::signatures::test_helpers::FakeNativeBoundary;

namespace {

struct Outcome {
    bool failed = false;
    int32_t code = 0;
    std::string message;
};

template<typename T>
Outcome ToOutcome(Result<T, BbsFailure>&& result) {
    if (result.IsOk()) {
        return Outcome{};
    }
    auto failure = std::move(result).UnwrapErr();
    return Outcome{true, failure.code, std::move(failure.message)};
}

/// Artifacts produced by a clean run, replayed against a failing library
struct Fixture {
    std::vector<std::string> messages{"message_1", "message_2", "message_3"};
    std::vector<IndexedMessage> hidden{{"message_1", 0}};
    std::vector<uint32_t> hidden_indices{0};
    std::vector<IndexedMessage> known{{"message_2", 1}, {"message_3", 2}};
    std::vector<ProofMessage> proof_messages{
        {"message_1", ProofMessageType::HiddenProofSpecificBlinding},
        {"message_2", ProofMessageType::Revealed},
        {"message_3", ProofMessageType::Revealed}};
    std::vector<IndexedMessage> revealed{{"message_2", 1}, {"message_3", 2}};
    std::string nonce = "leak-nonce";

    BlsKeyPair key_pair = BlsKeyPair::PublicOnly({});
    BbsPublicKey public_key{{}, 0};
    std::vector<uint8_t> signature;
    std::vector<uint8_t> commitment_context;
    std::vector<uint8_t> commitment;
    std::vector<uint8_t> blinding_factor;
    std::vector<uint8_t> blinded_signature;
    std::vector<uint8_t> proof;

    Fixture() {
        FakeNativeBoundary clean;
        const BbsProvider provider(clean);
        key_pair = provider.GenerateKey("leak-seed").Unwrap();
        public_key = provider.DeriveBbsKey(key_pair, 3).Unwrap();
        signature = provider.Sign(key_pair, messages).Unwrap();
        auto blinded = provider.CreateBlindedCommitment(public_key, nonce, hidden).Unwrap();
        commitment_context = blinded.GetContext();
        commitment = blinded.GetCommitment();
        blinding_factor = blinded.GetBlindingFactor();
        blinded_signature = provider.BlindSign(key_pair, public_key, commitment, known).Unwrap();
        proof = provider.CreateProof(public_key, proof_messages, {}, signature, nonce).Unwrap();
    }
};

using Operation = std::function<Outcome(const BbsProvider&, const Fixture&)>;

std::vector<std::pair<std::string, Operation>> Operations() {
    return {
        {"GenerateKey", [](const BbsProvider& p, const Fixture&) {
            return ToOutcome(p.GenerateKey("seed"));
        }},
        {"DeriveBbsKey", [](const BbsProvider& p, const Fixture& f) {
            return ToOutcome(p.DeriveBbsKey(f.key_pair, 3));
        }},
        {"Sign", [](const BbsProvider& p, const Fixture& f) {
            return ToOutcome(p.Sign(f.key_pair, f.messages));
        }},
        {"Verify", [](const BbsProvider& p, const Fixture& f) {
            return ToOutcome(p.Verify(f.public_key, f.messages, f.signature));
        }},
        {"CreateBlindedCommitment", [](const BbsProvider& p, const Fixture& f) {
            return ToOutcome(p.CreateBlindedCommitment(f.public_key, f.nonce, f.hidden));
        }},
        {"VerifyBlindedCommitment", [](const BbsProvider& p, const Fixture& f) {
            return ToOutcome(p.VerifyBlindedCommitment(f.commitment_context, f.hidden_indices, f.public_key, f.nonce));
        }},
        {"BlindSign", [](const BbsProvider& p, const Fixture& f) {
            return ToOutcome(p.BlindSign(f.key_pair, f.public_key, f.commitment, f.known));
        }},
        {"UnblindSignature", [](const BbsProvider& p, const Fixture& f) {
            return ToOutcome(p.UnblindSignature(f.blinded_signature, f.blinding_factor));
        }},
        {"CreateProof", [](const BbsProvider& p, const Fixture& f) {
            return ToOutcome(p.CreateProof(f.public_key, f.proof_messages, {}, f.signature, f.nonce));
        }},
        {"VerifyProof", [](const BbsProvider& p, const Fixture& f) {
            return ToOutcome(p.VerifyProof(f.public_key, f.proof, f.revealed, f.nonce));
        }},
    };
}

void RequireNothingOutstanding(const FakeNativeBoundary& fake) {
    REQUIRE(fake.LiveBuffers() == 0);
    REQUIRE(fake.LiveStrings() == 0);
    REQUIRE(fake.InvalidFrees() == 0);
}

}

TEST_CASE("Leak freedom - Clean runs release every buffer", "[boundaries][leaks]") {
    const Fixture fixture;
    for (const auto& [name, operation] : Operations()) {
        CAPTURE(name);
        FakeNativeBoundary fake;
        const BbsProvider provider(fake);
        const Outcome outcome = operation(provider, fixture);
        REQUIRE_FALSE(outcome.failed);
        RequireNothingOutstanding(fake);
    }
}

TEST_CASE("Leak freedom - Failure at any native entry releases everything", "[boundaries][leaks]") {
    const Fixture fixture;
    for (const auto& entry : FakeNativeBoundary::FallibleEntries()) {
        for (const auto& [name, operation] : Operations()) {
            CAPTURE(entry, name);
            FakeNativeBoundary fake;
            fake.FailOn(entry);
            const BbsProvider provider(fake);
            const Outcome outcome = operation(provider, fixture);

            if (fake.CallCount(entry) > 0) {
                REQUIRE(outcome.failed);
                REQUIRE(outcome.code == FakeNativeBoundary::INJECTED_ERROR_CODE);
                REQUIRE(outcome.message == "injected failure at " + entry);
                REQUIRE(fake.CallCount(entry) == 1);
            } else {
                REQUIRE_FALSE(outcome.failed);
            }
            RequireNothingOutstanding(fake);
        }
    }
}

TEST_CASE("Leak freedom - Failure without a native message", "[boundaries][leaks]") {
    const Fixture fixture;
    for (const auto& entry : FakeNativeBoundary::FallibleEntries()) {
        for (const auto& [name, operation] : Operations()) {
            CAPTURE(entry, name);
            FakeNativeBoundary fake;
            fake.FailSilentlyOn(entry);
            const BbsProvider provider(fake);
            const Outcome outcome = operation(provider, fixture);

            if (fake.CallCount(entry) > 0) {
                REQUIRE(outcome.failed);
                REQUIRE(outcome.code == FakeNativeBoundary::INJECTED_ERROR_CODE);
            }
            REQUIRE(fake.StringsAllocated() == 0);
            RequireNothingOutstanding(fake);
        }
    }
}

TEST_CASE("Leak freedom - Native rejections release everything", "[boundaries][leaks]") {
    const Fixture fixture;
    FakeNativeBoundary fake;
    const BbsProvider provider(fake);

    SECTION("Count mismatch on verify") {
        const std::vector<std::string> fewer = {"message_1"};
        auto result = provider.Verify(fixture.public_key, fewer, fixture.signature);
        REQUIRE(result.IsErr());
        REQUIRE(fake.StringsAllocated() == 1);
    }

    SECTION("Garbage public key on sign") {
        auto bogus = BlsKeyPair::FromBytes(std::vector<uint8_t>(32, 1), std::vector<uint8_t>(10, 2)).Unwrap();
        auto result = provider.Sign(bogus, fixture.messages);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().IsNative());
    }

    RequireNothingOutstanding(fake);
}
