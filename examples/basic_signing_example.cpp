/**
 * @file basic_signing_example.cpp
 * @brief Sign two messages, verify them, and disclose one through a proof
 */

#include "bbs/provider/bbs_provider.hpp"
#include "bbs/native/ffi_native_boundary.hpp"
#include "bbs/utilities/encoding.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace bbs::signatures;
using bbs::signatures::enums::ProofMessageType;
using bbs::signatures::enums::SignatureProofStatusMapping;
using bbs::signatures::utilities::Encoding;

namespace {
    int Fail(const std::string& step, const BbsFailure& failure) {
        std::cerr << step << " failed (code " << failure.code << "): " << failure.message << std::endl;
        return 1;
    }
}

int main() {
    std::cout << "=== BBS+ Signatures - Basic Signing Example ===" << std::endl;
    std::cout << std::endl;

    const BbsProvider provider(native::FfiNativeBoundary::Instance());
    const std::vector<std::string> messages = {"message_1", "message_2"};

    std::cout << "1. Generating a key pair from seed \"test-seed\"..." << std::endl;
    auto key_result = provider.GenerateKey("test-seed");
    if (key_result.IsErr()) {
        return Fail("GenerateKey", key_result.UnwrapErr());
    }
    auto key_pair = std::move(key_result).Unwrap();
    std::cout << "   BLS public key: " << Encoding::EncodeBase64(key_pair.GetPublicKey()) << std::endl;
    std::cout << std::endl;

    std::cout << "2. Deriving a BBS+ public key for " << messages.size() << " messages..." << std::endl;
    auto public_key_result = provider.DeriveBbsKey(key_pair, static_cast<uint32_t>(messages.size()));
    if (public_key_result.IsErr()) {
        return Fail("DeriveBbsKey", public_key_result.UnwrapErr());
    }
    auto public_key = std::move(public_key_result).Unwrap();
    std::cout << "   Key size: " << public_key.GetKey().size() << " bytes" << std::endl;
    std::cout << std::endl;

    std::cout << "3. Signing..." << std::endl;
    auto signature_result = provider.Sign(key_pair, messages);
    if (signature_result.IsErr()) {
        return Fail("Sign", signature_result.UnwrapErr());
    }
    auto signature = std::move(signature_result).Unwrap();
    std::cout << "   Signature: " << Encoding::EncodeBase64(signature) << std::endl;
    std::cout << std::endl;

    std::cout << "4. Verifying..." << std::endl;
    auto verify_result = provider.Verify(public_key, messages, signature);
    if (verify_result.IsErr()) {
        return Fail("Verify", verify_result.UnwrapErr());
    }
    std::cout << "   Verified: " << (verify_result.Unwrap() ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    std::cout << "5. Proving knowledge of the signature, revealing message_2 only..." << std::endl;
    const std::string nonce = "example-nonce";
    const std::vector<ProofMessage> proof_messages = {
        {"message_1", ProofMessageType::HiddenProofSpecificBlinding},
        {"message_2", ProofMessageType::Revealed}};
    auto proof_result = provider.CreateProof(public_key, proof_messages, {}, signature, nonce);
    if (proof_result.IsErr()) {
        return Fail("CreateProof", proof_result.UnwrapErr());
    }
    const auto proof = std::move(proof_result).Unwrap();

    const std::vector<IndexedMessage> revealed = {{"message_2", 1}};
    auto status_result = provider.VerifyProof(public_key, proof, revealed, nonce);
    if (status_result.IsErr()) {
        return Fail("VerifyProof", status_result.UnwrapErr());
    }
    std::cout << "   Proof status: " << SignatureProofStatusMapping::ToString(status_result.Unwrap()) << std::endl;

    return 0;
}
