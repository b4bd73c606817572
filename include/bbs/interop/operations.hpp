#pragma once
#include "bbs/native/native_boundary.hpp"
#include <string_view>
namespace bbs::signatures::interop {
using native::INativeBoundary;
// ============================================================================
// Operation descriptors for ContextProtocol<Op>
// ============================================================================
struct SignOperation {
    static constexpr std::string_view NAME = "sign";
    static constexpr auto INIT = &INativeBoundary::SignContextInit;
    static constexpr auto ADD_MESSAGE = &INativeBoundary::SignContextAddMessageBytes;
    static constexpr auto SET_PUBLIC_KEY = &INativeBoundary::SignContextSetPublicKey;
    static constexpr auto SET_SECRET_KEY = &INativeBoundary::SignContextSetSecretKey;
    static constexpr auto FINISH = &INativeBoundary::SignContextFinish;
};
struct VerifyOperation {
    static constexpr std::string_view NAME = "verify";
    static constexpr auto INIT = &INativeBoundary::VerifyContextInit;
    static constexpr auto ADD_MESSAGE = &INativeBoundary::VerifyContextAddMessageBytes;
    static constexpr auto SET_PUBLIC_KEY = &INativeBoundary::VerifyContextSetPublicKey;
    static constexpr auto SET_SIGNATURE = &INativeBoundary::VerifyContextSetSignature;
    static constexpr auto FINISH = &INativeBoundary::VerifyContextFinish;
};
struct VerifyProofOperation {
    static constexpr std::string_view NAME = "verify_proof";
    static constexpr auto INIT = &INativeBoundary::VerifyProofContextInit;
    static constexpr auto ADD_MESSAGE = &INativeBoundary::VerifyProofContextAddMessageBytes;
    static constexpr auto ADD_REVEALED_INDEX = &INativeBoundary::VerifyProofContextAddRevealedIndex;
    static constexpr auto SET_PUBLIC_KEY = &INativeBoundary::VerifyProofContextSetPublicKey;
    static constexpr auto SET_NONCE = &INativeBoundary::VerifyProofContextSetNonceBytes;
    static constexpr auto SET_PROOF = &INativeBoundary::VerifyProofContextSetProof;
    static constexpr auto FINISH = &INativeBoundary::VerifyProofContextFinish;
};
struct VerifyBlindCommitmentOperation {
    static constexpr std::string_view NAME = "verify_blind_commitment";
    static constexpr auto INIT = &INativeBoundary::VerifyBlindCommitmentContextInit;
    static constexpr auto ADD_BLINDED = &INativeBoundary::VerifyBlindCommitmentContextAddBlinded;
    static constexpr auto SET_PUBLIC_KEY = &INativeBoundary::VerifyBlindCommitmentContextSetPublicKey;
    static constexpr auto SET_NONCE = &INativeBoundary::VerifyBlindCommitmentContextSetNonceBytes;
    static constexpr auto SET_PROOF = &INativeBoundary::VerifyBlindCommitmentContextSetProof;
    static constexpr auto FINISH = &INativeBoundary::VerifyBlindCommitmentContextFinish;
};
struct BlindCommitmentOperation {
    static constexpr std::string_view NAME = "blind_commitment";
    static constexpr auto INIT = &INativeBoundary::BlindCommitmentContextInit;
    static constexpr auto ADD_MESSAGE = &INativeBoundary::BlindCommitmentContextAddMessageBytes;
    static constexpr auto SET_PUBLIC_KEY = &INativeBoundary::BlindCommitmentContextSetPublicKey;
    static constexpr auto SET_NONCE = &INativeBoundary::BlindCommitmentContextSetNonceBytes;
    static constexpr auto FINISH = &INativeBoundary::BlindCommitmentContextFinish;
};
struct BlindSignOperation {
    static constexpr std::string_view NAME = "blind_sign";
    static constexpr auto INIT = &INativeBoundary::BlindSignContextInit;
    static constexpr auto ADD_MESSAGE = &INativeBoundary::BlindSignContextAddMessageBytes;
    static constexpr auto SET_PUBLIC_KEY = &INativeBoundary::BlindSignContextSetPublicKey;
    static constexpr auto SET_SECRET_KEY = &INativeBoundary::BlindSignContextSetSecretKey;
    static constexpr auto SET_COMMITMENT = &INativeBoundary::BlindSignContextSetCommitment;
    static constexpr auto FINISH = &INativeBoundary::BlindSignContextFinish;
};
struct CreateProofOperation {
    static constexpr std::string_view NAME = "create_proof";
    static constexpr auto INIT = &INativeBoundary::CreateProofContextInit;
    static constexpr auto ADD_PROOF_MESSAGE = &INativeBoundary::CreateProofContextAddProofMessageBytes;
    static constexpr auto SET_SIGNATURE = &INativeBoundary::CreateProofContextSetSignature;
    static constexpr auto SET_PUBLIC_KEY = &INativeBoundary::CreateProofContextSetPublicKey;
    static constexpr auto SET_NONCE = &INativeBoundary::CreateProofContextSetNonceBytes;
    static constexpr auto FINISH = &INativeBoundary::CreateProofContextFinish;
};
}
