#pragma once
#include "bbs/native/native_boundary.hpp"
namespace bbs::signatures::native {
/// Forwards every call to the linked native BBS+ library.
class FfiNativeBoundary final : public INativeBoundary {
public:
    static FfiNativeBoundary& Instance();

    void ByteBufferFree(BbsByteBuffer buffer) override;
    void StringFree(char* message) override;

    int32_t SignatureSize() override;
    int32_t BlindSignatureSize() override;

    int32_t GenerateBlsKey(BbsByteArray seed, BbsByteBuffer* public_key,
                           BbsByteBuffer* secret_key, BbsExternError* err) override;
    int32_t PublicKeyToBbsKey(BbsByteArray bls_public_key, uint32_t message_count,
                              BbsByteBuffer* bbs_public_key, BbsExternError* err) override;
    int32_t UnblindSignature(BbsByteArray blind_signature, BbsByteArray blinding_factor,
                             BbsByteBuffer* unblind_signature, BbsExternError* err) override;

    uint64_t SignContextInit(BbsExternError* err) override;
    int32_t SignContextAddMessageBytes(uint64_t handle, BbsByteArray message, BbsExternError* err) override;
    int32_t SignContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t SignContextSetSecretKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t SignContextFinish(uint64_t handle, BbsByteBuffer* signature, BbsExternError* err) override;

    uint64_t VerifyContextInit(BbsExternError* err) override;
    int32_t VerifyContextAddMessageBytes(uint64_t handle, BbsByteArray message, BbsExternError* err) override;
    int32_t VerifyContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyContextSetSignature(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyContextFinish(uint64_t handle, BbsExternError* err) override;

    uint64_t VerifyProofContextInit(BbsExternError* err) override;
    int32_t VerifyProofContextAddMessageBytes(uint64_t handle, BbsByteArray message, BbsExternError* err) override;
    int32_t VerifyProofContextAddRevealedIndex(uint64_t handle, uint32_t index, BbsExternError* err) override;
    int32_t VerifyProofContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyProofContextSetNonceBytes(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyProofContextSetProof(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyProofContextFinish(uint64_t handle, BbsExternError* err) override;

    uint64_t VerifyBlindCommitmentContextInit(BbsExternError* err) override;
    int32_t VerifyBlindCommitmentContextAddBlinded(uint64_t handle, uint32_t index, BbsExternError* err) override;
    int32_t VerifyBlindCommitmentContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyBlindCommitmentContextSetNonceBytes(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyBlindCommitmentContextSetProof(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyBlindCommitmentContextFinish(uint64_t handle, BbsExternError* err) override;

    uint64_t BlindCommitmentContextInit(BbsExternError* err) override;
    int32_t BlindCommitmentContextAddMessageBytes(uint64_t handle, uint32_t index, BbsByteArray message,
                                                  BbsExternError* err) override;
    int32_t BlindCommitmentContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t BlindCommitmentContextSetNonceBytes(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t BlindCommitmentContextFinish(uint64_t handle, BbsByteBuffer* commitment, BbsByteBuffer* out_context,
                                         BbsByteBuffer* blinding_factor, BbsExternError* err) override;

    uint64_t BlindSignContextInit(BbsExternError* err) override;
    int32_t BlindSignContextAddMessageBytes(uint64_t handle, uint32_t index, BbsByteArray message,
                                            BbsExternError* err) override;
    int32_t BlindSignContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t BlindSignContextSetSecretKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t BlindSignContextSetCommitment(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t BlindSignContextFinish(uint64_t handle, BbsByteBuffer* blinded_signature, BbsExternError* err) override;

    uint64_t CreateProofContextInit(BbsExternError* err) override;
    int32_t CreateProofContextAddProofMessageBytes(uint64_t handle, BbsByteArray message,
                                                   BbsProofMessageType proof_type, BbsByteArray blinding_factor,
                                                   BbsExternError* err) override;
    int32_t CreateProofContextSetSignature(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t CreateProofContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t CreateProofContextSetNonceBytes(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t CreateProofContextFinish(uint64_t handle, BbsByteBuffer* proof, BbsExternError* err) override;

private:
    FfiNativeBoundary() = default;
};
}
