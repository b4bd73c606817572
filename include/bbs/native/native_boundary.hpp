#pragma once
#include "bbs/native/bbs_abi.h"
#include <cstdint>
namespace bbs::signatures::native {
/// The native library call contract as an injectable seam.
///
/// Every method mirrors one C entry point one-to-one: same arguments, same
/// out-parameters, same ownership. Buffers written to `BbsByteBuffer*` and
/// messages written to `BbsExternError::message` are native-allocated and
/// must go back through ByteBufferFree / StringFree. The int32_t returned by
/// fallible calls mirrors `err->code`; the error record is authoritative.
class INativeBoundary {
public:
    virtual ~INativeBoundary() = default;

    virtual void ByteBufferFree(BbsByteBuffer buffer) = 0;
    virtual void StringFree(char* message) = 0;

    [[nodiscard]] virtual int32_t SignatureSize() = 0;
    [[nodiscard]] virtual int32_t BlindSignatureSize() = 0;

    virtual int32_t GenerateBlsKey(BbsByteArray seed, BbsByteBuffer* public_key,
                                   BbsByteBuffer* secret_key, BbsExternError* err) = 0;
    virtual int32_t PublicKeyToBbsKey(BbsByteArray bls_public_key, uint32_t message_count,
                                      BbsByteBuffer* bbs_public_key, BbsExternError* err) = 0;
    virtual int32_t UnblindSignature(BbsByteArray blind_signature, BbsByteArray blinding_factor,
                                     BbsByteBuffer* unblind_signature, BbsExternError* err) = 0;

    virtual uint64_t SignContextInit(BbsExternError* err) = 0;
    virtual int32_t SignContextAddMessageBytes(uint64_t handle, BbsByteArray message, BbsExternError* err) = 0;
    virtual int32_t SignContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t SignContextSetSecretKey(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t SignContextFinish(uint64_t handle, BbsByteBuffer* signature, BbsExternError* err) = 0;

    virtual uint64_t VerifyContextInit(BbsExternError* err) = 0;
    virtual int32_t VerifyContextAddMessageBytes(uint64_t handle, BbsByteArray message, BbsExternError* err) = 0;
    virtual int32_t VerifyContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t VerifyContextSetSignature(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t VerifyContextFinish(uint64_t handle, BbsExternError* err) = 0;

    virtual uint64_t VerifyProofContextInit(BbsExternError* err) = 0;
    virtual int32_t VerifyProofContextAddMessageBytes(uint64_t handle, BbsByteArray message, BbsExternError* err) = 0;
    virtual int32_t VerifyProofContextAddRevealedIndex(uint64_t handle, uint32_t index, BbsExternError* err) = 0;
    virtual int32_t VerifyProofContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t VerifyProofContextSetNonceBytes(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t VerifyProofContextSetProof(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t VerifyProofContextFinish(uint64_t handle, BbsExternError* err) = 0;

    virtual uint64_t VerifyBlindCommitmentContextInit(BbsExternError* err) = 0;
    virtual int32_t VerifyBlindCommitmentContextAddBlinded(uint64_t handle, uint32_t index, BbsExternError* err) = 0;
    virtual int32_t VerifyBlindCommitmentContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t VerifyBlindCommitmentContextSetNonceBytes(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t VerifyBlindCommitmentContextSetProof(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t VerifyBlindCommitmentContextFinish(uint64_t handle, BbsExternError* err) = 0;

    virtual uint64_t BlindCommitmentContextInit(BbsExternError* err) = 0;
    virtual int32_t BlindCommitmentContextAddMessageBytes(uint64_t handle, uint32_t index, BbsByteArray message,
                                                          BbsExternError* err) = 0;
    virtual int32_t BlindCommitmentContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t BlindCommitmentContextSetNonceBytes(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t BlindCommitmentContextFinish(uint64_t handle, BbsByteBuffer* commitment, BbsByteBuffer* out_context,
                                                 BbsByteBuffer* blinding_factor, BbsExternError* err) = 0;

    virtual uint64_t BlindSignContextInit(BbsExternError* err) = 0;
    virtual int32_t BlindSignContextAddMessageBytes(uint64_t handle, uint32_t index, BbsByteArray message,
                                                    BbsExternError* err) = 0;
    virtual int32_t BlindSignContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t BlindSignContextSetSecretKey(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t BlindSignContextSetCommitment(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t BlindSignContextFinish(uint64_t handle, BbsByteBuffer* blinded_signature, BbsExternError* err) = 0;

    virtual uint64_t CreateProofContextInit(BbsExternError* err) = 0;
    virtual int32_t CreateProofContextAddProofMessageBytes(uint64_t handle, BbsByteArray message,
                                                           BbsProofMessageType proof_type, BbsByteArray blinding_factor,
                                                           BbsExternError* err) = 0;
    virtual int32_t CreateProofContextSetSignature(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t CreateProofContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t CreateProofContextSetNonceBytes(uint64_t handle, BbsByteArray value, BbsExternError* err) = 0;
    virtual int32_t CreateProofContextFinish(uint64_t handle, BbsByteBuffer* proof, BbsExternError* err) = 0;
};
}
