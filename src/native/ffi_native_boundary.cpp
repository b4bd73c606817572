#include "bbs/native/ffi_native_boundary.hpp"
#include "bbs_native_api.h"

namespace bbs::signatures::native {

FfiNativeBoundary& FfiNativeBoundary::Instance() {
    static FfiNativeBoundary instance;
    return instance;
}

// ============================================================================
// Deallocation
// ============================================================================

void FfiNativeBoundary::ByteBufferFree(const BbsByteBuffer buffer) {
    bbs_byte_buffer_free(buffer);
}

void FfiNativeBoundary::StringFree(char* message) {
    bbs_string_free(message);
}

// ============================================================================
// Stateless Calls
// ============================================================================

int32_t FfiNativeBoundary::SignatureSize() {
    return bbs_signature_size();
}

int32_t FfiNativeBoundary::BlindSignatureSize() {
    return bbs_blind_signature_size();
}

int32_t FfiNativeBoundary::GenerateBlsKey(const BbsByteArray seed, BbsByteBuffer* public_key,
                                          BbsByteBuffer* secret_key, BbsExternError* err) {
    return bls_generate_key(seed, public_key, secret_key, err);
}

int32_t FfiNativeBoundary::PublicKeyToBbsKey(const BbsByteArray bls_public_key, const uint32_t message_count,
                                             BbsByteBuffer* bbs_public_key, BbsExternError* err) {
    return bls_public_key_to_bbs_key(bls_public_key, message_count, bbs_public_key, err);
}

int32_t FfiNativeBoundary::UnblindSignature(const BbsByteArray blind_signature, const BbsByteArray blinding_factor,
                                            BbsByteBuffer* unblind_signature, BbsExternError* err) {
    return bbs_unblind_signature(blind_signature, blinding_factor, unblind_signature, err);
}

// ============================================================================
// Sign
// ============================================================================

uint64_t FfiNativeBoundary::SignContextInit(BbsExternError* err) {
    return bbs_sign_context_init(err);
}

int32_t FfiNativeBoundary::SignContextAddMessageBytes(const uint64_t handle, const BbsByteArray message,
                                                      BbsExternError* err) {
    return bbs_sign_context_add_message_bytes(handle, message, err);
}

int32_t FfiNativeBoundary::SignContextSetPublicKey(const uint64_t handle, const BbsByteArray value,
                                                   BbsExternError* err) {
    return bbs_sign_context_set_public_key(handle, value, err);
}

int32_t FfiNativeBoundary::SignContextSetSecretKey(const uint64_t handle, const BbsByteArray value,
                                                   BbsExternError* err) {
    return bbs_sign_context_set_secret_key(handle, value, err);
}

int32_t FfiNativeBoundary::SignContextFinish(const uint64_t handle, BbsByteBuffer* signature, BbsExternError* err) {
    return bbs_sign_context_finish(handle, signature, err);
}

// ============================================================================
// Verify
// ============================================================================

uint64_t FfiNativeBoundary::VerifyContextInit(BbsExternError* err) {
    return bbs_verify_context_init(err);
}

int32_t FfiNativeBoundary::VerifyContextAddMessageBytes(const uint64_t handle, const BbsByteArray message,
                                                        BbsExternError* err) {
    return bbs_verify_context_add_message_bytes(handle, message, err);
}

int32_t FfiNativeBoundary::VerifyContextSetPublicKey(const uint64_t handle, const BbsByteArray value,
                                                     BbsExternError* err) {
    return bbs_verify_context_set_public_key(handle, value, err);
}

int32_t FfiNativeBoundary::VerifyContextSetSignature(const uint64_t handle, const BbsByteArray value,
                                                     BbsExternError* err) {
    return bbs_verify_context_set_signature(handle, value, err);
}

int32_t FfiNativeBoundary::VerifyContextFinish(const uint64_t handle, BbsExternError* err) {
    return bbs_verify_context_finish(handle, err);
}

// ============================================================================
// Verify Proof
// ============================================================================

uint64_t FfiNativeBoundary::VerifyProofContextInit(BbsExternError* err) {
    return bbs_verify_proof_context_init(err);
}

int32_t FfiNativeBoundary::VerifyProofContextAddMessageBytes(const uint64_t handle, const BbsByteArray message,
                                                             BbsExternError* err) {
    return bbs_verify_proof_context_add_message_bytes(handle, message, err);
}

int32_t FfiNativeBoundary::VerifyProofContextAddRevealedIndex(const uint64_t handle, const uint32_t index,
                                                              BbsExternError* err) {
    return bbs_verify_proof_context_add_revealed_index(handle, index, err);
}

int32_t FfiNativeBoundary::VerifyProofContextSetPublicKey(const uint64_t handle, const BbsByteArray value,
                                                          BbsExternError* err) {
    return bbs_verify_proof_context_set_public_key(handle, value, err);
}

int32_t FfiNativeBoundary::VerifyProofContextSetNonceBytes(const uint64_t handle, const BbsByteArray value,
                                                           BbsExternError* err) {
    return bbs_verify_proof_context_set_nonce_bytes(handle, value, err);
}

int32_t FfiNativeBoundary::VerifyProofContextSetProof(const uint64_t handle, const BbsByteArray value,
                                                      BbsExternError* err) {
    return bbs_verify_proof_context_set_proof(handle, value, err);
}

int32_t FfiNativeBoundary::VerifyProofContextFinish(const uint64_t handle, BbsExternError* err) {
    return bbs_verify_proof_context_finish(handle, err);
}

// ============================================================================
// Verify Blind Commitment
// ============================================================================

uint64_t FfiNativeBoundary::VerifyBlindCommitmentContextInit(BbsExternError* err) {
    return bbs_verify_blind_commitment_context_init(err);
}

int32_t FfiNativeBoundary::VerifyBlindCommitmentContextAddBlinded(const uint64_t handle, const uint32_t index,
                                                                  BbsExternError* err) {
    return bbs_verify_blind_commitment_context_add_blinded(handle, index, err);
}

int32_t FfiNativeBoundary::VerifyBlindCommitmentContextSetPublicKey(const uint64_t handle, const BbsByteArray value,
                                                                    BbsExternError* err) {
    return bbs_verify_blind_commitment_context_set_public_key(handle, value, err);
}

int32_t FfiNativeBoundary::VerifyBlindCommitmentContextSetNonceBytes(const uint64_t handle, const BbsByteArray value,
                                                                     BbsExternError* err) {
    return bbs_verify_blind_commitment_context_set_nonce_bytes(handle, value, err);
}

int32_t FfiNativeBoundary::VerifyBlindCommitmentContextSetProof(const uint64_t handle, const BbsByteArray value,
                                                                BbsExternError* err) {
    return bbs_verify_blind_commitment_context_set_proof(handle, value, err);
}

int32_t FfiNativeBoundary::VerifyBlindCommitmentContextFinish(const uint64_t handle, BbsExternError* err) {
    return bbs_verify_blind_commitment_context_finish(handle, err);
}

// ============================================================================
// Blind Commitment
// ============================================================================

uint64_t FfiNativeBoundary::BlindCommitmentContextInit(BbsExternError* err) {
    return bbs_blind_commitment_context_init(err);
}

int32_t FfiNativeBoundary::BlindCommitmentContextAddMessageBytes(const uint64_t handle, const uint32_t index,
                                                                 const BbsByteArray message, BbsExternError* err) {
    return bbs_blind_commitment_context_add_message_bytes(handle, index, message, err);
}

int32_t FfiNativeBoundary::BlindCommitmentContextSetPublicKey(const uint64_t handle, const BbsByteArray value,
                                                              BbsExternError* err) {
    return bbs_blind_commitment_context_set_public_key(handle, value, err);
}

int32_t FfiNativeBoundary::BlindCommitmentContextSetNonceBytes(const uint64_t handle, const BbsByteArray value,
                                                               BbsExternError* err) {
    return bbs_blind_commitment_context_set_nonce_bytes(handle, value, err);
}

int32_t FfiNativeBoundary::BlindCommitmentContextFinish(const uint64_t handle, BbsByteBuffer* commitment,
                                                        BbsByteBuffer* out_context, BbsByteBuffer* blinding_factor,
                                                        BbsExternError* err) {
    return bbs_blind_commitment_context_finish(handle, commitment, out_context, blinding_factor, err);
}

// ============================================================================
// Blind Sign
// ============================================================================

uint64_t FfiNativeBoundary::BlindSignContextInit(BbsExternError* err) {
    return bbs_blind_sign_context_init(err);
}

int32_t FfiNativeBoundary::BlindSignContextAddMessageBytes(const uint64_t handle, const uint32_t index,
                                                           const BbsByteArray message, BbsExternError* err) {
    return bbs_blind_sign_context_add_message_bytes(handle, index, message, err);
}

int32_t FfiNativeBoundary::BlindSignContextSetPublicKey(const uint64_t handle, const BbsByteArray value,
                                                        BbsExternError* err) {
    return bbs_blind_sign_context_set_public_key(handle, value, err);
}

int32_t FfiNativeBoundary::BlindSignContextSetSecretKey(const uint64_t handle, const BbsByteArray value,
                                                        BbsExternError* err) {
    return bbs_blind_sign_context_set_secret_key(handle, value, err);
}

int32_t FfiNativeBoundary::BlindSignContextSetCommitment(const uint64_t handle, const BbsByteArray value,
                                                         BbsExternError* err) {
    return bbs_blind_sign_context_set_commitment(handle, value, err);
}

int32_t FfiNativeBoundary::BlindSignContextFinish(const uint64_t handle, BbsByteBuffer* blinded_signature,
                                                  BbsExternError* err) {
    return bbs_blind_sign_context_finish(handle, blinded_signature, err);
}

// ============================================================================
// Create Proof
// ============================================================================

uint64_t FfiNativeBoundary::CreateProofContextInit(BbsExternError* err) {
    return bbs_create_proof_context_init(err);
}

int32_t FfiNativeBoundary::CreateProofContextAddProofMessageBytes(const uint64_t handle, const BbsByteArray message,
                                                                  const BbsProofMessageType proof_type,
                                                                  const BbsByteArray blinding_factor,
                                                                  BbsExternError* err) {
    return bbs_create_proof_context_add_proof_message_bytes(handle, message, proof_type, blinding_factor, err);
}

int32_t FfiNativeBoundary::CreateProofContextSetSignature(const uint64_t handle, const BbsByteArray value,
                                                          BbsExternError* err) {
    return bbs_create_proof_context_set_signature(handle, value, err);
}

int32_t FfiNativeBoundary::CreateProofContextSetPublicKey(const uint64_t handle, const BbsByteArray value,
                                                          BbsExternError* err) {
    return bbs_create_proof_context_set_public_key(handle, value, err);
}

int32_t FfiNativeBoundary::CreateProofContextSetNonceBytes(const uint64_t handle, const BbsByteArray value,
                                                           BbsExternError* err) {
    return bbs_create_proof_context_set_nonce_bytes(handle, value, err);
}

int32_t FfiNativeBoundary::CreateProofContextFinish(const uint64_t handle, BbsByteBuffer* proof,
                                                    BbsExternError* err) {
    return bbs_create_proof_context_finish(handle, proof, err);
}

} // namespace bbs::signatures::native
