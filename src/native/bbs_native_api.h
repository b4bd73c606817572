#pragma once

/* Entry points exported by the native BBS+ signature library (C linkage). */

#include "bbs/native/bbs_abi.h"

#ifdef __cplusplus
extern "C" {
#endif

void bbs_byte_buffer_free(BbsByteBuffer v);
void bbs_string_free(char* s);

int32_t bbs_signature_size(void);
int32_t bbs_blind_signature_size(void);

int32_t bls_generate_key(BbsByteArray seed, BbsByteBuffer* public_key, BbsByteBuffer* secret_key, BbsExternError* err);
int32_t bls_public_key_to_bbs_key(BbsByteArray d_public_key, uint32_t message_count, BbsByteBuffer* public_key,
                                  BbsExternError* err);
int32_t bbs_unblind_signature(BbsByteArray blind_signature, BbsByteArray blinding_factor,
                              BbsByteBuffer* unblind_signature, BbsExternError* err);

uint64_t bbs_sign_context_init(BbsExternError* err);
int32_t bbs_sign_context_add_message_bytes(uint64_t handle, BbsByteArray message, BbsExternError* err);
int32_t bbs_sign_context_set_public_key(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_sign_context_set_secret_key(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_sign_context_finish(uint64_t handle, BbsByteBuffer* signature, BbsExternError* err);

uint64_t bbs_verify_context_init(BbsExternError* err);
int32_t bbs_verify_context_add_message_bytes(uint64_t handle, BbsByteArray message, BbsExternError* err);
int32_t bbs_verify_context_set_public_key(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_verify_context_set_signature(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_verify_context_finish(uint64_t handle, BbsExternError* err);

uint64_t bbs_verify_proof_context_init(BbsExternError* err);
int32_t bbs_verify_proof_context_add_message_bytes(uint64_t handle, BbsByteArray message, BbsExternError* err);
int32_t bbs_verify_proof_context_add_revealed_index(uint64_t handle, uint32_t index, BbsExternError* err);
int32_t bbs_verify_proof_context_set_public_key(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_verify_proof_context_set_nonce_bytes(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_verify_proof_context_set_proof(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_verify_proof_context_finish(uint64_t handle, BbsExternError* err);

uint64_t bbs_verify_blind_commitment_context_init(BbsExternError* err);
int32_t bbs_verify_blind_commitment_context_add_blinded(uint64_t handle, uint32_t index, BbsExternError* err);
int32_t bbs_verify_blind_commitment_context_set_public_key(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_verify_blind_commitment_context_set_nonce_bytes(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_verify_blind_commitment_context_set_proof(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_verify_blind_commitment_context_finish(uint64_t handle, BbsExternError* err);

uint64_t bbs_blind_commitment_context_init(BbsExternError* err);
int32_t bbs_blind_commitment_context_add_message_bytes(uint64_t handle, uint32_t index, BbsByteArray message,
                                                       BbsExternError* err);
int32_t bbs_blind_commitment_context_set_public_key(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_blind_commitment_context_set_nonce_bytes(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_blind_commitment_context_finish(uint64_t handle, BbsByteBuffer* commitment, BbsByteBuffer* out_context,
                                            BbsByteBuffer* blinding_factor, BbsExternError* err);

uint64_t bbs_blind_sign_context_init(BbsExternError* err);
int32_t bbs_blind_sign_context_add_message_bytes(uint64_t handle, uint32_t index, BbsByteArray message,
                                                 BbsExternError* err);
int32_t bbs_blind_sign_context_set_public_key(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_blind_sign_context_set_secret_key(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_blind_sign_context_set_commitment(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_blind_sign_context_finish(uint64_t handle, BbsByteBuffer* blinded_signature, BbsExternError* err);

uint64_t bbs_create_proof_context_init(BbsExternError* err);
int32_t bbs_create_proof_context_add_proof_message_bytes(uint64_t handle, BbsByteArray message,
                                                         BbsProofMessageType xtype, BbsByteArray blinding_factor,
                                                         BbsExternError* err);
int32_t bbs_create_proof_context_set_signature(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_create_proof_context_set_public_key(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_create_proof_context_set_nonce_bytes(uint64_t handle, BbsByteArray value, BbsExternError* err);
int32_t bbs_create_proof_context_finish(uint64_t handle, BbsByteBuffer* proof, BbsExternError* err);

#ifdef __cplusplus
}
#endif
