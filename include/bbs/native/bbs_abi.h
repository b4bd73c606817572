#pragma once

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

/* Fixed-layout types of the native BBS+ signature library call contract. */

typedef struct BbsExternError {
    int32_t code;
    char* message;
} BbsExternError;

/* Caller-owned input bytes. */
typedef struct BbsByteArray {
    uintptr_t length;
    const uint8_t* data;
} BbsByteArray;

/* Native-allocated output bytes, released with bbs_byte_buffer_free. */
typedef struct BbsByteBuffer {
    int64_t len;
    uint8_t* data;
} BbsByteBuffer;

typedef enum {
    BBS_PROOF_MESSAGE_REVEALED = 1,
    BBS_PROOF_MESSAGE_HIDDEN_PROOF_SPECIFIC_BLINDING = 2,
    BBS_PROOF_MESSAGE_HIDDEN_EXTERNAL_BLINDING = 3
} BbsProofMessageType;

typedef enum {
    BBS_SIGNATURE_PROOF_SUCCESS = 200,
    BBS_SIGNATURE_PROOF_BAD_SIGNATURE = 400,
    BBS_SIGNATURE_PROOF_BAD_HIDDEN_MESSAGE = 401,
    BBS_SIGNATURE_PROOF_BAD_REVEALED_MESSAGE = 402
} BbsSignatureProofStatus;

#ifdef __cplusplus
}
#endif
