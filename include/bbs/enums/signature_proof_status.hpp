#pragma once
#include "bbs/core/result.hpp"
#include "bbs/core/failures.hpp"
#include "bbs/native/bbs_abi.h"
#include <cstdint>
#include <string_view>
namespace bbs::signatures::enums {
/// Outcome of proof and blinded-commitment verification.
///
/// Values are the native status codes. Any other integer is reported by
/// FromNative as UnmappedStatus.
enum class SignatureProofStatus : int32_t {
    /// The proof verified
    Success = BBS_SIGNATURE_PROOF_SUCCESS,
    /// The signature proof of knowledge failed
    BadSignature = BBS_SIGNATURE_PROOF_BAD_SIGNATURE,
    /// A hidden message was invalid when the proof was created
    BadHiddenMessage = BBS_SIGNATURE_PROOF_BAD_HIDDEN_MESSAGE,
    /// A revealed message was invalid
    BadRevealedMessage = BBS_SIGNATURE_PROOF_BAD_REVEALED_MESSAGE
};
class SignatureProofStatusMapping {
public:
    [[nodiscard]] static Result<SignatureProofStatus, BbsFailure> FromNative(int32_t native_status);
    [[nodiscard]] static std::string_view ToString(SignatureProofStatus status) noexcept;
private:
    SignatureProofStatusMapping() = delete;
};
}
