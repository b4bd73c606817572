#include "bbs/enums/signature_proof_status.hpp"
#include "bbs/core/format.hpp"

#include <array>
#include <utility>

namespace bbs::signatures::enums {

namespace {
constexpr std::array<std::pair<int32_t, SignatureProofStatus>, 4> STATUS_TABLE{{
    {BBS_SIGNATURE_PROOF_SUCCESS, SignatureProofStatus::Success},
    {BBS_SIGNATURE_PROOF_BAD_SIGNATURE, SignatureProofStatus::BadSignature},
    {BBS_SIGNATURE_PROOF_BAD_HIDDEN_MESSAGE, SignatureProofStatus::BadHiddenMessage},
    {BBS_SIGNATURE_PROOF_BAD_REVEALED_MESSAGE, SignatureProofStatus::BadRevealedMessage},
}};
}

Result<SignatureProofStatus, BbsFailure> SignatureProofStatusMapping::FromNative(const int32_t native_status) {
    for (const auto& [code, status] : STATUS_TABLE) {
        if (code == native_status) {
            return Result<SignatureProofStatus, BbsFailure>::Ok(status);
        }
    }
    return Result<SignatureProofStatus, BbsFailure>::Err(
        BbsFailure::UnmappedStatus(compat::format(
            "Native library returned unknown signature proof status {}", native_status)));
}

std::string_view SignatureProofStatusMapping::ToString(const SignatureProofStatus status) noexcept {
    switch (status) {
        case SignatureProofStatus::Success: return "Success";
        case SignatureProofStatus::BadSignature: return "BadSignature";
        case SignatureProofStatus::BadHiddenMessage: return "BadHiddenMessage";
        case SignatureProofStatus::BadRevealedMessage: return "BadRevealedMessage";
    }
    return "Unknown";
}

} // namespace bbs::signatures::enums
