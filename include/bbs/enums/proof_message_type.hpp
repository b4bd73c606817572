#pragma once
#include "bbs/native/bbs_abi.h"
#include <cstdint>
namespace bbs::signatures::enums {
enum class ProofMessageType : int32_t {
    Revealed = BBS_PROOF_MESSAGE_REVEALED,
    HiddenProofSpecificBlinding = BBS_PROOF_MESSAGE_HIDDEN_PROOF_SPECIFIC_BLINDING,
    HiddenExternalBlinding = BBS_PROOF_MESSAGE_HIDDEN_EXTERNAL_BLINDING
};
[[nodiscard]] constexpr bool IsDefined(const ProofMessageType type) noexcept {
    switch (type) {
        case ProofMessageType::Revealed:
        case ProofMessageType::HiddenProofSpecificBlinding:
        case ProofMessageType::HiddenExternalBlinding:
            return true;
    }
    return false;
}
[[nodiscard]] constexpr BbsProofMessageType ToNative(const ProofMessageType type) noexcept {
    return static_cast<BbsProofMessageType>(type);
}
}
