#pragma once
#include <vector>
#include <cstdint>
namespace bbs::signatures::models {
/// Artifacts of the blind commitment step.
///
/// `context` is the proof of committed values sent to the signer together with
/// `commitment`; `blinding_factor` stays with the holder and unblinds the
/// resulting signature.
class BlindedCommitment {
public:
    BlindedCommitment(
        std::vector<uint8_t> context,
        std::vector<uint8_t> blinding_factor,
        std::vector<uint8_t> commitment);
    [[nodiscard]] const std::vector<uint8_t>& GetContext() const noexcept {
        return context_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetBlindingFactor() const noexcept {
        return blinding_factor_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetCommitment() const noexcept {
        return commitment_;
    }
private:
    std::vector<uint8_t> context_;
    std::vector<uint8_t> blinding_factor_;
    std::vector<uint8_t> commitment_;
};
}
