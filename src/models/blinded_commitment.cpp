#include "bbs/models/blinded_commitment.hpp"

namespace bbs::signatures::models {
    BlindedCommitment::BlindedCommitment(
        std::vector<uint8_t> context,
        std::vector<uint8_t> blinding_factor,
        std::vector<uint8_t> commitment)
        : context_(std::move(context))
          , blinding_factor_(std::move(blinding_factor))
          , commitment_(std::move(commitment)) {
    }
}
