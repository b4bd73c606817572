#include "bbs/models/bls_key_pair.hpp"

namespace bbs::signatures::models {
    BlsKeyPair::BlsKeyPair(
        std::optional<crypto::SecureMemoryHandle> secret_key_handle,
        std::vector<uint8_t> public_key)
        : secret_key_handle_(std::move(secret_key_handle))
          , public_key_(std::move(public_key)) {
    }

    Result<BlsKeyPair, BbsFailure> BlsKeyPair::FromBytes(
        std::span<const uint8_t> secret_key,
        std::vector<uint8_t> public_key) {
        if (secret_key.empty()) {
            return Result<BlsKeyPair, BbsFailure>::Ok(PublicOnly(std::move(public_key)));
        }
        auto handle_result = crypto::SecureMemoryHandle::FromBytes(secret_key);
        if (handle_result.IsErr()) {
            return Result<BlsKeyPair, BbsFailure>::Err(
                BbsFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        return Result<BlsKeyPair, BbsFailure>::Ok(BlsKeyPair(
            std::move(handle_result).Unwrap(),
            std::move(public_key)));
    }

    BlsKeyPair BlsKeyPair::PublicOnly(std::vector<uint8_t> public_key) {
        return BlsKeyPair(std::nullopt, std::move(public_key));
    }
}
