#pragma once
#include "bbs/core/result.hpp"
#include "bbs/core/failures.hpp"
#include "bbs/crypto/sodium_secure_memory_handle.hpp"
#include <optional>
#include <span>
#include <vector>
#include <cstdint>
namespace bbs::signatures::models {
/// BLS12-381 key pair. The secret key, when present, lives in guarded memory.
class BlsKeyPair {
public:
    BlsKeyPair(
        std::optional<crypto::SecureMemoryHandle> secret_key_handle,
        std::vector<uint8_t> public_key);
    [[nodiscard]] static Result<BlsKeyPair, BbsFailure> FromBytes(
        std::span<const uint8_t> secret_key,
        std::vector<uint8_t> public_key);
    [[nodiscard]] static BlsKeyPair PublicOnly(std::vector<uint8_t> public_key);
    BlsKeyPair(BlsKeyPair&&) noexcept = default;
    BlsKeyPair& operator=(BlsKeyPair&&) noexcept = default;
    BlsKeyPair(const BlsKeyPair&) = delete;
    BlsKeyPair& operator=(const BlsKeyPair&) = delete;
    [[nodiscard]] bool HasSecretKey() const noexcept {
        return secret_key_handle_.has_value() && !secret_key_handle_->IsInvalid();
    }
    [[nodiscard]] const std::optional<crypto::SecureMemoryHandle>& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] std::vector<uint8_t> GetPublicKeyCopy() const {
        return public_key_;
    }
    [[nodiscard]] BlsKeyPair ToPublicOnly() const {
        return PublicOnly(public_key_);
    }
private:
    std::optional<crypto::SecureMemoryHandle> secret_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
