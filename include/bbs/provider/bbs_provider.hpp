#pragma once
#include "bbs/core/result.hpp"
#include "bbs/core/failures.hpp"
#include "bbs/configuration/bbs_config.hpp"
#include "bbs/enums/signature_proof_status.hpp"
#include "bbs/interop/allocation_tracker.hpp"
#include "bbs/models/bls_key_pair.hpp"
#include "bbs/models/bbs_public_key.hpp"
#include "bbs/models/blinded_commitment.hpp"
#include "bbs/models/indexed_message.hpp"
#include "bbs/models/proof_message.hpp"
#include "bbs/native/native_boundary.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace bbs::signatures {
    using configuration::BbsConfig;
    using enums::SignatureProofStatus;
    using models::BbsPublicKey;
    using models::BlindedCommitment;
    using models::BlsKeyPair;
    using models::IndexedMessage;
    using models::ProofMessage;

    /**
     * @brief Typed entry point for BBS+ signatures, blind signatures and proofs
     *
     * Each operation validates its inputs locally, then opens one
     * AllocationTracker scope and drives one native protocol to completion.
     * Every buffer that crossed the boundary is released before the call
     * returns, on success and on failure alike. Failures come back as
     * BbsFailure: code 0 for local failures, the native code otherwise.
     *
     * The provider holds no per-call state; it may be shared between threads
     * when the native library is thread-safe.
     */
    class BbsProvider {
    public:
        explicit BbsProvider(native::INativeBoundary& native, BbsConfig config = BbsConfig::Default());

        [[nodiscard]] int32_t SignatureSize() const;

        [[nodiscard]] int32_t BlindSignatureSize() const;

        /// Key pair from native randomness
        [[nodiscard]] Result<BlsKeyPair, BbsFailure> GenerateKey() const;

        /// Deterministic key pair from the UTF-8 bytes of `seed`
        [[nodiscard]] Result<BlsKeyPair, BbsFailure> GenerateKey(std::string_view seed) const;

        [[nodiscard]] Result<BlsKeyPair, BbsFailure> GenerateKey(std::span<const uint8_t> seed) const;

        /**
         * @brief BBS+ public key for signing exactly `message_count` messages
         *
         * Not cached; derive again when the message count changes.
         */
        [[nodiscard]] Result<BbsPublicKey, BbsFailure> DeriveBbsKey(
            const BlsKeyPair& key_pair,
            uint32_t message_count) const;

        /**
         * @brief Sign `messages` in order
         *
         * @return Err(InvalidInput) without any native call if `key_pair` has
         *         no secret key
         */
        [[nodiscard]] Result<std::vector<uint8_t>, BbsFailure> Sign(
            const BlsKeyPair& key_pair,
            std::span<const std::string> messages) const;

        /**
         * @brief Check `signature` over `messages`
         *
         * A well-formed but non-matching signature yields Ok(false). A public
         * key derived for a different message count is a native failure.
         */
        [[nodiscard]] Result<bool, BbsFailure> Verify(
            const BbsPublicKey& public_key,
            std::span<const std::string> messages,
            std::span<const uint8_t> signature) const;

        [[nodiscard]] Result<SignatureProofStatus, BbsFailure> VerifyProof(
            const BbsPublicKey& public_key,
            std::span<const uint8_t> proof,
            std::span<const IndexedMessage> revealed_messages,
            std::string_view nonce) const;

        [[nodiscard]] Result<SignatureProofStatus, BbsFailure> VerifyBlindedCommitment(
            std::span<const uint8_t> proof,
            std::span<const uint32_t> blinded_indices,
            const BbsPublicKey& public_key,
            std::string_view nonce) const;

        [[nodiscard]] Result<BlindedCommitment, BbsFailure> CreateBlindedCommitment(
            const BbsPublicKey& public_key,
            std::string_view nonce,
            std::span<const IndexedMessage> blinded_messages) const;

        /**
         * @brief Sign the known messages together with a holder's commitment
         *
         * @return Err(InvalidInput) without any native call if `key_pair` has
         *         no secret key
         */
        [[nodiscard]] Result<std::vector<uint8_t>, BbsFailure> BlindSign(
            const BlsKeyPair& key_pair,
            const BbsPublicKey& public_key,
            std::span<const uint8_t> commitment,
            std::span<const IndexedMessage> known_messages) const;

        [[nodiscard]] Result<std::vector<uint8_t>, BbsFailure> UnblindSignature(
            std::span<const uint8_t> blinded_signature,
            std::span<const uint8_t> blinding_factor) const;

        [[nodiscard]] Result<std::vector<uint8_t>, BbsFailure> CreateProof(
            const BbsPublicKey& public_key,
            std::span<const ProofMessage> proof_messages,
            std::span<const uint8_t> blinding_factor,
            std::span<const uint8_t> signature,
            std::string_view nonce) const;

        [[nodiscard]] const BbsConfig& GetConfig() const noexcept { return config_; }

    private:
        [[nodiscard]] static Result<Unit, BbsFailure> EnsureSodium();

        [[nodiscard]] static Result<std::vector<uint8_t>, BbsFailure> DeriveBbsKeyInScope(
            interop::AllocationTracker& tracker,
            std::span<const uint8_t> bls_public_key,
            uint32_t message_count);

        native::INativeBoundary& native_;
        BbsConfig config_;
    };
}
