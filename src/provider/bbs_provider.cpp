#include "bbs/provider/bbs_provider.hpp"
#include "bbs/core/constants.hpp"
#include "bbs/core/format.hpp"
#include "bbs/crypto/sodium_interop.hpp"
#include "bbs/debug/interop_logger.hpp"
#include "bbs/enums/proof_message_type.hpp"
#include "bbs/interop/byte_buffer_bridge.hpp"
#include "bbs/interop/context_protocol.hpp"
#include "bbs/interop/error_translator.hpp"
#include "bbs/interop/operations.hpp"
#include "bbs/utilities/encoding.hpp"

namespace bbs::signatures {
    using crypto::SodiumInterop;
    using interop::AllocationTracker;
    using interop::ByteBufferBridge;
    using interop::ContextProtocol;
    using interop::ErrorTranslator;
    using configuration::BufferSensitivity;

    namespace {
        BbsFailure SecretKeyNotFound() {
            return BbsFailure::InvalidInput(std::string(ErrorMessages::SECRET_KEY_NOT_FOUND));
        }
    }

    BbsProvider::BbsProvider(native::INativeBoundary& native, const BbsConfig config)
        : native_(native)
          , config_(config) {
    }

    Result<Unit, BbsFailure> BbsProvider::EnsureSodium() {
        auto init_result = SodiumInterop::Initialize();
        if (init_result.IsErr()) {
            return Result<Unit, BbsFailure>::Err(BbsFailure::FromSodiumFailure(init_result.UnwrapErr()));
        }
        return Result<Unit, BbsFailure>::Ok(unit);
    }

    int32_t BbsProvider::SignatureSize() const {
        return native_.SignatureSize();
    }

    int32_t BbsProvider::BlindSignatureSize() const {
        return native_.BlindSignatureSize();
    }

    // ============================================================================
    // Keys
    // ============================================================================

    Result<BlsKeyPair, BbsFailure> BbsProvider::GenerateKey() const {
        return GenerateKey(std::span<const uint8_t>{});
    }

    Result<BlsKeyPair, BbsFailure> BbsProvider::GenerateKey(const std::string_view seed) const {
        return GenerateKey(utilities::Encoding::AsBytes(seed));
    }

    Result<BlsKeyPair, BbsFailure> BbsProvider::GenerateKey(std::span<const uint8_t> seed) const {
        using R = Result<BlsKeyPair, BbsFailure>;
        if (auto sodium_result = EnsureSodium(); sodium_result.IsErr()) {
            return std::move(sodium_result).ErrAs<BlsKeyPair>();
        }
        AllocationTracker tracker(native_, config_);

        auto seed_result = tracker.Reference(seed, BufferSensitivity::Secret);
        if (seed_result.IsErr()) {
            return std::move(seed_result).ErrAs<BlsKeyPair>();
        }

        BbsExternError error{NativeConstants::SUCCESS, nullptr};
        BbsByteBuffer public_key = ByteBufferBridge::EmptyBuffer();
        BbsByteBuffer secret_key = ByteBufferBridge::EmptyBuffer();
        native_.GenerateBlsKey(seed_result.Unwrap(), &public_key, &secret_key, &error);
        BBS_LOG_STEP("generate_key", "bls_generate_key", error.code);
        if (auto check_result = ErrorTranslator::Check(tracker, error); check_result.IsErr()) {
            return std::move(check_result).ErrAs<BlsKeyPair>();
        }

        auto public_result = ByteBufferBridge::ToBytes(tracker, public_key);
        auto secret_result = ByteBufferBridge::ToSecretBytes(tracker, secret_key);
        if (public_result.IsErr()) {
            return std::move(public_result).ErrAs<BlsKeyPair>();
        }
        if (secret_result.IsErr()) {
            return std::move(secret_result).ErrAs<BlsKeyPair>();
        }

        std::vector<uint8_t> secret = std::move(secret_result).Unwrap();
        auto key_pair_result = BlsKeyPair::FromBytes(secret, std::move(public_result).Unwrap());
        auto wipe_result = SodiumInterop::SecureWipe(secret);
        if (wipe_result.IsErr()) {
            return R::Err(BbsFailure::FromSodiumFailure(wipe_result.UnwrapErr()));
        }
        return key_pair_result;
    }

    Result<std::vector<uint8_t>, BbsFailure> BbsProvider::DeriveBbsKeyInScope(
        AllocationTracker& tracker,
        std::span<const uint8_t> bls_public_key,
        const uint32_t message_count) {
        using Bytes = std::vector<uint8_t>;
        auto key_result = ByteBufferBridge::FromBytes(tracker, bls_public_key);
        if (key_result.IsErr()) {
            return std::move(key_result).ErrAs<Bytes>();
        }

        BbsExternError error{NativeConstants::SUCCESS, nullptr};
        BbsByteBuffer bbs_key = ByteBufferBridge::EmptyBuffer();
        tracker.Native().PublicKeyToBbsKey(key_result.Unwrap(), message_count, &bbs_key, &error);
        BBS_LOG_STEP("derive_bbs_key", "bls_public_key_to_bbs_key", error.code);
        if (auto check_result = ErrorTranslator::Check(tracker, error); check_result.IsErr()) {
            return std::move(check_result).ErrAs<Bytes>();
        }
        return ByteBufferBridge::ToBytes(tracker, bbs_key);
    }

    Result<BbsPublicKey, BbsFailure> BbsProvider::DeriveBbsKey(
        const BlsKeyPair& key_pair,
        const uint32_t message_count) const {
        if (auto sodium_result = EnsureSodium(); sodium_result.IsErr()) {
            return std::move(sodium_result).ErrAs<BbsPublicKey>();
        }
        AllocationTracker tracker(native_, config_);
        auto key_result = DeriveBbsKeyInScope(tracker, key_pair.GetPublicKey(), message_count);
        if (key_result.IsErr()) {
            return std::move(key_result).ErrAs<BbsPublicKey>();
        }
        return Result<BbsPublicKey, BbsFailure>::Ok(
            BbsPublicKey(std::move(key_result).Unwrap(), message_count));
    }

    // ============================================================================
    // Signatures
    // ============================================================================

    Result<std::vector<uint8_t>, BbsFailure> BbsProvider::Sign(
        const BlsKeyPair& key_pair,
        std::span<const std::string> messages) const {
        using Bytes = std::vector<uint8_t>;
        using interop::SignOperation;
        if (!key_pair.HasSecretKey()) {
            return Result<Bytes, BbsFailure>::Err(SecretKeyNotFound());
        }
        auto count_result = ByteBufferBridge::ToNativeCount(messages.size());
        if (count_result.IsErr()) {
            return std::move(count_result).ErrAs<Bytes>();
        }
        if (auto sodium_result = EnsureSodium(); sodium_result.IsErr()) {
            return std::move(sodium_result).ErrAs<Bytes>();
        }
        AllocationTracker tracker(native_, config_);

        auto bbs_key_result = DeriveBbsKeyInScope(tracker, key_pair.GetPublicKey(), count_result.Unwrap());
        if (bbs_key_result.IsErr()) {
            return std::move(bbs_key_result).ErrAs<Bytes>();
        }

        auto context_result = ContextProtocol<SignOperation>::Open(tracker);
        if (context_result.IsErr()) {
            return std::move(context_result).ErrAs<Bytes>();
        }
        auto context = std::move(context_result).Unwrap();

        for (const auto& message : messages) {
            auto message_result = ByteBufferBridge::FromUtf8(tracker, message);
            if (message_result.IsErr()) {
                return std::move(message_result).ErrAs<Bytes>();
            }
            auto add_result = context.Add("add_message", SignOperation::ADD_MESSAGE, message_result.Unwrap());
            if (add_result.IsErr()) {
                return std::move(add_result).ErrAs<Bytes>();
            }
        }

        auto public_key_result = ByteBufferBridge::FromBytes(tracker, bbs_key_result.Unwrap());
        if (public_key_result.IsErr()) {
            return std::move(public_key_result).ErrAs<Bytes>();
        }
        if (auto set_result = context.Set("set_public_key", SignOperation::SET_PUBLIC_KEY, public_key_result.Unwrap());
            set_result.IsErr()) {
            return std::move(set_result).ErrAs<Bytes>();
        }

        auto secret_key_result = ByteBufferBridge::FromSecret(tracker, key_pair.GetSecretKeyHandle().value());
        if (secret_key_result.IsErr()) {
            return std::move(secret_key_result).ErrAs<Bytes>();
        }
        if (auto set_result = context.Set("set_secret_key", SignOperation::SET_SECRET_KEY, secret_key_result.Unwrap());
            set_result.IsErr()) {
            return std::move(set_result).ErrAs<Bytes>();
        }

        BbsByteBuffer signature = ByteBufferBridge::EmptyBuffer();
        if (auto finish_result = std::move(context).Finish(&signature); finish_result.IsErr()) {
            return std::move(finish_result).ErrAs<Bytes>();
        }
        return ByteBufferBridge::ToBytes(tracker, signature);
    }

    Result<bool, BbsFailure> BbsProvider::Verify(
        const BbsPublicKey& public_key,
        std::span<const std::string> messages,
        std::span<const uint8_t> signature) const {
        using interop::VerifyOperation;
        if (auto count_result = ByteBufferBridge::ToNativeCount(messages.size()); count_result.IsErr()) {
            return std::move(count_result).ErrAs<bool>();
        }
        if (auto sodium_result = EnsureSodium(); sodium_result.IsErr()) {
            return std::move(sodium_result).ErrAs<bool>();
        }
        AllocationTracker tracker(native_, config_);

        auto context_result = ContextProtocol<VerifyOperation>::Open(tracker);
        if (context_result.IsErr()) {
            return std::move(context_result).ErrAs<bool>();
        }
        auto context = std::move(context_result).Unwrap();

        auto public_key_result = ByteBufferBridge::FromBytes(tracker, public_key.GetKey());
        if (public_key_result.IsErr()) {
            return std::move(public_key_result).ErrAs<bool>();
        }
        if (auto set_result = context.Set("set_public_key", VerifyOperation::SET_PUBLIC_KEY, public_key_result.Unwrap());
            set_result.IsErr()) {
            return std::move(set_result).ErrAs<bool>();
        }

        auto signature_result = ByteBufferBridge::FromBytes(tracker, signature);
        if (signature_result.IsErr()) {
            return std::move(signature_result).ErrAs<bool>();
        }
        if (auto set_result = context.Set("set_signature", VerifyOperation::SET_SIGNATURE, signature_result.Unwrap());
            set_result.IsErr()) {
            return std::move(set_result).ErrAs<bool>();
        }

        for (const auto& message : messages) {
            auto message_result = ByteBufferBridge::FromUtf8(tracker, message);
            if (message_result.IsErr()) {
                return std::move(message_result).ErrAs<bool>();
            }
            auto add_result = context.Add("add_message", VerifyOperation::ADD_MESSAGE, message_result.Unwrap());
            if (add_result.IsErr()) {
                return std::move(add_result).ErrAs<bool>();
            }
        }

        auto finish_result = std::move(context).Finish();
        if (finish_result.IsErr()) {
            return std::move(finish_result).ErrAs<bool>();
        }
        return Result<bool, BbsFailure>::Ok(finish_result.Unwrap() == NativeConstants::VERIFIED);
    }

    Result<std::vector<uint8_t>, BbsFailure> BbsProvider::UnblindSignature(
        std::span<const uint8_t> blinded_signature,
        std::span<const uint8_t> blinding_factor) const {
        using Bytes = std::vector<uint8_t>;
        if (auto sodium_result = EnsureSodium(); sodium_result.IsErr()) {
            return std::move(sodium_result).ErrAs<Bytes>();
        }
        AllocationTracker tracker(native_, config_);

        auto signature_result = ByteBufferBridge::FromBytes(tracker, blinded_signature);
        if (signature_result.IsErr()) {
            return std::move(signature_result).ErrAs<Bytes>();
        }
        auto factor_result = tracker.Reference(blinding_factor, BufferSensitivity::Secret);
        if (factor_result.IsErr()) {
            return std::move(factor_result).ErrAs<Bytes>();
        }

        BbsExternError error{NativeConstants::SUCCESS, nullptr};
        BbsByteBuffer unblinded = ByteBufferBridge::EmptyBuffer();
        native_.UnblindSignature(signature_result.Unwrap(), factor_result.Unwrap(), &unblinded, &error);
        BBS_LOG_STEP("unblind_signature", "bbs_unblind_signature", error.code);
        if (auto check_result = ErrorTranslator::Check(tracker, error); check_result.IsErr()) {
            return std::move(check_result).ErrAs<Bytes>();
        }
        return ByteBufferBridge::ToBytes(tracker, unblinded);
    }

    // ============================================================================
    // Blind signatures
    // ============================================================================

    Result<BlindedCommitment, BbsFailure> BbsProvider::CreateBlindedCommitment(
        const BbsPublicKey& public_key,
        const std::string_view nonce,
        std::span<const IndexedMessage> blinded_messages) const {
        using interop::BlindCommitmentOperation;
        if (auto count_result = ByteBufferBridge::ToNativeCount(blinded_messages.size()); count_result.IsErr()) {
            return std::move(count_result).ErrAs<BlindedCommitment>();
        }
        if (auto sodium_result = EnsureSodium(); sodium_result.IsErr()) {
            return std::move(sodium_result).ErrAs<BlindedCommitment>();
        }
        AllocationTracker tracker(native_, config_);

        auto context_result = ContextProtocol<BlindCommitmentOperation>::Open(tracker);
        if (context_result.IsErr()) {
            return std::move(context_result).ErrAs<BlindedCommitment>();
        }
        auto context = std::move(context_result).Unwrap();

        for (const auto& [message, index] : blinded_messages) {
            auto message_result = ByteBufferBridge::FromUtf8(tracker, message);
            if (message_result.IsErr()) {
                return std::move(message_result).ErrAs<BlindedCommitment>();
            }
            auto add_result = context.Add(
                "add_message", BlindCommitmentOperation::ADD_MESSAGE, index, message_result.Unwrap());
            if (add_result.IsErr()) {
                return std::move(add_result).ErrAs<BlindedCommitment>();
            }
        }

        auto nonce_result = ByteBufferBridge::FromUtf8(tracker, nonce);
        if (nonce_result.IsErr()) {
            return std::move(nonce_result).ErrAs<BlindedCommitment>();
        }
        if (auto set_result = context.Set("set_nonce", BlindCommitmentOperation::SET_NONCE, nonce_result.Unwrap());
            set_result.IsErr()) {
            return std::move(set_result).ErrAs<BlindedCommitment>();
        }

        auto public_key_result = ByteBufferBridge::FromBytes(tracker, public_key.GetKey());
        if (public_key_result.IsErr()) {
            return std::move(public_key_result).ErrAs<BlindedCommitment>();
        }
        if (auto set_result = context.Set(
                "set_public_key", BlindCommitmentOperation::SET_PUBLIC_KEY, public_key_result.Unwrap());
            set_result.IsErr()) {
            return std::move(set_result).ErrAs<BlindedCommitment>();
        }

        BbsByteBuffer commitment = ByteBufferBridge::EmptyBuffer();
        BbsByteBuffer out_context = ByteBufferBridge::EmptyBuffer();
        BbsByteBuffer blinding_factor = ByteBufferBridge::EmptyBuffer();
        if (auto finish_result = std::move(context).Finish(&commitment, &out_context, &blinding_factor);
            finish_result.IsErr()) {
            return std::move(finish_result).ErrAs<BlindedCommitment>();
        }

        auto commitment_result = ByteBufferBridge::ToBytes(tracker, commitment);
        auto context_bytes_result = ByteBufferBridge::ToBytes(tracker, out_context);
        auto factor_result = ByteBufferBridge::ToSecretBytes(tracker, blinding_factor);
        if (commitment_result.IsErr()) {
            return std::move(commitment_result).ErrAs<BlindedCommitment>();
        }
        if (context_bytes_result.IsErr()) {
            return std::move(context_bytes_result).ErrAs<BlindedCommitment>();
        }
        if (factor_result.IsErr()) {
            return std::move(factor_result).ErrAs<BlindedCommitment>();
        }
        return Result<BlindedCommitment, BbsFailure>::Ok(BlindedCommitment(
            std::move(context_bytes_result).Unwrap(),
            std::move(factor_result).Unwrap(),
            std::move(commitment_result).Unwrap()));
    }

    Result<SignatureProofStatus, BbsFailure> BbsProvider::VerifyBlindedCommitment(
        std::span<const uint8_t> proof,
        std::span<const uint32_t> blinded_indices,
        const BbsPublicKey& public_key,
        const std::string_view nonce) const {
        using interop::VerifyBlindCommitmentOperation;
        using Op = VerifyBlindCommitmentOperation;
        if (auto count_result = ByteBufferBridge::ToNativeCount(blinded_indices.size()); count_result.IsErr()) {
            return std::move(count_result).ErrAs<SignatureProofStatus>();
        }
        if (auto sodium_result = EnsureSodium(); sodium_result.IsErr()) {
            return std::move(sodium_result).ErrAs<SignatureProofStatus>();
        }
        AllocationTracker tracker(native_, config_);

        auto context_result = ContextProtocol<Op>::Open(tracker);
        if (context_result.IsErr()) {
            return std::move(context_result).ErrAs<SignatureProofStatus>();
        }
        auto context = std::move(context_result).Unwrap();

        auto nonce_result = ByteBufferBridge::FromUtf8(tracker, nonce);
        if (nonce_result.IsErr()) {
            return std::move(nonce_result).ErrAs<SignatureProofStatus>();
        }
        if (auto set_result = context.Set("set_nonce", Op::SET_NONCE, nonce_result.Unwrap()); set_result.IsErr()) {
            return std::move(set_result).ErrAs<SignatureProofStatus>();
        }

        auto proof_result = ByteBufferBridge::FromBytes(tracker, proof);
        if (proof_result.IsErr()) {
            return std::move(proof_result).ErrAs<SignatureProofStatus>();
        }
        if (auto set_result = context.Set("set_proof", Op::SET_PROOF, proof_result.Unwrap()); set_result.IsErr()) {
            return std::move(set_result).ErrAs<SignatureProofStatus>();
        }

        auto public_key_result = ByteBufferBridge::FromBytes(tracker, public_key.GetKey());
        if (public_key_result.IsErr()) {
            return std::move(public_key_result).ErrAs<SignatureProofStatus>();
        }
        if (auto set_result = context.Set("set_public_key", Op::SET_PUBLIC_KEY, public_key_result.Unwrap());
            set_result.IsErr()) {
            return std::move(set_result).ErrAs<SignatureProofStatus>();
        }

        for (const uint32_t index : blinded_indices) {
            if (auto add_result = context.Add("add_blinded", Op::ADD_BLINDED, index); add_result.IsErr()) {
                return std::move(add_result).ErrAs<SignatureProofStatus>();
            }
        }

        auto finish_result = std::move(context).Finish();
        if (finish_result.IsErr()) {
            return std::move(finish_result).ErrAs<SignatureProofStatus>();
        }
        return enums::SignatureProofStatusMapping::FromNative(finish_result.Unwrap());
    }

    Result<std::vector<uint8_t>, BbsFailure> BbsProvider::BlindSign(
        const BlsKeyPair& key_pair,
        const BbsPublicKey& public_key,
        std::span<const uint8_t> commitment,
        std::span<const IndexedMessage> known_messages) const {
        using Bytes = std::vector<uint8_t>;
        using interop::BlindSignOperation;
        if (!key_pair.HasSecretKey()) {
            return Result<Bytes, BbsFailure>::Err(SecretKeyNotFound());
        }
        if (auto count_result = ByteBufferBridge::ToNativeCount(known_messages.size()); count_result.IsErr()) {
            return std::move(count_result).ErrAs<Bytes>();
        }
        if (auto sodium_result = EnsureSodium(); sodium_result.IsErr()) {
            return std::move(sodium_result).ErrAs<Bytes>();
        }
        AllocationTracker tracker(native_, config_);

        auto context_result = ContextProtocol<BlindSignOperation>::Open(tracker);
        if (context_result.IsErr()) {
            return std::move(context_result).ErrAs<Bytes>();
        }
        auto context = std::move(context_result).Unwrap();

        for (const auto& [message, index] : known_messages) {
            auto message_result = ByteBufferBridge::FromUtf8(tracker, message);
            if (message_result.IsErr()) {
                return std::move(message_result).ErrAs<Bytes>();
            }
            auto add_result = context.Add(
                "add_message", BlindSignOperation::ADD_MESSAGE, index, message_result.Unwrap());
            if (add_result.IsErr()) {
                return std::move(add_result).ErrAs<Bytes>();
            }
        }

        auto public_key_result = ByteBufferBridge::FromBytes(tracker, public_key.GetKey());
        if (public_key_result.IsErr()) {
            return std::move(public_key_result).ErrAs<Bytes>();
        }
        if (auto set_result = context.Set(
                "set_public_key", BlindSignOperation::SET_PUBLIC_KEY, public_key_result.Unwrap());
            set_result.IsErr()) {
            return std::move(set_result).ErrAs<Bytes>();
        }

        auto secret_key_result = ByteBufferBridge::FromSecret(tracker, key_pair.GetSecretKeyHandle().value());
        if (secret_key_result.IsErr()) {
            return std::move(secret_key_result).ErrAs<Bytes>();
        }
        if (auto set_result = context.Set(
                "set_secret_key", BlindSignOperation::SET_SECRET_KEY, secret_key_result.Unwrap());
            set_result.IsErr()) {
            return std::move(set_result).ErrAs<Bytes>();
        }

        auto commitment_result = ByteBufferBridge::FromBytes(tracker, commitment);
        if (commitment_result.IsErr()) {
            return std::move(commitment_result).ErrAs<Bytes>();
        }
        if (auto set_result = context.Set(
                "set_commitment", BlindSignOperation::SET_COMMITMENT, commitment_result.Unwrap());
            set_result.IsErr()) {
            return std::move(set_result).ErrAs<Bytes>();
        }

        BbsByteBuffer blinded_signature = ByteBufferBridge::EmptyBuffer();
        if (auto finish_result = std::move(context).Finish(&blinded_signature); finish_result.IsErr()) {
            return std::move(finish_result).ErrAs<Bytes>();
        }
        return ByteBufferBridge::ToBytes(tracker, blinded_signature);
    }

    // ============================================================================
    // Proofs
    // ============================================================================

    Result<std::vector<uint8_t>, BbsFailure> BbsProvider::CreateProof(
        const BbsPublicKey& public_key,
        std::span<const ProofMessage> proof_messages,
        std::span<const uint8_t> blinding_factor,
        std::span<const uint8_t> signature,
        const std::string_view nonce) const {
        using Bytes = std::vector<uint8_t>;
        using interop::CreateProofOperation;
        if (auto count_result = ByteBufferBridge::ToNativeCount(proof_messages.size()); count_result.IsErr()) {
            return std::move(count_result).ErrAs<Bytes>();
        }
        for (const auto& proof_message : proof_messages) {
            if (!enums::IsDefined(proof_message.proof_type)) {
                return Result<Bytes, BbsFailure>::Err(BbsFailure::InvalidInput(compat::format(
                    "{} ({})", ErrorMessages::INVALID_PROOF_MESSAGE_TYPE,
                    static_cast<int32_t>(proof_message.proof_type))));
            }
        }
        if (auto sodium_result = EnsureSodium(); sodium_result.IsErr()) {
            return std::move(sodium_result).ErrAs<Bytes>();
        }
        AllocationTracker tracker(native_, config_);

        auto context_result = ContextProtocol<CreateProofOperation>::Open(tracker);
        if (context_result.IsErr()) {
            return std::move(context_result).ErrAs<Bytes>();
        }
        auto context = std::move(context_result).Unwrap();

        auto factor_result = tracker.Reference(blinding_factor, BufferSensitivity::Secret);
        if (factor_result.IsErr()) {
            return std::move(factor_result).ErrAs<Bytes>();
        }
        for (const auto& [message, proof_type] : proof_messages) {
            auto message_result = ByteBufferBridge::FromUtf8(tracker, message);
            if (message_result.IsErr()) {
                return std::move(message_result).ErrAs<Bytes>();
            }
            auto add_result = context.Add(
                "add_proof_message", CreateProofOperation::ADD_PROOF_MESSAGE,
                message_result.Unwrap(), enums::ToNative(proof_type), factor_result.Unwrap());
            if (add_result.IsErr()) {
                return std::move(add_result).ErrAs<Bytes>();
            }
        }

        auto nonce_result = ByteBufferBridge::FromUtf8(tracker, nonce);
        if (nonce_result.IsErr()) {
            return std::move(nonce_result).ErrAs<Bytes>();
        }
        if (auto set_result = context.Set("set_nonce", CreateProofOperation::SET_NONCE, nonce_result.Unwrap());
            set_result.IsErr()) {
            return std::move(set_result).ErrAs<Bytes>();
        }

        auto public_key_result = ByteBufferBridge::FromBytes(tracker, public_key.GetKey());
        if (public_key_result.IsErr()) {
            return std::move(public_key_result).ErrAs<Bytes>();
        }
        if (auto set_result = context.Set(
                "set_public_key", CreateProofOperation::SET_PUBLIC_KEY, public_key_result.Unwrap());
            set_result.IsErr()) {
            return std::move(set_result).ErrAs<Bytes>();
        }

        auto signature_result = ByteBufferBridge::FromBytes(tracker, signature);
        if (signature_result.IsErr()) {
            return std::move(signature_result).ErrAs<Bytes>();
        }
        if (auto set_result = context.Set(
                "set_signature", CreateProofOperation::SET_SIGNATURE, signature_result.Unwrap());
            set_result.IsErr()) {
            return std::move(set_result).ErrAs<Bytes>();
        }

        BbsByteBuffer proof = ByteBufferBridge::EmptyBuffer();
        if (auto finish_result = std::move(context).Finish(&proof); finish_result.IsErr()) {
            return std::move(finish_result).ErrAs<Bytes>();
        }
        return ByteBufferBridge::ToBytes(tracker, proof);
    }

    Result<SignatureProofStatus, BbsFailure> BbsProvider::VerifyProof(
        const BbsPublicKey& public_key,
        std::span<const uint8_t> proof,
        std::span<const IndexedMessage> revealed_messages,
        const std::string_view nonce) const {
        using interop::VerifyProofOperation;
        using Op = VerifyProofOperation;
        if (auto count_result = ByteBufferBridge::ToNativeCount(revealed_messages.size()); count_result.IsErr()) {
            return std::move(count_result).ErrAs<SignatureProofStatus>();
        }
        if (auto sodium_result = EnsureSodium(); sodium_result.IsErr()) {
            return std::move(sodium_result).ErrAs<SignatureProofStatus>();
        }
        AllocationTracker tracker(native_, config_);

        auto context_result = ContextProtocol<Op>::Open(tracker);
        if (context_result.IsErr()) {
            return std::move(context_result).ErrAs<SignatureProofStatus>();
        }
        auto context = std::move(context_result).Unwrap();

        auto public_key_result = ByteBufferBridge::FromBytes(tracker, public_key.GetKey());
        if (public_key_result.IsErr()) {
            return std::move(public_key_result).ErrAs<SignatureProofStatus>();
        }
        if (auto set_result = context.Set("set_public_key", Op::SET_PUBLIC_KEY, public_key_result.Unwrap());
            set_result.IsErr()) {
            return std::move(set_result).ErrAs<SignatureProofStatus>();
        }

        auto nonce_result = ByteBufferBridge::FromUtf8(tracker, nonce);
        if (nonce_result.IsErr()) {
            return std::move(nonce_result).ErrAs<SignatureProofStatus>();
        }
        if (auto set_result = context.Set("set_nonce", Op::SET_NONCE, nonce_result.Unwrap()); set_result.IsErr()) {
            return std::move(set_result).ErrAs<SignatureProofStatus>();
        }

        auto proof_result = ByteBufferBridge::FromBytes(tracker, proof);
        if (proof_result.IsErr()) {
            return std::move(proof_result).ErrAs<SignatureProofStatus>();
        }
        if (auto set_result = context.Set("set_proof", Op::SET_PROOF, proof_result.Unwrap()); set_result.IsErr()) {
            return std::move(set_result).ErrAs<SignatureProofStatus>();
        }

        for (const auto& [message, index] : revealed_messages) {
            auto message_result = ByteBufferBridge::FromUtf8(tracker, message);
            if (message_result.IsErr()) {
                return std::move(message_result).ErrAs<SignatureProofStatus>();
            }
            if (auto add_result = context.Add("add_message", Op::ADD_MESSAGE, message_result.Unwrap());
                add_result.IsErr()) {
                return std::move(add_result).ErrAs<SignatureProofStatus>();
            }
            if (auto add_result = context.Add("add_revealed_index", Op::ADD_REVEALED_INDEX, index);
                add_result.IsErr()) {
                return std::move(add_result).ErrAs<SignatureProofStatus>();
            }
        }

        auto finish_result = std::move(context).Finish();
        if (finish_result.IsErr()) {
            return std::move(finish_result).ErrAs<SignatureProofStatus>();
        }
        return enums::SignatureProofStatusMapping::FromNative(finish_result.Unwrap());
    }
}
