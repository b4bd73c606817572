#pragma once
#include "bbs/native/native_boundary.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace bbs::signatures::test_helpers {

using native::INativeBoundary;

/**
 * In-process stand-in for the native BBS+ library.
 *
 * Implements the full call contract with a toy scheme built from BLAKE2b
 * (crypto_generichash): signatures are hash expansions over the derived key
 * and the message digests, blinding is an XOR mask, proofs carry per-message
 * digests and a tag. Nothing here is secure; it only behaves like the real
 * library at the boundary:
 * - every output buffer and error message is heap-allocated and counted
 * - frees of unknown pointers are counted as invalid frees
 * - a failure can be injected at any named entry point
 * - every call is appended to the call log
 *
 * Sizes match BBS+ over BLS12-381: 32-byte secret keys, 96-byte BLS public
 * keys, 112-byte signatures.
 */
class FakeNativeBoundary final : public INativeBoundary {
public:
    using Bytes = std::vector<uint8_t>;

    static constexpr int32_t SIGNATURE_SIZE = 112;
    static constexpr int32_t BLIND_SIGNATURE_SIZE = 112;
    static constexpr size_t SECRET_KEY_SIZE = 32;
    static constexpr size_t BLS_PUBLIC_KEY_SIZE = 96;
    static constexpr size_t DIGEST_SIZE = 32;
    static constexpr size_t BBS_KEY_SIZE = BLS_PUBLIC_KEY_SIZE + 4 + DIGEST_SIZE;

    static constexpr int32_t INPUT_ERROR_CODE = 1;
    static constexpr int32_t INJECTED_ERROR_CODE = 99;

    FakeNativeBoundary() = default;
    ~FakeNativeBoundary() override;

    FakeNativeBoundary(const FakeNativeBoundary&) = delete;
    FakeNativeBoundary& operator=(const FakeNativeBoundary&) = delete;

    // ------------------------------------------------------------------------
    // Test controls
    // ------------------------------------------------------------------------

    /// Every fallible entry point, in C symbol naming
    [[nodiscard]] static const std::vector<std::string>& FallibleEntries();

    /// Make `entry` fail with INJECTED_ERROR_CODE and a message naming it
    void FailOn(std::string entry) { fail_on_.insert(std::move(entry)); }

    /// Make `entry` fail with INJECTED_ERROR_CODE and a null message
    void FailSilentlyOn(std::string entry) { fail_silently_on_.insert(std::move(entry)); }

    /// Make the `*_init` entry `entry` return a zero handle without an error
    void ReturnInvalidHandleOn(std::string entry) { invalid_handle_on_.insert(std::move(entry)); }

    void ClearFailures();

    [[nodiscard]] const std::vector<std::string>& Calls() const noexcept { return calls_; }
    [[nodiscard]] size_t CallCount() const noexcept { return calls_.size(); }
    [[nodiscard]] size_t CallCount(std::string_view entry) const;
    void ClearCalls() { calls_.clear(); }

    [[nodiscard]] size_t LiveBuffers() const noexcept { return live_buffers_.size(); }
    [[nodiscard]] size_t LiveStrings() const noexcept { return live_strings_.size(); }
    [[nodiscard]] size_t BuffersAllocated() const noexcept { return buffers_allocated_; }
    [[nodiscard]] size_t StringsAllocated() const noexcept { return strings_allocated_; }
    [[nodiscard]] size_t InvalidFrees() const noexcept { return invalid_frees_; }
    /// Buffers whose contents were all zero when they came back for release
    [[nodiscard]] size_t ZeroedOnFree() const noexcept { return zeroed_on_free_; }
    [[nodiscard]] size_t OpenContexts() const noexcept { return contexts_.size(); }

    /// Signature digest the fake would produce, for tampering tests
    [[nodiscard]] static Bytes Digest(std::string_view domain, const std::vector<Bytes>& parts);

    // ------------------------------------------------------------------------
    // INativeBoundary
    // ------------------------------------------------------------------------

    void ByteBufferFree(BbsByteBuffer buffer) override;
    void StringFree(char* message) override;

    int32_t SignatureSize() override;
    int32_t BlindSignatureSize() override;

    int32_t GenerateBlsKey(BbsByteArray seed, BbsByteBuffer* public_key,
                           BbsByteBuffer* secret_key, BbsExternError* err) override;
    int32_t PublicKeyToBbsKey(BbsByteArray bls_public_key, uint32_t message_count,
                              BbsByteBuffer* bbs_public_key, BbsExternError* err) override;
    int32_t UnblindSignature(BbsByteArray blind_signature, BbsByteArray blinding_factor,
                             BbsByteBuffer* unblind_signature, BbsExternError* err) override;

    uint64_t SignContextInit(BbsExternError* err) override;
    int32_t SignContextAddMessageBytes(uint64_t handle, BbsByteArray message, BbsExternError* err) override;
    int32_t SignContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t SignContextSetSecretKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t SignContextFinish(uint64_t handle, BbsByteBuffer* signature, BbsExternError* err) override;

    uint64_t VerifyContextInit(BbsExternError* err) override;
    int32_t VerifyContextAddMessageBytes(uint64_t handle, BbsByteArray message, BbsExternError* err) override;
    int32_t VerifyContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyContextSetSignature(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyContextFinish(uint64_t handle, BbsExternError* err) override;

    uint64_t VerifyProofContextInit(BbsExternError* err) override;
    int32_t VerifyProofContextAddMessageBytes(uint64_t handle, BbsByteArray message, BbsExternError* err) override;
    int32_t VerifyProofContextAddRevealedIndex(uint64_t handle, uint32_t index, BbsExternError* err) override;
    int32_t VerifyProofContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyProofContextSetNonceBytes(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyProofContextSetProof(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyProofContextFinish(uint64_t handle, BbsExternError* err) override;

    uint64_t VerifyBlindCommitmentContextInit(BbsExternError* err) override;
    int32_t VerifyBlindCommitmentContextAddBlinded(uint64_t handle, uint32_t index, BbsExternError* err) override;
    int32_t VerifyBlindCommitmentContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyBlindCommitmentContextSetNonceBytes(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyBlindCommitmentContextSetProof(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t VerifyBlindCommitmentContextFinish(uint64_t handle, BbsExternError* err) override;

    uint64_t BlindCommitmentContextInit(BbsExternError* err) override;
    int32_t BlindCommitmentContextAddMessageBytes(uint64_t handle, uint32_t index, BbsByteArray message,
                                                  BbsExternError* err) override;
    int32_t BlindCommitmentContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t BlindCommitmentContextSetNonceBytes(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t BlindCommitmentContextFinish(uint64_t handle, BbsByteBuffer* commitment, BbsByteBuffer* out_context,
                                         BbsByteBuffer* blinding_factor, BbsExternError* err) override;

    uint64_t BlindSignContextInit(BbsExternError* err) override;
    int32_t BlindSignContextAddMessageBytes(uint64_t handle, uint32_t index, BbsByteArray message,
                                            BbsExternError* err) override;
    int32_t BlindSignContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t BlindSignContextSetSecretKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t BlindSignContextSetCommitment(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t BlindSignContextFinish(uint64_t handle, BbsByteBuffer* blinded_signature, BbsExternError* err) override;

    uint64_t CreateProofContextInit(BbsExternError* err) override;
    int32_t CreateProofContextAddProofMessageBytes(uint64_t handle, BbsByteArray message,
                                                   BbsProofMessageType proof_type, BbsByteArray blinding_factor,
                                                   BbsExternError* err) override;
    int32_t CreateProofContextSetSignature(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t CreateProofContextSetPublicKey(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t CreateProofContextSetNonceBytes(uint64_t handle, BbsByteArray value, BbsExternError* err) override;
    int32_t CreateProofContextFinish(uint64_t handle, BbsByteBuffer* proof, BbsExternError* err) override;

private:
    enum class Kind {
        Sign,
        Verify,
        VerifyProof,
        VerifyBlindCommitment,
        BlindCommitment,
        BlindSign,
        CreateProof
    };

    struct ProofEntry {
        Bytes message;
        BbsProofMessageType proof_type;
        Bytes blinding_factor;
    };

    struct Context {
        Kind kind;
        std::vector<Bytes> messages;
        std::vector<std::pair<uint32_t, Bytes>> indexed_messages;
        std::vector<uint32_t> indices;
        std::vector<ProofEntry> proof_messages;
        Bytes public_key;
        Bytes secret_key;
        Bytes signature;
        Bytes nonce;
        Bytes proof;
        Bytes commitment;
    };

    struct ParsedKey {
        Bytes bls_public_key;
        uint32_t message_count;
    };

    bool Enter(std::string_view entry, BbsExternError* err);
    int32_t Fail(BbsExternError* err, int32_t code, const std::string& message);
    uint64_t OpenContext(std::string_view entry, Kind kind, BbsExternError* err);
    Context* Find(uint64_t handle, Kind kind, BbsExternError* err);
    std::optional<Context> Take(uint64_t handle, Kind kind, BbsExternError* err);
    int32_t SetField(std::string_view entry, uint64_t handle, Kind kind, Bytes Context::* field,
                     BbsByteArray value, BbsExternError* err);
    int32_t AddMessage(std::string_view entry, uint64_t handle, Kind kind, BbsByteArray message,
                       BbsExternError* err);
    int32_t AddIndexedMessage(std::string_view entry, uint64_t handle, Kind kind, uint32_t index,
                              BbsByteArray message, BbsExternError* err);
    int32_t AddIndex(std::string_view entry, uint64_t handle, Kind kind, uint32_t index, BbsExternError* err);

    BbsByteBuffer AllocateBuffer(const Bytes& bytes);
    char* AllocateString(const std::string& text);

    static Bytes ToBytes(BbsByteArray array);
    static Bytes Expand(const Bytes& seed, size_t length);
    static Bytes MessageHash(const Bytes& message);
    static Bytes PublicFromSecret(const Bytes& secret_key);
    static Bytes BbsKeyFor(const Bytes& bls_public_key, uint32_t message_count);
    static std::optional<ParsedKey> ParseBbsKey(const Bytes& bbs_key);
    static Bytes SignatureFor(const ParsedKey& key, const std::vector<Bytes>& message_hashes);
    static Bytes BlindMask(const Bytes& blinding_factor);
    static Bytes CommitmentContextFor(const Bytes& nonce, const Bytes& bbs_key, std::vector<uint32_t> indices);
    static void AppendU32(Bytes& out, uint32_t value);
    static uint32_t ReadU32(const Bytes& in, size_t offset);

    std::map<uint64_t, Context> contexts_;
    uint64_t next_handle_ = 1;

    std::set<const void*> live_buffers_;
    std::set<const void*> live_strings_;
    size_t buffers_allocated_ = 0;
    size_t strings_allocated_ = 0;
    size_t invalid_frees_ = 0;
    size_t zeroed_on_free_ = 0;

    std::vector<std::string> calls_;
    std::set<std::string, std::less<>> fail_on_;
    std::set<std::string, std::less<>> fail_silently_on_;
    std::set<std::string, std::less<>> invalid_handle_on_;
};

}
