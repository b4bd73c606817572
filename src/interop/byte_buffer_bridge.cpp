#include "bbs/interop/byte_buffer_bridge.hpp"
#include "bbs/utilities/encoding.hpp"
#include "bbs/core/constants.hpp"
#include "bbs/core/format.hpp"

namespace bbs::signatures::interop {

Result<BbsByteArray, BbsFailure> ByteBufferBridge::FromBytes(
    AllocationTracker& tracker,
    std::span<const uint8_t> bytes) {
    return tracker.Reference(bytes, BufferSensitivity::Public);
}

Result<BbsByteArray, BbsFailure> ByteBufferBridge::FromUtf8(
    AllocationTracker& tracker,
    const std::string_view text) {
    return tracker.Reference(utilities::Encoding::AsBytes(text), BufferSensitivity::Public);
}

Result<BbsByteArray, BbsFailure> ByteBufferBridge::FromSecret(
    AllocationTracker& tracker,
    const crypto::SecureMemoryHandle& secret) {
    auto access_result = secret.WithReadAccess([&tracker](std::span<const uint8_t> key) {
        return tracker.Reference(key, BufferSensitivity::Secret);
    });
    if (access_result.IsErr()) {
        return Result<BbsByteArray, BbsFailure>::Err(
            BbsFailure::FromSodiumFailure(access_result.UnwrapErr()));
    }
    return std::move(access_result).Unwrap();
}

Result<std::vector<uint8_t>, BbsFailure> ByteBufferBridge::ToBytes(
    AllocationTracker& tracker,
    const BbsByteBuffer& buffer) {
    return tracker.Dereference(buffer, BufferSensitivity::Public);
}

Result<std::vector<uint8_t>, BbsFailure> ByteBufferBridge::ToSecretBytes(
    AllocationTracker& tracker,
    const BbsByteBuffer& buffer) {
    return tracker.Dereference(buffer, BufferSensitivity::Secret);
}

Result<uint32_t, BbsFailure> ByteBufferBridge::ToNativeCount(const size_t count) {
    if (count > Constants::MAX_MESSAGE_COUNT) {
        return Result<uint32_t, BbsFailure>::Err(
            BbsFailure::InvalidInput(compat::format(
                "{} ({} > {})", ErrorMessages::TOO_MANY_MESSAGES, count, Constants::MAX_MESSAGE_COUNT)));
    }
    return Result<uint32_t, BbsFailure>::Ok(static_cast<uint32_t>(count));
}

} // namespace bbs::signatures::interop
