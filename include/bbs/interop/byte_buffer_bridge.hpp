#pragma once

#include "bbs/core/result.hpp"
#include "bbs/core/failures.hpp"
#include "bbs/crypto/sodium_secure_memory_handle.hpp"
#include "bbs/interop/allocation_tracker.hpp"
#include "bbs/native/bbs_abi.h"

#include <span>
#include <string_view>
#include <vector>
#include <cstdint>

namespace bbs::signatures::interop {

/**
 * @brief Conversions between owned data and the native {pointer, length} layouts
 *
 * Every conversion goes through the tracker of the current call, so the
 * produced layout is released with that call's scope.
 */
class ByteBufferBridge {
public:
    [[nodiscard]] static Result<BbsByteArray, BbsFailure> FromBytes(
        AllocationTracker& tracker,
        std::span<const uint8_t> bytes);

    /**
     * @brief UTF-8 text as a length-delimited byte array (no terminator)
     */
    [[nodiscard]] static Result<BbsByteArray, BbsFailure> FromUtf8(
        AllocationTracker& tracker,
        std::string_view text);

    /**
     * @brief Secret key material, copied from guarded memory into a secret reference
     */
    [[nodiscard]] static Result<BbsByteArray, BbsFailure> FromSecret(
        AllocationTracker& tracker,
        const crypto::SecureMemoryHandle& secret);

    [[nodiscard]] static Result<std::vector<uint8_t>, BbsFailure> ToBytes(
        AllocationTracker& tracker,
        const BbsByteBuffer& buffer);

    /**
     * @brief Secret native output: copied out, then wiped per configuration
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, BbsFailure> ToSecretBytes(
        AllocationTracker& tracker,
        const BbsByteBuffer& buffer);

    /**
     * @brief Collection size as the native uint32 message count
     *
     * @return Err(InvalidInput) if the count does not fit
     */
    [[nodiscard]] static Result<uint32_t, BbsFailure> ToNativeCount(size_t count);

    [[nodiscard]] static constexpr BbsByteBuffer EmptyBuffer() noexcept {
        return BbsByteBuffer{0, nullptr};
    }

private:
    ByteBufferBridge() = delete;
};

} // namespace bbs::signatures::interop
