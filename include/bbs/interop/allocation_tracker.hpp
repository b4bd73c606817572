#pragma once

#include "bbs/core/result.hpp"
#include "bbs/core/failures.hpp"
#include "bbs/configuration/bbs_config.hpp"
#include "bbs/native/native_boundary.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace bbs::signatures::interop {

using configuration::BbsConfig;
using configuration::BufferSensitivity;

enum class BufferOrigin : uint8_t {
    /// Tracker-owned copy of caller bytes handed to the native side
    CallerSupplied,
    /// BbsByteBuffer produced by the native side
    NativeReturned,
    /// Error message produced by the native side
    NativeString
};

[[nodiscard]] std::string_view ToString(BufferOrigin origin) noexcept;

struct TrackedBuffer {
    void* pointer;
    size_t length;
    BufferOrigin origin;
    bool secure;
};

/**
 * @brief Scoped owner of every buffer crossing the native boundary
 *
 * One tracker per facade call. Each registered buffer is released exactly
 * once, in reverse registration order, when the tracker is destroyed:
 * - CallerSupplied: wiped (guarded memory) or deleted (heap)
 * - NativeReturned: bbs_byte_buffer_free
 * - NativeString: bbs_string_free
 *
 * Registration is idempotent per pointer. The tracker is neither copyable nor
 * movable; it lives on the stack of the facade call that owns it.
 *
 * Example:
 * @code
 * AllocationTracker tracker(native, config);
 * auto key = tracker.Reference(secret_key, BufferSensitivity::Secret);
 * ...
 * auto signature = tracker.Dereference(native_signature);
 * // every boundary buffer is released when tracker goes out of scope
 * @endcode
 */
class AllocationTracker {
public:
    AllocationTracker(native::INativeBoundary& native, BbsConfig config);

    ~AllocationTracker();

    AllocationTracker(const AllocationTracker&) = delete;
    AllocationTracker& operator=(const AllocationTracker&) = delete;
    AllocationTracker(AllocationTracker&&) = delete;
    AllocationTracker& operator=(AllocationTracker&&) = delete;

    /**
     * @brief Copy caller bytes into a tracked block and describe it for the native side
     *
     * The caller keeps ownership of `bytes`. Empty input yields `{0, nullptr}`
     * and registers nothing.
     *
     * @return Ok(view) or Err(Allocation) if the copy cannot be allocated
     */
    Result<BbsByteArray, BbsFailure> Reference(
        std::span<const uint8_t> bytes,
        BufferSensitivity sensitivity = BufferSensitivity::Public);

    /**
     * @brief Copy a native-allocated buffer into owned memory
     *
     * The native buffer is registered for release before it is read, so it is
     * freed even when the copy fails. Secret outputs are wiped in native memory
     * after the copy when the configuration asks for it.
     */
    Result<std::vector<uint8_t>, BbsFailure> Dereference(
        const BbsByteBuffer& buffer,
        BufferSensitivity sensitivity = BufferSensitivity::Public);

    /**
     * @brief Take ownership of a native error message and copy it out
     *
     * A null message yields an empty string.
     */
    Result<std::string, BbsFailure> AdoptNativeString(char* message);

    [[nodiscard]] bool IsTracked(const void* pointer) const noexcept;

    [[nodiscard]] size_t Registered() const noexcept { return registered_; }
    [[nodiscard]] size_t Released() const noexcept { return released_; }
    [[nodiscard]] size_t Outstanding() const noexcept { return registered_ - released_; }

    [[nodiscard]] native::INativeBoundary& Native() noexcept { return native_; }
    [[nodiscard]] const BbsConfig& Config() const noexcept { return config_; }

private:
    Result<Unit, BbsFailure> Track(const TrackedBuffer& buffer);
    void Release(const TrackedBuffer& buffer) noexcept;
    void ReleaseAll() noexcept;

    native::INativeBoundary& native_;
    BbsConfig config_;
    std::vector<TrackedBuffer> buffers_;
    size_t registered_;
    size_t released_;
};

} // namespace bbs::signatures::interop
