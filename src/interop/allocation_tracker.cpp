#include "bbs/interop/allocation_tracker.hpp"
#include "bbs/crypto/sodium_interop.hpp"
#include "bbs/core/constants.hpp"
#include "bbs/core/format.hpp"
#include "bbs/debug/interop_logger.hpp"

#include <algorithm>
#include <cstring>
#include <new>

namespace bbs::signatures::interop {

using crypto::SodiumInterop;

std::string_view ToString(const BufferOrigin origin) noexcept {
    switch (origin) {
        case BufferOrigin::CallerSupplied: return "caller-supplied";
        case BufferOrigin::NativeReturned: return "native-returned";
        case BufferOrigin::NativeString: return "native-string";
    }
    return "unknown";
}

AllocationTracker::AllocationTracker(native::INativeBoundary& native, const BbsConfig config)
    : native_(native)
    , config_(config)
    , registered_(0)
    , released_(0) {
    buffers_.reserve(Constants::INITIAL_TRACKED_CAPACITY);
}

AllocationTracker::~AllocationTracker() {
    ReleaseAll();
}

// ============================================================================
// Caller -> Native
// ============================================================================

Result<BbsByteArray, BbsFailure> AllocationTracker::Reference(
    std::span<const uint8_t> bytes,
    const BufferSensitivity sensitivity) {

    if (bytes.empty()) {
        return Result<BbsByteArray, BbsFailure>::Ok(BbsByteArray{0, nullptr});
    }

    const bool secure = config_.UsesSecureMemoryFor(sensitivity);
    void* block = nullptr;
    if (secure) {
        auto guarded = SodiumInterop::GuardedCopy(bytes);
        if (guarded.IsErr()) {
            return Result<BbsByteArray, BbsFailure>::Err(
                BbsFailure::FromSodiumFailure(guarded.UnwrapErr()));
        }
        block = guarded.Unwrap();
    } else {
        auto* heap = new (std::nothrow) uint8_t[bytes.size()];
        if (heap == nullptr) {
            return Result<BbsByteArray, BbsFailure>::Err(
                BbsFailure::Allocation(compat::format(
                    "Failed to allocate {} bytes for a heap reference", bytes.size())));
        }
        std::memcpy(heap, bytes.data(), bytes.size());
        block = heap;
    }

    const TrackedBuffer tracked{block, bytes.size(), BufferOrigin::CallerSupplied, secure};
    if (auto track_result = Track(tracked); track_result.IsErr()) {
        Release(tracked);
        return Result<BbsByteArray, BbsFailure>::Err(std::move(track_result).UnwrapErr());
    }

    return Result<BbsByteArray, BbsFailure>::Ok(BbsByteArray{
        static_cast<uintptr_t>(bytes.size()),
        static_cast<const uint8_t*>(block)});
}

// ============================================================================
// Native -> Caller
// ============================================================================

Result<std::vector<uint8_t>, BbsFailure> AllocationTracker::Dereference(
    const BbsByteBuffer& buffer,
    const BufferSensitivity sensitivity) {

    if (buffer.len < 0) {
        return Result<std::vector<uint8_t>, BbsFailure>::Err(
            BbsFailure::InvalidInput(std::string(ErrorMessages::NEGATIVE_BUFFER_LENGTH)));
    }
    const auto length = static_cast<size_t>(buffer.len);
    if (buffer.data == nullptr) {
        if (length > 0) {
            return Result<std::vector<uint8_t>, BbsFailure>::Err(
                BbsFailure::InvalidInput(std::string(ErrorMessages::NULL_BUFFER_DATA)));
        }
        return Result<std::vector<uint8_t>, BbsFailure>::Ok(std::vector<uint8_t>{});
    }

    if (!IsTracked(buffer.data)) {
        const TrackedBuffer tracked{buffer.data, length, BufferOrigin::NativeReturned, false};
        if (auto track_result = Track(tracked); track_result.IsErr()) {
            Release(tracked);
            return Result<std::vector<uint8_t>, BbsFailure>::Err(std::move(track_result).UnwrapErr());
        }
    }

    std::vector<uint8_t> owned;
    try {
        owned.assign(buffer.data, buffer.data + length);
    } catch (const std::bad_alloc&) {
        return Result<std::vector<uint8_t>, BbsFailure>::Err(
            BbsFailure::Allocation(compat::format(
                "Failed to copy {} bytes out of a native buffer", length)));
    }

    if (config_.WipesOutput(sensitivity)) {
        auto wipe_result = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer.data, length));
        if (wipe_result.IsErr()) {
            return Result<std::vector<uint8_t>, BbsFailure>::Err(
                BbsFailure::FromSodiumFailure(wipe_result.UnwrapErr()));
        }
    }

    return Result<std::vector<uint8_t>, BbsFailure>::Ok(std::move(owned));
}

Result<std::string, BbsFailure> AllocationTracker::AdoptNativeString(char* message) {
    if (message == nullptr) {
        return Result<std::string, BbsFailure>::Ok(std::string{});
    }

    if (!IsTracked(message)) {
        const TrackedBuffer tracked{message, std::strlen(message), BufferOrigin::NativeString, false};
        if (auto track_result = Track(tracked); track_result.IsErr()) {
            Release(tracked);
            return Result<std::string, BbsFailure>::Err(std::move(track_result).UnwrapErr());
        }
    }

    try {
        return Result<std::string, BbsFailure>::Ok(std::string(message));
    } catch (const std::bad_alloc&) {
        return Result<std::string, BbsFailure>::Err(
            BbsFailure::Allocation("Failed to copy a native error message"));
    }
}

bool AllocationTracker::IsTracked(const void* pointer) const noexcept {
    return std::any_of(buffers_.begin(), buffers_.end(),
        [pointer](const TrackedBuffer& tracked) { return tracked.pointer == pointer; });
}

// ============================================================================
// Registry
// ============================================================================

Result<Unit, BbsFailure> AllocationTracker::Track(const TrackedBuffer& buffer) {
    try {
        buffers_.push_back(buffer);
    } catch (const std::bad_alloc&) {
        return Result<Unit, BbsFailure>::Err(
            BbsFailure::Allocation("Failed to register a boundary buffer"));
    }
    ++registered_;
    BBS_LOG_BUFFER(debug::Direction::Register, ToString(buffer.origin), buffer.length);
    return Result<Unit, BbsFailure>::Ok(unit);
}

void AllocationTracker::Release(const TrackedBuffer& buffer) noexcept {
    switch (buffer.origin) {
        case BufferOrigin::CallerSupplied:
            if (buffer.secure) {
                SodiumInterop::ReleaseGuarded(buffer.pointer);
            } else {
                delete[] static_cast<uint8_t*>(buffer.pointer);
            }
            break;
        case BufferOrigin::NativeReturned:
            native_.ByteBufferFree(BbsByteBuffer{
                static_cast<int64_t>(buffer.length),
                static_cast<uint8_t*>(buffer.pointer)});
            break;
        case BufferOrigin::NativeString:
            native_.StringFree(static_cast<char*>(buffer.pointer));
            break;
    }
    BBS_LOG_BUFFER(debug::Direction::Release, ToString(buffer.origin), buffer.length);
}

void AllocationTracker::ReleaseAll() noexcept {
    for (auto it = buffers_.rbegin(); it != buffers_.rend(); ++it) {
        Release(*it);
        ++released_;
    }
    buffers_.clear();
    debug::LogScopeClosed(registered_, released_);
}

} // namespace bbs::signatures::interop
