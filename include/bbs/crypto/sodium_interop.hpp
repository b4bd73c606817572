#pragma once

#include "bbs/core/result.hpp"
#include "bbs/core/failures.hpp"
#include "bbs/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <mutex>
#include <span>
#include <cstddef>

namespace bbs::signatures::crypto {

/**
 * @brief The libsodium facilities the bridge relies on
 *
 * Secret inputs handed to the native library live in sodium_malloc'd pages
 * (guard pages, canary, zeroed on free). Transient copies of secret outputs
 * are wiped with sodium_memzero.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /// Thread-safe and idempotent; every provider operation calls it first.
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Wiping
    // ========================================================================

    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    // ========================================================================
    // Guarded Memory
    // ========================================================================

    /**
     * @brief Copy bytes into a fresh guarded block and seal it read-only
     *
     * The native library only reads caller-supplied buffers, so a stray
     * write through the pointer faults instead of corrupting the secret.
     * Release with ReleaseGuarded.
     */
    static Result<void*, SodiumFailure> GuardedCopy(std::span<const uint8_t> bytes);

    /// Writable guarded block, or nullptr when uninitialized, empty or exhausted.
    static void* AllocateGuarded(size_t size) noexcept;

    /// Accepts read-only and no-access blocks; libsodium zeroes before unmapping.
    static void ReleaseGuarded(void* block) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace bbs::signatures::crypto
