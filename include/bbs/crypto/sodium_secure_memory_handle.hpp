#pragma once

#include "bbs/core/result.hpp"
#include "bbs/core/failures.hpp"
#include "bbs/core/constants.hpp"

#include <sodium.h>
#include <span>
#include <string>
#include <type_traits>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace bbs::signatures::crypto {

/**
 * @brief A BLS secret key sealed in libsodium guarded memory
 *
 * The pages are no-access at rest and readable only inside WithReadAccess,
 * so the key is never addressable between operations. Zeroed on release.
 * Move-only; a moved-from handle is invalid.
 */
class SecureMemoryHandle {
public:
    /// Zero-filled sealed block of `size` bytes.
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /// Seal a copy of `secret`. The caller still owns and wipes the source.
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> secret);

    SecureMemoryHandle() noexcept : block_(nullptr), size_(0) {}
    ~SecureMemoryHandle();

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Unseal read-only, run `func` over the key, seal again
     *
     * The span must not escape `func`.
     */
    template<typename F>
    auto WithReadAccess(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
        }
        if (sodium_mprotect_readonly(block_) != SodiumConstants::SUCCESS) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::ReadOperationFailed(
                    std::string(ErrorMessages::FAILED_TO_READ_SECURE_MEMORY) + "unseal"));
        }

        T value = std::forward<F>(func)(std::span<const uint8_t>(static_cast<const uint8_t*>(block_), size_));

        if (auto seal_result = Seal(); seal_result.IsErr()) {
            return Result<T, SodiumFailure>::Err(std::move(seal_result).UnwrapErr());
        }
        return Result<T, SodiumFailure>::Ok(std::move(value));
    }

    /// Copy of the whole key; wipe it once handed to the native side.
    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes() const;

    [[nodiscard]] bool IsInvalid() const noexcept { return block_ == nullptr; }
    [[nodiscard]] size_t Size() const noexcept { return size_; }

private:
    SecureMemoryHandle(void* block, size_t size) noexcept : block_(block), size_(size) {}

    /// Fill a fresh writable block from `source` (zeros when empty) and seal it.
    static Result<SecureMemoryHandle, SodiumFailure> Create(size_t size, std::span<const uint8_t> source);

    Result<Unit, SodiumFailure> Seal() const;
    void Release() noexcept;

    void* block_;
    size_t size_;
};

} // namespace bbs::signatures::crypto
