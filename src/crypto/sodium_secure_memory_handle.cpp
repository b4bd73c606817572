#include "bbs/crypto/sodium_secure_memory_handle.hpp"
#include "bbs/crypto/sodium_interop.hpp"
#include "bbs/core/format.hpp"

#include <cstring>
#include <utility>

namespace bbs::signatures::crypto {

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(const size_t size) {
    return Create(size, {});
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::FromBytes(std::span<const uint8_t> secret) {
    return Create(secret.size(), secret);
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Create(
    const size_t size,
    std::span<const uint8_t> source) {

    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed("Cannot seal an empty secret"));
    }

    void* block = SodiumInterop::AllocateGuarded(size);
    if (block == nullptr) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(compat::format(
                "{}{} bytes", ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
    }
    if (source.empty()) {
        sodium_memzero(block, size);
    } else {
        std::memcpy(block, source.data(), size);
    }

    SecureMemoryHandle handle(block, size);
    if (auto seal_result = handle.Seal(); seal_result.IsErr()) {
        return std::move(seal_result).ErrAs<SecureMemoryHandle>();
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(handle));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Release();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : block_(std::exchange(other.block_, nullptr))
    , size_(std::exchange(other.size_, 0)) {
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Release();
        block_ = std::exchange(other.block_, nullptr);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes() const {
    return WithReadAccess([](std::span<const uint8_t> key) {
        return std::vector<uint8_t>(key.begin(), key.end());
    });
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Seal() const {
    if (sodium_mprotect_noaccess(block_) != SodiumConstants::SUCCESS) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Failed to seal secret key memory"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

void SecureMemoryHandle::Release() noexcept {
    SodiumInterop::ReleaseGuarded(block_);
    block_ = nullptr;
    size_ = 0;
}

} // namespace bbs::signatures::crypto
