#include "bbs/crypto/sodium_interop.hpp"
#include "bbs/core/format.hpp"

#include <cstring>
#include <string>

namespace bbs::signatures::crypto {

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, [] {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });
    if (IsInitialized()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    return Result<Unit, SodiumFailure>::Err(
        SodiumFailure::InitializationFailed(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (buffer.size() > Constants::MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(compat::format(
                "Refusing to wipe {} bytes (limit {})", buffer.size(), Constants::MAX_BUFFER_SIZE)));
    }
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<void*, SodiumFailure> SodiumInterop::GuardedCopy(std::span<const uint8_t> bytes) {
    if (!IsInitialized()) {
        return Result<void*, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (bytes.empty()) {
        return Result<void*, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall("Guarded copy of an empty buffer"));
    }

    void* block = sodium_malloc(bytes.size());
    if (block == nullptr) {
        return Result<void*, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(compat::format(
                "{}sodium_malloc({}) returned null",
                ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, bytes.size())));
    }
    std::memcpy(block, bytes.data(), bytes.size());

    if (sodium_mprotect_readonly(block) != SodiumConstants::SUCCESS) {
        sodium_free(block);
        return Result<void*, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Failed to seal a guarded copy read-only"));
    }
    return Result<void*, SodiumFailure>::Ok(block);
}

void* SodiumInterop::AllocateGuarded(const size_t size) noexcept {
    if (size == 0 || !IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::ReleaseGuarded(void* block) noexcept {
    if (block != nullptr) {
        sodium_free(block);
    }
}

} // namespace bbs::signatures::crypto
