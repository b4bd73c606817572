#pragma once

#include <cstdint>

namespace bbs::signatures::configuration {

/// Where caller bytes are copied before they are handed to the native side
enum class ReferenceMemory : uint8_t {
    /// Only secret material (secret keys) goes to guarded libsodium memory,
    /// public data uses the regular heap
    SecretsInSecureMemory = 0,

    /// Every reference is placed in guarded libsodium memory
    AllInSecureMemory = 1
};

/// Sensitivity of a buffer crossing the boundary
enum class BufferSensitivity : uint8_t {
    Public = 0,
    Secret = 1
};

/// Memory handling policy for the interop bridge
///
/// The bridge has no persisted configuration. This value only decides how
/// boundary copies are allocated and whether native outputs holding secret
/// material are wiped before they are returned to the native allocator.
///
/// @example
/// ```cpp
/// BbsProvider provider(native, BbsConfig::Hardened());
/// ```
class BbsConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Secret references in guarded memory, secret outputs wiped
    [[nodiscard]] static constexpr BbsConfig Default() noexcept {
        return BbsConfig(ReferenceMemory::SecretsInSecureMemory, true);
    }

    /// Every reference in guarded memory, secret outputs wiped
    [[nodiscard]] static constexpr BbsConfig Hardened() noexcept {
        return BbsConfig(ReferenceMemory::AllInSecureMemory, true);
    }

    /// Secret references in guarded memory, native outputs released as-is
    [[nodiscard]] static constexpr BbsConfig Lightweight() noexcept {
        return BbsConfig(ReferenceMemory::SecretsInSecureMemory, false);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] constexpr ReferenceMemory GetReferenceMemory() const noexcept {
        return reference_memory_;
    }

    [[nodiscard]] constexpr bool WipesSecretOutputs() const noexcept {
        return wipe_secret_outputs_;
    }

    /// Check if a reference of the given sensitivity must use guarded memory
    [[nodiscard]] constexpr bool UsesSecureMemoryFor(const BufferSensitivity sensitivity) const noexcept {
        return reference_memory_ == ReferenceMemory::AllInSecureMemory
            || sensitivity == BufferSensitivity::Secret;
    }

    /// Check if a native output of the given sensitivity is wiped before release
    [[nodiscard]] constexpr bool WipesOutput(const BufferSensitivity sensitivity) const noexcept {
        return wipe_secret_outputs_ && sensitivity == BufferSensitivity::Secret;
    }

    [[nodiscard]] constexpr bool operator==(const BbsConfig& other) const noexcept {
        return reference_memory_ == other.reference_memory_
            && wipe_secret_outputs_ == other.wipe_secret_outputs_;
    }

    [[nodiscard]] constexpr bool operator!=(const BbsConfig& other) const noexcept {
        return !(*this == other);
    }

private:
    constexpr BbsConfig(const ReferenceMemory reference_memory, const bool wipe_secret_outputs) noexcept
        : reference_memory_(reference_memory)
        , wipe_secret_outputs_(wipe_secret_outputs) {}

    ReferenceMemory reference_memory_;
    bool wipe_secret_outputs_;
};

} // namespace bbs::signatures::configuration
