#pragma once
#include <cstdint>
#include <string>
#include <string_view>
namespace bbs::signatures {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    ReadOperationFailed,
    InvalidOperation
};
enum class BbsFailureType {
    InvalidInput,
    InvalidState,
    UnmappedStatus,
    Allocation,
    SecureMemory,
    NativeProtocol
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
/// Single failure type surfaced by every bridge operation.
///
/// `code` carries the native error code verbatim for NativeProtocol failures
/// and is LOCAL_FAILURE_CODE (0) for everything raised on this side of the
/// boundary.
class BbsFailure {
public:
    static constexpr int32_t LOCAL_FAILURE_CODE = 0;
    BbsFailureType type;
    int32_t code;
    std::string message;
    BbsFailure(const BbsFailureType t, const int32_t c, std::string msg)
        : type(t), code(c), message(std::move(msg)) {}
    static BbsFailure InvalidInput(std::string msg) {
        return {BbsFailureType::InvalidInput, LOCAL_FAILURE_CODE, std::move(msg)};
    }
    static BbsFailure InvalidState(std::string msg) {
        return {BbsFailureType::InvalidState, LOCAL_FAILURE_CODE, std::move(msg)};
    }
    static BbsFailure UnmappedStatus(std::string msg) {
        return {BbsFailureType::UnmappedStatus, LOCAL_FAILURE_CODE, std::move(msg)};
    }
    static BbsFailure Allocation(std::string msg) {
        return {BbsFailureType::Allocation, LOCAL_FAILURE_CODE, std::move(msg)};
    }
    static BbsFailure SecureMemory(std::string msg) {
        return {BbsFailureType::SecureMemory, LOCAL_FAILURE_CODE, std::move(msg)};
    }
    static BbsFailure NativeProtocol(const int32_t native_code, std::string msg) {
        return {BbsFailureType::NativeProtocol, native_code, std::move(msg)};
    }
    static BbsFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::AllocationFailed) {
            return Allocation(sf.message);
        }
        return SecureMemory(sf.message);
    }
    [[nodiscard]] bool IsNative() const noexcept {
        return type == BbsFailureType::NativeProtocol;
    }
    [[nodiscard]] bool IsLocal() const noexcept {
        return !IsNative();
    }
};
}
