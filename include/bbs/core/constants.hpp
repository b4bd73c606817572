#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
namespace bbs::signatures {
struct Constants {
    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;
    static constexpr size_t MAX_MESSAGE_COUNT = std::numeric_limits<uint32_t>::max();
    static constexpr size_t INITIAL_TRACKED_CAPACITY = 16;
};
struct NativeConstants {
    static constexpr int32_t SUCCESS = 0;
    static constexpr int32_t VERIFIED = 1;
    static constexpr uint64_t INVALID_HANDLE = 0;
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view SECRET_KEY_NOT_FOUND = "Secret key not found";
    static constexpr std::string_view NATIVE_MESSAGE_MISSING = "Native call failed without an error message";
    static constexpr std::string_view CONTEXT_NOT_OPEN = "Context is not open";
    static constexpr std::string_view INVALID_CONTEXT_HANDLE = "Native library returned an invalid context handle";
    static constexpr std::string_view NEGATIVE_BUFFER_LENGTH = "Native buffer reports a negative length";
    static constexpr std::string_view NULL_BUFFER_DATA = "Native buffer data is null but length is non-zero";
    static constexpr std::string_view TOO_MANY_MESSAGES = "Message count exceeds the native limit";
    static constexpr std::string_view INVALID_PROOF_MESSAGE_TYPE = "Proof message type is not defined by the native library";
    static constexpr std::string_view INVALID_BASE64 = "Input is not valid base64";
};
}
