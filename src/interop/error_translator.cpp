#include "bbs/interop/error_translator.hpp"
#include "bbs/core/constants.hpp"
#include "bbs/debug/interop_logger.hpp"

namespace bbs::signatures::interop {

bool ErrorTranslator::IsSuccess(const BbsExternError& error) noexcept {
    return error.code == NativeConstants::SUCCESS;
}

Result<Unit, BbsFailure> ErrorTranslator::Check(AllocationTracker& tracker, BbsExternError& error) {
    const int32_t code = error.code;
    char* native_message = error.message;
    error.code = NativeConstants::SUCCESS;
    error.message = nullptr;

    auto message_result = tracker.AdoptNativeString(native_message);
    if (message_result.IsErr()) {
        return Result<Unit, BbsFailure>::Err(std::move(message_result).UnwrapErr());
    }

    if (code == NativeConstants::SUCCESS) {
        return Result<Unit, BbsFailure>::Ok(unit);
    }

    std::string message = std::move(message_result).Unwrap();
    if (message.empty()) {
        message = std::string(ErrorMessages::NATIVE_MESSAGE_MISSING);
    }
    BBS_LOG_FAILURE(code, message);
    return Result<Unit, BbsFailure>::Err(BbsFailure::NativeProtocol(code, std::move(message)));
}

} // namespace bbs::signatures::interop
