#pragma once
#include "bbs/core/result.hpp"
#include "bbs/core/failures.hpp"
#include "bbs/interop/allocation_tracker.hpp"
#include "bbs/native/bbs_abi.h"
namespace bbs::signatures::interop {
/// Turns a native error record into Ok or a NativeProtocol failure.
///
/// The record's message is handed to the tracker (released at scope exit)
/// and the record is reset, so one record can serve a whole protocol.
class ErrorTranslator {
public:
    [[nodiscard]] static Result<Unit, BbsFailure> Check(AllocationTracker& tracker, BbsExternError& error);
    [[nodiscard]] static bool IsSuccess(const BbsExternError& error) noexcept;
private:
    ErrorTranslator() = delete;
};
}
