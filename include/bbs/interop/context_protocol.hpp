#pragma once

#include "bbs/core/result.hpp"
#include "bbs/core/failures.hpp"
#include "bbs/core/constants.hpp"
#include "bbs/core/format.hpp"
#include "bbs/debug/interop_logger.hpp"
#include "bbs/interop/allocation_tracker.hpp"
#include "bbs/interop/error_translator.hpp"
#include "bbs/native/native_boundary.hpp"

#include <cstdint>
#include <functional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace bbs::signatures::interop {

enum class ContextState : uint8_t {
    Uninitialized,
    Open,
    Finished,
    Failed
};

[[nodiscard]] constexpr std::string_view ToString(const ContextState state) noexcept {
    switch (state) {
        case ContextState::Uninitialized: return "uninitialized";
        case ContextState::Open: return "open";
        case ContextState::Finished: return "finished";
        case ContextState::Failed: return "failed";
    }
    return "unknown";
}

/**
 * @brief One native multi-step operation: init, then add/set steps, then finish
 *
 * `Op` is an operation descriptor (see operations.hpp) exposing `NAME`, `INIT`
 * and `FINISH`. The handle type is whatever `INIT` returns.
 *
 * State machine:
 * - Open() is the only way to obtain a context, and it is already `Open`
 * - Add/Set issue exactly one native call followed by an error check; a native
 *   failure moves the context to `Failed`
 * - Finish is rvalue-only and moves the context to `Finished` or `Failed`
 * - any step on a context that is not `Open` returns InvalidState without a
 *   native call
 *
 * Every native error message is adopted by the tracker of the enclosing scope.
 *
 * Example:
 * @code
 * auto context = ContextProtocol<SignOperation>::Open(tracker);
 * if (context.IsErr()) { return ...; }
 * auto sign = std::move(context).Unwrap();
 * sign.Add("add_message", SignOperation::ADD_MESSAGE, message);
 * auto finished = std::move(sign).Finish(&signature);
 * @endcode
 */
template<typename Op>
class ContextProtocol {
public:
    using Handle = std::invoke_result_t<decltype(Op::INIT), native::INativeBoundary&, BbsExternError*>;

    [[nodiscard]] static Result<ContextProtocol, BbsFailure> Open(AllocationTracker& tracker) {
        BbsExternError error{NativeConstants::SUCCESS, nullptr};
        const Handle handle = std::invoke(Op::INIT, tracker.Native(), &error);
        BBS_LOG_STEP(Op::NAME, "init", error.code);
        auto check_result = ErrorTranslator::Check(tracker, error);
        if (check_result.IsErr()) {
            return Result<ContextProtocol, BbsFailure>::Err(std::move(check_result).UnwrapErr());
        }
        if (handle == static_cast<Handle>(NativeConstants::INVALID_HANDLE)) {
            return Result<ContextProtocol, BbsFailure>::Err(
                BbsFailure::InvalidState(compat::format(
                    "{} ({})", ErrorMessages::INVALID_CONTEXT_HANDLE, Op::NAME)));
        }
        return Result<ContextProtocol, BbsFailure>::Ok(ContextProtocol(tracker, handle));
    }

    ContextProtocol(ContextProtocol&& other) noexcept
        : tracker_(other.tracker_)
        , handle_(other.handle_)
        , state_(other.state_) {
        other.handle_ = static_cast<Handle>(NativeConstants::INVALID_HANDLE);
        other.state_ = ContextState::Uninitialized;
    }

    ContextProtocol& operator=(ContextProtocol&&) = delete;
    ContextProtocol(const ContextProtocol&) = delete;
    ContextProtocol& operator=(const ContextProtocol&) = delete;

    ~ContextProtocol() = default;

    /// Feed one repeated item (message, index, proof message)
    template<typename Entry, typename... Args>
    Result<Unit, BbsFailure> Add(const std::string_view step, Entry entry, Args&&... args) {
        return Step(step, entry, std::forward<Args>(args)...);
    }

    /// Set one fixed field (public key, secret key, nonce, signature, proof, commitment)
    template<typename Entry, typename... Args>
    Result<Unit, BbsFailure> Set(const std::string_view step, Entry entry, Args&&... args) {
        return Step(step, entry, std::forward<Args>(args)...);
    }

    /**
     * @brief Consume the handle and return the native integer result
     *
     * `args` are the operation's output parameters (result buffers); the
     * caller dereferences them through the tracker afterwards.
     */
    template<typename... Args>
    Result<int32_t, BbsFailure> Finish(Args&&... args) && {
        if (state_ != ContextState::Open) {
            return Result<int32_t, BbsFailure>::Err(NotOpen("finish"));
        }
        BbsExternError error{NativeConstants::SUCCESS, nullptr};
        const int32_t native_result = std::invoke(
            Op::FINISH, tracker_->Native(), handle_, std::forward<Args>(args)..., &error);
        BBS_LOG_STEP(Op::NAME, "finish", error.code);
        handle_ = static_cast<Handle>(NativeConstants::INVALID_HANDLE);
        auto check_result = ErrorTranslator::Check(*tracker_, error);
        if (check_result.IsErr()) {
            state_ = ContextState::Failed;
            return Result<int32_t, BbsFailure>::Err(std::move(check_result).UnwrapErr());
        }
        state_ = ContextState::Finished;
        return Result<int32_t, BbsFailure>::Ok(native_result);
    }

    [[nodiscard]] ContextState GetState() const noexcept { return state_; }
    [[nodiscard]] bool IsOpen() const noexcept { return state_ == ContextState::Open; }

private:
    ContextProtocol(AllocationTracker& tracker, const Handle handle)
        : tracker_(&tracker)
        , handle_(handle)
        , state_(ContextState::Open) {}

    template<typename Entry, typename... Args>
    Result<Unit, BbsFailure> Step(const std::string_view step, Entry entry, Args&&... args) {
        if (state_ != ContextState::Open) {
            return Result<Unit, BbsFailure>::Err(NotOpen(step));
        }
        BbsExternError error{NativeConstants::SUCCESS, nullptr};
        std::invoke(entry, tracker_->Native(), handle_, std::forward<Args>(args)..., &error);
        BBS_LOG_STEP(Op::NAME, step, error.code);
        auto check_result = ErrorTranslator::Check(*tracker_, error);
        if (check_result.IsErr()) {
            state_ = ContextState::Failed;
        }
        return check_result;
    }

    [[nodiscard]] BbsFailure NotOpen(const std::string_view step) const {
        return BbsFailure::InvalidState(compat::format(
            "{}: {} {} while {}", ErrorMessages::CONTEXT_NOT_OPEN, Op::NAME, step, ToString(state_)));
    }

    AllocationTracker* tracker_;
    Handle handle_;
    ContextState state_;
};

} // namespace bbs::signatures::interop
