#pragma once
#include <variant>
#include <utility>
#include <functional>
#include <type_traits>
#include <stdexcept>
namespace bbs::signatures {

/// Value of a successful step that produces nothing.
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
};
inline constexpr Unit unit{};

/**
 * @brief Either a value or a failure, never both
 *
 * Every bridge operation returns one of these; nothing throws across the
 * facade. `Unwrap` on the wrong alternative throws std::logic_error and is
 * meant for tests and for values already checked with IsOk/IsErr.
 *
 * A failed step usually aborts the whole operation, so `ErrAs<U>()` rewraps
 * the failure for the caller's result type:
 * @code
 * auto view = tracker.Reference(bytes);
 * if (view.IsErr()) {
 *     return std::move(view).ErrAs<std::vector<uint8_t>>();
 * }
 * @endcode
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<OK>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<ERR>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == OK; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == ERR; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<OK>(storage_);
    }

    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<OK>(storage_);
    }

    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<OK>(std::move(storage_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<ERR>(storage_);
    }

    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<ERR>(storage_);
    }

    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<ERR>(std::move(storage_));
    }

    [[nodiscard]] T UnwrapOr(T fallback) && {
        if (IsOk()) {
            return std::get<OK>(std::move(storage_));
        }
        return fallback;
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsErr()) {
            return Result<U, E>::Err(std::get<ERR>(std::move(storage_)));
        }
        return Result<U, E>::Ok(std::invoke(std::forward<F>(func), std::get<OK>(std::move(storage_))));
    }

    /// Move the failure into a result of another value type. Err only.
    template<typename U>
    [[nodiscard]] Result<U, E> ErrAs() && {
        RequireErr();
        return Result<U, E>::Err(std::get<ERR>(std::move(storage_)));
    }

private:
    static constexpr std::size_t OK = 0;
    static constexpr std::size_t ERR = 1;

    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> tag, Arg&& arg)
        : storage_(tag, std::forward<Arg>(arg)) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::logic_error("Result holds a failure, not a value");
        }
    }

    void RequireErr() const {
        if (IsOk()) {
            throw std::logic_error("Result holds a value, not a failure");
        }
    }

    std::variant<T, E> storage_;
};

}
