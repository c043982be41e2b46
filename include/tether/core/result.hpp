#pragma once
#include <variant>
#include <utility>
#include <stdexcept>

namespace tether {

struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
};
inline constexpr Unit unit{};

/**
 * Value-or-error carrier used for every fallible operation in the library.
 *
 * Errors never cross an API boundary as exceptions; Unwrap() on the wrong
 * alternative is a programming error and throws std::logic_error.
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result() = default;

    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == 1; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<0>(value_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<0>(value_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<0>(std::move(value_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<1>(value_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<1>(value_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<1>(std::move(value_));
    }

private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an Err result");
        }
    }

    void RequireErr() const {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on an Ok result");
        }
    }

    std::variant<T, E> value_;
};

}
