#pragma once

/**
 * @file result.hpp
 * @brief Result<T, E> carrying either a value or a stacking error
 *
 * Result exposes the stacking contract of its error type, so context can be
 * added directly on a fallible call:
 *
 * @code
 * Result<Config> load(const std::string& path) {
 *     return read_file(path)
 *         .stack_err("failed to read config")
 *         .with_err_uri("https://example.com/docs/config");
 * }
 * @endcode
 *
 * Every contract operation applies to the error branch only.
 */

#include "error.hpp"
#include "stacks.hpp"

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace stackerror {

// ============================================================================
// RESULT TYPE
// ============================================================================

template<typename T = void, typename E = StackError>
class Result;

/**
 * @brief Result of an operation with no value
 */
template<typename E>
class Result<void, E> : public LiftErrorStacks<Result<void, E>, E> {
    static_assert(is_error_stacks_v<E>, "Result error type must implement the stacking contract");

public:
    using value_type = void;
    using error_type = E;

    // Success
    Result() noexcept = default;

    // Error
    Result(E error) : error_(std::move(error)) {}

    // Status
    bool is_success() const noexcept { return !error_.has_value(); }
    bool is_error() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return is_success(); }

    // Error access (only call if is_error())
    E& error() & noexcept { return *error_; }
    const E& error() const& noexcept { return *error_; }
    E&& error() && noexcept { return std::move(*error_); }

private:
    friend class LiftErrorStacks<Result<void, E>, E>;

    template<typename F>
    Result lift_error(F&& func) && {
        if (error_) {
            E updated = std::forward<F>(func)(std::move(*error_));
            error_.emplace(std::move(updated));
        }
        return std::move(*this);
    }

    std::optional<E> error_;
};

/**
 * @brief Result holding a T on success or an E on failure
 */
template<typename T, typename E>
class Result : public LiftErrorStacks<Result<T, E>, E> {
    static_assert(is_error_stacks_v<E>, "Result error type must implement the stacking contract");
    static_assert(!std::is_same_v<std::decay_t<T>, E>, "Result value and error types must differ");

public:
    using value_type = T;
    using error_type = E;

    // Success with value
    Result(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : storage_(std::in_place_index<0>, std::move(value)) {}

    // Error
    Result(E error) noexcept : storage_(std::in_place_index<1>, std::move(error)) {}

    // Status
    bool is_success() const noexcept { return storage_.index() == 0; }
    bool is_error() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return is_success(); }

    // Value access (only call if is_success())
    T& value() & noexcept { return *std::get_if<0>(&storage_); }
    const T& value() const& noexcept { return *std::get_if<0>(&storage_); }
    T&& value() && noexcept { return std::move(*std::get_if<0>(&storage_)); }

    // Value access with default
    T value_or(T default_value) const& noexcept(std::is_nothrow_copy_constructible_v<T>) {
        return is_success() ? value() : std::move(default_value);
    }

    T value_or(T default_value) && noexcept(std::is_nothrow_move_constructible_v<T>) {
        return is_success() ? std::move(*this).value() : std::move(default_value);
    }

    // Error access (only call if is_error())
    E& error() & noexcept { return *std::get_if<1>(&storage_); }
    const E& error() const& noexcept { return *std::get_if<1>(&storage_); }
    E&& error() && noexcept { return std::move(*std::get_if<1>(&storage_)); }

    // Transform the value (if success)
    template<typename F>
    auto map(F&& func) && -> Result<std::invoke_result_t<F, T&&>, E> {
        using ReturnType = Result<std::invoke_result_t<F, T&&>, E>;
        if (is_success()) {
            return ReturnType(std::forward<F>(func)(std::move(*this).value()));
        }
        return ReturnType(std::move(*this).error());
    }

private:
    friend class LiftErrorStacks<Result<T, E>, E>;

    template<typename F>
    Result lift_error(F&& func) && {
        if (is_error()) {
            E updated = std::forward<F>(func)(std::move(*this).error());
            storage_.template emplace<1>(std::move(updated));
        }
        return std::move(*this);
    }

    std::variant<T, E> storage_;
};

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

/**
 * @brief Create a success Result
 */
template<typename T, typename E = StackError>
Result<T, E> ok(T value) {
    return Result<T, E>(std::move(value));
}

inline Result<void> ok() {
    return Result<void>();
}

/**
 * @brief Create an error Result
 */
template<typename T = void, typename E>
Result<T, E> err(E error) {
    return Result<T, E>(std::move(error));
}

}  // namespace stackerror

// ============================================================================
// ERROR PROPAGATION MACROS
// ============================================================================

/**
 * @brief Return the error early if result is an error
 *
 * Usage: STACKERROR_TRY(some_function_returning_result());
 */
#define STACKERROR_TRY(expr)                                        \
    do {                                                            \
        auto _stackerror_result = (expr);                           \
        if (STACKERROR_UNLIKELY(_stackerror_result.is_error())) {   \
            return std::move(_stackerror_result).error();           \
        }                                                           \
    } while (0)

/**
 * @brief Return early with msg stacked on top of the error
 */
#define STACKERROR_TRY_MSG(expr, msg)                                           \
    do {                                                                        \
        auto _stackerror_result = (expr);                                       \
        if (STACKERROR_UNLIKELY(_stackerror_result.is_error())) {               \
            return std::move(_stackerror_result).error().stack_err(msg);        \
        }                                                                       \
    } while (0)

#define STACKERROR_CONCAT_IMPL(a, b) a##b
#define STACKERROR_CONCAT(a, b) STACKERROR_CONCAT_IMPL(a, b)

/**
 * @brief Assign the value on success, return the error otherwise
 *
 * Usage: STACKERROR_TRY_ASSIGN(auto config, load_config(path));
 */
#define STACKERROR_TRY_ASSIGN(var, expr)                                              \
    auto STACKERROR_CONCAT(_stackerror_try_, __LINE__) = (expr);                      \
    if (STACKERROR_UNLIKELY(STACKERROR_CONCAT(_stackerror_try_, __LINE__).is_error())) { \
        return std::move(STACKERROR_CONCAT(_stackerror_try_, __LINE__)).error();      \
    }                                                                                 \
    var = std::move(STACKERROR_CONCAT(_stackerror_try_, __LINE__)).value()
