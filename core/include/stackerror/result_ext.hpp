#pragma once

/**
 * @file result_ext.hpp
 * @brief Monadic extensions for Result<T, E>
 *
 * Provides functional programming style operations:
 * - and_then: Chain operations that return Result<U, E>
 * - or_else: Handle errors with fallback
 * - map_error: Transform the error
 * - inspect_error: Peek at the error without consuming
 * - ok_or_else: Lift an optional into a Result
 * - unwrap_or_throw: Get value or throw exception
 * - stack_map / stack_else: Callables that turn foreign failures into chains
 *
 * Example:
 * @code
 * auto port = ok_or_else(lookup_env("PORT"), stack_else("PORT is not set"))
 *     .with_err_code(ErrorCode::RUNTIME_INVALID_KEY)
 *     .map([](std::string s) { return std::stoi(s); });
 * @endcode
 */

#include "result.hpp"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace stackerror {

// ============================================================================
// RESULT MONADIC EXTENSIONS
// ============================================================================

/**
 * @brief Chain a function that returns Result<U, E> on success
 *
 * If the Result is an error, propagates the error.
 */
template<typename T, typename E, typename F>
auto and_then(Result<T, E>&& result, F&& func)
    -> std::invoke_result_t<F, T&&>
{
    using ReturnType = std::invoke_result_t<F, T&&>;
    if (result.is_success()) {
        return std::forward<F>(func)(std::move(result).value());
    }
    return ReturnType(std::move(result).error());
}

// Specialization for Result<void, E>
template<typename E, typename F>
auto and_then(Result<void, E>&& result, F&& func)
    -> std::invoke_result_t<F>
{
    using ReturnType = std::invoke_result_t<F>;
    if (result.is_success()) {
        return std::forward<F>(func)();
    }
    return ReturnType(std::move(result).error());
}

/**
 * @brief Handle error with a fallback function
 *
 * @param func Function that takes E&& and returns Result<T, E>
 */
template<typename T, typename E, typename F>
Result<T, E> or_else(Result<T, E>&& result, F&& func) {
    if (result.is_success()) {
        return std::move(result);
    }
    return std::forward<F>(func)(std::move(result).error());
}

/**
 * @brief Transform the error (if present)
 *
 * The error type may change: func takes E&& and returns any E2.
 */
template<typename T, typename E, typename F>
auto map_error(Result<T, E>&& result, F&& func)
    -> Result<T, std::invoke_result_t<F, E&&>>
{
    using ReturnType = Result<T, std::invoke_result_t<F, E&&>>;
    if (result.is_error()) {
        return ReturnType(std::forward<F>(func)(std::move(result).error()));
    }
    if constexpr (std::is_void_v<T>) {
        return ReturnType();
    } else {
        return ReturnType(std::move(result).value());
    }
}

/**
 * @brief Inspect the error without consuming it
 */
template<typename T, typename E, typename F>
const Result<T, E>& inspect_error(const Result<T, E>& result, F&& func) {
    if (result.is_error()) {
        func(result.error());
    }
    return result;
}

/**
 * @brief Lift an optional into a Result, building the error lazily
 */
template<typename T, typename F>
auto ok_or_else(std::optional<T> value, F&& make_error)
    -> Result<T, std::invoke_result_t<F>>
{
    using ReturnType = Result<T, std::invoke_result_t<F>>;
    if (value.has_value()) {
        return ReturnType(std::move(*value));
    }
    return ReturnType(std::forward<F>(make_error)());
}

/**
 * @brief Get the value or throw std::runtime_error with the rendered chain
 */
template<typename T, typename E>
T unwrap_or_throw(Result<T, E>&& result) {
    if (result.is_success()) {
        if constexpr (std::is_void_v<T>) {
            return;
        } else {
            return std::move(result).value();
        }
    }
    throw std::runtime_error(result.error().to_string());
}

template<typename T, typename E>
const T& unwrap_or_throw(const Result<T, E>& result) {
    if (result.is_success()) {
        return result.value();
    }
    throw std::runtime_error(result.error().to_string());
}

/**
 * @brief Check if result contains specific error code
 */
template<typename T, typename E>
bool has_error(const Result<T, E>& result, typename E::code_type code) {
    return result.is_error() && result.err_code() == code;
}

/**
 * @brief Check if result contains error from specific category
 */
template<typename T, typename E>
bool has_error_category(const Result<T, E>& result, ErrorCategory category) {
    if (!result.is_error()) {
        return false;
    }
    auto code = result.err_code();
    return code.has_value() && get_category(*code) == category;
}

// ============================================================================
// CALLABLE FACTORIES
// ============================================================================

/**
 * @brief Callable that stacks msg on top of a failure
 *
 * A failure of type E (an rvalue) keeps its chain, code and URI and gets msg
 * stacked on it. Any other failure becomes the root message, so it must be
 * string-like, a std::exception or streamable.
 *
 * @code
 * try {
 *     node = YAML::Load(text);
 * } catch (const YAML::Exception& e) {
 *     return stack_map("invalid manifest")(e);
 * }
 * @endcode
 */
template<typename E = StackError, typename M>
auto stack_map(M message) {
    return [message = std::move(message)](auto&& failure) -> E {
        using Failure = decltype(failure);
        if constexpr (std::is_same_v<std::decay_t<Failure>, E>) {
            static_assert(!std::is_lvalue_reference_v<Failure>,
                          "stack_map consumes the chain it extends; pass it as an rvalue");
            return std::move(failure).stack_err(message);
        } else {
            return E::from_msg(std::forward<Failure>(failure)).stack_err(message);
        }
    };
}

/**
 * @brief Callable with no arguments producing a root chain from msg
 *
 * Pairs with ok_or_else for absent values.
 */
template<typename E = StackError, typename M>
auto stack_else(M message) {
    return [message = std::move(message)]() -> E {
        return E::from_msg(message);
    };
}

/**
 * @brief Create an error Result whose chain starts with msg
 */
template<typename T = void, typename E = StackError, typename M>
Result<T, E> err_msg(M&& message) {
    return Result<T, E>(E::from_msg(std::forward<M>(message)));
}

}  // namespace stackerror
