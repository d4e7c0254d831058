#pragma once

/**
 * @file stacks.hpp
 * @brief The error stacking contract and its lifting over Result-like types
 *
 * A type satisfies the contract when it exposes code_type and the consuming
 * operations of StackError:
 *
 * - err_code(), err_uri()
 * - with_err_code(c), with_no_err_code()
 * - with_err_uri(u), with_no_err_uri()
 * - with_err_msg(m), with_no_err_msg()
 * - stack_err(), stack_err(m)
 *
 * StackError, every DeriveStackError wrapper and every Result<T, E> over a
 * conforming E satisfy it.
 */

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace stackerror {

// ============================================================================
// CONTRACT DETECTION
// ============================================================================

namespace detail {

template<typename E, typename = void>
struct has_stacks_ops : std::false_type {};

template<typename E>
struct has_stacks_ops<E, std::void_t<
    typename E::code_type,
    decltype(std::declval<const E&>().err_code()),
    decltype(std::declval<const E&>().err_uri()),
    decltype(std::declval<E&&>().with_err_code(std::declval<typename E::code_type>())),
    decltype(std::declval<E&&>().with_no_err_code()),
    decltype(std::declval<E&&>().with_err_uri(std::declval<std::string>())),
    decltype(std::declval<E&&>().with_no_err_uri()),
    decltype(std::declval<E&&>().with_err_msg(std::declval<const char*>())),
    decltype(std::declval<E&&>().with_no_err_msg()),
    decltype(std::declval<E&&>().stack_err()),
    decltype(std::declval<E&&>().stack_err(std::declval<const char*>()))
>> : std::conjunction<
    std::is_same<decltype(std::declval<E&&>().with_err_code(
                     std::declval<typename E::code_type>())), E>,
    std::is_same<decltype(std::declval<E&&>().with_no_err_code()), E>,
    std::is_same<decltype(std::declval<E&&>().with_err_uri(std::declval<std::string>())), E>,
    std::is_same<decltype(std::declval<E&&>().with_no_err_uri()), E>,
    std::is_same<decltype(std::declval<E&&>().with_no_err_msg()), E>,
    std::is_same<decltype(std::declval<E&&>().stack_err()), E>,
    std::is_same<decltype(std::declval<E&&>().stack_err(std::declval<const char*>())), E>
> {};

}  // namespace detail

/**
 * @brief Whether E implements the full stacking contract
 */
template<typename E>
struct is_error_stacks : detail::has_stacks_ops<std::remove_cv_t<E>> {};

template<typename E>
inline constexpr bool is_error_stacks_v = is_error_stacks<E>::value;

// ============================================================================
// LIFTING
// ============================================================================

/**
 * @brief Projects the contract of E onto a success/failure container
 *
 * Derived must provide is_error(), error() and a private
 * `Derived lift_error(F) &&` that applies F to the error branch only.
 * Every operation leaves a success untouched; err_code() and err_uri()
 * report nothing for a success.
 */
template<typename Derived, typename E>
class LiftErrorStacks {
public:
    using code_type = typename E::code_type;

    auto err_code() const {
        using CodeResult = decltype(std::declval<const E&>().err_code());
        const Derived& self = derived();
        return self.is_error() ? self.error().err_code() : CodeResult{};
    }

    auto err_uri() const {
        using UriResult = decltype(std::declval<const E&>().err_uri());
        const Derived& self = derived();
        return self.is_error() ? self.error().err_uri() : UriResult{};
    }

    Derived with_err_code(code_type code) && {
        return std::move(derived()).lift_error(
            [&code](E&& error) { return std::move(error).with_err_code(code); });
    }

    Derived with_no_err_code() && {
        return std::move(derived()).lift_error(
            [](E&& error) { return std::move(error).with_no_err_code(); });
    }

    Derived with_err_uri(std::string uri) && {
        return std::move(derived()).lift_error(
            [&uri](E&& error) { return std::move(error).with_err_uri(std::move(uri)); });
    }

    Derived with_no_err_uri() && {
        return std::move(derived()).lift_error(
            [](E&& error) { return std::move(error).with_no_err_uri(); });
    }

    template<typename M>
    Derived with_err_msg(M&& message) && {
        return std::move(derived()).lift_error([&message](E&& error) {
            return std::move(error).with_err_msg(std::forward<M>(message));
        });
    }

    Derived with_no_err_msg() && {
        return std::move(derived()).lift_error(
            [](E&& error) { return std::move(error).with_no_err_msg(); });
    }

    Derived stack_err() && {
        return std::move(derived()).lift_error(
            [](E&& error) { return std::move(error).stack_err(); });
    }

    template<typename M>
    Derived stack_err(M&& message) && {
        return std::move(derived()).lift_error([&message](E&& error) {
            return std::move(error).stack_err(std::forward<M>(message));
        });
    }

private:
    Derived& derived() noexcept { return static_cast<Derived&>(*this); }
    const Derived& derived() const noexcept { return static_cast<const Derived&>(*this); }
};

}  // namespace stackerror
