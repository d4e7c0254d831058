#pragma once

/**
 * @file derive.hpp
 * @brief Generates the full StackError contract for a single-field wrapper
 *
 * Libraries declare their own nominal error type and inherit every
 * operation by delegation to the wrapped field:
 *
 * @code
 * struct LibError : stackerror::DeriveStackError<LibError> {
 *     stackerror::StackError inner;
 * };
 *
 * LibError e = LibError::from_msg("disk full")
 *                  .with_err_code(stackerror::ErrorCode::IO_STORAGE_FULL)
 *                  .stack_err("cannot save document");
 * @endcode
 *
 * The wrapper must be an aggregate with exactly one data member. Each
 * operation unwraps the field, applies the same operation to it and wraps
 * the result again, so a wrapper renders and classifies exactly like the
 * error it wraps. Wrappers may wrap other wrappers.
 */

#include "error.hpp"
#include "stacks.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace stackerror {

// ============================================================================
// FIELD COUNTING
// ============================================================================

namespace detail {

// Converts to any field type during aggregate initialization probes
template<std::size_t I>
struct any_field {
    template<typename U>
    operator U() const;
};

template<typename T, typename Base, typename Indices, typename = void>
struct is_brace_constructible_with : std::false_type {};

template<typename T, typename Base, std::size_t... I>
struct is_brace_constructible_with<T, Base, std::index_sequence<I...>, std::void_t<
    decltype(T{std::declval<Base>(), any_field<I>{}...})
>> : std::true_type {};

template<typename T, typename Base, bool = std::is_aggregate_v<T>>
struct is_single_field_wrapper : std::false_type {};

template<typename T, typename Base>
struct is_single_field_wrapper<T, Base, true> : std::bool_constant<
    std::is_base_of_v<Base, T> &&
    is_brace_constructible_with<T, Base, std::make_index_sequence<1>>::value &&
    !is_brace_constructible_with<T, Base, std::make_index_sequence<2>>::value
> {};

}  // namespace detail

/**
 * @brief Whether T is an aggregate deriving from Base with exactly one field
 */
template<typename T, typename Base>
inline constexpr bool is_single_field_wrapper_v = detail::is_single_field_wrapper<T, Base>::value;

// ============================================================================
// DERIVE STACK ERROR
// ============================================================================

/**
 * @brief CRTP base implementing the stacking contract for Derived
 *
 * @tparam Derived The wrapper type, an aggregate with a single data member
 * @tparam Inner   Type of that member; must implement the stacking contract
 */
template<typename Derived, typename Inner = StackError>
class DeriveStackError {
    static_assert(is_error_stacks_v<Inner>,
                  "DeriveStackError: the wrapped type must implement the stacking contract");

public:
    using code_type = typename Inner::code_type;
    using inner_type = Inner;

    template<typename M>
    static Derived from_msg(M&& message) {
        return wrap(Inner::from_msg(std::forward<M>(message)));
    }

    // ========== Contract ==========

    auto err_code() const { return inner_error().err_code(); }
    auto err_uri() const { return inner_error().err_uri(); }

    Derived with_err_code(code_type code) && {
        return wrap(std::move(*this).into_inner().with_err_code(code));
    }

    Derived with_no_err_code() && {
        return wrap(std::move(*this).into_inner().with_no_err_code());
    }

    Derived with_err_uri(std::string uri) && {
        return wrap(std::move(*this).into_inner().with_err_uri(std::move(uri)));
    }

    Derived with_no_err_uri() && {
        return wrap(std::move(*this).into_inner().with_no_err_uri());
    }

    template<typename M>
    Derived with_err_msg(M&& message) && {
        return wrap(std::move(*this).into_inner().with_err_msg(std::forward<M>(message)));
    }

    Derived with_no_err_msg() && {
        return wrap(std::move(*this).into_inner().with_no_err_msg());
    }

    Derived stack_err() && {
        return wrap(std::move(*this).into_inner().stack_err());
    }

    template<typename M>
    Derived stack_err(M&& message) && {
        return wrap(std::move(*this).into_inner().stack_err(std::forward<M>(message)));
    }

    // ========== Rendering and introspection ==========

    auto cause() const noexcept { return inner_error().cause(); }
    bool has_message() const noexcept { return inner_error().has_message(); }
    size_t depth() const noexcept { return inner_error().depth(); }
    std::string message_string() const { return inner_error().message_string(); }
    std::vector<std::string> messages() const { return inner_error().messages(); }
    std::string to_string() const { return inner_error().to_string(); }

    friend std::ostream& operator<<(std::ostream& os, const Derived& error) {
        return os << static_cast<const DeriveStackError&>(error).inner_error();
    }

    // ========== Field access ==========

    const Inner& inner_error() const noexcept {
        check_shape();
        const auto& [field] = static_cast<const Derived&>(*this);
        return field;
    }

    Inner& inner_error() noexcept {
        check_shape();
        auto& [field] = static_cast<Derived&>(*this);
        return field;
    }

    Inner into_inner() && {
        check_shape();
        auto& [field] = static_cast<Derived&>(*this);
        return std::move(field);
    }

private:
    static constexpr void check_shape() noexcept {
        static_assert(std::is_base_of_v<DeriveStackError, Derived>,
                      "DeriveStackError: Derived must inherit from DeriveStackError<Derived>");
        static_assert(is_single_field_wrapper_v<Derived, DeriveStackError>,
                      "DeriveStackError: the wrapper must be an aggregate with exactly one "
                      "data member, e.g. struct MyError : DeriveStackError<MyError> "
                      "{ stackerror::StackError inner; };");
    }

    static Derived wrap(Inner&& value) {
        check_shape();
        return Derived{{}, std::move(value)};
    }
};

}  // namespace stackerror
