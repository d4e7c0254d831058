#pragma once

/**
 * @file error.hpp
 * @brief StackError, an owned chain of contextual error messages
 *
 * A StackError is the newest node of a singly linked chain. Each node holds
 * an optional type-erased message, an optional classification code, an
 * optional diagnostic URI and the node it was stacked on (its cause).
 *
 * Builders and stack operations consume the receiver and return a new value:
 *
 * @code
 * auto err = StackError::from_msg("Base error")
 *                .with_err_code(ErrorCode::IO_INVALID_INPUT)
 *                .with_err_uri("https://example.com/base")
 *                .stack_err("Stacked error");
 *
 * err.to_string();  // "Base error\nStacked error"
 * err.err_code();   // IO_INVALID_INPUT, copied forward by stack_err
 * @endcode
 */

#include "error_code.hpp"
#include "platform.hpp"

#include <exception>
#include <iosfwd>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace stackerror {

// ============================================================================
// MESSAGE PAYLOAD
// ============================================================================

namespace detail {

/**
 * @brief Immutable message that only knows how to render itself
 */
class MessagePayload {
public:
    virtual ~MessagePayload() = default;

    virtual void render(std::ostream& os) const = 0;
};

template<typename T>
class StreamablePayload final : public MessagePayload {
public:
    explicit StreamablePayload(T value) : value_(std::move(value)) {}

    void render(std::ostream& os) const override { os << value_; }

private:
    T value_;
};

template<typename T, typename = void>
struct is_streamable : std::false_type {};

template<typename T>
struct is_streamable<T, std::void_t<
    decltype(std::declval<std::ostream&>() << std::declval<const T&>())
>> : std::true_type {};

/**
 * @brief Box a message into an owned payload
 *
 * String-like values are copied into a std::string, exceptions keep their
 * what() text, everything else must be streamable with operator<<.
 * A null C string yields no payload, i.e. a node without a message.
 */
template<typename M>
std::unique_ptr<const MessagePayload> make_payload(M&& message) {
    using Decayed = std::decay_t<M>;
    if constexpr (std::is_null_pointer_v<Decayed>) {
        return nullptr;
    } else if constexpr (std::is_convertible_v<const Decayed&, std::string_view>) {
        if constexpr (std::is_pointer_v<Decayed>) {
            if (message == nullptr) {
                return nullptr;
            }
        }
        return std::make_unique<StreamablePayload<std::string>>(
            std::string(std::string_view(message)));
    } else if constexpr (std::is_base_of_v<std::exception, Decayed>) {
        return std::make_unique<StreamablePayload<std::string>>(std::string(message.what()));
    } else {
        static_assert(is_streamable<Decayed>::value,
                      "StackError messages must be string-like, a std::exception, "
                      "or printable with operator<<(std::ostream&, const T&)");
        return std::make_unique<StreamablePayload<Decayed>>(std::forward<M>(message));
    }
}

}  // namespace detail

// ============================================================================
// STACK ERROR
// ============================================================================

/**
 * @brief Error chain node with optional code, URI and cause
 *
 * Move-only. The top node exclusively owns its predecessors back to the root.
 */
class STACKERROR_API StackError {
public:
    using code_type = ErrorCode;

    /// Empty root: no message, no code, no URI
    StackError() noexcept = default;

    StackError(StackError&&) noexcept = default;
    StackError& operator=(StackError&&) noexcept = default;
    StackError(const StackError&) = delete;
    StackError& operator=(const StackError&) = delete;

    ~StackError();

    /**
     * @brief Root node carrying a message
     */
    template<typename M>
    static StackError from_msg(M&& message) {
        StackError error;
        error.message_ = detail::make_payload(std::forward<M>(message));
        return error;
    }

    // ========== Metadata of the top node ==========

    std::optional<ErrorCode> err_code() const noexcept { return code_; }

    /// View into this node; valid while the node is alive
    std::optional<std::string_view> err_uri() const noexcept {
        if (!uri_) {
            return std::nullopt;
        }
        return std::string_view(*uri_);
    }

    // ========== Builders ==========

    StackError with_err_code(ErrorCode code) &&;
    StackError with_no_err_code() &&;
    StackError with_err_uri(std::string uri) &&;
    StackError with_no_err_uri() &&;

    /// Replace the message of the top node
    template<typename M>
    StackError with_err_msg(M&& message) && {
        message_ = detail::make_payload(std::forward<M>(message));
        return std::move(*this);
    }

    StackError with_no_err_msg() &&;

    // ========== Stacking ==========

    /**
     * @brief Push a node without a message on top of this chain
     *
     * The new node inherits this node's code and URI.
     */
    StackError stack_err() &&;

    /**
     * @brief Push a node carrying @p message on top of this chain
     *
     * The new node inherits this node's code and URI.
     */
    template<typename M>
    StackError stack_err(M&& message) && {
        return std::move(*this).push(detail::make_payload(std::forward<M>(message)));
    }

    // ========== Introspection ==========

    /// Immediate predecessor, nullptr at the root
    const StackError* cause() const noexcept { return cause_.get(); }

    bool has_message() const noexcept { return message_ != nullptr; }

    /// Number of nodes in the chain, this one included
    size_t depth() const noexcept;

    /// Message of the top node only, empty when it has none
    std::string message_string() const;

    /// One rendered message per node, root first
    std::vector<std::string> messages() const;

    /// Whole chain, root first, one message per line
    std::string to_string() const;

    friend std::ostream& operator<<(std::ostream& os, const StackError& error);

private:
    StackError push(std::unique_ptr<const detail::MessagePayload> message) &&;
    void render_message(std::ostream& os) const;

    std::unique_ptr<const detail::MessagePayload> message_;
    std::unique_ptr<StackError> cause_;
    std::optional<ErrorCode> code_;
    std::optional<std::string> uri_;
};

STACKERROR_API std::ostream& operator<<(std::ostream& os, const StackError& error);

}  // namespace stackerror
