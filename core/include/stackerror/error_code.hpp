#pragma once

/**
 * @file error_code.hpp
 * @brief Closed classification table for stackerror
 *
 * This header provides:
 * - ErrorCode, the closed set of classification codes carried by a chain
 * - ErrorCategory, derived from the high byte of each code
 * - Partial one-to-one mappings to HTTP status values and std::errc
 *
 * Codes outside a mapped subset yield std::nullopt, never a guessed value.
 */

#include "platform.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <system_error>

namespace stackerror {

// ============================================================================
// ERROR CATEGORY SYSTEM
// ============================================================================

/**
 * @brief Categories for classification codes
 *
 * - 0x00xx: Runtime errors raised by application code
 * - 0x01xx: HTTP 4xx/5xx statuses
 * - 0x02xx: Platform I/O errors
 */
enum class ErrorCategory : uint8_t {
    RUNTIME = 0x00,
    HTTP    = 0x01,
    IO      = 0x02,
};

/**
 * @brief Get category name as string
 */
constexpr std::string_view category_name(ErrorCategory cat) noexcept {
    switch (cat) {
        case ErrorCategory::RUNTIME: return "Runtime";
        case ErrorCategory::HTTP:    return "HTTP";
        case ErrorCategory::IO:      return "I/O";
        default:                     return "Unknown";
    }
}

// ============================================================================
// ERROR CODE DEFINITIONS
// ============================================================================

/**
 * @brief Classification codes
 *
 * Format: 0xCCEE where CC = category, EE = specific error
 */
enum class ErrorCode : uint32_t {
    // ========== Runtime (0x00xx) ==========
    RUNTIME_INVALID_VALUE   = 0x0001,
    RUNTIME_INVALID_INDEX   = 0x0002,
    RUNTIME_INVALID_KEY     = 0x0003,
    RUNTIME_NOT_IMPLEMENTED = 0x0004,

    // ========== HTTP 4xx (0x01xx) ==========
    HTTP_BAD_REQUEST                     = 0x0100,
    HTTP_UNAUTHORIZED                    = 0x0101,
    HTTP_PAYMENT_REQUIRED                = 0x0102,
    HTTP_FORBIDDEN                       = 0x0103,
    HTTP_NOT_FOUND                       = 0x0104,
    HTTP_METHOD_NOT_ALLOWED              = 0x0105,
    HTTP_NOT_ACCEPTABLE                  = 0x0106,
    HTTP_PROXY_AUTHENTICATION_REQUIRED   = 0x0107,
    HTTP_REQUEST_TIMEOUT                 = 0x0108,
    HTTP_CONFLICT                        = 0x0109,
    HTTP_GONE                            = 0x010A,
    HTTP_LENGTH_REQUIRED                 = 0x010B,
    HTTP_PRECONDITION_FAILED             = 0x010C,
    HTTP_PAYLOAD_TOO_LARGE               = 0x010D,
    HTTP_URI_TOO_LONG                    = 0x010E,
    HTTP_UNSUPPORTED_MEDIA_TYPE          = 0x010F,
    HTTP_RANGE_NOT_SATISFIABLE           = 0x0110,
    HTTP_EXPECTATION_FAILED              = 0x0111,
    HTTP_IM_A_TEAPOT                     = 0x0112,
    HTTP_MISDIRECTED_REQUEST             = 0x0113,
    HTTP_UNPROCESSABLE_ENTITY            = 0x0114,
    HTTP_LOCKED                          = 0x0115,
    HTTP_FAILED_DEPENDENCY               = 0x0116,
    HTTP_TOO_EARLY                       = 0x0117,
    HTTP_UPGRADE_REQUIRED                = 0x0118,
    HTTP_PRECONDITION_REQUIRED           = 0x0119,
    HTTP_TOO_MANY_REQUESTS               = 0x011A,
    HTTP_REQUEST_HEADER_FIELDS_TOO_LARGE = 0x011B,
    HTTP_UNAVAILABLE_FOR_LEGAL_REASONS   = 0x011C,

    // ========== HTTP 5xx (0x01xx) ==========
    HTTP_INTERNAL_SERVER_ERROR           = 0x0140,
    HTTP_NOT_IMPLEMENTED                 = 0x0141,
    HTTP_BAD_GATEWAY                     = 0x0142,
    HTTP_SERVICE_UNAVAILABLE             = 0x0143,
    HTTP_GATEWAY_TIMEOUT                 = 0x0144,
    HTTP_VERSION_NOT_SUPPORTED           = 0x0145,
    HTTP_VARIANT_ALSO_NEGOTIATES         = 0x0146,
    HTTP_INSUFFICIENT_STORAGE            = 0x0147,
    HTTP_LOOP_DETECTED                   = 0x0148,
    HTTP_NOT_EXTENDED                    = 0x0149,
    HTTP_NETWORK_AUTHENTICATION_REQUIRED = 0x014A,

    // ========== I/O (0x02xx) ==========
    IO_NOT_FOUND            = 0x0200,
    IO_PERMISSION_DENIED    = 0x0201,
    IO_CONNECTION_REFUSED   = 0x0202,
    IO_CONNECTION_RESET     = 0x0203,
    IO_CONNECTION_ABORTED   = 0x0204,
    IO_NOT_CONNECTED        = 0x0205,
    IO_ADDR_IN_USE          = 0x0206,
    IO_ADDR_NOT_AVAILABLE   = 0x0207,
    IO_BROKEN_PIPE          = 0x0208,
    IO_ALREADY_EXISTS       = 0x0209,
    IO_WOULD_BLOCK          = 0x020A,
    IO_INVALID_INPUT        = 0x020B,
    IO_INVALID_DATA         = 0x020C,
    IO_TIMED_OUT            = 0x020D,
    IO_INTERRUPTED          = 0x020E,
    IO_UNSUPPORTED          = 0x020F,
    IO_OUT_OF_MEMORY        = 0x0210,
    IO_HOST_UNREACHABLE     = 0x0211,
    IO_NETWORK_UNREACHABLE  = 0x0212,
    IO_NETWORK_DOWN         = 0x0213,
    IO_STORAGE_FULL         = 0x0214,
    IO_READ_ONLY_FILESYSTEM = 0x0215,
    IO_IS_A_DIRECTORY       = 0x0216,
    IO_NOT_A_DIRECTORY      = 0x0217,
    IO_DIRECTORY_NOT_EMPTY  = 0x0218,
    IO_TOO_MANY_OPEN_FILES  = 0x0219,
    IO_FILE_TOO_LARGE       = 0x021A,
};

/**
 * @brief Get category from error code
 */
constexpr ErrorCategory get_category(ErrorCode code) noexcept {
    return static_cast<ErrorCategory>((static_cast<uint32_t>(code) >> 8) & 0xFF);
}

/**
 * @brief Get human-readable error name, e.g. "HTTP_NOT_FOUND"
 */
STACKERROR_API std::string_view error_name(ErrorCode code) noexcept;

STACKERROR_API std::ostream& operator<<(std::ostream& os, ErrorCode code);

// ============================================================================
// EXTERNAL MAPPINGS
// ============================================================================

/**
 * @brief Map an HTTP status value to its code
 * @return std::nullopt for statuses outside the table (1xx-3xx included)
 */
STACKERROR_API std::optional<ErrorCode> code_from_http(uint16_t status) noexcept;

/**
 * @brief Map a code back to its HTTP status value
 * @return std::nullopt for non-HTTP codes
 */
STACKERROR_API std::optional<uint16_t> code_to_http(ErrorCode code) noexcept;

/**
 * @brief Map a portable I/O error condition to its code
 */
STACKERROR_API std::optional<ErrorCode> code_from_errc(std::errc condition) noexcept;

/**
 * @brief Map a code back to its portable I/O error condition
 */
STACKERROR_API std::optional<std::errc> code_to_errc(ErrorCode code) noexcept;

/**
 * @brief Map any std::error_code whose default condition is a generic
 *        (errno) condition, e.g. system_category errors on POSIX
 */
STACKERROR_API std::optional<ErrorCode> code_from_error_code(const std::error_code& ec) noexcept;

/**
 * @brief Canonical reason phrase for an HTTP status
 * @return Empty view for unknown statuses
 */
STACKERROR_API std::string_view http_reason_phrase(uint16_t status) noexcept;

}  // namespace stackerror
