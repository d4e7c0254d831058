#include <stackerror/error_code.hpp>

#include <array>
#include <iomanip>
#include <ostream>

namespace stackerror {

namespace {

struct HttpMapping {
    ErrorCode code;
    uint16_t status;
};

constexpr std::array<HttpMapping, 40> HTTP_TABLE = {{
    {ErrorCode::HTTP_BAD_REQUEST, 400},
    {ErrorCode::HTTP_UNAUTHORIZED, 401},
    {ErrorCode::HTTP_PAYMENT_REQUIRED, 402},
    {ErrorCode::HTTP_FORBIDDEN, 403},
    {ErrorCode::HTTP_NOT_FOUND, 404},
    {ErrorCode::HTTP_METHOD_NOT_ALLOWED, 405},
    {ErrorCode::HTTP_NOT_ACCEPTABLE, 406},
    {ErrorCode::HTTP_PROXY_AUTHENTICATION_REQUIRED, 407},
    {ErrorCode::HTTP_REQUEST_TIMEOUT, 408},
    {ErrorCode::HTTP_CONFLICT, 409},
    {ErrorCode::HTTP_GONE, 410},
    {ErrorCode::HTTP_LENGTH_REQUIRED, 411},
    {ErrorCode::HTTP_PRECONDITION_FAILED, 412},
    {ErrorCode::HTTP_PAYLOAD_TOO_LARGE, 413},
    {ErrorCode::HTTP_URI_TOO_LONG, 414},
    {ErrorCode::HTTP_UNSUPPORTED_MEDIA_TYPE, 415},
    {ErrorCode::HTTP_RANGE_NOT_SATISFIABLE, 416},
    {ErrorCode::HTTP_EXPECTATION_FAILED, 417},
    {ErrorCode::HTTP_IM_A_TEAPOT, 418},
    {ErrorCode::HTTP_MISDIRECTED_REQUEST, 421},
    {ErrorCode::HTTP_UNPROCESSABLE_ENTITY, 422},
    {ErrorCode::HTTP_LOCKED, 423},
    {ErrorCode::HTTP_FAILED_DEPENDENCY, 424},
    {ErrorCode::HTTP_TOO_EARLY, 425},
    {ErrorCode::HTTP_UPGRADE_REQUIRED, 426},
    {ErrorCode::HTTP_PRECONDITION_REQUIRED, 428},
    {ErrorCode::HTTP_TOO_MANY_REQUESTS, 429},
    {ErrorCode::HTTP_REQUEST_HEADER_FIELDS_TOO_LARGE, 431},
    {ErrorCode::HTTP_UNAVAILABLE_FOR_LEGAL_REASONS, 451},
    {ErrorCode::HTTP_INTERNAL_SERVER_ERROR, 500},
    {ErrorCode::HTTP_NOT_IMPLEMENTED, 501},
    {ErrorCode::HTTP_BAD_GATEWAY, 502},
    {ErrorCode::HTTP_SERVICE_UNAVAILABLE, 503},
    {ErrorCode::HTTP_GATEWAY_TIMEOUT, 504},
    {ErrorCode::HTTP_VERSION_NOT_SUPPORTED, 505},
    {ErrorCode::HTTP_VARIANT_ALSO_NEGOTIATES, 506},
    {ErrorCode::HTTP_INSUFFICIENT_STORAGE, 507},
    {ErrorCode::HTTP_LOOP_DETECTED, 508},
    {ErrorCode::HTTP_NOT_EXTENDED, 510},
    {ErrorCode::HTTP_NETWORK_AUTHENTICATION_REQUIRED, 511},
}};

struct ErrcMapping {
    ErrorCode code;
    std::errc condition;
};

// One condition per code. Aliased errno values (EAGAIN/EWOULDBLOCK,
// ENOTSUP/EOPNOTSUPP on Linux) compare equal and land on the same entry.
constexpr std::array<ErrcMapping, 27> ERRC_TABLE = {{
    {ErrorCode::IO_NOT_FOUND, std::errc::no_such_file_or_directory},
    {ErrorCode::IO_PERMISSION_DENIED, std::errc::permission_denied},
    {ErrorCode::IO_CONNECTION_REFUSED, std::errc::connection_refused},
    {ErrorCode::IO_CONNECTION_RESET, std::errc::connection_reset},
    {ErrorCode::IO_CONNECTION_ABORTED, std::errc::connection_aborted},
    {ErrorCode::IO_NOT_CONNECTED, std::errc::not_connected},
    {ErrorCode::IO_ADDR_IN_USE, std::errc::address_in_use},
    {ErrorCode::IO_ADDR_NOT_AVAILABLE, std::errc::address_not_available},
    {ErrorCode::IO_BROKEN_PIPE, std::errc::broken_pipe},
    {ErrorCode::IO_ALREADY_EXISTS, std::errc::file_exists},
    {ErrorCode::IO_WOULD_BLOCK, std::errc::operation_would_block},
    {ErrorCode::IO_INVALID_INPUT, std::errc::invalid_argument},
    {ErrorCode::IO_INVALID_DATA, std::errc::bad_message},
    {ErrorCode::IO_TIMED_OUT, std::errc::timed_out},
    {ErrorCode::IO_INTERRUPTED, std::errc::interrupted},
    {ErrorCode::IO_UNSUPPORTED, std::errc::not_supported},
    {ErrorCode::IO_OUT_OF_MEMORY, std::errc::not_enough_memory},
    {ErrorCode::IO_HOST_UNREACHABLE, std::errc::host_unreachable},
    {ErrorCode::IO_NETWORK_UNREACHABLE, std::errc::network_unreachable},
    {ErrorCode::IO_NETWORK_DOWN, std::errc::network_down},
    {ErrorCode::IO_STORAGE_FULL, std::errc::no_space_on_device},
    {ErrorCode::IO_READ_ONLY_FILESYSTEM, std::errc::read_only_file_system},
    {ErrorCode::IO_IS_A_DIRECTORY, std::errc::is_a_directory},
    {ErrorCode::IO_NOT_A_DIRECTORY, std::errc::not_a_directory},
    {ErrorCode::IO_DIRECTORY_NOT_EMPTY, std::errc::directory_not_empty},
    {ErrorCode::IO_TOO_MANY_OPEN_FILES, std::errc::too_many_files_open},
    {ErrorCode::IO_FILE_TOO_LARGE, std::errc::file_too_large},
}};

}  // namespace

// ============================================================================
// Names
// ============================================================================

std::string_view error_name(ErrorCode code) noexcept {
    switch (code) {
        // Runtime
        case ErrorCode::RUNTIME_INVALID_VALUE:   return "RUNTIME_INVALID_VALUE";
        case ErrorCode::RUNTIME_INVALID_INDEX:   return "RUNTIME_INVALID_INDEX";
        case ErrorCode::RUNTIME_INVALID_KEY:     return "RUNTIME_INVALID_KEY";
        case ErrorCode::RUNTIME_NOT_IMPLEMENTED: return "RUNTIME_NOT_IMPLEMENTED";

        // HTTP 4xx
        case ErrorCode::HTTP_BAD_REQUEST:                     return "HTTP_BAD_REQUEST";
        case ErrorCode::HTTP_UNAUTHORIZED:                    return "HTTP_UNAUTHORIZED";
        case ErrorCode::HTTP_PAYMENT_REQUIRED:                return "HTTP_PAYMENT_REQUIRED";
        case ErrorCode::HTTP_FORBIDDEN:                       return "HTTP_FORBIDDEN";
        case ErrorCode::HTTP_NOT_FOUND:                       return "HTTP_NOT_FOUND";
        case ErrorCode::HTTP_METHOD_NOT_ALLOWED:              return "HTTP_METHOD_NOT_ALLOWED";
        case ErrorCode::HTTP_NOT_ACCEPTABLE:                  return "HTTP_NOT_ACCEPTABLE";
        case ErrorCode::HTTP_PROXY_AUTHENTICATION_REQUIRED:   return "HTTP_PROXY_AUTHENTICATION_REQUIRED";
        case ErrorCode::HTTP_REQUEST_TIMEOUT:                 return "HTTP_REQUEST_TIMEOUT";
        case ErrorCode::HTTP_CONFLICT:                        return "HTTP_CONFLICT";
        case ErrorCode::HTTP_GONE:                            return "HTTP_GONE";
        case ErrorCode::HTTP_LENGTH_REQUIRED:                 return "HTTP_LENGTH_REQUIRED";
        case ErrorCode::HTTP_PRECONDITION_FAILED:             return "HTTP_PRECONDITION_FAILED";
        case ErrorCode::HTTP_PAYLOAD_TOO_LARGE:               return "HTTP_PAYLOAD_TOO_LARGE";
        case ErrorCode::HTTP_URI_TOO_LONG:                    return "HTTP_URI_TOO_LONG";
        case ErrorCode::HTTP_UNSUPPORTED_MEDIA_TYPE:          return "HTTP_UNSUPPORTED_MEDIA_TYPE";
        case ErrorCode::HTTP_RANGE_NOT_SATISFIABLE:           return "HTTP_RANGE_NOT_SATISFIABLE";
        case ErrorCode::HTTP_EXPECTATION_FAILED:              return "HTTP_EXPECTATION_FAILED";
        case ErrorCode::HTTP_IM_A_TEAPOT:                     return "HTTP_IM_A_TEAPOT";
        case ErrorCode::HTTP_MISDIRECTED_REQUEST:             return "HTTP_MISDIRECTED_REQUEST";
        case ErrorCode::HTTP_UNPROCESSABLE_ENTITY:            return "HTTP_UNPROCESSABLE_ENTITY";
        case ErrorCode::HTTP_LOCKED:                          return "HTTP_LOCKED";
        case ErrorCode::HTTP_FAILED_DEPENDENCY:               return "HTTP_FAILED_DEPENDENCY";
        case ErrorCode::HTTP_TOO_EARLY:                       return "HTTP_TOO_EARLY";
        case ErrorCode::HTTP_UPGRADE_REQUIRED:                return "HTTP_UPGRADE_REQUIRED";
        case ErrorCode::HTTP_PRECONDITION_REQUIRED:           return "HTTP_PRECONDITION_REQUIRED";
        case ErrorCode::HTTP_TOO_MANY_REQUESTS:               return "HTTP_TOO_MANY_REQUESTS";
        case ErrorCode::HTTP_REQUEST_HEADER_FIELDS_TOO_LARGE: return "HTTP_REQUEST_HEADER_FIELDS_TOO_LARGE";
        case ErrorCode::HTTP_UNAVAILABLE_FOR_LEGAL_REASONS:   return "HTTP_UNAVAILABLE_FOR_LEGAL_REASONS";

        // HTTP 5xx
        case ErrorCode::HTTP_INTERNAL_SERVER_ERROR:           return "HTTP_INTERNAL_SERVER_ERROR";
        case ErrorCode::HTTP_NOT_IMPLEMENTED:                 return "HTTP_NOT_IMPLEMENTED";
        case ErrorCode::HTTP_BAD_GATEWAY:                     return "HTTP_BAD_GATEWAY";
        case ErrorCode::HTTP_SERVICE_UNAVAILABLE:             return "HTTP_SERVICE_UNAVAILABLE";
        case ErrorCode::HTTP_GATEWAY_TIMEOUT:                 return "HTTP_GATEWAY_TIMEOUT";
        case ErrorCode::HTTP_VERSION_NOT_SUPPORTED:           return "HTTP_VERSION_NOT_SUPPORTED";
        case ErrorCode::HTTP_VARIANT_ALSO_NEGOTIATES:         return "HTTP_VARIANT_ALSO_NEGOTIATES";
        case ErrorCode::HTTP_INSUFFICIENT_STORAGE:            return "HTTP_INSUFFICIENT_STORAGE";
        case ErrorCode::HTTP_LOOP_DETECTED:                   return "HTTP_LOOP_DETECTED";
        case ErrorCode::HTTP_NOT_EXTENDED:                    return "HTTP_NOT_EXTENDED";
        case ErrorCode::HTTP_NETWORK_AUTHENTICATION_REQUIRED: return "HTTP_NETWORK_AUTHENTICATION_REQUIRED";

        // I/O
        case ErrorCode::IO_NOT_FOUND:            return "IO_NOT_FOUND";
        case ErrorCode::IO_PERMISSION_DENIED:    return "IO_PERMISSION_DENIED";
        case ErrorCode::IO_CONNECTION_REFUSED:   return "IO_CONNECTION_REFUSED";
        case ErrorCode::IO_CONNECTION_RESET:     return "IO_CONNECTION_RESET";
        case ErrorCode::IO_CONNECTION_ABORTED:   return "IO_CONNECTION_ABORTED";
        case ErrorCode::IO_NOT_CONNECTED:        return "IO_NOT_CONNECTED";
        case ErrorCode::IO_ADDR_IN_USE:          return "IO_ADDR_IN_USE";
        case ErrorCode::IO_ADDR_NOT_AVAILABLE:   return "IO_ADDR_NOT_AVAILABLE";
        case ErrorCode::IO_BROKEN_PIPE:          return "IO_BROKEN_PIPE";
        case ErrorCode::IO_ALREADY_EXISTS:       return "IO_ALREADY_EXISTS";
        case ErrorCode::IO_WOULD_BLOCK:          return "IO_WOULD_BLOCK";
        case ErrorCode::IO_INVALID_INPUT:        return "IO_INVALID_INPUT";
        case ErrorCode::IO_INVALID_DATA:         return "IO_INVALID_DATA";
        case ErrorCode::IO_TIMED_OUT:            return "IO_TIMED_OUT";
        case ErrorCode::IO_INTERRUPTED:          return "IO_INTERRUPTED";
        case ErrorCode::IO_UNSUPPORTED:          return "IO_UNSUPPORTED";
        case ErrorCode::IO_OUT_OF_MEMORY:        return "IO_OUT_OF_MEMORY";
        case ErrorCode::IO_HOST_UNREACHABLE:     return "IO_HOST_UNREACHABLE";
        case ErrorCode::IO_NETWORK_UNREACHABLE:  return "IO_NETWORK_UNREACHABLE";
        case ErrorCode::IO_NETWORK_DOWN:         return "IO_NETWORK_DOWN";
        case ErrorCode::IO_STORAGE_FULL:         return "IO_STORAGE_FULL";
        case ErrorCode::IO_READ_ONLY_FILESYSTEM: return "IO_READ_ONLY_FILESYSTEM";
        case ErrorCode::IO_IS_A_DIRECTORY:       return "IO_IS_A_DIRECTORY";
        case ErrorCode::IO_NOT_A_DIRECTORY:      return "IO_NOT_A_DIRECTORY";
        case ErrorCode::IO_DIRECTORY_NOT_EMPTY:  return "IO_DIRECTORY_NOT_EMPTY";
        case ErrorCode::IO_TOO_MANY_OPEN_FILES:  return "IO_TOO_MANY_OPEN_FILES";
        case ErrorCode::IO_FILE_TOO_LARGE:       return "IO_FILE_TOO_LARGE";

        default: return "UNKNOWN_ERROR";
    }
}

std::ostream& operator<<(std::ostream& os, ErrorCode code) {
    return os << error_name(code);
}

// ============================================================================
// HTTP Mapping
// ============================================================================

std::optional<ErrorCode> code_from_http(uint16_t status) noexcept {
    for (const auto& entry : HTTP_TABLE) {
        if (entry.status == status) {
            return entry.code;
        }
    }
    return std::nullopt;
}

std::optional<uint16_t> code_to_http(ErrorCode code) noexcept {
    if (get_category(code) != ErrorCategory::HTTP) {
        return std::nullopt;
    }
    for (const auto& entry : HTTP_TABLE) {
        if (entry.code == code) {
            return entry.status;
        }
    }
    return std::nullopt;
}

std::string_view http_reason_phrase(uint16_t status) noexcept {
    switch (status) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 102: return "Processing";
        case 103: return "Early Hints";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 203: return "Non Authoritative Information";
        case 204: return "No Content";
        case 205: return "Reset Content";
        case 206: return "Partial Content";
        case 207: return "Multi-Status";
        case 208: return "Already Reported";
        case 226: return "IM Used";
        case 300: return "Multiple Choices";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 305: return "Use Proxy";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 402: return "Payment Required";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 406: return "Not Acceptable";
        case 407: return "Proxy Authentication Required";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 411: return "Length Required";
        case 412: return "Precondition Failed";
        case 413: return "Payload Too Large";
        case 414: return "URI Too Long";
        case 415: return "Unsupported Media Type";
        case 416: return "Range Not Satisfiable";
        case 417: return "Expectation Failed";
        case 418: return "I'm a teapot";
        case 421: return "Misdirected Request";
        case 422: return "Unprocessable Entity";
        case 423: return "Locked";
        case 424: return "Failed Dependency";
        case 425: return "Too Early";
        case 426: return "Upgrade Required";
        case 428: return "Precondition Required";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 451: return "Unavailable For Legal Reasons";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
        case 506: return "Variant Also Negotiates";
        case 507: return "Insufficient Storage";
        case 508: return "Loop Detected";
        case 510: return "Not Extended";
        case 511: return "Network Authentication Required";
        default:  return {};
    }
}

// ============================================================================
// I/O Mapping
// ============================================================================

std::optional<ErrorCode> code_from_errc(std::errc condition) noexcept {
    for (const auto& entry : ERRC_TABLE) {
        if (entry.condition == condition) {
            return entry.code;
        }
    }
    return std::nullopt;
}

std::optional<std::errc> code_to_errc(ErrorCode code) noexcept {
    if (get_category(code) != ErrorCategory::IO) {
        return std::nullopt;
    }
    for (const auto& entry : ERRC_TABLE) {
        if (entry.code == code) {
            return entry.condition;
        }
    }
    return std::nullopt;
}

std::optional<ErrorCode> code_from_error_code(const std::error_code& ec) noexcept {
    if (!ec) {
        return std::nullopt;
    }
    const std::error_condition condition = ec.default_error_condition();
    if (condition.category() != std::generic_category()) {
        return std::nullopt;
    }
    return code_from_errc(static_cast<std::errc>(condition.value()));
}

}  // namespace stackerror
