#pragma once

/**
 * @file message.hpp
 * @brief Source location capture and location-prefixed messages
 *
 * STACKERROR_MSG builds a message with operator<< (like the logging macros)
 * and prefixes it with the calling file and line:
 *
 *     return StackError::from_msg(STACKERROR_MSG("cannot open " << path));
 *     // "src/loader.cpp:42 cannot open /etc/app.yaml"
 */

#include "platform.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

#if defined(STACKERROR_HAS_SOURCE_LOCATION)
#include <source_location>
#endif

namespace stackerror {

// ============================================================================
// SOURCE LOCATION
// ============================================================================

/**
 * @brief Source location information for messages and log records
 */
struct SourceLocation {
    const char* file = "";
    const char* function = "";
    uint32_t line = 0;
    uint32_t column = 0;

    constexpr SourceLocation() noexcept = default;

    constexpr SourceLocation(const char* file_, const char* func_,
                            uint32_t line_, uint32_t col_ = 0) noexcept
        : file(file_), function(func_), line(line_), column(col_) {}

#if defined(STACKERROR_HAS_SOURCE_LOCATION)
    constexpr SourceLocation(const std::source_location& loc) noexcept
        : file(loc.file_name())
        , function(loc.function_name())
        , line(loc.line())
        , column(loc.column()) {}

    static constexpr SourceLocation current(
        const std::source_location& loc = std::source_location::current()) noexcept {
        return SourceLocation(loc);
    }
#else
    static constexpr SourceLocation current() noexcept {
        return SourceLocation();
    }
#endif

    constexpr bool is_valid() const noexcept {
        return line > 0 && file[0] != '\0';
    }
};

#if defined(STACKERROR_HAS_SOURCE_LOCATION)
    #define STACKERROR_CURRENT_LOCATION ::stackerror::SourceLocation::current()
#else
    #define STACKERROR_CURRENT_LOCATION ::stackerror::SourceLocation(__FILE__, __func__, __LINE__)
#endif

// Default argument form: resolves to the caller of the function it is declared on
#if defined(STACKERROR_HAS_SOURCE_LOCATION)
    #define STACKERROR_CALLER_LOCATION std::source_location::current()
#else
    #define STACKERROR_CALLER_LOCATION ::stackerror::SourceLocation()
#endif

// ============================================================================
// LOCATION-PREFIXED MESSAGES
// ============================================================================

/**
 * @brief Prefix a message with "<file>:<line> "
 *
 * An invalid location leaves the message unchanged.
 */
inline std::string format_with_location(const SourceLocation& loc, std::string_view message) {
    if (!loc.is_valid()) {
        return std::string(message);
    }
    std::string result(loc.file);
    result += ':';
    result += std::to_string(loc.line);
    result += ' ';
    result += message;
    return result;
}

}  // namespace stackerror

/**
 * @brief Build a location-prefixed message from a stream expression
 *
 * Usage: STACKERROR_MSG("key " << key << " missing")
 */
#define STACKERROR_MSG(...)                                                       \
    ::stackerror::format_with_location(                                           \
        ::stackerror::SourceLocation(__FILE__, __func__, __LINE__),               \
        [&]() {                                                                   \
            std::ostringstream _stackerror_oss;                                   \
            _stackerror_oss << __VA_ARGS__;                                       \
            return _stackerror_oss.str();                                         \
        }())
