#pragma once

/**
 * @file debug.hpp
 * @brief Diagnostics output for rendered error chains
 *
 * The Logger carries records whose body is a list of lines. A chain passed
 * through report() arrives as one line per node, root first, followed by
 * its code and URI lines; a plain message is split on '\n'. One minimum
 * level gates everything and one sink receives what passes.
 *
 * @code
 * debug::Logger::instance().set_sink(
 *     std::make_shared<debug::StreamSink>(std::clog));
 * report(load_manifest(path).error());
 * // [E] [error] manifest.yaml: no such file
 * //     while loading plugins (main.cpp:40)
 * @endcode
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "message.hpp"
#include "platform.hpp"

namespace stackerror::debug {

// ============================================================================
// LOG LEVELS
// ============================================================================

enum class LogLevel : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6  // Threshold only; records never carry it
};

STACKERROR_API std::string_view level_name(LogLevel level) noexcept;

/// Single-letter tag used in line prefixes, '?' for OFF
STACKERROR_API char level_char(LogLevel level) noexcept;

/**
 * @brief Parse a level name, rejecting unknown names
 *
 * Case-insensitive. Accepts WARNING, ERR, CRITICAL and NONE as aliases.
 * @p out is left untouched on failure.
 */
STACKERROR_API bool try_parse_log_level(std::string_view name, LogLevel& out) noexcept;

/// Lenient form of try_parse_log_level; unknown names give INFO
STACKERROR_API LogLevel parse_log_level(std::string_view name) noexcept;

namespace category {
constexpr std::string_view GENERAL = "general";
constexpr std::string_view REPORT  = "error";
constexpr std::string_view CONFIG  = "config";
}  // namespace category

// ============================================================================
// RECORDS AND SINKS
// ============================================================================

struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::string category;
    std::vector<std::string> lines;
    SourceLocation location;
    std::chrono::system_clock::time_point timestamp;

    /// Lines joined with '\n'
    std::string text() const;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Writes records to a std::ostream
 *
 * The first line gets the "[L] [category] " prefix, every following line is
 * indented by four spaces so a chain reads as one block. The location, when
 * enabled and known, closes the last line.
 */
class STACKERROR_API StreamSink : public ILogSink {
public:
    struct Options {
        bool include_timestamp = false;
        bool include_location  = true;
    };

    explicit StreamSink(std::ostream& out) : out_(out) {}
    StreamSink(std::ostream& out, Options options) : out_(out), options_(options) {}

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ostream& out_;
    Options options_;
};

// ============================================================================
// LOGGER
// ============================================================================

/**
 * @brief Process-wide dispatch point for diagnostics
 *
 * Starts at INFO with a StreamSink on std::cerr. Sink replacement and
 * writes are serialized.
 */
class STACKERROR_API Logger {
public:
    static Logger& instance() noexcept;

    void set_level(LogLevel level) noexcept { level_.store(level, std::memory_order_relaxed); }
    LogLevel level() const noexcept { return level_.load(std::memory_order_relaxed); }

    bool is_enabled(LogLevel level) const noexcept {
        return level != LogLevel::OFF && level >= this->level();
    }

    /**
     * @brief Replace the sink, returning the previous one
     *
     * A null sink discards every record.
     */
    std::shared_ptr<ILogSink> set_sink(std::shared_ptr<ILogSink> sink);

    /// Log text, split into lines on '\n'
    void log(LogLevel level, std::string_view category, std::string_view text,
             SourceLocation loc = STACKERROR_CALLER_LOCATION);

    void log_lines(LogLevel level, std::string_view category, std::vector<std::string> lines,
                   SourceLocation loc = STACKERROR_CALLER_LOCATION);

    void flush();

private:
    Logger();

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::mutex mutex_;
    std::shared_ptr<ILogSink> sink_;
};

// ============================================================================
// LOGGING MACROS
// ============================================================================

#define STACKERROR_LOG_ENABLED(level) \
    ::stackerror::debug::Logger::instance().is_enabled(::stackerror::debug::LogLevel::level)

// The stream expression is only evaluated when the level is enabled
#define STACKERROR_LOG_IMPL(level, category, ...)                                           \
    do {                                                                                    \
        if (STACKERROR_LOG_ENABLED(level)) {                                                \
            std::ostringstream _stackerror_log_oss;                                         \
            _stackerror_log_oss << __VA_ARGS__;                                             \
            ::stackerror::debug::Logger::instance().log(                                    \
                ::stackerror::debug::LogLevel::level, category, _stackerror_log_oss.str(),  \
                STACKERROR_CURRENT_LOCATION);                                               \
        }                                                                                   \
    } while (0)

#define STACKERROR_LOG_TRACE(cat, ...) STACKERROR_LOG_IMPL(TRACE, cat, __VA_ARGS__)
#define STACKERROR_LOG_DEBUG(cat, ...) STACKERROR_LOG_IMPL(DEBUG, cat, __VA_ARGS__)
#define STACKERROR_LOG_INFO(cat, ...)  STACKERROR_LOG_IMPL(INFO, cat, __VA_ARGS__)
#define STACKERROR_LOG_WARN(cat, ...)  STACKERROR_LOG_IMPL(WARN, cat, __VA_ARGS__)
#define STACKERROR_LOG_ERROR(cat, ...) STACKERROR_LOG_IMPL(ERROR, cat, __VA_ARGS__)
#define STACKERROR_LOG_FATAL(cat, ...) STACKERROR_LOG_IMPL(FATAL, cat, __VA_ARGS__)

// ============================================================================
// INITIALIZATION
// ============================================================================

/**
 * @brief Set the minimum level
 *
 * A valid level name in STACKERROR_LOG_LEVEL takes precedence over @p level.
 */
STACKERROR_API void init_logging(LogLevel level = LogLevel::INFO);

/// Flush and detach the sink; later records are discarded
STACKERROR_API void shutdown_logging();

}  // namespace stackerror::debug
