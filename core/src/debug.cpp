#include <stackerror/debug.hpp>

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <iostream>

namespace stackerror::debug {

namespace {

constexpr std::string_view LEVEL_NAMES[] = {"TRACE", "DEBUG", "INFO", "WARN",
                                            "ERROR", "FATAL", "OFF"};

struct LevelAlias {
    std::string_view name;
    LogLevel level;
};

constexpr LevelAlias LEVEL_ALIASES[] = {
    {"WARNING", LogLevel::WARN},
    {"ERR", LogLevel::ERROR},
    {"CRITICAL", LogLevel::FATAL},
    {"NONE", LogLevel::OFF},
};

bool equals_ignore_case(std::string_view text, std::string_view upper) noexcept {
    if (text.size() != upper.size()) {
        return false;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(text[i])) != upper[i]) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            return lines;
        }
        lines.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
}

std::tm to_local_time(std::time_t time) {
    std::tm result{};
#if defined(STACKERROR_OS_WINDOWS)
    localtime_s(&result, &time);
#else
    localtime_r(&time, &result);
#endif
    return result;
}

}  // anonymous namespace

// ============================================================================
// Levels
// ============================================================================

std::string_view level_name(LogLevel level) noexcept {
    auto index = static_cast<size_t>(level);
    return index < std::size(LEVEL_NAMES) ? LEVEL_NAMES[index] : "UNKNOWN";
}

char level_char(LogLevel level) noexcept {
    return level < LogLevel::OFF ? LEVEL_NAMES[static_cast<size_t>(level)][0] : '?';
}

bool try_parse_log_level(std::string_view name, LogLevel& out) noexcept {
    for (size_t i = 0; i < std::size(LEVEL_NAMES); ++i) {
        if (equals_ignore_case(name, LEVEL_NAMES[i])) {
            out = static_cast<LogLevel>(i);
            return true;
        }
    }
    for (const auto& alias : LEVEL_ALIASES) {
        if (equals_ignore_case(name, alias.name)) {
            out = alias.level;
            return true;
        }
    }
    return false;
}

LogLevel parse_log_level(std::string_view name) noexcept {
    LogLevel level = LogLevel::INFO;
    try_parse_log_level(name, level);
    return level;
}

// ============================================================================
// LogRecord
// ============================================================================

std::string LogRecord::text() const {
    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += lines[i];
    }
    return joined;
}

// ============================================================================
// StreamSink
// ============================================================================

void StreamSink::write(const LogRecord& record) {
    if (options_.include_timestamp) {
        auto time = std::chrono::system_clock::to_time_t(record.timestamp);
        auto ms   = std::chrono::duration_cast<std::chrono::milliseconds>(
                      record.timestamp.time_since_epoch()) %
                  1000;
        auto local = to_local_time(time);
        out_ << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
             << std::setw(3) << ms.count() << std::setfill(' ') << ' ';
    }

    out_ << '[' << level_char(record.level) << "] ";
    if (!record.category.empty()) {
        out_ << '[' << record.category << "] ";
    }

    for (size_t i = 0; i < record.lines.size(); ++i) {
        if (i > 0) {
            out_ << "\n    ";
        }
        out_ << record.lines[i];
    }

    if (options_.include_location && record.location.is_valid()) {
        out_ << " (" << record.location.file << ':' << record.location.line << ')';
    }
    out_ << '\n';
}

void StreamSink::flush() {
    out_.flush();
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() noexcept {
    static Logger logger;
    return logger;
}

Logger::Logger() : sink_(std::make_shared<StreamSink>(std::cerr)) {}

std::shared_ptr<ILogSink> Logger::set_sink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_.swap(sink);
    return sink;
}

void Logger::log(LogLevel level, std::string_view category, std::string_view text,
                 SourceLocation loc) {
    if (!is_enabled(level)) {
        return;
    }
    log_lines(level, category, split_lines(text), loc);
}

void Logger::log_lines(LogLevel level, std::string_view category, std::vector<std::string> lines,
                       SourceLocation loc) {
    if (!is_enabled(level)) {
        return;
    }

    LogRecord record;
    record.level     = level;
    record.category  = std::string(category);
    record.lines     = std::move(lines);
    record.location  = loc;
    record.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_->write(record);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_->flush();
    }
}

// ============================================================================
// Initialization
// ============================================================================

void init_logging(LogLevel level) {
    if (const char* env = std::getenv("STACKERROR_LOG_LEVEL")) {
        try_parse_log_level(env, level);
    }
    Logger::instance().set_level(level);
}

void shutdown_logging() {
    Logger::instance().flush();
    Logger::instance().set_sink(nullptr);
}

}  // namespace stackerror::debug
