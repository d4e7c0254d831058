#pragma once

/**
 * @file report.hpp
 * @brief Emitting rendered error chains at a boundary
 *
 * report() renders a chain together with its classification and sends it
 * through the debug Logger. The output shape comes from a ReportConfig,
 * which can be loaded from YAML:
 *
 * @code
 * report:
 *   level: warn
 *   category: http
 *   include_code: true
 *   include_uri: false
 *   numbered: true
 * @endcode
 */

#include "debug.hpp"
#include "error.hpp"
#include "message.hpp"
#include "result.hpp"
#include "stacks.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stackerror {

/**
 * @brief How a chain is rendered and logged by report()
 */
struct ReportConfig {
    debug::LogLevel level = debug::LogLevel::ERROR;
    std::string category  = std::string(debug::category::REPORT);
    bool include_code     = true;  // Append "code: <NAME>" when present
    bool include_uri      = true;  // Append "uri: <uri>" when present
    bool numbered         = false; // Prefix each message with "<index>: "
};

// ============================================================================
// CONFIGURATION LOADING
// ============================================================================

/**
 * @brief Parse a ReportConfig from YAML text
 *
 * Keys live under a top-level `report` mapping; missing keys keep their
 * defaults.
 *
 * @return RUNTIME_INVALID_VALUE for malformed YAML or wrongly typed values,
 *         RUNTIME_INVALID_KEY for an unknown level name
 */
STACKERROR_API Result<ReportConfig> parse_report_config(std::string_view yaml);

/**
 * @brief Load a ReportConfig from a YAML file
 *
 * @return IO_NOT_FOUND when the file does not exist, otherwise the
 *         errors of parse_report_config with the path stacked on top
 */
STACKERROR_API Result<ReportConfig> load_report_config(const std::filesystem::path& path);

// ============================================================================
// FORMATTING AND REPORTING
// ============================================================================

namespace detail {

/// Chain messages (optionally numbered) followed by code and URI lines
STACKERROR_API std::vector<std::string> report_lines(std::vector<std::string> messages,
                                                     std::optional<ErrorCode> code,
                                                     std::optional<std::string_view> uri,
                                                     const ReportConfig& config);

STACKERROR_API std::string join_lines(const std::vector<std::string>& lines);

}  // namespace detail

/**
 * @brief Render a chain root first, followed by its code and URI lines
 */
template<typename E>
std::string format_report(const E& error, const ReportConfig& config = {}) {
    static_assert(is_error_stacks_v<E>, "format_report requires a stacking error type");
    return detail::join_lines(
        detail::report_lines(error.messages(), error.err_code(), error.err_uri(), config));
}

/**
 * @brief Log a chain through debug::Logger at config.level under config.category
 *
 * The record carries one line per chain node, then the code and URI lines.
 */
template<typename E>
void report(const E& error, const ReportConfig& config = {},
            SourceLocation loc = STACKERROR_CALLER_LOCATION) {
    static_assert(is_error_stacks_v<E>, "report requires a stacking error type");
    auto& logger = debug::Logger::instance();
    if (!logger.is_enabled(config.level)) {
        return;
    }
    logger.log_lines(config.level, config.category,
                     detail::report_lines(error.messages(), error.err_code(), error.err_uri(),
                                          config),
                     loc);
}

}  // namespace stackerror
