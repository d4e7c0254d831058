#include <stackerror/report.hpp>

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

namespace stackerror {

namespace {

Result<void> read_flag(const YAML::Node& node, const char* key, bool& out) {
    if (!node[key]) {
        return ok();
    }
    try {
        out = node[key].as<bool>();
    } catch (const YAML::Exception& e) {
        return StackError::from_msg(e)
            .with_err_code(ErrorCode::RUNTIME_INVALID_VALUE)
            .stack_err("report." + std::string(key) + " must be a boolean");
    }
    return ok();
}

Result<ReportConfig> parse_report_node(const YAML::Node& root) {
    ReportConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        return StackError::from_msg("report configuration must be a mapping")
            .with_err_code(ErrorCode::RUNTIME_INVALID_VALUE);
    }

    const YAML::Node node = root["report"];
    if (!node || node.IsNull()) {
        return config;
    }
    if (!node.IsMap()) {
        return StackError::from_msg("'report' must be a mapping")
            .with_err_code(ErrorCode::RUNTIME_INVALID_VALUE);
    }

    try {
        if (node["level"]) {
            const auto name = node["level"].as<std::string>();
            if (!debug::try_parse_log_level(name, config.level)) {
                return StackError::from_msg("unknown log level '" + name + "'")
                    .with_err_code(ErrorCode::RUNTIME_INVALID_KEY);
            }
        }
        if (node["category"]) {
            config.category = node["category"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return StackError::from_msg(e)
            .with_err_code(ErrorCode::RUNTIME_INVALID_VALUE)
            .stack_err("report.level and report.category must be strings");
    }

    STACKERROR_TRY(read_flag(node, "include_code", config.include_code));
    STACKERROR_TRY(read_flag(node, "include_uri", config.include_uri));
    STACKERROR_TRY(read_flag(node, "numbered", config.numbered));

    return config;
}

}  // anonymous namespace

// ============================================================================
// Configuration Loading
// ============================================================================

Result<ReportConfig> parse_report_config(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        return StackError::from_msg(e)
            .with_err_code(ErrorCode::RUNTIME_INVALID_VALUE)
            .stack_err("failed to parse report configuration");
    }
    return parse_report_node(root);
}

Result<ReportConfig> load_report_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return StackError::from_msg("report configuration file not found: " + path.string())
            .with_err_code(ErrorCode::IO_NOT_FOUND);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        const std::error_code open_error(errno, std::generic_category());
        auto error = StackError::from_msg(open_error.message());
        if (auto code = code_from_error_code(open_error)) {
            error = std::move(error).with_err_code(*code);
        }
        return std::move(error).stack_err("failed to open report configuration: " +
                                          path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_report_config(buffer.str()).stack_err("while loading " + path.string());
    if (result.is_success()) {
        STACKERROR_LOG_DEBUG(debug::category::CONFIG,
                             "Loaded report configuration from " << path.string());
    }
    return result;
}

// ============================================================================
// Formatting
// ============================================================================

namespace detail {

std::vector<std::string> report_lines(std::vector<std::string> messages,
                                      std::optional<ErrorCode> code,
                                      std::optional<std::string_view> uri,
                                      const ReportConfig& config) {
    if (config.numbered) {
        for (size_t i = 0; i < messages.size(); ++i) {
            messages[i] = std::to_string(i) + ": " + messages[i];
        }
    }
    if (config.include_code && code.has_value()) {
        messages.push_back("code: " + std::string(error_name(*code)));
    }
    if (config.include_uri && uri.has_value()) {
        messages.push_back("uri: " + std::string(*uri));
    }
    return messages;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += lines[i];
    }
    return joined;
}

}  // namespace detail

}  // namespace stackerror
