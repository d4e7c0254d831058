/**
 * @file test_report.cpp
 * @brief Unit tests for chain reporting and report configuration
 *
 * Tests coverage for:
 * - format_report: Plain, numbered, code and URI lines
 * - report: One record line per node through debug::Logger
 * - parse_report_config: Defaults, overrides, error classification
 * - load_report_config: Files on disk, missing files
 */

#include <gtest/gtest.h>
#include <stackerror/derive.hpp>
#include <stackerror/report.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace stackerror;

namespace {

struct ServiceError : DeriveStackError<ServiceError> {
    StackError inner;
};

StackError sample_chain() {
    return StackError::from_msg("connection reset")
        .with_err_code(ErrorCode::IO_CONNECTION_RESET)
        .stack_err("sync aborted")
        .with_err_uri("https://example.com/sync");
}

}  // anonymous namespace

// ============================================================================
// Formatting Tests
// ============================================================================

class FormatReportTest : public ::testing::Test {};

TEST_F(FormatReportTest, DefaultIncludesCodeAndUri) {
    EXPECT_EQ(format_report(sample_chain()),
              "connection reset\n"
              "sync aborted\n"
              "code: IO_CONNECTION_RESET\n"
              "uri: https://example.com/sync");
}

TEST_F(FormatReportTest, Numbered) {
    ReportConfig config;
    config.numbered = true;
    config.include_uri = false;
    EXPECT_EQ(format_report(sample_chain(), config),
              "0: connection reset\n"
              "1: sync aborted\n"
              "code: IO_CONNECTION_RESET");
}

TEST_F(FormatReportTest, MessagesOnly) {
    ReportConfig config;
    config.include_code = false;
    config.include_uri = false;
    EXPECT_EQ(format_report(sample_chain(), config), "connection reset\nsync aborted");
}

TEST_F(FormatReportTest, NoMetadataNoExtraLines) {
    EXPECT_EQ(format_report(StackError::from_msg("plain")), "plain");
}

TEST_F(FormatReportTest, WrapperTypes) {
    auto error = ServiceError::from_msg("quota exceeded")
                     .with_err_code(ErrorCode::HTTP_TOO_MANY_REQUESTS);
    EXPECT_EQ(format_report(error), "quota exceeded\ncode: HTTP_TOO_MANY_REQUESTS");
}

// ============================================================================
// Reporting Tests
// ============================================================================

namespace {

class RecordingSink : public debug::ILogSink {
public:
    void write(const debug::LogRecord& record) override { records.push_back(record); }
    void flush() override {}

    std::vector<debug::LogRecord> records;
};

}  // anonymous namespace

class ReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink = std::make_shared<RecordingSink>();
        previous = debug::Logger::instance().set_sink(sink);
        debug::Logger::instance().set_level(debug::LogLevel::INFO);
    }

    void TearDown() override {
        debug::Logger::instance().set_sink(previous);
        debug::Logger::instance().set_level(debug::LogLevel::INFO);
    }

    std::shared_ptr<RecordingSink> sink;
    std::shared_ptr<debug::ILogSink> previous;
};

TEST_F(ReportTest, LogsAtConfiguredLevelAndCategory) {
    ReportConfig config;
    config.level = debug::LogLevel::WARN;
    config.category = "sync";
    report(sample_chain(), config);

    ASSERT_EQ(sink->records.size(), 1u);
    EXPECT_EQ(sink->records[0].level, debug::LogLevel::WARN);
    EXPECT_EQ(sink->records[0].category, "sync");
    EXPECT_EQ(sink->records[0].text(), format_report(sample_chain(), config));
}

TEST_F(ReportTest, OneLinePerNodeThenMetadata) {
    report(sample_chain());
    ASSERT_EQ(sink->records.size(), 1u);
    const std::vector<std::string> expected = {"connection reset", "sync aborted",
                                               "code: IO_CONNECTION_RESET",
                                               "uri: https://example.com/sync"};
    EXPECT_EQ(sink->records[0].lines, expected);
}

TEST_F(ReportTest, DefaultCategory) {
    report(StackError::from_msg("boom"));
    ASSERT_EQ(sink->records.size(), 1u);
    EXPECT_EQ(sink->records[0].level, debug::LogLevel::ERROR);
    EXPECT_EQ(sink->records[0].category, "error");
}

TEST_F(ReportTest, SuppressedBelowLoggerLevel) {
    debug::Logger::instance().set_level(debug::LogLevel::FATAL);
    report(sample_chain());
    EXPECT_TRUE(sink->records.empty());
}

#if defined(STACKERROR_HAS_SOURCE_LOCATION)
TEST_F(ReportTest, LocationIsCaller) {
    report(sample_chain());
    ASSERT_EQ(sink->records.size(), 1u);
    EXPECT_NE(std::string(sink->records[0].location.file).find("test_report.cpp"),
              std::string::npos);
}
#endif

// ============================================================================
// Configuration Parsing Tests
// ============================================================================

class ReportConfigTest : public ::testing::Test {};

TEST_F(ReportConfigTest, EmptyDocumentKeepsDefaults) {
    auto result = parse_report_config("");
    ASSERT_TRUE(result.is_success()) << result.error();
    EXPECT_EQ(result.value().level, debug::LogLevel::ERROR);
    EXPECT_EQ(result.value().category, "error");
    EXPECT_TRUE(result.value().include_code);
    EXPECT_TRUE(result.value().include_uri);
    EXPECT_FALSE(result.value().numbered);
}

TEST_F(ReportConfigTest, AllKeys) {
    auto result = parse_report_config(
        "report:\n"
        "  level: warn\n"
        "  category: http\n"
        "  include_code: false\n"
        "  include_uri: false\n"
        "  numbered: true\n");
    ASSERT_TRUE(result.is_success()) << result.error();
    EXPECT_EQ(result.value().level, debug::LogLevel::WARN);
    EXPECT_EQ(result.value().category, "http");
    EXPECT_FALSE(result.value().include_code);
    EXPECT_FALSE(result.value().include_uri);
    EXPECT_TRUE(result.value().numbered);
}

TEST_F(ReportConfigTest, OtherTopLevelKeysIgnored) {
    auto result = parse_report_config("server:\n  port: 80\n");
    ASSERT_TRUE(result.is_success());
    EXPECT_EQ(result.value().category, "error");
}

TEST_F(ReportConfigTest, MalformedYaml) {
    auto result = parse_report_config("report: [unterminated");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.err_code(), ErrorCode::RUNTIME_INVALID_VALUE);
    EXPECT_EQ(result.error().message_string(), "failed to parse report configuration");
    EXPECT_EQ(result.error().depth(), 2u);
}

TEST_F(ReportConfigTest, RootMustBeMapping) {
    auto result = parse_report_config("- a\n- b\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.err_code(), ErrorCode::RUNTIME_INVALID_VALUE);
}

TEST_F(ReportConfigTest, ReportMustBeMapping) {
    auto result = parse_report_config("report: loud\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().to_string(), "'report' must be a mapping");
}

TEST_F(ReportConfigTest, UnknownLevel) {
    auto result = parse_report_config("report:\n  level: loud\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.err_code(), ErrorCode::RUNTIME_INVALID_KEY);
    EXPECT_EQ(result.error().to_string(), "unknown log level 'loud'");
}

TEST_F(ReportConfigTest, NonBooleanFlag) {
    auto result = parse_report_config("report:\n  numbered: sometimes\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.err_code(), ErrorCode::RUNTIME_INVALID_VALUE);
    EXPECT_EQ(result.error().message_string(), "report.numbered must be a boolean");
}

TEST_F(ReportConfigTest, LevelMustBeScalar) {
    auto result = parse_report_config("report:\n  level: [warn]\n");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.err_code(), ErrorCode::RUNTIME_INVALID_VALUE);
}

// ============================================================================
// Configuration Loading Tests
// ============================================================================

class ReportConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = std::filesystem::temp_directory_path() /
               ("stackerror_report_test_" + std::to_string(stamp));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path dir_;
};

TEST_F(ReportConfigFileTest, LoadsFromDisk) {
    auto path = write_file("report.yaml", "report:\n  level: info\n  numbered: true\n");
    auto result = load_report_config(path);
    ASSERT_TRUE(result.is_success()) << result.error();
    EXPECT_EQ(result.value().level, debug::LogLevel::INFO);
    EXPECT_TRUE(result.value().numbered);
}

TEST_F(ReportConfigFileTest, MissingFile) {
    auto path = dir_ / "absent.yaml";
    auto result = load_report_config(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.err_code(), ErrorCode::IO_NOT_FOUND);
    EXPECT_EQ(result.error().to_string(),
              "report configuration file not found: " + path.string());
}

TEST_F(ReportConfigFileTest, ParseErrorsCarryPath) {
    auto path = write_file("bad.yaml", "report:\n  level: loud\n");
    auto result = load_report_config(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.err_code(), ErrorCode::RUNTIME_INVALID_KEY);

    auto messages = result.error().messages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], "unknown log level 'loud'");
    EXPECT_EQ(messages[1], "while loading " + path.string());
}
