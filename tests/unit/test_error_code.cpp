/**
 * @file test_error_code.cpp
 * @brief Unit tests for stackerror classification codes
 *
 * Tests coverage for:
 * - ErrorCategory: Extraction and names
 * - ErrorCode: Names and stream output
 * - HTTP mapping: Status to code and back, reason phrases
 * - I/O mapping: std::errc and std::error_code classification
 */

#include <gtest/gtest.h>
#include <stackerror/error_code.hpp>

#include <cerrno>
#include <sstream>
#include <string>
#include <system_error>

using namespace stackerror;

// ============================================================================
// Category Tests
// ============================================================================

class ErrorCategoryTest : public ::testing::Test {};

TEST_F(ErrorCategoryTest, CategoryExtraction) {
    // Runtime category (0x00xx)
    EXPECT_EQ(get_category(ErrorCode::RUNTIME_INVALID_VALUE), ErrorCategory::RUNTIME);
    EXPECT_EQ(get_category(ErrorCode::RUNTIME_NOT_IMPLEMENTED), ErrorCategory::RUNTIME);

    // HTTP category (0x01xx)
    EXPECT_EQ(get_category(ErrorCode::HTTP_BAD_REQUEST), ErrorCategory::HTTP);
    EXPECT_EQ(get_category(ErrorCode::HTTP_UNAVAILABLE_FOR_LEGAL_REASONS), ErrorCategory::HTTP);
    EXPECT_EQ(get_category(ErrorCode::HTTP_INTERNAL_SERVER_ERROR), ErrorCategory::HTTP);
    EXPECT_EQ(get_category(ErrorCode::HTTP_NETWORK_AUTHENTICATION_REQUIRED),
              ErrorCategory::HTTP);

    // I/O category (0x02xx)
    EXPECT_EQ(get_category(ErrorCode::IO_NOT_FOUND), ErrorCategory::IO);
    EXPECT_EQ(get_category(ErrorCode::IO_FILE_TOO_LARGE), ErrorCategory::IO);
}

TEST_F(ErrorCategoryTest, CategoryNames) {
    EXPECT_EQ(category_name(ErrorCategory::RUNTIME), "Runtime");
    EXPECT_EQ(category_name(ErrorCategory::HTTP), "HTTP");
    EXPECT_EQ(category_name(ErrorCategory::IO), "I/O");
}

TEST_F(ErrorCategoryTest, ConstexprCategory) {
    static_assert(get_category(ErrorCode::IO_TIMED_OUT) == ErrorCategory::IO);
    static_assert(category_name(ErrorCategory::HTTP) == "HTTP");
    SUCCEED();
}

// ============================================================================
// Name Tests
// ============================================================================

class ErrorNameTest : public ::testing::Test {};

TEST_F(ErrorNameTest, KnownNames) {
    EXPECT_EQ(error_name(ErrorCode::RUNTIME_INVALID_KEY), "RUNTIME_INVALID_KEY");
    EXPECT_EQ(error_name(ErrorCode::HTTP_IM_A_TEAPOT), "HTTP_IM_A_TEAPOT");
    EXPECT_EQ(error_name(ErrorCode::IO_STORAGE_FULL), "IO_STORAGE_FULL");
}

TEST_F(ErrorNameTest, UnknownValue) {
    EXPECT_EQ(error_name(static_cast<ErrorCode>(0xFFFF)), "UNKNOWN_ERROR");
}

TEST_F(ErrorNameTest, StreamOutput) {
    std::ostringstream oss;
    oss << ErrorCode::IO_BROKEN_PIPE;
    EXPECT_EQ(oss.str(), "IO_BROKEN_PIPE");
}

// ============================================================================
// HTTP Mapping Tests
// ============================================================================

class HttpMappingTest : public ::testing::Test {};

TEST_F(HttpMappingTest, ClientErrors) {
    EXPECT_EQ(code_from_http(400), ErrorCode::HTTP_BAD_REQUEST);
    EXPECT_EQ(code_from_http(404), ErrorCode::HTTP_NOT_FOUND);
    EXPECT_EQ(code_from_http(418), ErrorCode::HTTP_IM_A_TEAPOT);
    EXPECT_EQ(code_from_http(429), ErrorCode::HTTP_TOO_MANY_REQUESTS);
    EXPECT_EQ(code_from_http(451), ErrorCode::HTTP_UNAVAILABLE_FOR_LEGAL_REASONS);
}

TEST_F(HttpMappingTest, ServerErrors) {
    EXPECT_EQ(code_from_http(500), ErrorCode::HTTP_INTERNAL_SERVER_ERROR);
    EXPECT_EQ(code_from_http(503), ErrorCode::HTTP_SERVICE_UNAVAILABLE);
    EXPECT_EQ(code_from_http(511), ErrorCode::HTTP_NETWORK_AUTHENTICATION_REQUIRED);
}

TEST_F(HttpMappingTest, UnmappedStatuses) {
    EXPECT_FALSE(code_from_http(200).has_value());
    EXPECT_FALSE(code_from_http(301).has_value());
    EXPECT_FALSE(code_from_http(419).has_value());
    EXPECT_FALSE(code_from_http(509).has_value());
    EXPECT_FALSE(code_from_http(0).has_value());
}

TEST_F(HttpMappingTest, StatusRoundTrip) {
    for (uint16_t status : {400, 401, 403, 409, 422, 431, 502, 504, 508}) {
        auto code = code_from_http(status);
        ASSERT_TRUE(code.has_value()) << status;
        EXPECT_EQ(code_to_http(*code), status);
    }
}

TEST_F(HttpMappingTest, NonHttpCodesHaveNoStatus) {
    EXPECT_FALSE(code_to_http(ErrorCode::IO_NOT_FOUND).has_value());
    EXPECT_FALSE(code_to_http(ErrorCode::RUNTIME_INVALID_VALUE).has_value());
}

TEST_F(HttpMappingTest, ReasonPhrases) {
    EXPECT_EQ(http_reason_phrase(200), "OK");
    EXPECT_EQ(http_reason_phrase(203), "Non Authoritative Information");
    EXPECT_EQ(http_reason_phrase(404), "Not Found");
    EXPECT_EQ(http_reason_phrase(418), "I'm a teapot");
    EXPECT_EQ(http_reason_phrase(505), "HTTP Version Not Supported");
    EXPECT_TRUE(http_reason_phrase(599).empty());
}

// ============================================================================
// I/O Mapping Tests
// ============================================================================

class IoMappingTest : public ::testing::Test {};

TEST_F(IoMappingTest, FromErrc) {
    EXPECT_EQ(code_from_errc(std::errc::no_such_file_or_directory), ErrorCode::IO_NOT_FOUND);
    EXPECT_EQ(code_from_errc(std::errc::permission_denied), ErrorCode::IO_PERMISSION_DENIED);
    EXPECT_EQ(code_from_errc(std::errc::connection_refused), ErrorCode::IO_CONNECTION_REFUSED);
    EXPECT_EQ(code_from_errc(std::errc::no_space_on_device), ErrorCode::IO_STORAGE_FULL);
    EXPECT_EQ(code_from_errc(std::errc::too_many_files_open), ErrorCode::IO_TOO_MANY_OPEN_FILES);
}

TEST_F(IoMappingTest, UnmappedErrc) {
    EXPECT_FALSE(code_from_errc(std::errc::bad_file_descriptor).has_value());
    EXPECT_FALSE(code_from_errc(std::errc::result_out_of_range).has_value());
}

TEST_F(IoMappingTest, WouldBlockAliases) {
    // EAGAIN and EWOULDBLOCK share a value on Linux
    EXPECT_EQ(code_from_errc(std::errc::operation_would_block), ErrorCode::IO_WOULD_BLOCK);
    EXPECT_EQ(code_from_errc(std::errc::resource_unavailable_try_again),
              ErrorCode::IO_WOULD_BLOCK);
}

TEST_F(IoMappingTest, ToErrc) {
    EXPECT_EQ(code_to_errc(ErrorCode::IO_TIMED_OUT), std::errc::timed_out);
    EXPECT_EQ(code_to_errc(ErrorCode::IO_BROKEN_PIPE), std::errc::broken_pipe);
    EXPECT_FALSE(code_to_errc(ErrorCode::HTTP_NOT_FOUND).has_value());
}

TEST_F(IoMappingTest, FromErrorCode) {
    auto ec = std::make_error_code(std::errc::address_in_use);
    EXPECT_EQ(code_from_error_code(ec), ErrorCode::IO_ADDR_IN_USE);
}

TEST_F(IoMappingTest, FromSystemCategory) {
    // system_category maps its errno values onto generic conditions
    std::error_code ec(ENOENT, std::system_category());
    EXPECT_EQ(code_from_error_code(ec), ErrorCode::IO_NOT_FOUND);
}

TEST_F(IoMappingTest, EmptyErrorCode) {
    EXPECT_FALSE(code_from_error_code(std::error_code()).has_value());
}

TEST_F(IoMappingTest, ForeignCategory) {
    auto ec = std::make_error_code(std::io_errc::stream);
    EXPECT_FALSE(code_from_error_code(ec).has_value());
}
