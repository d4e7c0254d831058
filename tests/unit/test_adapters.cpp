/**
 * @file test_adapters.cpp
 * @brief Unit tests for the I/O and HTTP adapters
 *
 * Tests coverage for:
 * - from_error_code: Message and classification from std::error_code
 * - from_system_error: Message and classification from std::system_error
 * - format_http_status: Status line rendering
 * - from_http_status: Status chains with and without a code
 */

#include <gtest/gtest.h>
#include <stackerror/adapters/from_http.hpp>
#include <stackerror/adapters/from_io.hpp>
#include <stackerror/result.hpp>

#include <cerrno>
#include <string>
#include <system_error>

using namespace stackerror;
using namespace stackerror::adapters;

// ============================================================================
// I/O Adapter Tests
// ============================================================================

class IoAdapterTest : public ::testing::Test {};

TEST_F(IoAdapterTest, FromErrorCodeClassifies) {
    auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
    auto error = from_error_code(ec);

    EXPECT_EQ(error.err_code(), ErrorCode::IO_NOT_FOUND);
    EXPECT_EQ(error.to_string(), ec.message());
    EXPECT_FALSE(error.err_uri().has_value());
    EXPECT_EQ(error.depth(), 1u);
}

TEST_F(IoAdapterTest, FromSystemCategoryErrno) {
    std::error_code ec(EACCES, std::system_category());
    auto error = from_error_code(ec);
    EXPECT_EQ(error.err_code(), ErrorCode::IO_PERMISSION_DENIED);
}

TEST_F(IoAdapterTest, UnmappedConditionHasNoCode) {
    auto ec = std::make_error_code(std::errc::bad_file_descriptor);
    auto error = from_error_code(ec);
    EXPECT_FALSE(error.err_code().has_value());
    EXPECT_EQ(error.to_string(), ec.message());
}

TEST_F(IoAdapterTest, FromSystemError) {
    std::system_error failure(std::make_error_code(std::errc::connection_refused), "connect");
    auto error = from_system_error(failure);

    EXPECT_EQ(error.err_code(), ErrorCode::IO_CONNECTION_REFUSED);
    EXPECT_EQ(error.to_string(), failure.what());
}

TEST_F(IoAdapterTest, StackOnAdaptedError) {
    Result<void> result = from_error_code(std::make_error_code(std::errc::timed_out))
                              .stack_err("upload failed");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.err_code(), ErrorCode::IO_TIMED_OUT);
    EXPECT_EQ(result.error().depth(), 2u);
}

// ============================================================================
// HTTP Adapter Tests
// ============================================================================

class HttpAdapterTest : public ::testing::Test {};

TEST_F(HttpAdapterTest, FormatKnownStatus) {
    EXPECT_EQ(format_http_status(404), "404 Not Found");
    EXPECT_EQ(format_http_status(200), "200 OK");
    EXPECT_EQ(format_http_status(503), "503 Service Unavailable");
}

TEST_F(HttpAdapterTest, FormatUnknownStatus) {
    EXPECT_EQ(format_http_status(599), "599 <unknown status code>");
}

TEST_F(HttpAdapterTest, ErrorStatusCarriesCode) {
    auto error = from_http_status(404);
    EXPECT_EQ(error.to_string(), "404 Not Found");
    EXPECT_EQ(error.err_code(), ErrorCode::HTTP_NOT_FOUND);
}

TEST_F(HttpAdapterTest, SuccessStatusHasNoCode) {
    auto error = from_http_status(200);
    EXPECT_EQ(error.to_string(), "200 OK");
    EXPECT_FALSE(error.err_code().has_value());
}

TEST_F(HttpAdapterTest, UnknownStatusHasNoCode) {
    auto error = from_http_status(599);
    EXPECT_EQ(error.to_string(), "599 <unknown status code>");
    EXPECT_FALSE(error.err_code().has_value());
}

TEST_F(HttpAdapterTest, StackedWithUri) {
    auto error = from_http_status(503)
                     .stack_err("upstream rejected the document")
                     .with_err_uri("https://status.example.com/publish");

    EXPECT_EQ(error.to_string(), "503 Service Unavailable\nupstream rejected the document");
    EXPECT_EQ(error.err_code(), ErrorCode::HTTP_SERVICE_UNAVAILABLE);
    EXPECT_EQ(*error.err_uri(), "https://status.example.com/publish");
}
