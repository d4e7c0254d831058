#pragma once

/**
 * @file from_curl.hpp
 * @brief Conversion of libcurl transfer failures into StackError
 *
 * Only available when the library is built with libcurl
 * (STACKERROR_HAS_CURL).
 *
 * With a positive HTTP status the chain starts from from_http_status() and
 * the curl error text is stacked on top, keeping the status code. Without
 * one the curl error text is the root message and the chain has no code.
 */

#include <stackerror/error.hpp>

#include <optional>

#include <curl/curl.h>

namespace stackerror::adapters {

/**
 * @brief Chain from a transfer result and the response status, if any
 *
 * CURLE_OK adds nothing on top of the status chain.
 */
STACKERROR_API StackError from_curl(CURLcode result, std::optional<long> http_status);

/**
 * @brief Chain from a finished easy handle
 *
 * The status is read with CURLINFO_RESPONSE_CODE; 0 means no response.
 */
STACKERROR_API StackError from_curl(CURL* handle, CURLcode result);

}  // namespace stackerror::adapters
