/**
 * @file from_curl.cpp
 * @brief libcurl adapter implementation
 */

#include <stackerror/adapters/from_curl.hpp>
#include <stackerror/adapters/from_http.hpp>

#include <limits>

namespace stackerror::adapters {

StackError from_curl(CURLcode result, std::optional<long> http_status) {
    if (http_status.has_value() && *http_status > 0 &&
        *http_status <= std::numeric_limits<uint16_t>::max()) {
        auto error = from_http_status(static_cast<uint16_t>(*http_status));
        if (result == CURLE_OK) {
            return error;
        }
        return std::move(error).stack_err(curl_easy_strerror(result));
    }
    return StackError::from_msg(curl_easy_strerror(result));
}

StackError from_curl(CURL* handle, CURLcode result) {
    std::optional<long> status;
    if (handle != nullptr) {
        long status_code = 0;
        if (curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status_code) == CURLE_OK &&
            status_code > 0) {
            status = status_code;
        }
    }
    return from_curl(result, status);
}

}  // namespace stackerror::adapters
